/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>


namespace xmppxx
{


/**
Base64 encoder for SASL payloads.

SASL data travels as the character data of a single element, so the encoder never
wraps lines.
**/
class base64
{
public:

    /**
    Base64 character set.
    **/
    static constexpr std::string_view CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    static constexpr char EQUAL_CHAR = '=';

    /**
    Encoding a byte string into one Base64 line, padded with `=`.

    @param text Bytes to encode.
    @return     Encoded text.
    **/
    [[nodiscard]] static std::string encode(std::string_view text)
    {
        std::string line;
        line.reserve((text.size() + 2) / OCTETS_NO * SEXTETS_NO);
        unsigned char octets[OCTETS_NO];
        int octets_counter = 0;

        auto flush = [&line, &octets](int count)
        {
            const unsigned char sextets[SEXTETS_NO] = {
                static_cast<unsigned char>((octets[0] & 0xfc) >> 2),
                static_cast<unsigned char>(((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4)),
                static_cast<unsigned char>(((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6)),
                static_cast<unsigned char>(octets[2] & 0x3f)};
            for (int i = 0; i < count + 1; i++)
                line += CHARSET[sextets[i]];
            for (int i = count; i < OCTETS_NO; i++)
                line += EQUAL_CHAR;
        };

        for (char ch : text)
        {
            octets[octets_counter++] = static_cast<unsigned char>(ch);
            if (octets_counter == OCTETS_NO)
            {
                flush(OCTETS_NO);
                octets_counter = 0;
            }
        }

        // encode remaining characters if any
        if (octets_counter > 0)
        {
            for (int i = octets_counter; i < OCTETS_NO; i++)
                octets[i] = '\0';
            flush(octets_counter);
        }

        return line;
    }

private:

    /**
    Number of six bit chunks.
    **/
    static constexpr int SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr int OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace xmppxx
