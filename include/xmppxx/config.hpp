/*

config.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Global build configuration for xmppxx.

Define XMPPXX_NO_EXCEPTIONS to disable exception-based wrappers.

*/

#pragma once

#if defined(XMPPXX_NO_EXCEPTIONS)
#define XMPPXX_THROWING_ENABLED 0
#else
#define XMPPXX_THROWING_ENABLED 1
#endif
