#pragma once

#include <iostream>
#include <xmppxx/detail/result.hpp>

inline void print_error(const xmppxx::error_info& err)
{
    std::cout << "Error: " << xmppxx::to_string(err.code) << " - " << err.message << "\n";
    std::cout << "Detail: " << err.detail << "\n";
    std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}
