#pragma once

#include <iostream>
#include <joinxx/detail/result.hpp>

inline void print_error(const joinxx::error& err)
{
    std::cout << "Error: " << joinxx::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    std::cout << "Detail: " << err.detail() << "\n";
}
