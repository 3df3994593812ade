/*

joinxx.cppm
-----------

C++20 module interface for joinxx.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

module;

// Global module fragment - non-modular dependencies
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <expected>
#include <format>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

export module joinxx;

export {
    #include <joinxx/config.hpp>
    #include <joinxx/detail/result.hpp>
    #include <joinxx/detail/log.hpp>
    #include <joinxx/joiner_options.hpp>
    #include <joinxx/joiner.hpp>
}
