/*

error_detail.hpp
----------------

Header-only helper to build structured error detail strings without throwing
(except potential allocation failures).

Each entry is formatted as key=value\n to ease parsing.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace joinxx::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::int64_t v)
    {
        append_key(key);
        append_number(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_size(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_number(v);
        out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    template<typename Int>
    void append_number(Int v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace joinxx::detail
