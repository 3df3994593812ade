#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace joinxx
{
namespace detail
{

/// U+FFFD, written in place of code points that have no UTF-8 encoding.
inline constexpr char32_t replacement_char = 0xFFFD;

inline constexpr char32_t max_code_point = 0x10FFFF;

inline void append_sv(std::string& out, std::string_view sv)
{
    out.reserve(out.size() + sv.size());
    out.append(sv.data(), sv.size());
}

inline void append_char(std::string& out, char ch)
{
    out.reserve(out.size() + 1);
    out.push_back(ch);
}

inline void append_bytes(std::string& out, std::span<const std::byte> bytes)
{
    out.reserve(out.size() + bytes.size());
    out.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/// Appends the UTF-8 encoding of cp. Surrogates and values past U+10FFFF
/// are written as U+FFFD. Returns the number of bytes appended.
inline std::size_t append_rune(std::string& out, char32_t cp)
{
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > max_code_point)
        cp = replacement_char;

    char buffer[4];
    std::size_t len = 0;
    if (cp < 0x80)
    {
        buffer[len++] = static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        buffer[len++] = static_cast<char>(0xC0 | (cp >> 6));
        buffer[len++] = static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        buffer[len++] = static_cast<char>(0xE0 | (cp >> 12));
        buffer[len++] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[len++] = static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        buffer[len++] = static_cast<char>(0xF0 | (cp >> 18));
        buffer[len++] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buffer[len++] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[len++] = static_cast<char>(0x80 | (cp & 0x3F));
    }

    out.reserve(out.size() + len);
    out.append(buffer, len);
    return len;
}

} // namespace detail
} // namespace joinxx
