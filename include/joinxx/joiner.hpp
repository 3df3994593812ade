/*

joiner.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Streaming writer that joins fragments with a step, wrapped in a prefix and a
suffix.

*/

#pragma once

#include <cstddef>
#include <cstdlib>
#include <format>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <joinxx/config.hpp>
#include <joinxx/joiner_options.hpp>
#include <joinxx/detail/append.hpp>
#include <joinxx/detail/error_detail.hpp>
#include <joinxx/detail/log.hpp>
#include <joinxx/detail/result.hpp>
#if JOINXX_THROWING_ENABLED
#include <joinxx/throwing.hpp>
#endif

namespace joinxx
{

/**
Builds `prefix + fragment (step fragment)* + suffix` one fragment at a time.

The step goes before every write but the first one since construction or the
last reset. Prefix and suffix never enter the buffer; they are added by
`str()` and counted by `size()` and `capacity()`.

A joiner is not synchronized.
**/
class joiner
{
public:
    joiner()
        : joiner(joiner_options{})
    {
    }

    explicit joiner(joiner_options options)
        : options_(std::move(options)),
          affix_size_(options_.prefix.size() + options_.suffix.size())
    {
        if (log::logger::instance().is_enabled(log::level::debug))
            JOINXX_DEBUG(std::format("joiner configured: prefix=\"{}\" step=\"{}\" suffix=\"{}\"",
                options_.prefix, options_.step, options_.suffix));
    }

    joiner(std::initializer_list<joiner_option> opts)
        : joiner(make_options(opts))
    {
    }

    explicit joiner(const std::vector<joiner_option>& opts)
        : joiner(make_options(opts))
    {
    }

    joiner(const joiner&) = default;
    joiner& operator=(const joiner&) = default;
    ~joiner() = default;

    /// The source is left as a default constructed joiner.
    joiner(joiner&& other) noexcept
        : options_(std::exchange(other.options_, joiner_options{})),
          affix_size_(std::exchange(other.affix_size_, 0)),
          buffer_(std::exchange(other.buffer_, std::nullopt)),
          has_written_(std::exchange(other.has_written_, false))
    {
    }

    joiner& operator=(joiner&& other) noexcept
    {
        if (this != &other)
        {
            options_ = std::exchange(other.options_, joiner_options{});
            affix_size_ = std::exchange(other.affix_size_, 0);
            buffer_ = std::exchange(other.buffer_, std::nullopt);
            has_written_ = std::exchange(other.has_written_, false);
        }
        return *this;
    }

    /**
    Appends the UTF-8 encoding of a code point.

    @param cp Code point; surrogates and values past U+10FFFF become U+FFFD.
    @return   Number of bytes of the encoding, the step excluded.
    **/
    std::size_t write_rune(char32_t cp)
    {
        return detail::append_rune(write_step(), cp);
    }

    /**
    Appends a string verbatim.

    @param text Fragment to append.
    @return     Size of the fragment.
    **/
    std::size_t write_string(std::string_view text)
    {
        detail::append_sv(write_step(), text);
        return text.size();
    }

    /// Appends a single raw byte.
    void write_byte(std::byte b)
    {
        detail::append_char(write_step(), static_cast<char>(b));
    }

    /**
    Appends raw bytes verbatim.

    @param bytes Fragment to append.
    @return      Number of bytes appended, the step excluded.
    **/
    std::size_t write(std::span<const std::byte> bytes)
    {
        detail::append_bytes(write_step(), bytes);
        return bytes.size();
    }

    /// Accumulated string, wrapped in prefix and suffix.
    [[nodiscard]] std::string str() const
    {
        std::string out;
        out.reserve(size());
        detail::append_sv(out, options_.prefix);
        if (buffer_)
            detail::append_sv(out, *buffer_);
        detail::append_sv(out, options_.suffix);
        return out;
    }

    /**
    Reserves room for `n` more bytes of fragments, creating the buffer if it
    does not exist yet.

    @param n Number of bytes; must not be negative.
    @return  Error `invalid_argument` if `n` is negative, in which case the
             joiner is left untouched.
    **/
    [[nodiscard]] result_void try_grow(std::ptrdiff_t n)
    {
        if (n < 0)
        {
            detail::error_detail info;
            info.add_int("requested", n).add_size("size", size());
            JOINXX_ERROR(std::format("joiner: negative grow count {}", n));
            return fail(error_code::invalid_argument, "Negative grow count.", info.str());
        }

        if (!buffer_)
            buffer_.emplace();
        buffer_->reserve(buffer_->size() + static_cast<std::size_t>(n));
        return ok();
    }

    /**
    Same as `try_grow()`, but a negative count is a contract violation: it
    throws `joinxx::exception`, or aborts when exceptions are disabled.
    **/
    void grow(std::ptrdiff_t n)
    {
        auto res = try_grow(n);
#if JOINXX_THROWING_ENABLED
        unwrap(std::move(res));
#else
        if (!res)
        {
            JOINXX_FATAL(res.error().to_string());
            std::abort();
        }
#endif
    }

    /// Capacity of the buffer plus the prefix and suffix sizes.
    [[nodiscard]] std::size_t capacity() const noexcept
    {
        if (!buffer_)
            return affix_size_;
        return buffer_->capacity() + affix_size_;
    }

    /// Size of `str()`.
    [[nodiscard]] std::size_t size() const noexcept
    {
        if (!buffer_)
            return affix_size_;
        return buffer_->size() + affix_size_;
    }

    /// True when nothing was written since construction or the last reset.
    [[nodiscard]] bool empty() const noexcept
    {
        return !has_written_;
    }

    /**
    Drops the written fragments, keeping the configuration and the buffer
    capacity. The next write is a first write again.
    **/
    void reset()
    {
        if (buffer_)
            buffer_->clear();
        has_written_ = false;
        JOINXX_TRACE("joiner reset");
    }

    [[nodiscard]] const joiner_options& options() const noexcept
    {
        return options_;
    }

private:
    /// Creates the buffer on demand and writes the step unless this is the first write.
    std::string& write_step()
    {
        if (!buffer_)
            buffer_.emplace();
        if (has_written_)
            detail::append_sv(*buffer_, options_.step);
        has_written_ = true;
        return *buffer_;
    }

    joiner_options options_;

    /// prefix.size() + suffix.size()
    std::size_t affix_size_ = 0;

    std::optional<std::string> buffer_;

    bool has_written_ = false;
};

} // namespace joinxx
