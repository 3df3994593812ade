/*

throwing.hpp
------------

Helpers to bridge joinxx::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <utility>

#include <joinxx/config.hpp>
#include <joinxx/detail/result.hpp>

namespace joinxx
{

#if !JOINXX_THROWING_ENABLED
#error "JOINXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error err)
        : std::runtime_error(err.to_string()),
          error_(std::move(err))
    {
    }

    [[nodiscard]] const error& get_error() const noexcept { return error_; }
    [[nodiscard]] error_code code() const noexcept { return error_.code(); }

private:
    error error_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result_void&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace joinxx
