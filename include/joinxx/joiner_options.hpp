/*

joiner_options.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace joinxx
{

/**
 * Configuration of a joiner.
 */
struct joiner_options
{
    /// Written once, before the first fragment
    std::string prefix;

    /// Written between consecutive fragments
    std::string step;

    /// Written once, after the last fragment
    std::string suffix;
};


/**
 * Option function: mutates the options record it is applied to.
 * Options are applied in order, so the last one setting a field wins.
 */
using joiner_option = std::function<void(joiner_options&)>;


inline joiner_option with_prefix(std::string prefix)
{
    return [prefix = std::move(prefix)](joiner_options& options)
    {
        options.prefix = prefix;
    };
}

inline joiner_option with_step(std::string step)
{
    return [step = std::move(step)](joiner_options& options)
    {
        options.step = step;
    };
}

inline joiner_option with_suffix(std::string suffix)
{
    return [suffix = std::move(suffix)](joiner_options& options)
    {
        options.suffix = suffix;
    };
}

/// Sets prefix, step and suffix at once.
inline joiner_option with_joiner(std::string prefix, std::string step, std::string suffix)
{
    return [prefix = std::move(prefix), step = std::move(step), suffix = std::move(suffix)](joiner_options& options)
    {
        options.prefix = prefix;
        options.step = step;
        options.suffix = suffix;
    };
}


/**
 * Folds option functions, left to right, into a fresh options record.
 *
 * @param opts Options to apply. Empty functions are skipped.
 * @return     Resulting configuration.
 */
template<typename Options>
[[nodiscard]] joiner_options apply_options(const Options& opts)
{
    joiner_options options;
    for (const auto& opt : opts)
    {
        if (opt)
            opt(options);
    }
    return options;
}

[[nodiscard]] inline joiner_options make_options(std::initializer_list<joiner_option> opts)
{
    return apply_options(opts);
}

[[nodiscard]] inline joiner_options make_options(const std::vector<joiner_option>& opts)
{
    return apply_options(opts);
}

} // namespace joinxx
