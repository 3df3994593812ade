#pragma once

#include <joinxx/config.hpp>

#include <joinxx/joiner_options.hpp>
#include <joinxx/joiner.hpp>

// Utilities
#include <joinxx/detail/result.hpp>
#include <joinxx/detail/log.hpp>
