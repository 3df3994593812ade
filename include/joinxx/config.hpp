/*

config.hpp
----------

Global build configuration for joinxx.

Define JOINXX_NO_EXCEPTIONS to disable exception-based wrappers. Contract
violations then abort instead of throwing.

*/

#pragma once

#if defined(JOINXX_NO_EXCEPTIONS)
#define JOINXX_THROWING_ENABLED 0
#else
#define JOINXX_THROWING_ENABLED 1
#endif
