#pragma once

#if defined(_WIN32)
#define TEXTFIT_OPERATING_SYSTEM_WINDOWS
#elif defined(__linux__) || defined(__APPLE__) || defined(__unix__)
#define TEXTFIT_OPERATING_SYSTEM_POSIX
#endif

#if defined(__GNUC__) || defined(__clang__)
#define TEXTFIT_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define TEXTFIT_UNREACHABLE() __assume(false)
#else
#include <cassert>
#define TEXTFIT_UNREACHABLE() assert(0)
#endif
