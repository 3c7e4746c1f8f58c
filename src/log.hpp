#pragma once

#include <cstdio>

#define TEXTFIT_LOG_WARNING(fmt, ...) std::fprintf(stderr, "[textfit] warning: " fmt "\n" __VA_OPT__(,) __VA_ARGS__)
#define TEXTFIT_LOG_ERROR(fmt, ...) std::fprintf(stderr, "[textfit] error: " fmt "\n" __VA_OPT__(,) __VA_ARGS__)
