#pragma once

#include <unicode/utf8.h>

#include <cstdint>
#include <string_view>

namespace TextFit {

/**
 * Counts the code points in `str`. Ill-formed sequences count as one code point per maximal subpart,
 * matching the substitution behavior of `U8_NEXT`.
 */
inline int32_t count_code_points(std::string_view str) {
	auto length = static_cast<int32_t>(str.size());
	int32_t offset = 0;
	int32_t count = 0;

	while (offset < length) {
		U8_FWD_1(str.data(), offset, length);
		++count;
	}

	return count;
}

/**
 * Returns the byte offset of the code point `codePointIndex` code points after `byteOffset`, clamped to the
 * end of `str`.
 */
inline int32_t advance_code_points(std::string_view str, int32_t byteOffset, int32_t codePointIndex) {
	auto length = static_cast<int32_t>(str.size());

	for (int32_t i = 0; i < codePointIndex && byteOffset < length; ++i) {
		U8_FWD_1(str.data(), byteOffset, length);
	}

	return byteOffset;
}

}
