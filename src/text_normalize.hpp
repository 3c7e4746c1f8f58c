#pragma once

#include <string>
#include <string_view>

namespace TextFit {

// "Content is empty"
constexpr const std::string_view DEFAULT_EMPTY_PLACEHOLDER = "\xE5\x86\x85\xE5\xAE\xB9\xE4\xB8\xBA\xE7\xA9\xBA";

/**
 * Trims `text` and collapses every run of Unicode white space into a single U+0020. Returns `placeholder`
 * if nothing but white space remains.
 */
[[nodiscard]] std::string normalize_text(std::string_view text,
		std::string_view placeholder = DEFAULT_EMPTY_PLACEHOLDER);

/**
 * Returns true if `text` consists solely of Unicode white space (or is empty).
 */
[[nodiscard]] bool is_blank(std::string_view text);

}
