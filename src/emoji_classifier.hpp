#pragma once

#include "glyph_class.hpp"

#include <unicode/umachine.h>

#include <string_view>

namespace TextFit {

constexpr const UChar32 EMOJI_BLOCK_FIRST = 0x1F000;
constexpr const UChar32 EMOJI_BLOCK_LAST = 0x1F9FF;

/**
 * A code point is in the emoji/symbol class if its general category is Symbol, Other (So) or it lies in the
 * emoji blocks U+1F000..U+1F9FF.
 */
[[nodiscard]] bool is_emoji(UChar32 c);

/**
 * Returns true iff any code point of the UTF-8 string `text` satisfies `is_emoji`.
 */
[[nodiscard]] bool contains_emoji(std::string_view text);

[[nodiscard]] GlyphClass classify_text(std::string_view text);

}
