#include "emoji_classifier.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

using namespace TextFit;

bool TextFit::is_emoji(UChar32 c) {
	if (c < 0) {
		return false;
	}

	return (c >= EMOJI_BLOCK_FIRST && c <= EMOJI_BLOCK_LAST) || u_charType(c) == U_OTHER_SYMBOL;
}

bool TextFit::contains_emoji(std::string_view text) {
	auto length = static_cast<int32_t>(text.size());
	int32_t offset = 0;

	while (offset < length) {
		UChar32 c;
		U8_NEXT(text.data(), offset, length, c);

		if (is_emoji(c)) {
			return true;
		}
	}

	return false;
}

GlyphClass TextFit::classify_text(std::string_view text) {
	return contains_emoji(text) ? GlyphClass::EMOJI_AWARE : GlyphClass::PLAIN;
}
