#include "text_normalize.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

using namespace TextFit;

std::string TextFit::normalize_text(std::string_view text, std::string_view placeholder) {
	std::string result;
	result.reserve(text.size());

	auto length = static_cast<int32_t>(text.size());
	int32_t offset = 0;
	bool pendingSpace = false;

	while (offset < length) {
		auto charStart = offset;
		UChar32 c;
		U8_NEXT(text.data(), offset, length, c);

		if (c >= 0 && u_isUWhiteSpace(c)) {
			pendingSpace = !result.empty();
			continue;
		}

		if (pendingSpace) {
			result.push_back(' ');
			pendingSpace = false;
		}

		result.append(text.data() + charStart, static_cast<size_t>(offset - charStart));
	}

	if (result.empty()) {
		return std::string(placeholder);
	}

	return result;
}

bool TextFit::is_blank(std::string_view text) {
	auto length = static_cast<int32_t>(text.size());
	int32_t offset = 0;

	while (offset < length) {
		UChar32 c;
		U8_NEXT(text.data(), offset, length, c);

		if (c < 0 || !u_isUWhiteSpace(c)) {
			return false;
		}
	}

	return true;
}
