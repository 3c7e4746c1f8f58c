#include "fit_search.hpp"

#include "emoji_classifier.hpp"
#include "line_wrapper.hpp"
#include "utf8_util.hpp"

#include <algorithm>

using namespace TextFit;

static bool request_is_valid(const FitRequest& request);
static bool measure_max_width(const std::vector<std::string>& lines, uint32_t fontSize,
		const GlyphMetrics& metrics, float& outMaxWidth);

FitError FitSearch::fit(const FitRequest& request, const MetricsSet& metrics, FitResult& outResult) {
	if (!request_is_valid(request)) {
		return FitError::INVALID_REQUEST;
	}

	auto text = normalize_text(request.text, request.emptyPlaceholder);
	auto glyphClass = classify_text(text);

	switch (search_line_counts(text, request, metrics.select(glyphClass), outResult)) {
		case SearchStatus::FOUND:
			break;
		case SearchStatus::NOT_FOUND:
			make_fallback(text, request.minFontSize, outResult);
			break;
		case SearchStatus::FONT_UNAVAILABLE:
			return FitError::FONT_UNAVAILABLE;
	}

	outResult.glyphClass = glyphClass;
	return FitError::NONE;
}

SearchStatus FitSearch::search_line_counts(std::string_view text, const FitRequest& request,
		const GlyphMetrics& metrics, FitResult& outResult) {
	for (int32_t lineCount = 1; lineCount <= MAX_LINES; ++lineCount) {
		if (auto status = search_font_sizes(text, lineCount, request, metrics, outResult);
				status != SearchStatus::NOT_FOUND) {
			return status;
		}
	}

	return SearchStatus::NOT_FOUND;
}

SearchStatus FitSearch::search_font_sizes(std::string_view text, int32_t lineCount, const FitRequest& request,
		const GlyphMetrics& metrics, FitResult& outResult) {
	auto baseCharsPerLine = calc_chars_per_line(count_code_points(text), lineCount);

	// Each line count restarts from the largest size
	for (auto fontSize = static_cast<int64_t>(request.initialFontSize); fontSize >= request.minFontSize;
			fontSize -= request.fontSizeStep) {
		if (auto status = try_offsets(text, lineCount, baseCharsPerLine, static_cast<uint32_t>(fontSize),
				request.boxWidth, request.boxHeight, metrics, outResult); status != SearchStatus::NOT_FOUND) {
			return status;
		}
	}

	return SearchStatus::NOT_FOUND;
}

SearchStatus FitSearch::try_offsets(std::string_view text, int32_t lineCount, int32_t baseCharsPerLine,
		uint32_t fontSize, float boxWidth, float boxHeight, const GlyphMetrics& metrics, FitResult& outResult) {
	std::vector<std::string> lines;

	for (auto offset : CHARS_PER_LINE_OFFSETS) {
		auto charsPerLine = std::max(baseCharsPerLine + offset, 1);
		wrap_text(text, charsPerLine, lines);

		if (static_cast<int32_t>(lines.size()) != lineCount) {
			continue;
		}

		float maxWidth{};

		if (!measure_max_width(lines, fontSize, metrics, maxWidth)) {
			return SearchStatus::FONT_UNAVAILABLE;
		}

		if (maxWidth <= boxWidth && calc_text_height(lines.size(), fontSize) <= boxHeight) {
			outResult.fontSize = fontSize;
			outResult.charsPerLine = charsPerLine;
			outResult.lines = std::move(lines);
			outResult.fitGuaranteed = true;
			return SearchStatus::FOUND;
		}
	}

	return SearchStatus::NOT_FOUND;
}

void FitSearch::make_fallback(std::string_view text, uint32_t minFontSize, FitResult& outResult) {
	auto charsPerLine = std::max(calc_chars_per_line(count_code_points(text), MAX_LINES), 1);

	outResult.fontSize = minFontSize;
	outResult.charsPerLine = charsPerLine;
	outResult.fitGuaranteed = false;
	wrap_text(text, charsPerLine, outResult.lines);

	// Word boundaries can produce more lines than budgeted; keep the surplus on the last line
	if (outResult.lines.size() > static_cast<size_t>(MAX_LINES)) {
		auto& lastLine = outResult.lines[MAX_LINES - 1];

		for (size_t i = MAX_LINES; i < outResult.lines.size(); ++i) {
			lastLine.push_back(' ');
			lastLine.append(outResult.lines[i]);
		}

		outResult.lines.resize(MAX_LINES);
	}
}

// Static Functions

static bool request_is_valid(const FitRequest& request) {
	return request.boxWidth > 0.f && request.boxHeight > 0.f && request.minFontSize > 0
			&& request.initialFontSize >= request.minFontSize && request.fontSizeStep > 0;
}

static bool measure_max_width(const std::vector<std::string>& lines, uint32_t fontSize,
		const GlyphMetrics& metrics, float& outMaxWidth) {
	outMaxWidth = 0.f;

	for (auto& line : lines) {
		float width{};

		if (!metrics.measure_width(line, fontSize, width)) {
			return false;
		}

		outMaxWidth = std::max(outMaxWidth, width);
	}

	return true;
}
