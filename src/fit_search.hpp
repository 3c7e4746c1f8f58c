#pragma once

#include "glyph_class.hpp"
#include "glyph_metrics.hpp"
#include "text_normalize.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace TextFit {

constexpr const int32_t MAX_LINES = 3;
constexpr const float LINE_SPACING_FACTOR = 1.5f;
constexpr const uint32_t DEFAULT_FONT_SIZE_STEP = 5;

// Adjustments to the starting per-line budget, in order of preference
constexpr const int32_t CHARS_PER_LINE_OFFSETS[] = {0, -1, 1, -2, 2};

struct FitRequest {
	std::string_view text;
	float boxWidth;
	float boxHeight;
	uint32_t initialFontSize;
	uint32_t minFontSize;
	uint32_t fontSizeStep{DEFAULT_FONT_SIZE_STEP};
	std::string_view emptyPlaceholder{DEFAULT_EMPTY_PLACEHOLDER};
};

struct FitResult {
	uint32_t fontSize;
	int32_t charsPerLine;
	std::vector<std::string> lines;
	GlyphClass glyphClass;
	// False only for the fallback layout, which may overflow the box
	bool fitGuaranteed;
};

enum class FitError {
	NONE,
	INVALID_REQUEST,
	FONT_UNAVAILABLE,
};

enum class SearchStatus {
	FOUND,
	NOT_FOUND,
	FONT_UNAVAILABLE,
};

constexpr float calc_text_height(size_t lineCount, uint32_t fontSize) {
	return static_cast<float>(lineCount) * static_cast<float>(fontSize) * LINE_SPACING_FACTOR;
}

constexpr int32_t calc_chars_per_line(int32_t textLength, int32_t lineCount) {
	return (textLength + lineCount - 1) / lineCount;
}

}

namespace TextFit::FitSearch {

/**
 * Finds a font size and wrap width at which `request.text` fits the box in at most `MAX_LINES` lines.
 *
 * The text is normalized first (see `normalize_text`), so the search never runs on empty input. The emoji
 * class of the text is determined once and selects the provider from `metrics` for every measurement.
 * Fewer lines are preferred over more, and for a given line count the largest font size reachable from
 * `initialFontSize` in steps of `fontSizeStep` wins.
 *
 * If nothing fits, `outResult` holds the fallback layout at `minFontSize` with `fitGuaranteed == false`;
 * this is not an error. `FONT_UNAVAILABLE` is returned only when a measurement could not obtain any font.
 *
 * @thread_safety Thread safe if the providers in `metrics` are.
 */
[[nodiscard]] FitError fit(const FitRequest& request, const MetricsSet& metrics, FitResult& outResult);

/**
 * Tries line counts 1 through `MAX_LINES` on already normalized `text`.
 */
[[nodiscard]] SearchStatus search_line_counts(std::string_view text, const FitRequest& request,
		const GlyphMetrics& metrics, FitResult& outResult);

/**
 * Tries every font size from `request.initialFontSize` down to `request.minFontSize` for exactly
 * `lineCount` lines.
 */
[[nodiscard]] SearchStatus search_font_sizes(std::string_view text, int32_t lineCount,
		const FitRequest& request, const GlyphMetrics& metrics, FitResult& outResult);

/**
 * Tries each offset of `CHARS_PER_LINE_OFFSETS` applied to `baseCharsPerLine`. A candidate is only
 * considered if it wraps to exactly `lineCount` lines.
 */
[[nodiscard]] SearchStatus try_offsets(std::string_view text, int32_t lineCount, int32_t baseCharsPerLine,
		uint32_t fontSize, float boxWidth, float boxHeight, const GlyphMetrics& metrics, FitResult& outResult);

/**
 * Builds the layout used when no candidate fits: `minFontSize`, at most `MAX_LINES` lines, with any
 * surplus wrapped lines joined onto the last one.
 */
void make_fallback(std::string_view text, uint32_t minFontSize, FitResult& outResult);

}
