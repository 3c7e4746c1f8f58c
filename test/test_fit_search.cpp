#include <catch2/catch_test_macros.hpp>

#include "fixed_metrics.hpp"

#include <fit_search.hpp>
#include <utf8_util.hpp>

#include <algorithm>
#include <string>

using namespace TextFit;

static std::string strip_spaces(std::string_view str) {
	std::string result;

	for (auto c : str) {
		if (c != ' ') {
			result.push_back(c);
		}
	}

	return result;
}

static float max_line_width(const FitResult& result, const GlyphMetrics& metrics) {
	float maxWidth = 0.f;

	for (auto& line : result.lines) {
		float width{};
		REQUIRE(metrics.measure_width(line, result.fontSize, width));
		maxWidth = std::max(maxWidth, width);
	}

	return maxWidth;
}

static FitRequest make_request(std::string_view text, float boxWidth, float boxHeight,
		uint32_t initialFontSize = 40, uint32_t minFontSize = 10) {
	return {
		.text = text,
		.boxWidth = boxWidth,
		.boxHeight = boxHeight,
		.initialFontSize = initialFontSize,
		.minFontSize = minFontSize,
	};
}

TEST_CASE("Single line fits at the initial size", "[FitSearch]") {
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	FitResult result{};

	REQUIRE(FitSearch::fit(make_request("AAAAAAAAAA", 200.f, 100.f), metricsSet, result) == FitError::NONE);

	REQUIRE(result.fitGuaranteed);
	REQUIRE(result.fontSize == 40);
	REQUIRE(result.charsPerLine == 10);
	REQUIRE(result.lines == std::vector<std::string>{"AAAAAAAAAA"});
	REQUIRE(result.glyphClass == GlyphClass::PLAIN);
}

TEST_CASE("Font size shrinks before adding lines", "[FitSearch]") {
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	FitResult result{};

	SECTION("Shrinks in steps from the initial size") {
		REQUIRE(FitSearch::fit(make_request("AAAAAAAAAA", 150.f, 100.f), metricsSet, result) == FitError::NONE);
		REQUIRE(result.fitGuaranteed);
		REQUIRE(result.fontSize == 30);
		REQUIRE(result.lines.size() == 1);
	}

	SECTION("One line is preferred even when two lines allow a larger font") {
		REQUIRE(FitSearch::fit(make_request("AAAAA AAAAA", 150.f, 200.f), metricsSet, result) == FitError::NONE);
		REQUIRE(result.fitGuaranteed);
		REQUIRE(result.lines.size() == 1);
		REQUIRE(result.fontSize == 25);
	}

	SECTION("Only sizes reachable from the initial size are tried") {
		REQUIRE(FitSearch::fit(make_request("AAAAAAAAAA", 115.f, 100.f, 42, 20), metricsSet, result)
				== FitError::NONE);
		REQUIRE(result.fitGuaranteed);
		REQUIRE(result.fontSize == 22);
	}
}

TEST_CASE("More lines are used when one line cannot fit", "[FitSearch]") {
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	FitResult result{};

	REQUIRE(FitSearch::fit(make_request("hello world foo", 100.f, 100.f, 40, 20), metricsSet, result)
			== FitError::NONE);

	REQUIRE(result.fitGuaranteed);
	REQUIRE(result.fontSize == 20);
	// Budgets 8 and 7 wrap to three lines and are skipped
	REQUIRE(result.charsPerLine == 9);
	REQUIRE(result.lines == std::vector<std::string>{"hello", "world foo"});
}

TEST_CASE("Search layers", "[FitSearch]") {
	FixedMetrics metrics;
	FitResult result{};
	std::string_view text = "hello world foo";

	SECTION("Offset candidates") {
		REQUIRE(FitSearch::try_offsets(text, 2, 8, 20, 100.f, 100.f, metrics, result) == SearchStatus::FOUND);
		REQUIRE(result.charsPerLine == 9);

		REQUIRE(FitSearch::try_offsets(text, 2, 8, 40, 100.f, 100.f, metrics, result)
				== SearchStatus::NOT_FOUND);
		// Every budget from 13 to 17 produces fewer than three lines
		REQUIRE(FitSearch::try_offsets(text, 3, 15, 10, 1000.f, 1000.f, metrics, result)
				== SearchStatus::NOT_FOUND);
	}

	SECTION("Font sizes restart from the initial size for every line count") {
		auto request = make_request(text, 200.f, 1000.f, 40, 10);

		REQUIRE(FitSearch::search_font_sizes(text, 2, request, metrics, result) == SearchStatus::FOUND);
		REQUIRE(result.fontSize == 40);
		REQUIRE(result.lines.size() == 2);

		REQUIRE(FitSearch::search_font_sizes(text, 3, request, metrics, result) == SearchStatus::FOUND);
		REQUIRE(result.fontSize == 40);
		REQUIRE(result.lines.size() == 3);
	}

	SECTION("Line counts") {
		auto request = make_request(text, 100.f, 100.f, 40, 20);

		REQUIRE(FitSearch::search_line_counts(text, request, metrics, result) == SearchStatus::FOUND);
		REQUIRE(result.lines.size() == 2);
	}
}

TEST_CASE("Text that never fits falls back", "[FitSearch]") {
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	FitResult result{};

	std::string text;

	for (int i = 0; i < 10; ++i) {
		text.append("abcdefghij ");
	}

	REQUIRE(FitSearch::fit(make_request(text, 100.f, 100.f, 40, 20), metricsSet, result) == FitError::NONE);

	REQUIRE_FALSE(result.fitGuaranteed);
	REQUIRE(result.fontSize == 20);
	REQUIRE(result.charsPerLine == 37);
	// Wrapping at 37 yields four lines; the last is merged so nothing is lost
	REQUIRE(result.lines.size() == 3);
	REQUIRE(count_code_points(result.lines[2]) == 43);

	std::string joined;

	for (auto& line : result.lines) {
		joined.append(line);
	}

	REQUIRE(strip_spaces(joined) == strip_spaces(text));
}

TEST_CASE("Empty input is replaced before fitting", "[FitSearch]") {
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	FitResult result{};

	auto request = make_request(" \t\n  ", 500.f, 500.f);

	SECTION("Default placeholder") {
		REQUIRE(FitSearch::fit(request, metricsSet, result) == FitError::NONE);
		REQUIRE(result.lines == std::vector<std::string>{std::string(DEFAULT_EMPTY_PLACEHOLDER)});
	}

	SECTION("Custom placeholder") {
		request.emptyPlaceholder = "EMPTY";
		REQUIRE(FitSearch::fit(request, metricsSet, result) == FitError::NONE);
		REQUIRE(result.lines == std::vector<std::string>{"EMPTY"});
		REQUIRE(result.fitGuaranteed);
	}
}

TEST_CASE("Emoji select the emoji-aware provider for the whole fit", "[FitSearch]") {
	FixedMetrics plainMetrics;
	FixedMetrics emojiMetrics;
	MetricsSet metricsSet{&plainMetrics, &emojiMetrics};
	FitResult result{};

	SECTION("Mixed text") {
		auto request = make_request("good news \xF0\x9F\x98\x80 everyone is here today", 120.f, 200.f, 40, 10);
		REQUIRE(FitSearch::fit(request, metricsSet, result) == FitError::NONE);

		REQUIRE(result.glyphClass == GlyphClass::EMOJI_AWARE);
		REQUIRE(emojiMetrics.get_measure_count() > 0);
		REQUIRE(plainMetrics.get_measure_count() == 0);
	}

	SECTION("Plain text") {
		auto request = make_request("good news everyone", 120.f, 200.f, 40, 10);
		REQUIRE(FitSearch::fit(request, metricsSet, result) == FitError::NONE);

		REQUIRE(result.glyphClass == GlyphClass::PLAIN);
		REQUIRE(plainMetrics.get_measure_count() > 0);
		REQUIRE(emojiMetrics.get_measure_count() == 0);
	}
}

TEST_CASE("Errors", "[FitSearch]") {
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	FitResult result{};

	SECTION("Missing font") {
		metrics.set_min_available_size(1000);
		REQUIRE(FitSearch::fit(make_request("hello", 100.f, 100.f), metricsSet, result)
				== FitError::FONT_UNAVAILABLE);
	}

	SECTION("Invalid requests") {
		REQUIRE(FitSearch::fit(make_request("hello", 100.f, 100.f, 10, 20), metricsSet, result)
				== FitError::INVALID_REQUEST);
		REQUIRE(FitSearch::fit(make_request("hello", 0.f, 100.f), metricsSet, result)
				== FitError::INVALID_REQUEST);
		REQUIRE(FitSearch::fit(make_request("hello", 100.f, -1.f), metricsSet, result)
				== FitError::INVALID_REQUEST);
		REQUIRE(FitSearch::fit(make_request("hello", 100.f, 100.f, 40, 0), metricsSet, result)
				== FitError::INVALID_REQUEST);

		auto request = make_request("hello", 100.f, 100.f);
		request.fontSizeStep = 0;
		REQUIRE(FitSearch::fit(request, metricsSet, result) == FitError::INVALID_REQUEST);
	}
}

TEST_CASE("Fit properties", "[FitSearch]") {
	static constexpr const char* texts[] = {
		"A",
		"AAAAAAAAAA",
		"hello world foo",
		"The quick brown fox jumps over the lazy dog",
		"\xE5\x96\x9C\xE6\x8A\xA5 \xE4\xBB\x8A\xE5\xA4\xA9\xE5\x8F\x91\xE5\xB7\xA5\xE8\xB5\x84\xE4\xBA\x86",
		"party \xF0\x9F\x8E\x89\xF0\x9F\x8E\x89 time",
		"Supercalifragilisticexpialidocious",
	};

	FixedMetrics plainMetrics;
	FixedMetrics emojiMetrics(0.5f, 1.2f);
	MetricsSet metricsSet{&plainMetrics, &emojiMetrics};

	for (auto* text : texts) {
		bool lastGuaranteed = true;

		for (float boxWidth = 400.f; boxWidth >= 20.f; boxWidth -= 20.f) {
			auto request = make_request(text, boxWidth, boxWidth * 0.75f, 60, 10);

			FitResult result{};
			REQUIRE(FitSearch::fit(request, metricsSet, result) == FitError::NONE);

			// Line bound
			REQUIRE(result.lines.size() >= 1);
			REQUIRE(result.lines.size() <= static_cast<size_t>(MAX_LINES));
			REQUIRE(result.fontSize >= request.minFontSize);
			REQUIRE(result.charsPerLine >= 1);

			// Validity
			if (result.fitGuaranteed) {
				auto& metrics = metricsSet.select(result.glyphClass);
				REQUIRE(max_line_width(result, metrics) <= request.boxWidth);
				REQUIRE(calc_text_height(result.lines.size(), result.fontSize) <= request.boxHeight);
			}

			// Shrinking the box never turns a fallback into a fit
			if (!lastGuaranteed) {
				REQUIRE_FALSE(result.fitGuaranteed);
			}

			lastGuaranteed = result.fitGuaranteed;

			// Determinism
			FitResult again{};
			REQUIRE(FitSearch::fit(request, metricsSet, again) == FitError::NONE);
			REQUIRE(again.fontSize == result.fontSize);
			REQUIRE(again.charsPerLine == result.charsPerLine);
			REQUIRE(again.lines == result.lines);
			REQUIRE(again.fitGuaranteed == result.fitGuaranteed);

			// Nothing dropped
			std::string joined;

			for (auto& line : result.lines) {
				joined.append(line);
			}

			REQUIRE(strip_spaces(joined) == strip_spaces(text));
		}
	}
}
