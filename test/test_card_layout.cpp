#include <catch2/catch_test_macros.hpp>

#include "fixed_metrics.hpp"

#include <card_layout.hpp>

using namespace TextFit;

TEST_CASE("Card text box is centered in the image", "[CardLayout]") {
	auto config = make_default_config();
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	CardLayout layout{};

	REQUIRE(build_card_layout(config, metricsSet, "good", 1000, 500, "AAAAAAAAAA", layout) == CardError::NONE);

	REQUIRE(layout.pTemplate == config.find_template("good"));
	REQUIRE(layout.boxWidth == 800.f);
	REQUIRE(layout.boxHeight == 300.f);
	REQUIRE(layout.boxX == 100.f);
	REQUIRE(layout.boxY == 100.f);

	REQUIRE(layout.fit.fitGuaranteed);
	REQUIRE(layout.fit.fontSize == 100);
	REQUIRE(layout.placements.size() == 1);
	REQUIRE(layout.placements[0].x == 250.f);
	REQUIRE(layout.placements[0].y == 175.f);
	REQUIRE(layout.placements[0].width == 500.f);
}

TEST_CASE("Card box dimensions are truncated", "[CardLayout]") {
	auto config = make_default_config();
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	CardLayout layout{};

	REQUIRE(build_card_layout(config, metricsSet, "bad", 333, 333, "hello", layout) == CardError::NONE);
	REQUIRE(layout.boxWidth == 266.f);
	REQUIRE(layout.boxHeight == 199.f);
	REQUIRE(layout.pTemplate->name == "bad");
}

TEST_CASE("Emoji cards measure with the emoji-aware provider", "[CardLayout]") {
	auto config = make_default_config();
	FixedMetrics plainMetrics;
	FixedMetrics emojiMetrics;
	MetricsSet metricsSet{&plainMetrics, &emojiMetrics};
	CardLayout layout{};

	REQUIRE(build_card_layout(config, metricsSet, "good", 1000, 500, "yay \xF0\x9F\x8E\x89", layout)
			== CardError::NONE);
	REQUIRE(layout.fit.glyphClass == GlyphClass::EMOJI_AWARE);
	REQUIRE(plainMetrics.get_measure_count() == 0);
	REQUIRE(layout.placements[0].width == 300.f);
}

TEST_CASE("Card errors", "[CardLayout]") {
	auto config = make_default_config();
	FixedMetrics metrics;
	MetricsSet metricsSet{&metrics, &metrics};
	CardLayout layout{};

	REQUIRE(build_card_layout(config, metricsSet, "neutral", 1000, 500, "hello", layout)
			== CardError::UNKNOWN_TEMPLATE);
	REQUIRE(build_card_layout(config, metricsSet, "good", 0, 500, "hello", layout)
			== CardError::INVALID_REQUEST);

	metrics.set_min_available_size(1000);
	REQUIRE(build_card_layout(config, metricsSet, "good", 1000, 500, "hello", layout)
			== CardError::FONT_UNAVAILABLE);
}
