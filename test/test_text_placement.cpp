#include <catch2/catch_test_macros.hpp>

#include "fixed_metrics.hpp"

#include <text_placement.hpp>

using namespace TextFit;

static FitResult make_result(uint32_t fontSize, std::vector<std::string> lines) {
	return {
		.fontSize = fontSize,
		.charsPerLine = 10,
		.lines = std::move(lines),
		.glyphClass = GlyphClass::PLAIN,
		.fitGuaranteed = true,
	};
}

TEST_CASE("Lines are centered in the box", "[TextPlacement]") {
	FixedMetrics metrics;
	std::vector<LinePlacement> placements;
	auto result = make_result(20, {"hello", "world foo"});

	SECTION("Box at the origin") {
		REQUIRE(compute_line_placements(result, 100.f, 100.f, metrics, placements) == FitError::NONE);
		REQUIRE(placements.size() == 2);

		REQUIRE(placements[0].x == 25.f);
		REQUIRE(placements[0].y == 20.f);
		REQUIRE(placements[0].width == 50.f);
		REQUIRE(placements[0].height == 20.f);
		REQUIRE_FALSE(placements[0].skipDraw);

		REQUIRE(placements[1].x == 5.f);
		REQUIRE(placements[1].y == 50.f);
		REQUIRE(placements[1].width == 90.f);
	}

	SECTION("Offset box") {
		REQUIRE(compute_line_placements(result, 100.f, 100.f, metrics, placements, 10.f, 30.f) == FitError::NONE);
		REQUIRE(placements.size() == 2);

		REQUIRE(placements[0].x == 35.f);
		REQUIRE(placements[0].y == 50.f);
		REQUIRE(placements[1].x == 15.f);
		REQUIRE(placements[1].y == 80.f);
	}

	SECTION("Text taller than the box starts above it") {
		REQUIRE(compute_line_placements(result, 100.f, 40.f, metrics, placements) == FitError::NONE);
		REQUIRE(placements[0].y == -10.f);
	}
}

TEST_CASE("Blank lines keep their slot but are not drawn", "[TextPlacement]") {
	FixedMetrics metrics;
	std::vector<LinePlacement> placements;
	auto result = make_result(10, {"ab", " ", "cd"});

	REQUIRE(compute_line_placements(result, 100.f, 45.f, metrics, placements) == FitError::NONE);
	REQUIRE(placements.size() == 3);
	REQUIRE(metrics.get_measure_count() == 2);

	REQUIRE(placements[1].skipDraw);
	REQUIRE(placements[1].width == 0.f);
	REQUIRE(placements[0].y == 0.f);
	REQUIRE(placements[1].y == 15.f);
	REQUIRE(placements[2].y == 30.f);
}

TEST_CASE("Placement reports a missing font", "[TextPlacement]") {
	FixedMetrics metrics;
	metrics.set_min_available_size(100);
	std::vector<LinePlacement> placements;

	REQUIRE(compute_line_placements(make_result(20, {"hello"}), 100.f, 100.f, metrics, placements)
			== FitError::FONT_UNAVAILABLE);
}
