#pragma once

#include "fit_search.hpp"

#include <vector>

namespace TextFit {

class GlyphMetrics;

struct LinePlacement {
	float x;
	float y;
	float width;
	float height;
	// Empty and whitespace-only lines occupy a line slot but draw nothing
	bool skipDraw;
};

/**
 * Positions the lines of `result` inside a box of `boxWidth` x `boxHeight` whose origin is at
 * (`originX`, `originY`). Lines are centered horizontally and the block of lines is centered vertically,
 * advancing `fontSize * LINE_SPACING_FACTOR` per line. `metrics` must be the provider the fit used.
 */
[[nodiscard]] FitError compute_line_placements(const FitResult& result, float boxWidth, float boxHeight,
		const GlyphMetrics& metrics, std::vector<LinePlacement>& outPlacements, float originX = 0.f,
		float originY = 0.f);

}
