#include "text_placement.hpp"

#include "glyph_metrics.hpp"
#include "text_normalize.hpp"

using namespace TextFit;

FitError TextFit::compute_line_placements(const FitResult& result, float boxWidth, float boxHeight,
		const GlyphMetrics& metrics, std::vector<LinePlacement>& outPlacements, float originX, float originY) {
	outPlacements.clear();
	outPlacements.reserve(result.lines.size());

	auto lineAdvance = static_cast<float>(result.fontSize) * LINE_SPACING_FACTOR;
	auto y = originY + (boxHeight - calc_text_height(result.lines.size(), result.fontSize)) * 0.5f;

	for (auto& line : result.lines) {
		LinePlacement placement{
			.x = originX,
			.y = y,
			.skipDraw = is_blank(line),
		};

		if (!placement.skipDraw) {
			TextExtents extents{};

			if (!metrics.measure(line, result.fontSize, extents)) {
				return FitError::FONT_UNAVAILABLE;
			}

			placement.x = originX + (boxWidth - extents.width) * 0.5f;
			placement.width = extents.width;
			placement.height = extents.height;
		}

		outPlacements.emplace_back(placement);
		y += lineAdvance;
	}

	return FitError::NONE;
}
