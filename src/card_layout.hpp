#pragma once

#include "config.hpp"
#include "fit_search.hpp"
#include "text_placement.hpp"

#include <string_view>
#include <vector>

namespace TextFit {

struct CardLayout {
	const CardTemplate* pTemplate;
	// Text box, centered in the background image
	float boxX;
	float boxY;
	float boxWidth;
	float boxHeight;
	FitResult fit;
	// Positions relative to the top-left corner of the background image
	std::vector<LinePlacement> placements;
};

enum class CardError {
	NONE,
	UNKNOWN_TEMPLATE,
	INVALID_REQUEST,
	FONT_UNAVAILABLE,
};

/**
 * Lays out `text` on a card using the template named `templateName` for a background image of
 * `imageWidth` x `imageHeight` pixels. The text box covers the configured fraction of the image and is
 * centered in it.
 */
[[nodiscard]] CardError build_card_layout(const Config& config, const MetricsSet& metrics,
		std::string_view templateName, uint32_t imageWidth, uint32_t imageHeight, std::string_view text,
		CardLayout& outLayout);

const char* card_error_to_string(CardError err);

}
