#include "card_layout.hpp"

#include "common.hpp"

#include <cmath>

using namespace TextFit;

static CardError to_card_error(FitError err);

CardError TextFit::build_card_layout(const Config& config, const MetricsSet& metrics,
		std::string_view templateName, uint32_t imageWidth, uint32_t imageHeight, std::string_view text,
		CardLayout& outLayout) {
	auto* pTemplate = config.find_template(templateName);

	if (!pTemplate) {
		return CardError::UNKNOWN_TEMPLATE;
	}

	auto boxWidth = std::floor(static_cast<float>(imageWidth) * config.fit.boxWidthRatio);
	auto boxHeight = std::floor(static_cast<float>(imageHeight) * config.fit.boxHeightRatio);

	outLayout.pTemplate = pTemplate;
	outLayout.boxWidth = boxWidth;
	outLayout.boxHeight = boxHeight;
	outLayout.boxX = (static_cast<float>(imageWidth) - boxWidth) * 0.5f;
	outLayout.boxY = (static_cast<float>(imageHeight) - boxHeight) * 0.5f;

	FitRequest request{
		.text = text,
		.boxWidth = boxWidth,
		.boxHeight = boxHeight,
		.initialFontSize = config.fit.initialFontSize,
		.minFontSize = config.fit.minFontSize,
		.fontSizeStep = config.fit.fontSizeStep,
		.emptyPlaceholder = config.fit.emptyPlaceholder,
	};

	if (auto err = FitSearch::fit(request, metrics, outLayout.fit); err != FitError::NONE) {
		return to_card_error(err);
	}

	auto& lineMetrics = metrics.select(outLayout.fit.glyphClass);

	return to_card_error(compute_line_placements(outLayout.fit, boxWidth, boxHeight, lineMetrics,
			outLayout.placements, outLayout.boxX, outLayout.boxY));
}

const char* TextFit::card_error_to_string(CardError err) {
	switch (err) {
		case CardError::NONE:
			return "no error";
		case CardError::UNKNOWN_TEMPLATE:
			return "unknown template";
		case CardError::INVALID_REQUEST:
			return "invalid request";
		case CardError::FONT_UNAVAILABLE:
			return "no usable font";
	}

	TEXTFIT_UNREACHABLE();
}

static CardError to_card_error(FitError err) {
	switch (err) {
		case FitError::NONE:
			return CardError::NONE;
		case FitError::INVALID_REQUEST:
			return CardError::INVALID_REQUEST;
		case FitError::FONT_UNAVAILABLE:
			return CardError::FONT_UNAVAILABLE;
	}

	TEXTFIT_UNREACHABLE();
}
