#pragma once

#include "color.hpp"
#include "text_normalize.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace TextFit {

struct FontConfig {
	std::string primaryUri{"assets/font.ttf"};
	std::string emojiUri{"assets/NotoColorEmoji.ttf"};
	// Used whenever the primary font cannot be loaded
	std::string defaultUri{"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"};
};

struct FitConfig {
	uint32_t initialFontSize{100};
	uint32_t minFontSize{20};
	uint32_t fontSizeStep{5};
	// Fraction of the background image covered by the text box
	float boxWidthRatio{0.8f};
	float boxHeightRatio{0.6f};
	std::string emptyPlaceholder{DEFAULT_EMPTY_PLACEHOLDER};
};

struct CardTemplate {
	std::string name;
	std::string imageUri;
	Color fontColor;
	Color strokeColor;
	uint32_t strokeWidth;
};

struct Config {
	FontConfig fonts;
	FitConfig fit;
	std::vector<CardTemplate> templates;

	const CardTemplate* find_template(std::string_view name) const;
};

enum class ConfigError {
	NONE,
	FILE_NOT_FOUND,
	INVALID_JSON,
	INVALID_VALUE,
};

/**
 * Returns the built-in configuration: the "good" (red) and "bad" (grey) card templates, font sizes 100 down
 * to 20 in steps of 5 and a text box covering 80% x 60% of the background image.
 */
[[nodiscard]] Config make_default_config();

/**
 * Overrides `config` with the values present in the JSON document `jsonData`. Keys that are absent keep
 * their current value; a present "templates" array replaces the template list. `config` is left untouched
 * on error.
 */
[[nodiscard]] ConfigError load_config_from_json_data(std::string_view jsonData, Config& config);

/**
 * Same as `load_config_from_json_data`, reading the document from the file at `uri`.
 */
[[nodiscard]] ConfigError load_config_from_json_file(const char* uri, Config& config);

const char* config_error_to_string(ConfigError err);

}
