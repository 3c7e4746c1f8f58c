#include "config.hpp"

#include "file_read_bytes.hpp"

#include <simdjson.h>

using namespace TextFit;

static ConfigError read_fonts(simdjson::ondemand::object& fontsObject, FontConfig& fonts);
static ConfigError read_fit(simdjson::ondemand::object& fitObject, FitConfig& fit);
static ConfigError read_template(simdjson::ondemand::object& templateObject, CardTemplate& cardTemplate);

static ConfigError read_string(simdjson::ondemand::object& object, std::string_view key, std::string& out);
static ConfigError read_size(simdjson::ondemand::object& object, std::string_view key, uint32_t& out);
static ConfigError read_ratio(simdjson::ondemand::object& object, std::string_view key, float& out);
static ConfigError read_color(simdjson::ondemand::object& object, std::string_view key, Color& out);

// Public Functions

ConfigError TextFit::load_config_from_json_file(const char* uri, Config& config) {
	auto fileData = file_read_bytes(uri);

	if (fileData.empty()) {
		return ConfigError::FILE_NOT_FOUND;
	}

	return load_config_from_json_data(std::string_view(fileData.data(), fileData.size()), config);
}

ConfigError TextFit::load_config_from_json_data(std::string_view jsonData, Config& config) {
	simdjson::padded_string paddedData(jsonData);
	simdjson::ondemand::parser parser;
	simdjson::ondemand::document doc;

	if (parser.iterate(paddedData).get(doc) != simdjson::SUCCESS) {
		return ConfigError::INVALID_JSON;
	}

	simdjson::ondemand::object root;
	if (doc.get(root) != simdjson::SUCCESS) {
		return ConfigError::INVALID_JSON;
	}

	auto result = config;

	simdjson::ondemand::object fontsObject;
	if (auto field = root["fonts"]; field.error() != simdjson::NO_SUCH_FIELD) {
		if (field.error() != simdjson::SUCCESS) {
			return ConfigError::INVALID_JSON;
		}

		if (field.get(fontsObject) != simdjson::SUCCESS) {
			return ConfigError::INVALID_VALUE;
		}

		if (auto err = read_fonts(fontsObject, result.fonts); err != ConfigError::NONE) {
			return err;
		}
	}

	simdjson::ondemand::object fitObject;
	if (auto field = root["fit"]; field.error() != simdjson::NO_SUCH_FIELD) {
		if (field.error() != simdjson::SUCCESS) {
			return ConfigError::INVALID_JSON;
		}

		if (field.get(fitObject) != simdjson::SUCCESS) {
			return ConfigError::INVALID_VALUE;
		}

		if (auto err = read_fit(fitObject, result.fit); err != ConfigError::NONE) {
			return err;
		}
	}

	simdjson::ondemand::array templateArray;
	if (auto field = root["templates"]; field.error() != simdjson::NO_SUCH_FIELD) {
		if (field.error() != simdjson::SUCCESS) {
			return ConfigError::INVALID_JSON;
		}

		if (field.get(templateArray) != simdjson::SUCCESS) {
			return ConfigError::INVALID_VALUE;
		}

		result.templates.clear();

		for (auto templateValue : templateArray) {
			simdjson::ondemand::object templateObject;
			if (templateValue.get(templateObject) != simdjson::SUCCESS) {
				return ConfigError::INVALID_VALUE;
			}

			auto& cardTemplate = result.templates.emplace_back(CardTemplate{
				.fontColor = Color::from_rgb(0.f, 0.f, 0.f),
				.strokeColor = Color::from_rgb(0.f, 0.f, 0.f),
			});

			if (auto err = read_template(templateObject, cardTemplate); err != ConfigError::NONE) {
				return err;
			}
		}
	}

	if (result.fit.minFontSize > result.fit.initialFontSize) {
		return ConfigError::INVALID_VALUE;
	}

	config = std::move(result);
	return ConfigError::NONE;
}

// Static Functions

static ConfigError read_fonts(simdjson::ondemand::object& fontsObject, FontConfig& fonts) {
	if (auto err = read_string(fontsObject, "primary", fonts.primaryUri); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_string(fontsObject, "emoji", fonts.emojiUri); err != ConfigError::NONE) {
		return err;
	}

	return read_string(fontsObject, "default", fonts.defaultUri);
}

static ConfigError read_fit(simdjson::ondemand::object& fitObject, FitConfig& fit) {
	if (auto err = read_size(fitObject, "initial_font_size", fit.initialFontSize); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_size(fitObject, "min_font_size", fit.minFontSize); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_size(fitObject, "font_size_step", fit.fontSizeStep); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_ratio(fitObject, "box_width_ratio", fit.boxWidthRatio); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_ratio(fitObject, "box_height_ratio", fit.boxHeightRatio); err != ConfigError::NONE) {
		return err;
	}

	return read_string(fitObject, "empty_placeholder", fit.emptyPlaceholder);
}

static ConfigError read_template(simdjson::ondemand::object& templateObject, CardTemplate& cardTemplate) {
	std::string_view name;
	if (templateObject["name"].get(name) != simdjson::SUCCESS || name.empty()) {
		return ConfigError::INVALID_VALUE;
	}

	cardTemplate.name = std::string(name);

	if (auto err = read_string(templateObject, "image", cardTemplate.imageUri); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_color(templateObject, "font_color", cardTemplate.fontColor); err != ConfigError::NONE) {
		return err;
	}

	if (auto err = read_color(templateObject, "stroke_color", cardTemplate.strokeColor);
			err != ConfigError::NONE) {
		return err;
	}

	int64_t strokeWidth{};
	if (auto field = templateObject["stroke_width"]; field.error() != simdjson::NO_SUCH_FIELD) {
		if (field.get(strokeWidth) != simdjson::SUCCESS || strokeWidth < 0) {
			return ConfigError::INVALID_VALUE;
		}

		cardTemplate.strokeWidth = static_cast<uint32_t>(strokeWidth);
	}

	return ConfigError::NONE;
}

static ConfigError read_string(simdjson::ondemand::object& object, std::string_view key, std::string& out) {
	auto field = object[key];

	if (field.error() == simdjson::NO_SUCH_FIELD) {
		return ConfigError::NONE;
	}

	std::string_view value;
	if (field.get(value) != simdjson::SUCCESS) {
		return ConfigError::INVALID_VALUE;
	}

	out = std::string(value);
	return ConfigError::NONE;
}

static ConfigError read_size(simdjson::ondemand::object& object, std::string_view key, uint32_t& out) {
	auto field = object[key];

	if (field.error() == simdjson::NO_SUCH_FIELD) {
		return ConfigError::NONE;
	}

	int64_t value;
	if (field.get(value) != simdjson::SUCCESS || value <= 0 || value > UINT16_MAX) {
		return ConfigError::INVALID_VALUE;
	}

	out = static_cast<uint32_t>(value);
	return ConfigError::NONE;
}

static ConfigError read_ratio(simdjson::ondemand::object& object, std::string_view key, float& out) {
	auto field = object[key];

	if (field.error() == simdjson::NO_SUCH_FIELD) {
		return ConfigError::NONE;
	}

	double value;
	if (field.get(value) != simdjson::SUCCESS || value <= 0.0 || value > 1.0) {
		return ConfigError::INVALID_VALUE;
	}

	out = static_cast<float>(value);
	return ConfigError::NONE;
}

static ConfigError read_color(simdjson::ondemand::object& object, std::string_view key, Color& out) {
	auto field = object[key];

	if (field.error() == simdjson::NO_SUCH_FIELD) {
		return ConfigError::NONE;
	}

	simdjson::ondemand::array components;
	if (field.get(components) != simdjson::SUCCESS) {
		return ConfigError::INVALID_VALUE;
	}

	float rgb[3]{};
	size_t count = 0;

	for (auto componentValue : components) {
		int64_t component;
		if (componentValue.get(component) != simdjson::SUCCESS || component < 0 || component > 255
				|| count >= 3) {
			return ConfigError::INVALID_VALUE;
		}

		rgb[count++] = static_cast<float>(component);
	}

	if (count != 3) {
		return ConfigError::INVALID_VALUE;
	}

	out = Color::from_rgb(rgb[0], rgb[1], rgb[2]);
	return ConfigError::NONE;
}
