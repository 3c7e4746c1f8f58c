#include "config.hpp"

#include "common.hpp"

using namespace TextFit;

const CardTemplate* Config::find_template(std::string_view name) const {
	for (auto& cardTemplate : templates) {
		if (cardTemplate.name == name) {
			return &cardTemplate;
		}
	}

	return nullptr;
}

Config TextFit::make_default_config() {
	Config config{};

	config.templates.push_back({
		.name = "good",
		.imageUri = "assets/good_news.jpg",
		.fontColor = Color::from_rgb(220.f, 48.f, 35.f),
		.strokeColor = Color::from_rgb(170.f, 0.f, 0.f),
		.strokeWidth = 0,
	});

	config.templates.push_back({
		.name = "bad",
		.imageUri = "assets/bad_news.jpg",
		.fontColor = Color::from_rgb(90.f, 90.f, 90.f),
		.strokeColor = Color::from_rgb(89.f, 88.f, 87.f),
		.strokeWidth = 0,
	});

	return config;
}

const char* TextFit::config_error_to_string(ConfigError err) {
	switch (err) {
		case ConfigError::NONE:
			return "no error";
		case ConfigError::FILE_NOT_FOUND:
			return "file not found";
		case ConfigError::INVALID_JSON:
			return "invalid JSON";
		case ConfigError::INVALID_VALUE:
			return "invalid value";
	}

	TEXTFIT_UNREACHABLE();
}
