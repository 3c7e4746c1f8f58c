#include "card_layout.hpp"
#include "config.hpp"
#include "font_cache.hpp"
#include "glyph_metrics.hpp"
#include "log.hpp"

#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>

using namespace TextFit;

namespace {

struct Arguments {
	const char* configPath{};
	std::string_view templateName{"good"};
	uint32_t imageWidth{};
	uint32_t imageHeight{};
	std::string text;
};

}

static constexpr const int EXIT_USAGE = 1;
static constexpr const int EXIT_NO_FONT = 2;

static bool parse_arguments(int argc, char** argv, Arguments& args);
static bool parse_image_size(std::string_view str, uint32_t& outWidth, uint32_t& outHeight);
static FontFace register_font(FontCache& fontCache, std::string_view name, const std::string& uri);
static void print_usage(const char* programName);

int main(int argc, char** argv) {
	Arguments args{};

	if (!parse_arguments(argc, argv, args)) {
		print_usage(argv[0]);
		return EXIT_USAGE;
	}

	auto config = make_default_config();

	if (args.configPath) {
		if (auto err = load_config_from_json_file(args.configPath, config); err != ConfigError::NONE) {
			TEXTFIT_LOG_ERROR("Failed to load config '%s': %s", args.configPath, config_error_to_string(err));
			return EXIT_USAGE;
		}
	}

	FontCache fontCache;

	auto primaryFace = register_font(fontCache, "primary", config.fonts.primaryUri);
	auto defaultFace = register_font(fontCache, "default", config.fonts.defaultUri);
	auto emojiFace = register_font(fontCache, "emoji", config.fonts.emojiUri);

	fontCache.set_default_face(defaultFace);

	if (!primaryFace && !defaultFace) {
		TEXTFIT_LOG_ERROR("No usable font");
		return EXIT_NO_FONT;
	}

	if (fontCache.preload(primaryFace ? primaryFace : defaultFace, config.fit.minFontSize,
			config.fit.initialFontSize, config.fit.fontSizeStep) == 0) {
		TEXTFIT_LOG_WARNING("Primary font could not be loaded at any configured size");
	}

	PlainMetrics plainMetrics(fontCache, primaryFace);
	CompositeMetrics compositeMetrics(fontCache, primaryFace, emojiFace);

	if (!compositeMetrics.is_compositor_available(config.fit.initialFontSize)) {
		TEXTFIT_LOG_WARNING("Emoji font unavailable, emoji widths are approximated with the primary font");
	}

	MetricsSet metrics{
		.pPlain = &plainMetrics,
		.pEmojiAware = &compositeMetrics,
	};

	CardLayout layout{};

	if (auto err = build_card_layout(config, metrics, args.templateName, args.imageWidth, args.imageHeight,
			args.text, layout); err != CardError::NONE) {
		TEXTFIT_LOG_ERROR("Failed to lay out card: %s", card_error_to_string(err));
		return err == CardError::FONT_UNAVAILABLE ? EXIT_NO_FONT : EXIT_USAGE;
	}

	std::printf("template: %s (%s, color #%08x)\n", layout.pTemplate->name.c_str(),
			layout.pTemplate->imageUri.c_str(), Color::to_rgba(layout.pTemplate->fontColor));
	std::printf("box: %.1f %.1f %.1f %.1f\n", layout.boxX, layout.boxY, layout.boxWidth, layout.boxHeight);
	std::printf("font size: %u\n", layout.fit.fontSize);
	std::printf("chars per line: %d\n", layout.fit.charsPerLine);
	std::printf("fit: %s\n", layout.fit.fitGuaranteed ? "guaranteed" : "overflow");

	for (size_t i = 0; i < layout.fit.lines.size(); ++i) {
		auto& placement = layout.placements[i];
		std::printf("line %zu: x=%.1f y=%.1f w=%.1f%s \"%s\"\n", i, placement.x, placement.y, placement.width,
				placement.skipDraw ? " (blank)" : "", layout.fit.lines[i].c_str());
	}

	return 0;
}

static bool parse_arguments(int argc, char** argv, Arguments& args) {
	bool hasSize = false;

	for (int i = 1; i < argc; ++i) {
		std::string_view arg = argv[i];

		if (arg == "--config" && i + 1 < argc) {
			args.configPath = argv[++i];
		}
		else if (arg == "--template" && i + 1 < argc) {
			args.templateName = argv[++i];
		}
		else if (arg == "--size" && i + 1 < argc) {
			if (!parse_image_size(argv[++i], args.imageWidth, args.imageHeight)) {
				return false;
			}

			hasSize = true;
		}
		else if (arg.starts_with("--")) {
			return false;
		}
		else {
			if (!args.text.empty()) {
				args.text.push_back(' ');
			}

			args.text.append(arg);
		}
	}

	return hasSize;
}

static bool parse_image_size(std::string_view str, uint32_t& outWidth, uint32_t& outHeight) {
	auto sep = str.find('x');

	if (sep == std::string_view::npos) {
		return false;
	}

	auto* widthEnd = str.data() + sep;
	auto* heightEnd = str.data() + str.size();

	if (auto [ptr, ec] = std::from_chars(str.data(), widthEnd, outWidth); ec != std::errc{} || ptr != widthEnd) {
		return false;
	}

	if (auto [ptr, ec] = std::from_chars(widthEnd + 1, heightEnd, outHeight); ec != std::errc{}
			|| ptr != heightEnd) {
		return false;
	}

	return outWidth > 0 && outHeight > 0;
}

static FontFace register_font(FontCache& fontCache, std::string_view name, const std::string& uri) {
	FontFace face{};

	switch (fontCache.register_face({.name = name, .uri = uri}, face)) {
		case FontCacheError::NONE:
		case FontCacheError::ALREADY_LOADED:
			break;
		case FontCacheError::FILE_NOT_FOUND:
			TEXTFIT_LOG_WARNING("Font file '%s' not found", uri.c_str());
			break;
		case FontCacheError::INVALID_FONT:
			TEXTFIT_LOG_WARNING("Font file '%s' is not a supported font", uri.c_str());
			break;
	}

	return face;
}

static void print_usage(const char* programName) {
	std::fprintf(stderr, "usage: %s [--config FILE] [--template NAME] --size WIDTHxHEIGHT TEXT...\n",
			programName);
}
