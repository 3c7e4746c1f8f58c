#include "glyph_metrics.hpp"

#include "emoji_classifier.hpp"
#include "font_cache.hpp"

#include <unicode/utf8.h>

#include <algorithm>

using namespace TextFit;

static constexpr const UChar32 CH_ZWJ = 0x200D;
static constexpr const UChar32 CH_VS15 = 0xFE0E;
static constexpr const UChar32 CH_VS16 = 0xFE0F;
static constexpr const UChar32 CH_KEYCAP = 0x20E3;

static constexpr bool is_emoji_continuation(UChar32 c) {
	return c == CH_ZWJ || c == CH_VS15 || c == CH_VS16 || c == CH_KEYCAP;
}

static void measure_plain(const FontData& fontData, std::string_view text, TextExtents& outExtents) {
	outExtents.width = fontData.get_text_advance(text);
	outExtents.height = fontData.get_line_height();
}

// GlyphMetrics

bool GlyphMetrics::measure_width(std::string_view text, uint32_t size, float& outWidth) const {
	TextExtents extents{};

	if (!measure(text, size, extents)) {
		return false;
	}

	outWidth = extents.width;
	return true;
}

// PlainMetrics

PlainMetrics::PlainMetrics(FontCache& fontCache, FontFace face)
		: m_fontCache(&fontCache)
		, m_face(face) {}

bool PlainMetrics::measure(std::string_view text, uint32_t size, TextExtents& outExtents) const {
	auto fontData = m_fontCache->get_font_data(m_face, size);

	if (!fontData) {
		return false;
	}

	measure_plain(fontData, text, outExtents);
	return true;
}

// CompositeMetrics

CompositeMetrics::CompositeMetrics(FontCache& fontCache, FontFace primaryFace, FontFace emojiFace)
		: m_fontCache(&fontCache)
		, m_primaryFace(primaryFace)
		, m_emojiFace(emojiFace) {}

bool CompositeMetrics::measure(std::string_view text, uint32_t size, TextExtents& outExtents) const {
	auto primary = m_fontCache->get_font_data(m_primaryFace, size);

	if (!primary) {
		return false;
	}

	FontData emoji{};

	if (m_emojiFace) {
		emoji = m_fontCache->get_exact_font_data(m_emojiFace, size);
	}

	if (emoji) {
		measure_runs(primary, emoji, text, outExtents);
	}
	else {
		measure_plain(primary, text, outExtents);
	}

	return true;
}

bool CompositeMetrics::is_compositor_available(uint32_t size) const {
	return m_emojiFace && m_fontCache->get_exact_font_data(m_emojiFace, size);
}

void CompositeMetrics::measure_runs(const FontData& primary, const FontData& emoji, std::string_view text,
		TextExtents& outExtents) const {
	auto length = static_cast<int32_t>(text.size());
	int32_t offset = 0;
	int32_t runStart = 0;
	bool runIsEmoji = false;
	bool anyEmoji = false;
	float width = 0.f;

	auto flushRun = [&](int32_t runEnd) {
		auto run = text.substr(static_cast<size_t>(runStart), static_cast<size_t>(runEnd - runStart));
		width += runIsEmoji ? emoji.get_text_advance(run) : primary.get_text_advance(run);
		anyEmoji = anyEmoji || runIsEmoji;
	};

	while (offset < length) {
		auto charStart = offset;
		UChar32 c;
		U8_NEXT(text.data(), offset, length, c);

		bool charIsEmoji = (runIsEmoji && charStart != runStart && is_emoji_continuation(c))
				|| (is_emoji(c) && emoji.has_codepoint(static_cast<uint32_t>(c)));

		if (charStart != runStart && charIsEmoji != runIsEmoji) {
			flushRun(charStart);
			runStart = charStart;
		}

		runIsEmoji = charIsEmoji;
	}

	if (runStart < length) {
		flushRun(length);
	}

	outExtents.width = width;
	outExtents.height = anyEmoji ? std::max(primary.get_line_height(), emoji.get_line_height() * EMOJI_SCALE)
			: primary.get_line_height();
}
