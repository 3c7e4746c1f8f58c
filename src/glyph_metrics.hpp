#pragma once

#include "font_common.hpp"
#include "glyph_class.hpp"

#include <cstdint>
#include <string_view>

namespace TextFit {

class FontCache;
struct FontData;

struct TextExtents {
	float width;
	float height;
};

/**
 * Measures the rendered extents of a UTF-8 string at a pixel size for one glyph class.
 */
class GlyphMetrics {
	public:
		virtual ~GlyphMetrics() = default;

		/**
		 * Writes the advance width and line height of `text` at `size` to `outExtents`. Returns false if no font
		 * could be obtained for `size`.
		 *
		 * @thread_safety Implementations must be safe to call concurrently.
		 */
		[[nodiscard]] virtual bool measure(std::string_view text, uint32_t size,
				TextExtents& outExtents) const = 0;

		[[nodiscard]] bool measure_width(std::string_view text, uint32_t size, float& outWidth) const;
};

/**
 * Measures text with a single face.
 */
class PlainMetrics final : public GlyphMetrics {
	public:
		explicit PlainMetrics(FontCache& fontCache, FontFace face);

		bool measure(std::string_view text, uint32_t size, TextExtents& outExtents) const override;
	private:
		FontCache* m_fontCache;
		FontFace m_face;
};

/**
 * Measures text by laying out emoji/symbol runs with a secondary emoji face and everything else with the
 * primary face. The returned height accounts for emoji being drawn at `EMOJI_SCALE`; widths are unscaled.
 *
 * Behaves exactly like `PlainMetrics` when the emoji face is invalid or cannot be loaded.
 */
class CompositeMetrics final : public GlyphMetrics {
	public:
		explicit CompositeMetrics(FontCache& fontCache, FontFace primaryFace, FontFace emojiFace);

		bool measure(std::string_view text, uint32_t size, TextExtents& outExtents) const override;

		/**
		 * Returns true if the emoji face is registered and can be loaded at `size`.
		 */
		[[nodiscard]] bool is_compositor_available(uint32_t size) const;
	private:
		FontCache* m_fontCache;
		FontFace m_primaryFace;
		FontFace m_emojiFace;

		void measure_runs(const FontData& primary, const FontData& emoji, std::string_view text,
				TextExtents& outExtents) const;
};

/**
 * The pair of providers a fit selects from, one per `GlyphClass`.
 */
struct MetricsSet {
	const GlyphMetrics* pPlain;
	const GlyphMetrics* pEmojiAware;

	constexpr const GlyphMetrics& select(GlyphClass glyphClass) const {
		return glyphClass == GlyphClass::EMOJI_AWARE ? *pEmojiAware : *pPlain;
	}
};

}
