#pragma once

#include <cstdint>
#include <string_view>

struct FT_FaceRec_;
struct hb_font_t;

namespace TextFit {

/**
 * Non-owning handle to a FreeType face and HarfBuzz font sized to a single pixel size. Handles are obtained
 * from a `FontCache` and stay valid for the lifetime of that cache.
 */
struct FontData {
	FT_FaceRec_* ftFace;
	hb_font_t* hbFont;
	// Factor from the loaded size to the requested size. Differs from 1 only for bitmap-only faces, which are
	// loaded at their closest fixed strike.
	float scale;

	constexpr bool valid() const {
		return ftFace && hbFont;
	}

	constexpr explicit operator bool() const {
		return valid();
	}

	float get_ascent() const;
	float get_descent() const;
	float get_line_height() const;

	bool has_codepoint(uint32_t codepoint) const;

	/**
	 * Shapes the UTF-8 string `text` with HarfBuzz and returns its total horizontal advance in pixels.
	 *
	 * @thread_safety Thread safe. HarfBuzz serializes access to the underlying FreeType face.
	 */
	float get_text_advance(std::string_view text) const;
};

}
