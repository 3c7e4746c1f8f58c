#include "font_data.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

#include <cmath>

using namespace TextFit;

namespace {

struct ShapeBuffer {
	hb_buffer_t* pBuffer{hb_buffer_create()};

	ShapeBuffer() = default;
	~ShapeBuffer() {
		hb_buffer_destroy(pBuffer);
	}

	ShapeBuffer(const ShapeBuffer&) = delete;
	void operator=(const ShapeBuffer&) = delete;
};

}

static thread_local ShapeBuffer t_shapeBuffer;

float FontData::get_ascent() const {
	return std::scalbn(static_cast<float>(ftFace->size->metrics.ascender), -6) * scale;
}

float FontData::get_descent() const {
	return std::scalbn(static_cast<float>(ftFace->size->metrics.descender), -6) * scale;
}

float FontData::get_line_height() const {
	return get_ascent() - get_descent();
}

bool FontData::has_codepoint(uint32_t codepoint) const {
	hb_codepoint_t tmp;
	return hb_font_get_nominal_glyph(hbFont, codepoint, &tmp);
}

float FontData::get_text_advance(std::string_view text) const {
	if (text.empty()) {
		return 0.f;
	}

	auto* pBuffer = t_shapeBuffer.pBuffer;
	auto length = static_cast<int>(text.size());

	hb_buffer_clear_contents(pBuffer);
	hb_buffer_add_utf8(pBuffer, text.data(), length, 0, length);
	hb_buffer_guess_segment_properties(pBuffer);

	hb_shape(hbFont, pBuffer, nullptr, 0);

	unsigned glyphCount{};
	auto* glyphPositions = hb_buffer_get_glyph_positions(pBuffer, &glyphCount);
	int64_t advance{};

	for (unsigned i = 0; i < glyphCount; ++i) {
		advance += glyphPositions[i].x_advance;
	}

	return std::scalbn(static_cast<float>(advance), -6) * scale;
}
