#pragma once

#include <cstdint>

namespace TextFit {

using FaceIndex_T = uint16_t;

struct FontFace {
	static constexpr const FaceIndex_T INVALID_FACE = static_cast<FaceIndex_T>(~0u);

	FaceIndex_T handle{INVALID_FACE};

	constexpr bool operator==(const FontFace& other) const {
		return handle == other.handle;
	}

	constexpr bool operator!=(const FontFace& other) const {
		return !(*this == other);
	}

	constexpr bool valid() const {
		return handle != INVALID_FACE;
	}

	constexpr explicit operator bool() const {
		return valid();
	}
};

// Emoji glyphs are drawn larger than the surrounding text; only the rendered line height reflects this
constexpr const float EMOJI_SCALE = 1.3f;

}
