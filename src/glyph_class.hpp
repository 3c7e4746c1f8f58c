#pragma once

#include <cstdint>

namespace TextFit {

enum class GlyphClass : uint8_t {
	PLAIN,
	EMOJI_AWARE,
};

}
