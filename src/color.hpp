#pragma once

#include <cstdint>

namespace TextFit {

struct Color {
	float r;
	float g;
	float b;
	float a;

	static constexpr Color from_rgb(float r, float g, float b, float a = 255.f) {
		return {r / 255.f, g / 255.f, b / 255.f, a / 255.f};
	}

	static constexpr uint32_t to_rgba(const Color& c) {
		return ((static_cast<uint32_t>(c.r * 255.f + 0.5f) & 0xFFu) << 24)
				| ((static_cast<uint32_t>(c.g * 255.f + 0.5f) & 0xFFu) << 16)
				| ((static_cast<uint32_t>(c.b * 255.f + 0.5f) & 0xFFu) << 8)
				| ((static_cast<uint32_t>(c.a * 255.f + 0.5f) & 0xFFu) << 0);
	}

	constexpr bool operator==(const Color& other) const {
		return to_rgba(*this) == to_rgba(other);
	}
};

}
