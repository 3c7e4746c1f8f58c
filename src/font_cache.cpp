#include "font_cache.hpp"

#include "log.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <cmath>
#include <cstdlib>
#include <mutex>

using namespace TextFit;

struct FontCache::FaceData {
	std::string name;
	FileMapping mapping;
	const FileMappingFunctions* pFileFuncs;

	explicit FaceData(std::string nameIn, FileMapping mappingIn, const FileMappingFunctions& fileFuncs)
			: name(std::move(nameIn))
			, mapping(mappingIn)
			, pFileFuncs(&fileFuncs) {}

	FaceData(const FaceData&) = delete;
	void operator=(const FaceData&) = delete;

	~FaceData() {
		if (mapping.valid()) {
			pFileFuncs->pfnUnmapFile(mapping);
		}
	}
};

struct FontCache::FontDataOwner {
	FT_Face ftFace{};
	hb_font_t* hbFont{};
	float scale{1.f};

	FontDataOwner() = default;

	FontDataOwner(const FontDataOwner&) = delete;
	void operator=(const FontDataOwner&) = delete;

	~FontDataOwner() {
		if (hbFont) {
			hb_font_destroy(hbFont);
		}

		if (ftFace) {
			FT_Done_Face(ftFace);
		}
	}

	FontData get_font_data() const {
		return FontData{
			.ftFace = ftFace,
			.hbFont = hbFont,
			.scale = scale,
		};
	}
};

static constexpr uint64_t make_font_key(FontFace face, uint32_t size) {
	return (static_cast<uint64_t>(face.handle) << 32) | size;
}

static bool set_face_size(FT_Face face, uint32_t size, float& outScale);

FontCache::FontCache(const FileMappingFunctions& fileFuncs)
		: m_fileFuncs(fileFuncs) {
	if (FT_Init_FreeType(&m_ftLibrary) != 0) {
		TEXTFIT_LOG_ERROR("Failed to initialize FreeType");
		m_ftLibrary = nullptr;
	}
}

FontCache::~FontCache() {
	// Faces must be released before the library that created them
	m_fonts.clear();
	m_faces.clear();

	if (m_ftLibrary) {
		FT_Done_FreeType(m_ftLibrary);
	}
}

FontCacheError FontCache::register_face(const FontFaceCreateInfo& faceInfo, FontFace& outFace) {
	std::unique_lock lock(m_mutex);

	if (auto it = m_facesByName.find(faceInfo.name); it != m_facesByName.end()) {
		outFace = it->second;
		return FontCacheError::ALREADY_LOADED;
	}

	auto mapping = m_fileFuncs.pfnMapFile(faceInfo.uri);

	if (!mapping.valid()) {
		return FontCacheError::FILE_NOT_FOUND;
	}

	auto faceData = std::make_unique<FaceData>(std::string(faceInfo.name), mapping, m_fileFuncs);

	// Validate the file once so that bad files are rejected here rather than on first measurement
	FT_Face probe{};

	if (!m_ftLibrary || FT_New_Memory_Face(m_ftLibrary, reinterpret_cast<const FT_Byte*>(mapping.mapping),
			static_cast<FT_Long>(mapping.size), 0, &probe) != 0) {
		return FontCacheError::INVALID_FONT;
	}

	FT_Done_Face(probe);

	FontFace face{static_cast<FaceIndex_T>(m_faces.size())};
	m_faces.emplace_back(std::move(faceData));
	m_facesByName.emplace(std::string(faceInfo.name), face);

	outFace = face;
	return FontCacheError::NONE;
}

FontFace FontCache::get_face(std::string_view name) const {
	std::shared_lock lock(m_mutex);

	if (auto it = m_facesByName.find(name); it != m_facesByName.end()) {
		return it->second;
	}

	return {};
}

void FontCache::set_default_face(FontFace face) {
	std::unique_lock lock(m_mutex);
	m_defaultFace = face;
}

FontFace FontCache::get_default_face() const {
	std::shared_lock lock(m_mutex);
	return m_defaultFace;
}

FontData FontCache::get_font_data(FontFace face, uint32_t size) {
	if (auto fontData = get_exact_font_data(face, size)) {
		return fontData;
	}

	auto defaultFace = get_default_face();

	if (defaultFace && defaultFace != face) {
		return get_exact_font_data(defaultFace, size);
	}

	return {};
}

FontData FontCache::get_exact_font_data(FontFace face, uint32_t size) {
	if (!face || size == 0) {
		return {};
	}

	if (auto fontData = find_loaded(face, size)) {
		return fontData;
	}

	return load_font(face, size);
}

size_t FontCache::preload(FontFace face, uint32_t minSize, uint32_t maxSize, uint32_t step) {
	if (step == 0 || minSize == 0) {
		return 0;
	}

	size_t loadedCount = 0;

	for (auto size = static_cast<int64_t>(maxSize); size >= minSize; size -= step) {
		if (get_exact_font_data(face, static_cast<uint32_t>(size))) {
			++loadedCount;
		}
	}

	return loadedCount;
}

FontData FontCache::find_loaded(FontFace face, uint32_t size) const {
	std::shared_lock lock(m_mutex);

	if (auto it = m_fonts.find(make_font_key(face, size)); it != m_fonts.end()) {
		return it->second->get_font_data();
	}

	return {};
}

FontData FontCache::load_font(FontFace face, uint32_t size) {
	std::unique_lock lock(m_mutex);

	auto key = make_font_key(face, size);

	// Another thread may have loaded the font while the lock was released
	if (auto it = m_fonts.find(key); it != m_fonts.end()) {
		return it->second->get_font_data();
	}

	if (!m_ftLibrary || face.handle >= m_faces.size()) {
		return {};
	}

	auto& faceData = *m_faces[face.handle];
	auto owner = std::make_unique<FontDataOwner>();

	if (FT_New_Memory_Face(m_ftLibrary, reinterpret_cast<const FT_Byte*>(faceData.mapping.mapping),
			static_cast<FT_Long>(faceData.mapping.size), 0, &owner->ftFace) != 0) {
		owner->ftFace = nullptr;
		TEXTFIT_LOG_ERROR("Failed to load face '%s'", faceData.name.c_str());
		return {};
	}

	if (!set_face_size(owner->ftFace, size, owner->scale)) {
		TEXTFIT_LOG_ERROR("Face '%s' cannot be sized to %upx", faceData.name.c_str(), size);
		return {};
	}

	owner->hbFont = hb_ft_font_create_referenced(owner->ftFace);

	if (!owner->hbFont) {
		return {};
	}

	hb_ft_font_set_load_flags(owner->hbFont, FT_LOAD_DEFAULT | FT_LOAD_NO_HINTING | FT_LOAD_COLOR);
	hb_font_make_immutable(owner->hbFont);

	auto fontData = owner->get_font_data();
	m_fonts.emplace(key, std::move(owner));

	return fontData;
}

static bool set_face_size(FT_Face face, uint32_t size, float& outScale) {
	if (FT_IS_SCALABLE(face)) {
		FT_Size_RequestRec sr{
			.type = FT_SIZE_REQUEST_TYPE_NOMINAL,
			.width = 0,
			.height = static_cast<FT_Long>(size) * 64,
		};

		outScale = 1.f;
		return FT_Request_Size(face, &sr) == 0;
	}

	// Bitmap-only faces (colour emoji) provide a fixed set of strikes; pick the closest and scale advances
	if (face->num_fixed_sizes <= 0) {
		return false;
	}

	FT_Int bestIndex = 0;
	FT_Pos bestDistance = -1;

	for (FT_Int i = 0; i < face->num_fixed_sizes; ++i) {
		auto distance = std::labs(face->available_sizes[i].y_ppem - static_cast<FT_Pos>(size) * 64);

		if (bestDistance < 0 || distance < bestDistance) {
			bestIndex = i;
			bestDistance = distance;
		}
	}

	if (FT_Select_Size(face, bestIndex) != 0) {
		return false;
	}

	auto strikeSize = std::scalbn(static_cast<float>(face->available_sizes[bestIndex].y_ppem), -6);
	outScale = strikeSize > 0.f ? static_cast<float>(size) / strikeSize : 1.f;

	return true;
}
