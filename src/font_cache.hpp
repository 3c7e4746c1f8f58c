#pragma once

#include "file_mapping.hpp"
#include "font_common.hpp"
#include "font_data.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct FT_LibraryRec_;

namespace TextFit {

struct FontFaceCreateInfo {
	std::string_view name;
	std::string_view uri;
};

enum class FontCacheError {
	NONE,
	ALREADY_LOADED,
	FILE_NOT_FOUND,
	INVALID_FONT,
};

/**
 * Owns every font resource used for measurement: the FreeType library, the mapped font files and one
 * (FreeType face, HarfBuzz font) pair per face and pixel size. Created once by the application and passed by
 * reference to the metrics providers.
 *
 * @thread_safety All member functions are thread safe. Loading a new size takes an exclusive lock, lookups
 * of already loaded sizes share the lock. Loaded entries are never modified or evicted.
 */
class FontCache final {
	public:
		explicit FontCache(const FileMappingFunctions& fileFuncs = {
			.pfnMapFile = map_file_default,
			.pfnUnmapFile = unmap_file_default,
		});
		~FontCache();

		FontCache(const FontCache&) = delete;
		void operator=(const FontCache&) = delete;

		/**
		 * Maps the font file at `uri` and validates it with FreeType. On success `outFace` receives the handle
		 * of the new face. If a face with the same name already exists, `outFace` receives that face and
		 * `ALREADY_LOADED` is returned.
		 */
		[[nodiscard]] FontCacheError register_face(const FontFaceCreateInfo& faceInfo, FontFace& outFace);

		/**
		 * Gets the handle of a registered face, or an invalid handle if no face with `name` exists.
		 */
		[[nodiscard]] FontFace get_face(std::string_view name) const;

		/**
		 * Sets the face used whenever a requested face is invalid or fails to load.
		 */
		void set_default_face(FontFace face);
		[[nodiscard]] FontFace get_default_face() const;

		/**
		 * Gets the font data for `face` at `size` pixels per em, loading it on first use. Falls back to the
		 * default face if `face` is invalid or cannot be loaded. The result is invalid only if neither face
		 * could be loaded.
		 */
		[[nodiscard]] FontData get_font_data(FontFace face, uint32_t size);

		/**
		 * Same as `get_font_data`, but never substitutes the default face.
		 */
		[[nodiscard]] FontData get_exact_font_data(FontFace face, uint32_t size);

		/**
		 * Loads every size from `maxSize` down to `minSize` in decrements of `step`. Returns the number of
		 * sizes that are available afterwards.
		 */
		size_t preload(FontFace face, uint32_t minSize, uint32_t maxSize, uint32_t step);
	private:
		struct FaceData;
		struct FontDataOwner;

		// Lets the name map be searched with a std::string_view
		struct NameHash {
			using is_transparent = void;

			size_t operator()(std::string_view name) const {
				return std::hash<std::string_view>{}(name);
			}
		};

		FileMappingFunctions m_fileFuncs;
		FT_LibraryRec_* m_ftLibrary{};

		std::vector<std::unique_ptr<FaceData>> m_faces;
		std::unordered_map<std::string, FontFace, NameHash, std::equal_to<>> m_facesByName;
		std::unordered_map<uint64_t, std::unique_ptr<FontDataOwner>> m_fonts;
		FontFace m_defaultFace{};

		mutable std::shared_mutex m_mutex;

		FontData find_loaded(FontFace face, uint32_t size) const;
		FontData load_font(FontFace face, uint32_t size);
};

}
