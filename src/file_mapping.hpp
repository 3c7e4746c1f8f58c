#pragma once

#include <cstddef>
#include <string_view>

namespace TextFit {

/**
 * A read-only view of a font file held in memory. `mapping` is `nullptr` if the file could not be opened.
 */
struct FileMapping {
	const void* mapping;
	size_t size;

	constexpr bool valid() const {
		return mapping != nullptr;
	}
};

struct FileMappingFunctions {
	FileMapping (*pfnMapFile)(std::string_view fileName);
	void (*pfnUnmapFile)(const FileMapping& mapping);
};

/**
 * @brief Maps `fileName` into memory with `mmap` where available, otherwise reads it into a heap buffer.
 */
[[nodiscard]] FileMapping map_file_default(std::string_view fileName);
/**
 * @brief Releases a mapping returned by `map_file_default`. Must only be called with valid mappings.
 */
void unmap_file_default(const FileMapping& mapping);

}
