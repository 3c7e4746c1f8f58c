#pragma once

#include <vector>

#include <cstdio>
#include <cstddef>

namespace TextFit {

/**
 * Reads the whole file into memory. Returns an empty vector if the file cannot be read.
 */
inline std::vector<char> file_read_bytes(const char* fileName) {
	FILE* file = std::fopen(fileName, "rb");

	if (!file) {
		return {};
	}

	std::fseek(file, 0, SEEK_END);
	auto fileSize = std::ftell(file);
	std::rewind(file);

	if (fileSize < 0) {
		std::fclose(file);
		return {};
	}

	std::vector<char> result(static_cast<size_t>(fileSize));

	auto bytesRead = std::fread(result.data(), 1, result.size(), file);
	std::fclose(file);

	if (bytesRead != result.size()) {
		return {};
	}

	return result;
}

}
