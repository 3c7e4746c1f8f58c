#include "line_wrapper.hpp"

#include "utf8_util.hpp"

#include <algorithm>

using namespace TextFit;

namespace {

struct Chunk {
	std::string_view text;
	int32_t length;
	bool whitespace;
};

}

static constexpr bool is_wrap_whitespace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static void split_chunks(std::string_view text, std::vector<Chunk>& chunks);
static void append_chunk(std::string& line, const Chunk& chunk);

void TextFit::wrap_text(std::string_view text, int32_t charsPerLine, std::vector<std::string>& outLines) {
	outLines.clear();

	auto width = std::max<int32_t>(charsPerLine, 1);

	std::vector<Chunk> chunks;
	split_chunks(text, chunks);

	std::vector<Chunk> lineChunks;
	size_t next = 0;

	while (next < chunks.size()) {
		lineChunks.clear();
		int32_t lineLength = 0;

		if (chunks[next].whitespace && !outLines.empty()) {
			++next;
		}

		while (next < chunks.size() && lineLength + chunks[next].length <= width) {
			lineLength += chunks[next].length;
			lineChunks.emplace_back(chunks[next]);
			++next;
		}

		// Break the chunk that can never fit on any line
		if (next < chunks.size() && chunks[next].length > width) {
			auto& chunk = chunks[next];
			auto spaceLeft = width - lineLength;

			if (spaceLeft > 0) {
				auto splitOffset = static_cast<size_t>(advance_code_points(chunk.text, 0, spaceLeft));
				lineChunks.push_back({chunk.text.substr(0, splitOffset), spaceLeft, chunk.whitespace});
				chunk.text.remove_prefix(splitOffset);
				chunk.length -= spaceLeft;
			}
		}

		if (!lineChunks.empty() && lineChunks.back().whitespace) {
			lineChunks.pop_back();
		}

		if (!lineChunks.empty()) {
			auto& line = outLines.emplace_back();

			for (auto& chunk : lineChunks) {
				append_chunk(line, chunk);
			}
		}
	}
}

static void split_chunks(std::string_view text, std::vector<Chunk>& chunks) {
	size_t start = 0;

	while (start < text.size()) {
		bool whitespace = is_wrap_whitespace(text[start]);
		auto end = start + 1;

		while (end < text.size() && is_wrap_whitespace(text[end]) == whitespace) {
			++end;
		}

		auto chunkText = text.substr(start, end - start);
		chunks.push_back({
			.text = chunkText,
			.length = whitespace ? static_cast<int32_t>(chunkText.size()) : count_code_points(chunkText),
			.whitespace = whitespace,
		});

		start = end;
	}
}

static void append_chunk(std::string& line, const Chunk& chunk) {
	if (chunk.whitespace) {
		line.append(static_cast<size_t>(chunk.length), ' ');
	}
	else {
		line.append(chunk.text);
	}
}
