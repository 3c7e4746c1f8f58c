#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace TextFit {

/**
 * Greedily word-wraps the UTF-8 string `text` so that no line exceeds `charsPerLine` code points.
 *
 * Chunks are delimited by ASCII whitespace; each whitespace character occupies one column and is emitted as
 * U+0020. A chunk longer than `charsPerLine` is broken without inserting a hyphen: its head fills whatever
 * space remains on the current line and the remainder continues on the following lines. Whitespace at the
 * end of a line, and at the start of any line after the first, is dropped.
 *
 * `outLines` is cleared first. Empty or whitespace-only input produces no lines. `charsPerLine` values below
 * 1 are treated as 1.
 */
void wrap_text(std::string_view text, int32_t charsPerLine, std::vector<std::string>& outLines);

}
