#pragma once

#include <string>

namespace text {

// Strips backend artifacts from raw transcripts: <tag>...</tag> blocks,
// bracketed annotations like [BLANK_AUDIO] or (music), filler words, and
// runs of whitespace.
std::string filter_output(const std::string& raw);

// Removes <think>, <thinking> and <reasoning> blocks that chat models emit
// ahead of their answer. Line breaks in the answer are kept.
std::string strip_reasoning(const std::string& reply);

std::string trim(const std::string& s);

} // namespace text
