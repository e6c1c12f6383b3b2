#pragma once

#include <functional>
#include <string>
#include <vector>

namespace text {

constexpr size_t PARAGRAPH_TARGET_WORDS = 50;
constexpr size_t PARAGRAPH_MAX_SENTENCES = 4;
constexpr size_t SIGNIFICANT_SENTENCE_WORDS = 4;

using SentenceMeasure = std::function<size_t(const std::string& sentence)>;

std::vector<std::string> split_sentences(const std::string& s);
size_t count_words(const std::string& s);

// Regroups sentences into paragraphs separated by a blank line. Whitespace
// inside a sentence is normalized to single spaces. `measure` gives each
// sentence's length in words; empty means count_words.
std::string format_paragraphs(const std::string& s, const SentenceMeasure& measure = {});

} // namespace text
