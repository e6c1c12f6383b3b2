#include "text/paragraph_formatter.hpp"

#include <sstream>

namespace text {

namespace {

bool ends_sentence(const std::string& word) {
    // Skip closing quotes/brackets: `done."` still ends a sentence.
    auto pos = word.find_last_not_of("\"')]");
    if (pos == std::string::npos) return false;
    char c = word[pos];
    return c == '.' || c == '!' || c == '?';
}

} // namespace

size_t count_words(const std::string& s) {
    std::istringstream in(s);
    size_t n = 0;
    for (std::string w; in >> w;) ++n;
    return n;
}

std::vector<std::string> split_sentences(const std::string& s) {
    std::vector<std::string> sentences;
    std::istringstream in(s);
    std::string current;

    for (std::string word; in >> word;) {
        if (!current.empty()) current += ' ';
        current += word;
        if (ends_sentence(word)) {
            sentences.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) sentences.push_back(std::move(current));
    return sentences;
}

std::string format_paragraphs(const std::string& s, const SentenceMeasure& measure) {
    auto sentences = split_sentences(s);

    std::string out;
    std::string paragraph;
    size_t words = 0;
    size_t significant = 0;

    auto flush = [&] {
        if (paragraph.empty()) return;
        if (!out.empty()) out += "\n\n";
        out += paragraph;
        paragraph.clear();
        words = 0;
        significant = 0;
    };

    for (const auto& sentence : sentences) {
        size_t n = measure ? measure(sentence) : count_words(sentence);
        if (!paragraph.empty()) paragraph += ' ';
        paragraph += sentence;
        words += n;
        if (n >= SIGNIFICANT_SENTENCE_WORDS) ++significant;

        if (words >= PARAGRAPH_TARGET_WORDS || significant >= PARAGRAPH_MAX_SENTENCES) {
            flush();
        }
    }
    flush();
    return out;
}

} // namespace text
