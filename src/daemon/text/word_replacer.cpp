#include "text/word_replacer.hpp"

#include "text/output_filter.hpp"

#include <cctype>

namespace text {

namespace {

bool is_word_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x80 && (std::isalnum(u) || c == '_');
}

bool has_non_ascii(const std::string& s) {
    for (char c : s) {
        if (static_cast<unsigned char>(c) >= 0x80) return true;
    }
    return false;
}

std::string escape_regex(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

// `$` in a replacement is a backreference for regex_replace.
std::string escape_replacement(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '$') out += '$';
        out += c;
    }
    return out;
}

std::vector<std::string> split_variants(const std::string& key) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= key.size()) {
        auto comma = key.find(',', start);
        auto part = trim(key.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start));
        if (!part.empty()) out.push_back(std::move(part));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

} // namespace

WordReplacer::WordReplacer(const std::map<std::string, std::string>& table) {
    for (const auto& [key, replacement] : table) {
        for (const auto& variant : split_variants(key)) {
            std::string pattern = escape_regex(variant);

            // Scripts without spaces between words (CJK, Thai) match anywhere.
            if (!has_non_ascii(variant)) {
                if (is_word_char(variant.front())) pattern = R"(\b)" + pattern;
                if (is_word_char(variant.back())) pattern += R"(\b)";
            }

            rules_.push_back(Rule{
                .pattern = std::regex(pattern, std::regex::ECMAScript | std::regex::icase),
                .replacement = escape_replacement(replacement),
            });
        }
    }
}

std::string WordReplacer::apply(const std::string& s) const {
    std::string out = s;
    for (const auto& rule : rules_) {
        out = std::regex_replace(out, rule.pattern, rule.replacement);
    }
    return out;
}

} // namespace text
