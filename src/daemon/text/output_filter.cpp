#include "text/output_filter.hpp"

#include <regex>

namespace text {

namespace {

const std::regex& tag_block_re() {
    static const std::regex re(R"(<([A-Za-z][A-Za-z0-9:_-]*)[^>]*>[\s\S]*?</\1>)");
    return re;
}

const std::regex& bracket_re() {
    static const std::regex re(R"(\[[^\]]*\]|\([^)]*\)|\{[^}]*\})");
    return re;
}

const std::regex& filler_re() {
    static const std::regex re(
        R"(\b(uh|um|uhm|umm|uhh|uhhh|ah|eh|hmm|hm|mmm|mm|mh|ha|ehh)\b[,.]?)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& reasoning_re() {
    static const std::regex re(R"(<(think|thinking|reasoning)>[\s\S]*?</\1>)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& spaces_re() {
    static const std::regex re(R"(\s{2,})");
    return re;
}

} // namespace

std::string filter_output(const std::string& raw) {
    std::string out = std::regex_replace(raw, tag_block_re(), "");
    out = std::regex_replace(out, bracket_re(), "");
    out = std::regex_replace(out, filler_re(), "");
    out = std::regex_replace(out, spaces_re(), " ");
    return trim(out);
}

std::string strip_reasoning(const std::string& reply) {
    return trim(std::regex_replace(reply, reasoning_re(), ""));
}

std::string trim(const std::string& s) {
    constexpr const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace text
