#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace text {

// Table-driven, case-insensitive substitutions. A key may list several
// comma-separated variants that all map to the same replacement
// ("gonna, gunna" -> "going to"). Rules apply in key order.
class WordReplacer {
public:
    WordReplacer() = default;
    explicit WordReplacer(const std::map<std::string, std::string>& table);

    std::string apply(const std::string& s) const;
    bool empty() const { return rules_.empty(); }

private:
    struct Rule {
        std::regex pattern;
        std::string replacement;
    };
    std::vector<Rule> rules_;
};

} // namespace text
