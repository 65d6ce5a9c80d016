#pragma once
#include <cstddef>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace syncf {

// One line of a pattern file.
//
// Plain rules name what to include and `!` rules name what to exclude from
// that inclusion; a path no rule reaches is excluded. This is the inverse of
// the usual ignore-file reading of the same dialect.
struct Rule {
    std::string pattern;        // line as written, trimmed
    std::string glob;           // without '!', leading '/' and trailing '/'
    bool negated{false};
    bool directory_only{false};
    bool anchored{false};
    std::size_t line{0};
};

struct RuleSet {
    std::string source;         // file name or "<rules>", used in diagnostics
    std::vector<Rule> rules;

    bool empty() const { return rules.empty(); }
    std::size_t size() const { return rules.size(); }
};

RuleSet parse_rules(const std::string& text, const std::string& source = "<rules>");
RuleSet load_rules(const std::filesystem::path& file);

enum class Verdict {
    Unmatched,
    Include,
    Exclude,
};

const char* to_string(Verdict v);

class Matcher {
public:
    // Throws Error(InvalidPattern) on a malformed glob or when no rule can
    // ever include anything.
    static Matcher compile(const RuleSet& rules);

    // Full decision for a path relative to the walk root, taking ancestor
    // directories into account.
    bool matches(const std::string& relative_path, bool is_directory) const;

    // Decision of the rules that match this exact path; the last one wins.
    Verdict evaluate(const std::string& relative_path, bool is_directory) const;

    // Own verdict if any rule matches the path, otherwise the inherited one.
    Verdict resolve(const std::string& relative_path, bool is_directory, Verdict inherited) const;

    std::size_t rule_count() const { return rules_.size(); }

private:
    struct Compiled {
        Rule rule;
        std::regex re;
    };

    std::vector<Compiled> rules_;

    static std::string glob_to_regex(const Rule& r, const std::string& source);
};

} // namespace syncf
