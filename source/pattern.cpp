#include <syncf/pattern.hpp>
#include <syncf/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace syncf {

const char* to_string(Verdict v){
    switch (v){
        case Verdict::Unmatched: return "unmatched";
        case Verdict::Include:   return "include";
        case Verdict::Exclude:   return "exclude";
    }
    return "unknown";
}

static std::string trim_rule_line(std::string s){
    if (!s.empty() && s.back() == '\r') s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    size_t end = s.size();
    while (end > i && (s[end-1] == ' ' || s[end-1] == '\t')) {
        if (end - i >= 2 && s[end-2] == '\\') break;
        --end;
    }
    return s.substr(i, end - i);
}

RuleSet parse_rules(const std::string& text, const std::string& source){
    RuleSet set;
    set.source = source;

    std::istringstream in(text);
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string s = trim_rule_line(line);
        if (s.empty() || s[0] == '#') continue;

        Rule r;
        r.pattern = s;
        r.line = lineno;

        std::string g = s;
        if (g[0] == '!') { r.negated = true; g.erase(0, 1); }
        while (!g.empty() && g.back() == '/' && !(g.size() >= 2 && g[g.size()-2] == '\\')) {
            r.directory_only = true;
            g.pop_back();
        }
        if (!g.empty() && g.front() == '/') { r.anchored = true; g.erase(0, 1); }
        if (g.find('/') != std::string::npos) r.anchored = true;

        if (g.empty()) {
            throw Error(ErrorKind::InvalidPattern,
                        fmt::format("{}:{}: empty pattern '{}'", source, lineno, s));
        }
        r.glob = std::move(g);
        set.rules.push_back(std::move(r));
    }
    return set;
}

RuleSet load_rules(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if (!in.good()) {
        throw Error(ErrorKind::InvalidPattern,
                    fmt::format("cannot read pattern file {}", file.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto set = parse_rules(ss.str(), file.string());
    spdlog::debug("loaded {} rules from {}", set.size(), file.string());
    return set;
}

static void append_literal(std::string& rx, char c){
    static const std::string specials = ".^$|()[]{}*+?\\";
    if (specials.find(c) != std::string::npos) rx.push_back('\\');
    rx.push_back(c);
}

std::string Matcher::glob_to_regex(const Rule& r, const std::string& source){
    const std::string& pat = r.glob;
    auto fail = [&](const std::string& what){
        return Error(ErrorKind::InvalidPattern,
                     fmt::format("{}:{}: {} in pattern '{}'", source, r.line, what, r.pattern));
    };

    std::string rx;
    const size_t n = pat.size();
    size_t i = 0;
    while (i < n) {
        char c = pat[i];
        if (c == '*') {
            if (i+1 < n && pat[i+1] == '*') {
                bool seg_start = (i == 0 || pat[i-1] == '/');
                size_t j = i;
                while (j < n && pat[j] == '*') ++j;
                if (seg_start && j < n && pat[j] == '/') {
                    rx += "(?:.*/)?";
                    i = j + 1;
                } else if (seg_start && j == n) {
                    rx += ".*";
                    i = j;
                } else {
                    rx += "[^/]*";
                    i = j;
                }
                continue;
            }
            rx += "[^/]*";
            ++i;
        } else if (c == '?') {
            rx += "[^/]";
            ++i;
        } else if (c == '[') {
            size_t j = i + 1;
            bool neg = false;
            if (j < n && (pat[j] == '!' || pat[j] == '^')) { neg = true; ++j; }
            std::string cls;
            bool first = true;
            bool closed = false;
            while (j < n) {
                char k = pat[j];
                if (k == ']' && !first) { closed = true; break; }
                if (k == '\\') {
                    if (j+1 >= n) break;
                    char e = pat[j+1];
                    if (std::isalnum(static_cast<unsigned char>(e))) cls.push_back(e);
                    else { cls.push_back('\\'); cls.push_back(e); }
                    j += 2;
                } else if (k == '[' || k == ']' || k == '^') {
                    cls.push_back('\\');
                    cls.push_back(k);
                    ++j;
                } else {
                    cls.push_back(k);
                    ++j;
                }
                first = false;
            }
            if (!closed) throw fail(fmt::format("unbalanced '[' at column {}", i + 1));
            rx += neg ? "[^/" : "[";
            rx += cls;
            rx += ']';
            i = j + 1;
        } else if (c == '\\') {
            if (i+1 >= n) throw fail("dangling '\\'");
            append_literal(rx, pat[i+1]);
            i += 2;
        } else {
            append_literal(rx, c);
            ++i;
        }
    }
    return rx;
}

Matcher Matcher::compile(const RuleSet& rules){
    Matcher m;
    bool any_positive = false;
    for (const auto& r : rules.rules) {
        std::string rx = glob_to_regex(r, rules.source);
        Compiled c{r, {}};
        try {
            c.re = std::regex(rx, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            throw Error(ErrorKind::InvalidPattern,
                        fmt::format("{}:{}: malformed pattern '{}' ({})",
                                    rules.source, r.line, r.pattern, e.what()));
        }
        if (!r.negated) any_positive = true;
        m.rules_.push_back(std::move(c));
    }
    if (!any_positive) {
        throw Error(ErrorKind::InvalidPattern,
                    fmt::format("{}: no inclusion rules, nothing can be selected", rules.source));
    }
    return m;
}

Verdict Matcher::evaluate(const std::string& rel, bool is_dir) const {
    const auto slash = rel.rfind('/');
    const std::string base = slash == std::string::npos ? rel : rel.substr(slash + 1);

    Verdict v = Verdict::Unmatched;
    for (const auto& c : rules_) {
        if (c.rule.directory_only && !is_dir) continue;
        const std::string& subject = c.rule.anchored ? rel : base;
        if (std::regex_match(subject, c.re)) {
            v = c.rule.negated ? Verdict::Exclude : Verdict::Include;
        }
    }
    return v;
}

Verdict Matcher::resolve(const std::string& rel, bool is_dir, Verdict inherited) const {
    Verdict own = evaluate(rel, is_dir);
    return own == Verdict::Unmatched ? inherited : own;
}

bool Matcher::matches(const std::string& rel, bool is_dir) const {
    Verdict inherited = Verdict::Unmatched;
    size_t pos = 0;
    for (;;) {
        size_t slash = rel.find('/', pos);
        if (slash == std::string::npos) break;
        std::string dir = rel.substr(0, slash);
        if (!dir.empty()) {
            Verdict own = evaluate(dir, true);
            if (own == Verdict::Exclude) return false;
            if (own != Verdict::Unmatched) inherited = own;
        }
        pos = slash + 1;
    }
    return resolve(rel, is_dir, inherited) == Verdict::Include;
}

} // namespace syncf
