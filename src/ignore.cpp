#include "memobuild/ignore.hpp"

#include <fnmatch.h>

#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace memobuild {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

size_t literal_chars(std::string_view pattern) {
    size_t count = 0;
    for (char c : pattern) {
        if (c != '*' && c != '?' && c != '[' && c != ']')
            ++count;
    }
    return count;
}

bool glob_match(const std::string &pattern, const std::string &subject, bool pathname) {
    int flags = pathname ? FNM_PATHNAME : 0;
    return fnmatch(pattern.c_str(), subject.c_str(), flags) == 0;
}

} // namespace

IgnoreRules IgnoreRules::parse(std::string_view content) {
    IgnoreRules rules;
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos)
            end = content.size();
        rules.add(content.substr(start, end - start));
        start = end + 1;
    }
    return rules;
}

IgnoreRules IgnoreRules::from_file(const fs::path &path) {
    std::ifstream in(path);
    if (!in)
        return {};
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

IgnoreRules IgnoreRules::load_for(const fs::path &root) {
    for (const char *name : {".memobuildignore", ".dockerignore", ".gitignore"}) {
        std::error_code ec;
        if (fs::is_regular_file(root / name, ec))
            return from_file(root / name);
    }
    return {};
}

void IgnoreRules::add(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.starts_with('#'))
        return;

    Rule rule;
    if (line.starts_with('!')) {
        rule.negated = true;
        line.remove_prefix(1);
    }
    if (line.ends_with('/')) {
        rule.dir_only = true;
        line.remove_suffix(1);
    }
    if (line.starts_with('/')) {
        rule.anchored = true;
        line.remove_prefix(1);
    }
    if (line.empty())
        return;
    // "a/b" is implicitly anchored, like git
    if (line.find('/') != std::string_view::npos)
        rule.anchored = true;

    rule.pattern = std::string(line);
    rule.specificity = literal_chars(line);
    rule.order = rules_.size();
    rules_.push_back(std::move(rule));
}

int IgnoreRules::decide(std::string_view rel_path, bool is_dir) const {
    const std::string path(rel_path);
    const size_t slash = path.rfind('/');
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    const Rule *winner = nullptr;
    for (const auto &rule : rules_) {
        if (rule.dir_only && !is_dir)
            continue;

        bool matched;
        if (rule.anchored) {
            bool deep = rule.pattern.find("**") != std::string::npos;
            matched = glob_match(rule.pattern, path, !deep);
        } else {
            matched = glob_match(rule.pattern, name, false);
        }
        if (!matched)
            continue;

        if (!winner || rule.specificity > winner->specificity ||
            (rule.specificity == winner->specificity && rule.order > winner->order)) {
            winner = &rule;
        }
    }

    if (!winner)
        return -1;
    return winner->negated ? 0 : 1;
}

bool IgnoreRules::is_ignored(std::string_view rel_path, bool is_dir) const {
    if (rules_.empty() || rel_path.empty() || rel_path == ".")
        return false;

    // An ignored directory hides its whole subtree; nothing below it can be re-included.
    size_t pos = rel_path.find('/');
    while (pos != std::string_view::npos) {
        if (decide(rel_path.substr(0, pos), true) == 1)
            return true;
        pos = rel_path.find('/', pos + 1);
    }
    return decide(rel_path, is_dir) == 1;
}

} // namespace memobuild
