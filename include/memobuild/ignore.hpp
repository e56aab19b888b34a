#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace memobuild {

/**
 * @brief Ignore rules in the familiar .gitignore / .dockerignore shape.
 *
 * Supported syntax per line: `#` comments, `!` negation, trailing `/` (directories only),
 * leading `/` (anchored to the root), and fnmatch-style wildcards. An unanchored pattern
 * without a slash matches any single path component.
 *
 * When several rules match a path, the most specific one (most literal characters) decides;
 * among equally specific rules the later one wins.
 */
class IgnoreRules {
public:
    struct Rule {
        std::string pattern;
        bool negated = false;
        bool dir_only = false;
        bool anchored = false;
        size_t specificity = 0;
        size_t order = 0;
    };

    static IgnoreRules parse(std::string_view content);

    /** @brief Loads rules from a file; a missing file yields no rules. */
    static IgnoreRules from_file(const std::filesystem::path &path);

    /**
     * @brief Loads the first of `.memobuildignore`, `.dockerignore`, `.gitignore` found in `root`.
     */
    static IgnoreRules load_for(const std::filesystem::path &root);

    void add(std::string_view line);

    /**
     * @brief Tests a path relative to the fingerprinted root, using '/' separators.
     *
     * A path is ignored when it, or any of its ancestors, is ignored.
     */
    bool is_ignored(std::string_view rel_path, bool is_dir = false) const;

    bool empty() const {
        return rules_.empty();
    }

    const std::vector<Rule> &rules() const {
        return rules_;
    }

private:
    // Decision for a single path, without looking at ancestors.
    // -1: no rule matched, 0: included, 1: ignored.
    int decide(std::string_view rel_path, bool is_dir) const;

    std::vector<Rule> rules_;
};

} // namespace memobuild
