// =================================================================
// include/Hotify/GlobPattern.hpp
// =================================================================
// Header for shell-style glob matching on file base names.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Hotify {

/**
 * @brief Shell-style glob matched against a file's base name
 * 
 * Supported syntax:
 * - Wildcards: * (any run of characters), ? (one character)
 * - Character classes: [abc], [a-z], negated with [!abc] or [^abc]
 * - Backslash escapes the next character
 *
 * Matching is case-insensitive, so "*.pdf" also claims "SCAN.PDF".
 */
class GlobPattern {
public:
    /**
     * @brief Compile a glob pattern
     * @param pattern The glob string, e.g. "*.tif"
     * @throws ConfigurationError if the pattern is empty or cannot be compiled
     */
    explicit GlobPattern(const std::string& pattern);

    /**
     * @brief Check whether a file matches this pattern
     * @param file_path Path or bare file name; only the base name is matched
     * @return true if the base name matches the whole pattern
     */
    bool matches(const std::string& file_path) const;

    /**
     * @brief Get the original pattern string
     */
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Convert a glob pattern to an equivalent ECMAScript regex
     * @param glob_pattern Glob pattern string
     * @return Regex source anchored at both ends
     */
    static std::string globToRegex(const std::string& glob_pattern);

private:
    std::string m_original_pattern;
    std::regex m_regex;
};

/**
 * @brief Ordered collection of glob patterns; a name matches if any pattern does
 */
class GlobPatternSet {
public:
    GlobPatternSet() = default;
    explicit GlobPatternSet(const std::vector<std::string>& patterns);

    /**
     * @brief Add a pattern to the set
     * @param pattern Glob string
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Check if any pattern matches the file's base name
     */
    bool matchesAny(const std::string& file_path) const;

    std::vector<std::string> getPatterns() const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }

private:
    std::vector<GlobPattern> m_patterns;
};

} // namespace Hotify
