// =================================================================
// src/Hotify/GlobPattern.cpp
// =================================================================
// Implementation for base-name glob matching.

#include "Hotify/GlobPattern.hpp"
#include "Hotify/Errors.hpp"
#include <filesystem>

namespace Hotify {

GlobPattern::GlobPattern(const std::string& pattern)
    : m_original_pattern(pattern)
{
    if (pattern.empty()) {
        throw ConfigurationError("Empty glob pattern");
    }
    
    try {
        m_regex = std::regex(globToRegex(pattern),
                             std::regex_constants::ECMAScript | std::regex_constants::icase);
    } catch (const std::regex_error& e) {
        throw ConfigurationError("Invalid glob pattern '" + pattern + "': " + e.what());
    }
}

bool GlobPattern::matches(const std::string& file_path) const {
    std::string base_name = std::filesystem::path(file_path).filename().string();
    if (base_name.empty()) {
        return false;
    }
    return std::regex_match(base_name, m_regex);
}

std::string GlobPattern::globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern = "^";
    bool in_brackets = false;
    
    for (size_t i = 0; i < glob_pattern.length(); ++i) {
        char c = glob_pattern[i];
        
        if (in_brackets) {
            if (c == ']') {
                in_brackets = false;
                regex_pattern += ']';
            } else if (c == '\\') {
                regex_pattern += "\\\\";
            } else {
                regex_pattern += c;
            }
            continue;
        }
        
        switch (c) {
            case '*':
                regex_pattern += ".*";
                break;
                
            case '?':
                regex_pattern += '.';
                break;
                
            case '[':
                // An unterminated bracket is a literal, as in fnmatch
                if (glob_pattern.find(']', i + 1) == std::string::npos) {
                    regex_pattern += "\\[";
                    break;
                }
                in_brackets = true;
                regex_pattern += '[';
                if (i + 1 < glob_pattern.length() &&
                    (glob_pattern[i + 1] == '!' || glob_pattern[i + 1] == '^')) {
                    regex_pattern += '^';
                    ++i;
                }
                // A leading ] is part of the class
                if (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == ']') {
                    regex_pattern += "\\]";
                    ++i;
                }
                break;
                
            case '\\':
                if (i + 1 < glob_pattern.length()) {
                    // Escaped character matches itself; only regex metacharacters keep the backslash
                    const char next = glob_pattern[++i];
                    if (std::string(".^$|()[]{}*+?\\").find(next) != std::string::npos) {
                        regex_pattern += '\\';
                    }
                    regex_pattern += next;
                } else {
                    regex_pattern += "\\\\";
                }
                break;
                
            default:
                if (c == '.' || c == '^' || c == '$' || c == '+' || c == '{' || c == '}' ||
                    c == '|' || c == '(' || c == ')' || c == ']') {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                break;
        }
    }
    
    regex_pattern += '$';
    return regex_pattern;
}

GlobPatternSet::GlobPatternSet(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

void GlobPatternSet::addPattern(const std::string& pattern) {
    m_patterns.emplace_back(pattern);
}

bool GlobPatternSet::matchesAny(const std::string& file_path) const {
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(file_path)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> GlobPatternSet::getPatterns() const {
    std::vector<std::string> patterns;
    patterns.reserve(m_patterns.size());
    for (const auto& pattern : m_patterns) {
        patterns.push_back(pattern.getPattern());
    }
    return patterns;
}

} // namespace Hotify
