#include "pathPattern.hpp"
#include "edgeErrors.hpp"
#include <cctype>
#include <utility>

static const size_t MAX_PATTERN_LENGTH = 255;

Matcher::Matcher(std::string pattern) : source(std::move(pattern)) {}

// Iterative wildcard match. On a mismatch, back up to the last '*' and let it
// swallow one more character. Stack depth stays constant for any path length.
bool Matcher::matches(const std::string &path) const {
    const size_t none = std::string::npos;
    size_t p = 0;
    size_t s = 0;
    size_t star = none;
    size_t resume = 0;

    while (s < path.size()) {
        if (p < source.size() && source[p] == '*') {
            star = p++;
            resume = s;
        } else if (p < source.size() && (source[p] == '?' || source[p] == path[s])) {
            ++p;
            ++s;
        } else if (star != none) {
            p = star + 1;
            s = ++resume;
        } else {
            return false;
        }
    }
    while (p < source.size() && source[p] == '*') {
        ++p;
    }
    return p == source.size();
}

PathPatternMatcher& PathPatternMatcher::getInstance() {
    static PathPatternMatcher instance;
    return instance;
}

void PathPatternMatcher::validate(const std::string &pattern) {
    if (pattern.empty()) {
        throw InvalidPattern(pattern, "pattern is empty");
    }
    if (pattern.size() > MAX_PATTERN_LENGTH) {
        throw InvalidPattern(pattern, "longer than 255 characters");
    }
    for (char c : pattern) {
        unsigned char uc = (unsigned char)c;
        if (std::isspace(uc) || std::iscntrl(uc)) {
            throw InvalidPattern(pattern, "whitespace or control character");
        }
    }
}

std::shared_ptr<const Matcher> PathPatternMatcher::compile(const std::string &pattern) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = compiledPatterns.find(pattern);
    if (it != compiledPatterns.end()) {
        return it->second;
    }

    validate(pattern);
    auto matcher = std::make_shared<const Matcher>(pattern);
    compiledPatterns.emplace(pattern, matcher);
    return matcher;
}

size_t PathPatternMatcher::cachedPatterns() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return compiledPatterns.size();
}
