#ifndef PATHPATTERN_HPP
#define PATHPATTERN_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

// A validated, anchored glob. '*' matches any run (empty included), '?' one char.
class Matcher{
public:
    explicit Matcher(std::string pattern);

    bool matches(const std::string &path) const;
    bool isCatchAll() const { return source == "*"; }
    const std::string &pattern() const { return source; }

private:
    std::string source;
};

class PathPatternMatcher{
public:
    static PathPatternMatcher& getInstance();
    PathPatternMatcher(PathPatternMatcher const&) = delete;
    PathPatternMatcher& operator=(PathPatternMatcher const&) = delete;

    // Throws InvalidPattern. Repeated calls with the same string share one Matcher.
    std::shared_ptr<const Matcher> compile(const std::string &pattern);
    size_t cachedPatterns();

    // Throws InvalidPattern for empty, over-long, or whitespace/control patterns.
    static void validate(const std::string &pattern);

private:
    PathPatternMatcher() {}

    std::mutex cacheMutex;
    std::map<std::string, std::shared_ptr<const Matcher>> compiledPatterns;
};

#endif // PATHPATTERN_HPP
