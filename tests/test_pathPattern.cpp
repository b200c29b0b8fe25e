#include <catch2/catch.hpp>

#include "edgeErrors.hpp"
#include "pathPattern.hpp"
#include <string>

static bool matches(const std::string &pattern, const std::string &path) {
    return PathPatternMatcher::getInstance().compile(pattern)->matches(path);
}

TEST_CASE("glob star matches any run of characters", "[pathPattern]") {
    CHECK(matches("/api/*", "/api/users"));
    CHECK(matches("/api/*", "/api/"));
    CHECK(matches("/api/*", "/api/users/42/orders"));
    CHECK_FALSE(matches("/api/*", "/other/api/x"));
    CHECK_FALSE(matches("/api/*", "/api"));

    CHECK(matches("*.jpg", "/images/cat.jpg"));
    CHECK_FALSE(matches("*.jpg", "/images/cat.jpeg"));
    CHECK(matches("/a*b*c", "/abc"));
    CHECK(matches("/a*b*c", "/a-x-b-y-c"));
}

TEST_CASE("glob question mark matches exactly one character", "[pathPattern]") {
    CHECK(matches("/v?/status", "/v1/status"));
    CHECK(matches("/v?/status", "/v?/status"));
    CHECK_FALSE(matches("/v?/status", "/v/status"));
    CHECK_FALSE(matches("/v?/status", "/v10/status"));
}

TEST_CASE("everything else in a pattern is literal", "[pathPattern]") {
    CHECK(matches("/file.txt", "/file.txt"));
    CHECK_FALSE(matches("/file.txt", "/fileXtxt"));
    CHECK(matches("/(a|b)+", "/(a|b)+"));
    CHECK_FALSE(matches("/(a|b)+", "/a"));
    CHECK(matches("/price$[1]", "/price$[1]"));
    CHECK(matches("/back\\slash", "/back\\slash"));
}

TEST_CASE("matching is anchored and case sensitive", "[pathPattern]") {
    CHECK_FALSE(matches("/echo", "/echo/more"));
    CHECK_FALSE(matches("/echo", "/prefix/echo"));
    CHECK_FALSE(matches("/Echo", "/echo"));
}

TEST_CASE("catch-all matches everything", "[pathPattern]") {
    auto m = PathPatternMatcher::getInstance().compile("*");
    CHECK(m->isCatchAll());
    CHECK(m->matches(""));
    CHECK(m->matches("/"));
    CHECK(m->matches("/any/path?with=query"));
    CHECK_FALSE(PathPatternMatcher::getInstance().compile("/x/*")->isCatchAll());
}

TEST_CASE("compiled patterns are shared", "[pathPattern]") {
    PathPatternMatcher &pm = PathPatternMatcher::getInstance();
    auto first = pm.compile("/shared/*");
    auto second = pm.compile("/shared/*");
    CHECK(first.get() == second.get());
    CHECK(first->pattern() == "/shared/*");
    CHECK(pm.cachedPatterns() >= 1);
}

TEST_CASE("invalid patterns are rejected", "[pathPattern]") {
    PathPatternMatcher &pm = PathPatternMatcher::getInstance();

    SECTION("empty") {
        CHECK_THROWS_AS(pm.compile(""), InvalidPattern);
    }
    SECTION("too long") {
        CHECK_THROWS_AS(pm.compile("/" + std::string(255, 'a')), InvalidPattern);
        CHECK_NOTHROW(pm.compile("/" + std::string(254, 'a')));
    }
    SECTION("whitespace and control characters") {
        CHECK_THROWS_AS(pm.compile("/with space"), InvalidPattern);
        CHECK_THROWS_AS(pm.compile("/tab\there"), InvalidPattern);
        CHECK_THROWS_AS(pm.compile(std::string("/nul\x01")), InvalidPattern);
    }
    SECTION("error carries the pattern and maps to 500") {
        try {
            pm.compile("/bad pattern");
            FAIL("expected InvalidPattern");
        } catch (const InvalidPattern &e) {
            CHECK(e.pattern() == "/bad pattern");
            CHECK(e.httpStatus() == 500);
            CHECK(e.code() == ErrorCode::InvalidPattern);
        }
    }
}

TEST_CASE("validation runs without compiling", "[pathPattern]") {
    CHECK_NOTHROW(PathPatternMatcher::validate("/a.b"));
    CHECK_NOTHROW(PathPatternMatcher::validate("?"));
    CHECK_THROWS_AS(PathPatternMatcher::validate(""), InvalidPattern);
    CHECK_THROWS_AS(PathPatternMatcher::validate("/a b"), InvalidPattern);
}

TEST_CASE("stars backtrack to the last wildcard", "[pathPattern]") {
    CHECK(matches("/a*b", "/aXbXb"));
    CHECK_FALSE(matches("/a*b", "/aXbX"));
    CHECK(matches("/*/*/end", "/x/y/z/end"));
    CHECK(matches("/**", "/"));
    CHECK(matches("/*?", "/x"));
    CHECK_FALSE(matches("/*?", "/"));
}

TEST_CASE("very long paths match without exhausting the stack", "[pathPattern]") {
    const std::string tail(200000, 'a');
    CHECK(matches("/api/*", "/api/" + tail));
    CHECK_FALSE(matches("/api/*", "/other/" + tail));
    CHECK(matches("/api/*a", "/api/" + tail));
    CHECK_FALSE(matches("/api/*b", "/api/" + tail));
}
