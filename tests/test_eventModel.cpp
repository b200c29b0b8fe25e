#include <catch2/catch.hpp>

#include "eventModel.hpp"
#include "originClient.hpp"
#include "utils.hpp"
#include <stdexcept>

TEST_CASE("header map keeps order and repeated names", "[eventModel]") {
    HeaderMap h;
    h.add("Set-Cookie", "a=1");
    h.add("Content-Type", "text/plain");
    h.add("set-cookie", "b=2");

    CHECK(h.size() == 3);
    CHECK(h.has("SET-COOKIE"));
    CHECK(h.get("set-cookie") == std::optional<std::string>("a=1"));
    CHECK(h.getAll("Set-Cookie") == std::vector<std::string>{"a=1", "b=2"});
    CHECK_FALSE(h.get("X-Missing"));

    h.set("Set-Cookie", "c=3");
    CHECK(h.getAll("set-cookie") == std::vector<std::string>{"c=3"});
    CHECK(h.fields().front().first == "Content-Type");

    CHECK(h.remove("content-type") == 1);
    CHECK(h.remove("content-type") == 0);
    CHECK(h.size() == 1);
}

TEST_CASE("request path and query", "[eventModel]") {
    RequestEvent req;
    req.url = "/a/b?x=1&y=2";
    CHECK(req.path() == "/a/b");
    CHECK(req.query() == "x=1&y=2");

    req.url = "http://edge.test:8080/abs?q";
    CHECK(req.path() == "/abs");
    CHECK(req.query() == "q");

    req.url = "http://edge.test";
    CHECK(req.path() == "/");
    CHECK(req.query().empty());
}

TEST_CASE("stage names", "[eventModel]") {
    CHECK(parseStage("viewer-request") == Stage::ViewerRequest);
    CHECK(parseStage("Origin-Response") == Stage::OriginResponse);
    CHECK_THROWS_AS(parseStage("viewer"), std::invalid_argument);
    for (size_t s = 0; s < STAGE_COUNT; ++s) {
        CHECK(parseStage(stageName((Stage)s)) == (Stage)s);
    }
    CHECK(isRequestPhase(Stage::OriginRequest));
    CHECK_FALSE(isRequestPhase(Stage::OriginResponse));
}

TEST_CASE("stage results", "[eventModel]") {
    StageResult empty;
    CHECK(empty.kind() == StageResult::Kind::Empty);

    RequestEvent req;
    req.url = "/r";
    StageResult fwd = StageResult::forward(req);
    CHECK(fwd.isRequest());
    CHECK(fwd.request().url == "/r");

    ResponseArtifact res;
    res.status = 204;
    StageResult resp = StageResult::respond(res);
    CHECK(resp.isResponse());
    CHECK(resp.response().status == 204);
}

TEST_CASE("parse a request with repeated headers and a body", "[wire]") {
    RequestEvent req = parseRequest("POST /submit?id=7 HTTP/1.1\r\n"
                                    "Host: edge.test\r\n"
                                    "Cookie: a=1\r\n"
                                    "Cookie: b=2\r\n"
                                    "Content-Length: 5\r\n"
                                    "\r\n"
                                    "hello");
    CHECK(req.method == "POST");
    CHECK(req.url == "/submit?id=7");
    CHECK(req.headers.getAll("cookie") == std::vector<std::string>{"a=1", "b=2"});
    CHECK(req.body == "hello");

    CHECK_THROWS_AS(parseRequest("GET / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort"), std::runtime_error);
    CHECK_THROWS_AS(parseRequest("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n"), std::runtime_error);
    CHECK_THROWS_AS(parseRequest(""), std::runtime_error);
}

TEST_CASE("parse responses", "[wire]") {
    SECTION("content length") {
        ResponseArtifact res = parseResponse("HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\nX-A: 1\r\nX-A: 2\r\n\r\nnope");
        CHECK(res.status == 404);
        CHECK(res.statusDescription == "Not Found");
        CHECK(res.headers.getAll("x-a") == std::vector<std::string>{"1", "2"});
        CHECK(res.body == "nope");
    }
    SECTION("chunked bodies are decoded") {
        ResponseArtifact res = parseResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                                             "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
        CHECK(res.body == "hello world");
        CHECK_FALSE(res.headers.has("Transfer-Encoding"));
    }
    SECTION("no length reads to the end") {
        ResponseArtifact res = parseResponse("HTTP/1.0 200 OK\r\n\r\nall of it");
        CHECK(res.body == "all of it");
    }
    SECTION("bad status line") {
        CHECK_THROWS_AS(parseResponse("SPDY/3 200 OK\r\n\r\n"), std::runtime_error);
    }
}

TEST_CASE("serialize a response for the client", "[wire]") {
    ResponseArtifact res;
    res.status = 200;
    res.headers.add("Set-Cookie", "a=1");
    res.headers.add("Set-Cookie", "b=2");
    res.headers.add("Transfer-Encoding", "chunked");
    res.headers.add("Content-Length", "999");
    res.body = "body";

    std::string wire = serializeResponseForClient(res);
    CHECK(wire == "HTTP/1.1 200 OK\r\n"
                  "Set-Cookie: a=1\r\n"
                  "Set-Cookie: b=2\r\n"
                  "Content-Length: 4\r\n"
                  "\r\n"
                  "body");

    std::string head = serializeResponseForClient(res, true);
    CHECK(head.find("Content-Length: 4\r\n\r\n") != std::string::npos);
    CHECK(head.compare(head.size() - 4, 4, "\r\n\r\n") == 0);

    ResponseArtifact back = parseResponse(wire);
    CHECK(back.headers.getAll("Set-Cookie").size() == 2);
    CHECK(back.body == "body");
}

TEST_CASE("status lines fall back to the standard reason", "[wire]") {
    ResponseArtifact res;
    res.status = 301;
    CHECK(statusLine(res) == "HTTP/1.1 301 Moved Permanently");
    res.statusDescription = "Gone Elsewhere";
    CHECK(statusLine(res) == "HTTP/1.1 301 Gone Elsewhere");
    CHECK(reasonPhrase(599) == "Unknown");
}

TEST_CASE("cookies", "[wire]") {
    auto cookies = parseCookies("session=abc; theme=\"dark\" ;empty=; broken; session=xyz");
    CHECK(cookies.size() == 3);
    CHECK(cookies["session"] == "xyz");
    CHECK(cookies["theme"] == "dark");
    CHECK(cookies["empty"].empty());
}

TEST_CASE("chunk decoding errors", "[wire]") {
    CHECK(handleChunk("3\r\nabc\r\n0\r\n\r\n") == "abc");
    CHECK_THROWS_AS(handleChunk("zz\r\nabc\r\n"), std::runtime_error);
    CHECK_THROWS_AS(handleChunk("10\r\nabc"), std::runtime_error);
}

TEST_CASE("path normalization", "[wire]") {
    CHECK(normalizePath("") == "/");
    CHECK(normalizePath("/a//b/./c/../d") == "/a/b/d");
    CHECK(normalizePath("/../../etc") == "/etc");
    CHECK(normalizePath("/dir/") == "/dir/");
}
