#include <catch2/catch.hpp>

#include "config.hpp"
#include "edgeErrors.hpp"
#include "handlerCatalog.hpp"
#include "router.hpp"
#include "testHelpers.hpp"
#include <algorithm>

static StageEvent eventFor(Stage stage, const RequestEvent &req, const ResponseArtifact *response = nullptr) {
    StageEvent event;
    event.config.stage = stage;
    event.config.requestId = "cat-1";
    event.request = req;
    event.response = response;
    return event;
}

TEST_CASE("in-process registration", "[catalog]") {
    HandlerCatalog catalog;
    StageSpy spy;
    catalog.registerHandler("one", spy.passThrough("one").fn);

    CHECK(catalog.contains("one"));
    CHECK_FALSE(catalog.contains("two"));
    CHECK(catalog.lookup("one").name == "one");
    CHECK_THROWS_AS(catalog.lookup("two"), ConfigError);
    CHECK_THROWS_AS(catalog.registerHandler("", spy.passThrough("x").fn), ConfigError);
    CHECK_THROWS_AS(catalog.registerHandler("empty", StageHandler()), ConfigError);

    catalog.registerHandler("one", spy.responder("one", 204, "").fn);
    StageResult r = catalog.lookup("one").fn(eventFor(Stage::ViewerRequest, makeRequest("GET", "/")));
    CHECK(r.isResponse());
    CHECK(catalog.names() == std::vector<std::string>{"one"});
}

TEST_CASE("plugin loading failures", "[catalog]") {
    HandlerCatalog catalog;
    CHECK_THROWS_AS(catalog.loadPlugin("/nonexistent/libnothing.so"), ConfigError);
    // A real shared object without the init symbol.
    CHECK_THROWS_AS(catalog.loadPlugin("libc.so.6"), ConfigError);
    CHECK(catalog.loadedPlugins().empty());
}

TEST_CASE("sample plugin handlers", "[catalog][plugin]") {
    HandlerCatalog catalog;
    catalog.loadPlugin(EDGE_SIM_SAMPLE_PLUGIN);
    REQUIRE(catalog.loadedPlugins().size() == 1);

    std::vector<std::string> names = catalog.names();
    for (const char *expected : {"echo", "add-security-headers", "redirect-legacy", "strip-cookies"}) {
        CHECK(std::find(names.begin(), names.end(), expected) != names.end());
    }

    SECTION("loading twice is a no-op") {
        catalog.loadPlugin(EDGE_SIM_SAMPLE_PLUGIN);
        CHECK(catalog.loadedPlugins().size() == 1);
    }
    SECTION("echo answers with the request") {
        RequestEvent req = makeRequest("POST", "/echo?x=1");
        req.body = "ping";
        StageResult r = catalog.lookup("echo").fn(eventFor(Stage::ViewerRequest, req));
        REQUIRE(r.isResponse());
        CHECK(r.response().status == 200);
        CHECK(r.response().body == "POST /echo?x=1\nping");
        CHECK(r.response().headers.get("X-Edge-Request-Id") == std::optional<std::string>("cat-1"));
    }
    SECTION("redirect-legacy") {
        StageResult moved = catalog.lookup("redirect-legacy").fn(
            eventFor(Stage::ViewerRequest, makeRequest("GET", "/legacy/docs/a.html?lang=en")));
        REQUIRE(moved.isResponse());
        CHECK(moved.response().status == 301);
        CHECK(moved.response().headers.get("Location") == std::optional<std::string>("/docs/a.html?lang=en"));

        StageResult kept = catalog.lookup("redirect-legacy").fn(
            eventFor(Stage::ViewerRequest, makeRequest("GET", "/docs/a.html")));
        REQUIRE(kept.isRequest());
        CHECK(kept.request().url == "/docs/a.html");
    }
    SECTION("strip-cookies") {
        RequestEvent req = makeRequest("GET", "/");
        req.headers.add("Cookie", "a=1");
        req.cookies["a"] = "1";
        StageResult r = catalog.lookup("strip-cookies").fn(eventFor(Stage::OriginRequest, req));
        REQUIRE(r.isRequest());
        CHECK_FALSE(r.request().headers.has("Cookie"));
        CHECK(r.request().cookies.empty());
        CHECK(r.request().headers.has("Host"));
    }
    SECTION("add-security-headers") {
        ResponseArtifact res = CountingOrigin::okResponse("page");
        StageResult r = catalog.lookup("add-security-headers").fn(
            eventFor(Stage::ViewerResponse, makeRequest("GET", "/"), &res));
        REQUIRE(r.isResponse());
        CHECK(r.response().body == "page");
        CHECK(r.response().headers.get("X-Frame-Options") == std::optional<std::string>("DENY"));
        CHECK(r.response().headers.has("Strict-Transport-Security"));

        CHECK_THROWS_AS(catalog.lookup("add-security-headers").fn(
                            eventFor(Stage::ViewerRequest, makeRequest("GET", "/"))),
                        std::runtime_error);
    }
}

TEST_CASE("configured plugins drive the router end to end", "[catalog][plugin]") {
    TempDir dir;
    dir.write("edge.yaml", std::string("plugins: [\"") + EDGE_SIM_SAMPLE_PLUGIN + "\"]\n"
                           "behaviors:\n"
                           "  - path_pattern: /echo*\n"
                           "    event_type: viewer-request\n"
                           "    handler: echo\n"
                           "  - event_type: viewer-response\n"
                           "    handler: add-security-headers\n"
                           "origins:\n"
                           "  - path_pattern: \"*\"\n"
                           "    target: http://origin.test\n");

    HandlerCatalog catalog;
    EdgeConfig config = loadConfigFile(dir.file("edge.yaml"));
    CountingOrigin *origin = new CountingOrigin();
    Router router(std::unique_ptr<CacheStore>(new CacheStore(dir.file("cache"))),
                  std::unique_ptr<OriginClient>(origin));
    router.reload(buildRegistry(config, catalog));

    ResponseArtifact echoed = router.handle(makeRequest("GET", "/echo"), "1");
    CHECK(echoed.body == "GET /echo\n");
    CHECK_FALSE(echoed.headers.has("X-Frame-Options"));

    ResponseArtifact page = router.handle(makeRequest("GET", "/index.html"), "2");
    CHECK(page.body == "from origin");
    CHECK(page.headers.get("X-Frame-Options") == std::optional<std::string>("DENY"));
    CHECK(origin->calls() == 1);
}
