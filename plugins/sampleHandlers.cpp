// plugins/sampleHandlers.cpp
// Handlers loadable with `plugins: [libedge_sim_sample_handlers.so]`.

#include "handlerCatalog.hpp"
#include "eventModel.hpp"
#include <stdexcept>
#include <string>

namespace {

const std::string LEGACY_PREFIX = "/legacy/";

// Answers every request itself; the origin is never contacted.
StageResult echo(const StageEvent &event){
    ResponseArtifact resp;
    resp.status = 200;
    resp.statusDescription = "OK";
    resp.headers.set("Content-Type", "text/plain");
    resp.headers.set("X-Edge-Request-Id", event.config.requestId);
    resp.body = event.request.method + " " + event.request.url + "\n" + event.request.body;
    return StageResult::respond(resp);
}

StageResult addSecurityHeaders(const StageEvent &event){
    if (event.response == nullptr) {
        throw std::runtime_error("add-security-headers is a response-phase handler, got " +
                                 std::string(stageName(event.config.stage)));
    }
    ResponseArtifact resp = *event.response;
    resp.headers.set("Strict-Transport-Security", "max-age=63072000; includeSubDomains; preload");
    resp.headers.set("X-Content-Type-Options", "nosniff");
    resp.headers.set("X-Frame-Options", "DENY");
    resp.headers.set("Referrer-Policy", "same-origin");
    return StageResult::respond(resp);
}

// /legacy/x -> 301 /x; everything else passes through.
StageResult redirectLegacy(const StageEvent &event){
    std::string path = event.request.path();
    if (path.compare(0, LEGACY_PREFIX.size(), LEGACY_PREFIX) != 0) {
        return StageResult::forward(event.request);
    }

    std::string location = "/" + path.substr(LEGACY_PREFIX.size());
    std::string query = event.request.query();
    if (!query.empty()) {
        location += "?" + query;
    }

    ResponseArtifact resp;
    resp.status = 301;
    resp.statusDescription = "Moved Permanently";
    resp.headers.set("Location", location);
    return StageResult::respond(resp);
}

StageResult stripCookies(const StageEvent &event){
    RequestEvent req = event.request;
    req.headers.remove("Cookie");
    req.cookies.clear();
    return StageResult::forward(req);
}

}

extern "C" void EdgeSimPluginInit(HandlerCatalog &catalog){
    catalog.registerHandler("echo", echo);
    catalog.registerHandler("add-security-headers", addSecurityHeaders);
    catalog.registerHandler("redirect-legacy", redirectLegacy);
    catalog.registerHandler("strip-cookies", stripCookies);
}
