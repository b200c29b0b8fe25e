#include "eventModel.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool headerNameEquals(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

// -----------------------------
// HeaderMap
// -----------------------------
void HeaderMap::add(const std::string &name, const std::string &value) {
    entries.emplace_back(name, value);
}

void HeaderMap::set(const std::string &name, const std::string &value) {
    remove(name);
    add(name, value);
}

size_t HeaderMap::remove(const std::string &name) {
    size_t before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const Field &f){ return headerNameEquals(f.first, name); }),
                  entries.end());
    return before - entries.size();
}

bool HeaderMap::has(const std::string &name) const {
    for (const auto &f : entries) {
        if (headerNameEquals(f.first, name)) return true;
    }
    return false;
}

std::optional<std::string> HeaderMap::get(const std::string &name) const {
    for (const auto &f : entries) {
        if (headerNameEquals(f.first, name)) return f.second;
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::getAll(const std::string &name) const {
    std::vector<std::string> values;
    for (const auto &f : entries) {
        if (headerNameEquals(f.first, name)) values.push_back(f.second);
    }
    return values;
}

// -----------------------------
// RequestEvent
// -----------------------------
std::string RequestEvent::path() const {
    size_t q = url.find('?');
    std::string p = (q == std::string::npos) ? url : url.substr(0, q);
    // Absolute-form targets ("http://host/path") are reduced to their path.
    size_t scheme = p.find("://");
    if (scheme != std::string::npos) {
        size_t slash = p.find('/', scheme + 3);
        p = (slash == std::string::npos) ? "/" : p.substr(slash);
    }
    return p;
}

std::string RequestEvent::query() const {
    size_t q = url.find('?');
    if (q == std::string::npos) return "";
    return url.substr(q + 1);
}

bool operator==(const ResponseArtifact &a, const ResponseArtifact &b) {
    return a.status == b.status &&
           a.statusDescription == b.statusDescription &&
           a.headers == b.headers &&
           a.body == b.body;
}

// -----------------------------
// Stage
// -----------------------------
const char *stageName(Stage stage) {
    switch (stage) {
        case Stage::ViewerRequest:  return "viewer-request";
        case Stage::OriginRequest:  return "origin-request";
        case Stage::OriginResponse: return "origin-response";
        case Stage::ViewerResponse: return "viewer-response";
    }
    return "unknown";
}

Stage parseStage(const std::string &name) {
    std::string n = toLowerCopy(name);
    if (n == "viewer-request")  return Stage::ViewerRequest;
    if (n == "origin-request")  return Stage::OriginRequest;
    if (n == "origin-response") return Stage::OriginResponse;
    if (n == "viewer-response") return Stage::ViewerResponse;
    throw std::invalid_argument("Unknown event type: " + name);
}

bool isRequestPhase(Stage stage) {
    return stage == Stage::ViewerRequest || stage == Stage::OriginRequest;
}

// -----------------------------
// StageResult
// -----------------------------
StageResult StageResult::forward(RequestEvent request) {
    StageResult r;
    r.resultKind = Kind::Request;
    r.requestValue = std::move(request);
    return r;
}

StageResult StageResult::respond(ResponseArtifact response) {
    StageResult r;
    r.resultKind = Kind::Response;
    r.responseValue = std::move(response);
    return r;
}

std::string reasonPhrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}
