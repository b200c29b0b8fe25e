#include "originClient.hpp"
#include "edgeErrors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sys/stat.h>
#include <vector>

// Headers that describe one hop and must not be forwarded.
static const char *HOP_BY_HOP[] = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Proxy-Authorization",
    "TE", "Trailer", "Transfer-Encoding", "Upgrade"
};

OriginTarget parseOriginTarget(const std::string &baseUrl){
    OriginTarget target;
    target.baseUrl = baseUrl;

    size_t schemeEnd = baseUrl.find("://");
    if(schemeEnd == std::string::npos){
        throw ConfigError("Origin target needs a scheme: " + baseUrl);
    }
    std::string scheme = toLowerCopy(baseUrl.substr(0, schemeEnd));
    std::string rest = baseUrl.substr(schemeEnd + 3);

    if(scheme == "file"){
        if(rest.empty() || rest.front() != '/'){
            throw ConfigError("File origin must be an absolute path: " + baseUrl);
        }
        target.scheme = OriginTarget::Scheme::File;
        target.pathPrefix = rest;
        while(target.pathPrefix.size() > 1 && target.pathPrefix.back() == '/') target.pathPrefix.pop_back();
        return target;
    }
    if(scheme != "http"){
        throw ConfigError("Unsupported origin scheme '" + scheme + "' in " + baseUrl);
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if(slash != std::string::npos){
        target.pathPrefix = rest.substr(slash);
        while(!target.pathPrefix.empty() && target.pathPrefix.back() == '/') target.pathPrefix.pop_back();
    }

    size_t colonPos = authority.rfind(':');
    if(colonPos != std::string::npos && authority.find(']', colonPos) == std::string::npos){
        target.port = authority.substr(colonPos + 1);
        authority = authority.substr(0, colonPos);
        if(target.port.empty() || target.port.find_first_not_of("0123456789") != std::string::npos){
            throw ConfigError("Invalid origin port in " + baseUrl);
        }
    }
    if(authority.size() > 2 && authority.front() == '[' && authority.back() == ']'){
        authority = authority.substr(1, authority.size() - 2);
    }
    if(authority.empty()){
        throw ConfigError("Origin target has no host: " + baseUrl);
    }
    target.host = authority;
    return target;
}

std::string normalizePath(const std::string &path){
    std::vector<std::string> segments;
    size_t pos = 0;
    while(pos <= path.size()){
        size_t end = path.find('/', pos);
        if(end == std::string::npos) end = path.size();
        std::string seg = path.substr(pos, end - pos);
        pos = end + 1;

        if(seg.empty() || seg == ".") continue;
        if(seg == ".."){
            if(!segments.empty()) segments.pop_back();
            continue;
        }
        segments.push_back(seg);
    }

    std::string out;
    for(const auto &s : segments) out += "/" + s;
    if(out.empty()) out = "/";
    // Keep the trailing slash: "/api/" and "/api" are different resources.
    else if(!path.empty() && path.back() == '/') out += "/";
    return out;
}

HttpOriginClient::HttpOriginClient(int timeoutMs) : timeoutMs(timeoutMs) {}

ResponseArtifact HttpOriginClient::fetch(const RequestEvent &request, const OriginTarget &origin,
                                         const std::string &requestId){
    if(origin.scheme == OriginTarget::Scheme::File){
        return fetchFile(request, origin, requestId);
    }
    return fetchHttp(request, origin, requestId);
}

ResponseArtifact HttpOriginClient::fetchHttp(const RequestEvent &request, const OriginTarget &origin,
                                             const std::string &requestId){
    std::string target = origin.pathPrefix + request.path();
    if(!request.query().empty()){
        target += "?" + request.query();
    }

    HeaderMap headers = request.headers;
    for(const char *h : HOP_BY_HOP){
        headers.remove(h);
    }
    std::string hostHeader = origin.host.find(':') != std::string::npos ? "[" + origin.host + "]" : origin.host;
    if(origin.port != "80") hostHeader += ":" + origin.port;
    headers.set("Host", hostHeader);
    headers.set("Connection", "close");
    if(!request.body.empty() || headers.has("Content-Length")){
        headers.set("Content-Length", std::to_string(request.body.size()));
    }

    Logger::getInstance().logRequesting(requestId, request.method + " " + target, origin.baseUrl);

    std::string connectError;
    int fd = connectToOther(origin.host, origin.port, timeoutMs, &connectError);
    if(fd < 0){
        throw OriginUnavailable(connectError);
    }

    ResponseArtifact response;
    try{
        std::string reqBytes = requestToString(request.method, target, headers, request.body);
        if(!sendAll(fd, reqBytes.data(), reqBytes.size())){
            throw std::runtime_error(std::string("send failed: ") + std::strerror(errno));
        }

        // Read response using proper framing (CL/chunked/close)
        response = readHttpResponseFromFd(fd);
    } catch (const std::runtime_error &e) {
        close(fd);
        throw OriginUnavailable(e.what());
    }
    close(fd);

    // Connection-level framing belongs to the origin hop only.
    for(const char *h : HOP_BY_HOP){
        response.headers.remove(h);
    }

    Logger::getInstance().logReceived(requestId, statusLine(response), origin.baseUrl);
    return response;
}

static std::string contentTypeFor(const std::string &path){
    size_t dot = path.rfind('.');
    size_t slash = path.rfind('/');
    if(dot == std::string::npos || (slash != std::string::npos && dot < slash)){
        return "application/octet-stream";
    }
    std::string ext = toLowerCopy(path.substr(dot + 1));
    if(ext == "html" || ext == "htm") return "text/html";
    if(ext == "css")  return "text/css";
    if(ext == "js")   return "application/javascript";
    if(ext == "json") return "application/json";
    if(ext == "txt")  return "text/plain";
    if(ext == "svg")  return "image/svg+xml";
    if(ext == "png")  return "image/png";
    if(ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if(ext == "gif")  return "image/gif";
    return "application/octet-stream";
}

static ResponseArtifact simpleResponse(int status, const std::string &body){
    ResponseArtifact res;
    res.status = status;
    res.statusDescription = reasonPhrase(status);
    res.headers.add("Content-Type", "text/plain");
    res.body = body;
    return res;
}

ResponseArtifact HttpOriginClient::fetchFile(const RequestEvent &request, const OriginTarget &origin,
                                             const std::string &requestId){
    std::string rawPath = request.path();
    std::string path = normalizePath(rawPath);

    Logger::getInstance().logRequesting(requestId, request.method + " " + path, origin.baseUrl);

    // normalizePath() clamps ".." at the root; refuse paths that tried to climb above it.
    if(rawPath.find("..") != std::string::npos){
        int depth = 0;
        bool escapes = false;
        std::istringstream segs(rawPath);
        std::string seg;
        while(std::getline(segs, seg, '/')){
            if(seg.empty() || seg == ".") continue;
            depth += (seg == "..") ? -1 : 1;
            if(depth < 0) escapes = true;
        }
        if(escapes){
            ResponseArtifact res = simpleResponse(403, "Forbidden");
            Logger::getInstance().logReceived(requestId, statusLine(res), origin.baseUrl);
            return res;
        }
    }

    if(path.back() == '/') path += "index.html";
    std::string file = origin.pathPrefix + path;

    struct stat st;
    if(stat(file.c_str(), &st) != 0 || !S_ISREG(st.st_mode)){
        ResponseArtifact res = simpleResponse(404, "Not Found");
        Logger::getInstance().logReceived(requestId, statusLine(res), origin.baseUrl);
        return res;
    }

    std::ifstream in(file, std::ios::binary);
    if(!in.is_open()){
        throw OriginUnavailable("cannot open " + file);
    }
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if(in.bad()){
        throw OriginUnavailable("read failed for " + file);
    }

    ResponseArtifact res;
    res.status = 200;
    res.statusDescription = reasonPhrase(200);
    res.headers.add("Content-Type", contentTypeFor(file));
    res.headers.add("Content-Length", std::to_string(body.size()));
    if(request.method != "HEAD"){
        res.body = std::move(body);
    }
    Logger::getInstance().logReceived(requestId, statusLine(res), origin.baseUrl);
    return res;
}
