#include "utils.hpp"
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

static const size_t MAX_MESSAGE_BYTES = 50 * 1024 * 1024;

// Robust send: keep sending until all bytes are written.
bool sendAll(int fd, const char *data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += (size_t)n;
    }
    return true;
}

// Read exactly len bytes (blocking). Throw if connection closes early.
static std::string recvExactOrThrow(int fd, size_t len) {
    std::string out;
    out.resize(len);
    size_t got = 0;
    while (got < len) {
        ssize_t n = recv(fd, &out[got], len - got, 0);
        if (n <= 0) {
            throw std::runtime_error("Socket closed before receiving enough bytes");
        }
        got += (size_t)n;
    }
    return out;
}

// Read until delimiter appears. Throw if exceeds maxBytes or socket closes too early.
static std::string recvUntilOrThrow(int fd, const std::string &delim, size_t maxBytes = 1024 * 1024) {
    std::string buf;
    buf.reserve(8192);
    std::vector<char> tmp(8192);

    while (buf.size() < maxBytes) {
        if (buf.find(delim) != std::string::npos) return buf;
        ssize_t n = recv(fd, tmp.data(), tmp.size(), 0);
        if (n <= 0) break;
        buf.append(tmp.data(), (size_t)n);
    }
    throw std::runtime_error("Failed to read until delimiter");
}

// "Name: value" -> add to headers. Throws on a line without ':'.
static void parseHeaderLine(const std::string &line, HeaderMap &headers) {
    size_t col_pos = line.find(':');
    if (col_pos == std::string::npos || col_pos == 0) {
        throw std::runtime_error("Invalid header: " + line);
    }
    std::string key = line.substr(0, col_pos);
    std::string value = line.substr(col_pos + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();
    headers.add(key, value);
}

// Parse headers only from a header block (first line included).
static HeaderMap parseHeaderFieldsOnly(const std::string &headerBlock) {
    HeaderMap headers;
    std::istringstream iss(headerBlock);
    std::string line;

    // Skip request/status line
    std::getline(iss, line);

    while (std::getline(iss, line)) {
        if (line == "\r" || line.empty()) break;
        if (line.back() == '\r') line.pop_back();
        if (line.find(':') == std::string::npos) continue;
        parseHeaderLine(line, headers);
    }
    return headers;
}

static size_t contentLengthOf(const HeaderMap &headers, bool &present) {
    auto cl = headers.get("Content-Length");
    present = cl.has_value();
    if (!present) return 0;
    long long len = 0;
    try {
        len = std::stoll(*cl);
    } catch (const std::logic_error &) {
        throw std::runtime_error("Invalid Content-Length");
    }
    if (len < 0) throw std::runtime_error("Negative Content-Length");
    if ((size_t)len > MAX_MESSAGE_BYTES) throw std::runtime_error("Content-Length too large");
    return (size_t)len;
}

static bool isChunked(const HeaderMap &headers) {
    auto te = headers.get("Transfer-Encoding");
    return te && toLowerCopy(*te).find("chunked") != std::string::npos;
}

// -----------------------------
// connectToOther
// -----------------------------
int connectToOther(const std::string &host, const std::string &portStr, int timeoutMs, std::string *errorOut){
    struct addrinfo hints, *serverInfo;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &serverInfo);
    if(status != 0){
        if (errorOut) *errorOut = std::string("getaddrinfo error: ") + gai_strerror(status);
        return -1;
    }

    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

    struct addrinfo *p;
    int socketFd = -1;
    int lastErr = 0;
    for(p = serverInfo; p != nullptr; p = p->ai_next){
        socketFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if(socketFd < 0) { lastErr = errno; continue; }

        // On Linux SO_SNDTIMEO also bounds connect().
        if(timeoutMs > 0){
            setsockopt(socketFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);
            setsockopt(socketFd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof tv);
        }

        if(connect(socketFd, p->ai_addr, p->ai_addrlen) < 0){
            lastErr = errno;
            close(socketFd);
            socketFd = -1;
            continue;
        }
        break;
    }
    freeaddrinfo(serverInfo);
    if (socketFd < 0 && errorOut) {
        *errorOut = "connect to " + host + ":" + portStr + " failed: " + std::strerror(lastErr);
    }
    return socketFd;
}

// -----------------------------
// parseRequest / parseResponse
// Require full body bytes when Content-Length exists.
// -----------------------------
RequestEvent parseRequest(const std::string &request){
    std::istringstream iss(request);
    std::string line;
    RequestEvent req;

    if(!std::getline(iss, line)){
        throw std::runtime_error("Invalid request (no start line)");
    }
    if(!line.empty() && line.back() == '\r') line.pop_back();

    std::string version;
    std::istringstream firstLine(line);
    firstLine >> req.method >> req.url >> version;
    if(req.method.empty() || req.url.empty()){
        throw std::runtime_error("Invalid request line: " + line);
    }

    // Headers
    while(std::getline(iss, line) && line != "\r" && !line.empty()){
        if(line.back() == '\r') line.pop_back();
        parseHeaderLine(line, req.headers);
    }

    // Body (Content-Length only)
    bool hasLength = false;
    size_t len = contentLengthOf(req.headers, hasLength);
    if(hasLength && len > 0){
        std::string body(len, '\0');
        iss.read(&body[0], (std::streamsize)len);

        // Enforce full read
        if (iss.gcount() != (std::streamsize)len) {
            throw std::runtime_error("Incomplete request body for Content-Length");
        }
        req.body = body;
    }
    return req;
}

ResponseArtifact parseResponse(const std::string &response){
    std::istringstream iss(response);
    std::string line;
    ResponseArtifact res;

    if(!std::getline(iss, line)){
        throw std::runtime_error("Invalid response (no status line)");
    }
    if(!line.empty() && line.back() == '\r') line.pop_back();

    std::string version;
    std::istringstream statusStream(line);
    statusStream >> version >> res.status;
    if(statusStream.fail() || version.compare(0, 5, "HTTP/") != 0){
        throw std::runtime_error("Invalid status line: " + line);
    }

    std::getline(statusStream, res.statusDescription);
    res.statusDescription.erase(0, res.statusDescription.find_first_not_of(' '));

    // Headers
    while(std::getline(iss, line) && line != "\r" && !line.empty()){
        if(line.back() == '\r') line.pop_back();
        parseHeaderLine(line, res.headers);
    }

    // Body: chunked
    if (isChunked(res.headers)) {
        std::string chunkedBody;
        char ch;
        while (iss.get(ch)) chunkedBody += ch;
        res.body = handleChunk(chunkedBody);
        res.headers.remove("Transfer-Encoding");
        return res;
    }

    // Body: Content-Length, else everything that is left
    bool hasLength = false;
    size_t len = contentLengthOf(res.headers, hasLength);
    if (hasLength) {
        std::string body(len, '\0');
        if (len > 0) iss.read(&body[0], (std::streamsize)len);

        // Enforce full read
        if (len > 0 && iss.gcount() != (std::streamsize)len) {
            throw std::runtime_error("Incomplete response body for Content-Length");
        }
        res.body = body;
    } else {
        std::ostringstream rest;
        rest << iss.rdbuf();
        res.body = rest.str();
    }

    return res;
}

// -----------------------------
// Chunk decoding
// -----------------------------
std::string handleChunk(const std::string &chunkedBody) {
    std::istringstream stream(chunkedBody);
    std::string final_string;
    std::string line;

    while (std::getline(stream, line)) {
        if(line.empty() || line == "\r") continue;
        if (line.back() == '\r') line.pop_back();

        size_t chunkSize = 0;
        std::istringstream sizeStream(line);
        sizeStream >> std::hex >> chunkSize;
        if (sizeStream.fail()) {
            throw std::runtime_error("Invalid chunk size: " + line);
        }
        if (chunkSize == 0) {
            break;
        }

        std::vector<char> buffer(chunkSize);
        stream.read(buffer.data(), (std::streamsize)chunkSize);

        if (stream.gcount() != (std::streamsize)chunkSize) {
            throw std::runtime_error("Chunk data size mismatch");
        }

        final_string.append(buffer.data(), chunkSize);

        // Consume CRLF after chunk data
        if (!std::getline(stream, line)) {
            throw std::runtime_error("Missing CRLF after chunk");
        }
    }

    return final_string;
}

// -----------------------------
// Wire serializers
// -----------------------------
std::string requestToString(const std::string &method, const std::string &target,
                            const HeaderMap &headers, const std::string &body){
    std::ostringstream oss;
    oss << method << " " << target << " HTTP/1.1\r\n";
    for(const auto &h: headers.fields()){
        oss << h.first << ": " << h.second << "\r\n";
    }
    oss << "\r\n";
    if(!body.empty()){
        oss.write(body.data(), (std::streamsize)body.size());
    }
    return oss.str();
}

std::string statusLine(const ResponseArtifact &response){
    std::string desc = response.statusDescription.empty() ? reasonPhrase(response.status)
                                                          : response.statusDescription;
    return "HTTP/1.1 " + std::to_string(response.status) + " " + desc;
}

std::string serializeResponseForClient(ResponseArtifact response, bool headOnly){
    response.headers.remove("Transfer-Encoding");
    response.headers.set("Content-Length", std::to_string(response.body.size()));

    std::ostringstream oss;
    oss << statusLine(response) << "\r\n";
    for(const auto &h: response.headers.fields()){
        oss << h.first << ": " << h.second << "\r\n";
    }
    oss << "\r\n";
    if(!headOnly && !response.body.empty()){
        oss.write(response.body.data(), (std::streamsize)response.body.size());
    }
    return oss.str();
}

std::map<std::string, std::string> parseCookies(const std::string &cookieHeader){
    std::map<std::string, std::string> cookies;
    size_t pos = 0;
    while (pos < cookieHeader.size()) {
        size_t end = cookieHeader.find(';', pos);
        if (end == std::string::npos) end = cookieHeader.size();
        std::string pair = cookieHeader.substr(pos, end - pos);
        pos = end + 1;

        size_t eq = pair.find('=');
        if (eq == std::string::npos) continue;
        std::string name = pair.substr(0, eq);
        std::string value = pair.substr(eq + 1);
        name.erase(0, name.find_first_not_of(" \t"));
        while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) name.pop_back();
        value.erase(0, value.find_first_not_of(" \t"));
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!name.empty()) cookies[name] = value;
    }
    return cookies;
}

// -----------------------------
// Socket framing readers
// Do not rely on "server closes connection" for HTTP/1.1.
// -----------------------------
RequestEvent readHttpRequestFromFd(int clientFd){
    // Read headers fully first
    std::string raw = recvUntilOrThrow(clientFd, "\r\n\r\n");
    size_t headerEnd = raw.find("\r\n\r\n");
    std::string headerPart = raw.substr(0, headerEnd + 4);

    // Determine Content-Length using header-only parse
    HeaderMap headers = parseHeaderFieldsOnly(headerPart);
    bool hasLength = false;
    size_t needBody = contentLengthOf(headers, hasLength);

    // Keep any already received bytes after header
    std::string bodyAlready = raw.substr(headerEnd + 4);

    if (bodyAlready.size() < needBody) {
        bodyAlready += recvExactOrThrow(clientFd, needBody - bodyAlready.size());
    }

    std::string full = headerPart + bodyAlready.substr(0, needBody);
    return parseRequest(full);
}

ResponseArtifact readHttpResponseFromFd(int serverFd){
    // Read headers fully first
    std::string raw = recvUntilOrThrow(serverFd, "\r\n\r\n");
    size_t headerEnd = raw.find("\r\n\r\n");
    std::string headerPart = raw.substr(0, headerEnd + 4);

    HeaderMap headers = parseHeaderFieldsOnly(headerPart);

    // Keep any already received bytes after header
    std::string bodyAlready = raw.substr(headerEnd + 4);

    // Case 1: chunked
    if (isChunked(headers)) {
        // Simplified framing: read until the terminating chunk marker appears.
        std::string chunked = bodyAlready;
        std::vector<char> tmp(8192);
        while (chunked.find("0\r\n\r\n") == std::string::npos) {
            ssize_t n = recv(serverFd, tmp.data(), tmp.size(), 0);
            if (n <= 0) break;
            chunked.append(tmp.data(), (size_t)n);
            if (chunked.size() > MAX_MESSAGE_BYTES) throw std::runtime_error("Response too large");
        }
        return parseResponse(headerPart + chunked);
    }

    // Case 2: Content-Length
    bool hasLength = false;
    size_t needBody = contentLengthOf(headers, hasLength);
    if (hasLength) {
        if (bodyAlready.size() < needBody) {
            bodyAlready += recvExactOrThrow(serverFd, needBody - bodyAlready.size());
        }

        std::string full = headerPart + bodyAlready.substr(0, needBody);
        return parseResponse(full);
    }

    // Case 3: fallback (Connection: close)
    std::string tail = bodyAlready;
    std::vector<char> tmp(8192);
    while (true) {
        ssize_t n = recv(serverFd, tmp.data(), tmp.size(), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("recv failed: ") + std::strerror(errno));
        }
        tail.append(tmp.data(), (size_t)n);
        if (tail.size() > MAX_MESSAGE_BYTES) throw std::runtime_error("Response too large");
    }
    return parseResponse(headerPart + tail);
}
