#ifndef UTILS_HPP
#define UTILS_HPP

#include "eventModel.hpp"
#include <map>
#include <string>

// Connect helper. timeoutMs > 0 also bounds every later send/recv on the socket.
// Returns -1 on failure; errorOut (if given) receives the reason.
int connectToOther(const std::string &host, const std::string &portStr, int timeoutMs = 0,
                   std::string *errorOut = nullptr);

// Robust send (handles partial writes)
bool sendAll(int fd, const char *data, size_t len);

// Read full HTTP request from socket (header + optional Content-Length body)
RequestEvent readHttpRequestFromFd(int clientFd);

// Read full HTTP response from socket (header + body using CL/chunked/close)
ResponseArtifact readHttpResponseFromFd(int serverFd);

// Parsing (these expect a complete message string)
RequestEvent parseRequest(const std::string &request);
ResponseArtifact parseResponse(const std::string &response);

// Serialize a request to wire bytes with the given request-target.
std::string requestToString(const std::string &method, const std::string &target,
                            const HeaderMap &headers, const std::string &body);

// Serialize response to wire bytes (binary safe). Content-Length always reflects
// the body; Transfer-Encoding is dropped because bodies are already decoded.
std::string serializeResponseForClient(ResponseArtifact response, bool headOnly = false);

// Status line only, e.g. "HTTP/1.1 200 OK"
std::string statusLine(const ResponseArtifact &response);

// Chunk decoding
std::string handleChunk(const std::string &chunkedBody);

// "a=1; b=2" -> {a:1, b:2}; later duplicates win.
std::map<std::string, std::string> parseCookies(const std::string &cookieHeader);

#endif // UTILS_HPP
