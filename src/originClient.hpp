#ifndef ORIGINCLIENT_HPP
#define ORIGINCLIENT_HPP

#include "eventModel.hpp"
#include <string>

struct OriginTarget{
    enum class Scheme{
        Http,
        File
    };

    std::string baseUrl;
    Scheme scheme = Scheme::Http;
    std::string host;       // Http only
    std::string port = "80";
    std::string pathPrefix; // Http: prefix without trailing '/'. File: base directory.
};

// Accepts http://host[:port][/prefix] and file:///abs/dir. Throws ConfigError.
OriginTarget parseOriginTarget(const std::string &baseUrl);

// Resolves "a/./b/../c" style segments and duplicate slashes; always starts with '/'.
std::string normalizePath(const std::string &path);

class OriginClient{
public:
    virtual ~OriginClient() {}

    // Throws OriginUnavailable.
    virtual ResponseArtifact fetch(const RequestEvent &request, const OriginTarget &origin,
                                   const std::string &requestId) = 0;
};

class HttpOriginClient : public OriginClient{
public:
    explicit HttpOriginClient(int timeoutMs = 30000);

    ResponseArtifact fetch(const RequestEvent &request, const OriginTarget &origin,
                           const std::string &requestId) override;

    int timeout() const { return timeoutMs; }

private:
    int timeoutMs;

    ResponseArtifact fetchHttp(const RequestEvent &request, const OriginTarget &origin,
                               const std::string &requestId);
    ResponseArtifact fetchFile(const RequestEvent &request, const OriginTarget &origin,
                               const std::string &requestId);
};

#endif // ORIGINCLIENT_HPP
