#ifndef ROUTER_HPP
#define ROUTER_HPP

#include "behaviorRegistry.hpp"
#include "cacheStore.hpp"
#include "eventModel.hpp"
#include "originClient.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

struct RouterOptions{
    std::vector<std::string> fingerprintHeaders;
    std::string distributionDomainName = "d111111abcdef8.cloudfront.net";
    std::string distributionId = "EDFDVBD6EXAMPLE";
};

// Owns the cache, the origin client and the current behavior registry for the
// life of the process. Safe to call from many worker threads at once.
class Router{
public:
    Router(std::unique_ptr<CacheStore> cache, std::unique_ptr<OriginClient> originClient,
           RouterOptions options = RouterOptions());

    Router(Router const&) = delete;
    Router& operator=(Router const&) = delete;

    // Publishes a complete registry; in-flight requests keep the one they started with.
    void reload(std::shared_ptr<const BehaviorRegistry> registry);
    std::shared_ptr<const BehaviorRegistry> registry() const;

    // Runs one request to completion. Pipeline failures come back as error
    // responses ({code, message} JSON), never as exceptions.
    ResponseArtifact handle(const RequestEvent &request, const std::string &requestId);

    CacheStore &cache() { return *responseCache; }
    const RouterOptions &options() const { return routerOptions; }

private:
    std::unique_ptr<CacheStore> responseCache;
    std::unique_ptr<OriginClient> origin;
    RouterOptions routerOptions;

    mutable std::shared_mutex registryMutex;
    std::shared_ptr<const BehaviorRegistry> currentRegistry;

    ResponseArtifact purge(const std::string &requestId);
};

// Error response carrying {"code": status, "message": message} as JSON.
ResponseArtifact makeErrorResponse(int status, const std::string &payload);

#endif // ROUTER_HPP
