#include "router.hpp"
#include "edgeErrors.hpp"
#include "lifecycle.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <mutex>
#include <stdexcept>

Router::Router(std::unique_ptr<CacheStore> cache, std::unique_ptr<OriginClient> originClient,
               RouterOptions options)
    : responseCache(std::move(cache)), origin(std::move(originClient)), routerOptions(std::move(options)) {
    if (!responseCache || !origin) {
        throw std::invalid_argument("Router needs a cache and an origin client");
    }
}

void Router::reload(std::shared_ptr<const BehaviorRegistry> registry) {
    if (!registry) {
        throw std::invalid_argument("Router::reload needs a registry");
    }
    std::unique_lock<std::shared_mutex> lock(registryMutex);
    currentRegistry = std::move(registry);
}

std::shared_ptr<const BehaviorRegistry> Router::registry() const {
    std::shared_lock<std::shared_mutex> lock(registryMutex);
    return currentRegistry;
}

ResponseArtifact makeErrorResponse(int status, const std::string &payload) {
    ResponseArtifact res;
    res.status = status;
    res.statusDescription = reasonPhrase(status);
    res.headers.add("Content-Type", "application/json");
    res.body = payload;
    return res;
}

ResponseArtifact Router::purge(const std::string &requestId) {
    responseCache->purgeAll();
    Logger::getInstance().logNote(requestId, "PURGE: cache cleared");

    ResponseArtifact res;
    res.status = 200;
    res.statusDescription = reasonPhrase(200);
    return res;
}

ResponseArtifact Router::handle(const RequestEvent &request, const std::string &requestId) {
    Logger &log = Logger::getInstance();
    try {
        if (toLowerCopy(request.method) == "purge") {
            return purge(requestId);
        }

        // Hold the snapshot for the whole run: the engine borrows its behavior.
        std::shared_ptr<const BehaviorRegistry> snapshot = registry();
        std::string path = request.path();
        if (!snapshot) {
            throw NoMatchingBehavior(path);
        }
        const Behavior *behavior = snapshot->resolve(path);
        log.logBehavior(requestId, behavior->pattern);

        EventContext context;
        context.stage = Stage::ViewerRequest;
        context.requestId = requestId;
        context.distributionDomainName = routerOptions.distributionDomainName;
        context.distributionId = routerOptions.distributionId;

        LifecycleEngine engine(*behavior, *responseCache, *origin, request, context,
                               routerOptions.fingerprintHeaders);
        return engine.run();
    } catch (const EdgeError &e) {
        log.logError(requestId, std::string(errorCodeName(e.code())) + ": " + e.what());
        return makeErrorResponse(e.httpStatus(), e.responsePayload());
    } catch (const std::exception &e) {
        log.logError(requestId, e.what());
        return makeErrorResponse(500, errorPayload(500, e.what()));
    }
}
