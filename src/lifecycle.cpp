#include "lifecycle.hpp"
#include "edgeErrors.hpp"
#include "fingerprint.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <stdexcept>

const char *lifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::ViewerRequest:  return "VIEWER_REQUEST";
        case LifecycleState::OriginRequest:  return "ORIGIN_REQUEST";
        case LifecycleState::FetchOrigin:    return "FETCH_ORIGIN";
        case LifecycleState::OriginResponse: return "ORIGIN_RESPONSE";
        case LifecycleState::ViewerResponse: return "VIEWER_RESPONSE";
        case LifecycleState::Done:           return "DONE";
    }
    return "UNKNOWN";
}

LifecycleEngine::LifecycleEngine(const Behavior &behavior, CacheStore &cache, OriginClient &originClient,
                                 RequestEvent request, EventContext context,
                                 const std::vector<std::string> &fingerprintHeaders)
    : behavior(behavior), cache(cache), originClient(originClient), context(std::move(context)),
      fingerprintHeaders(fingerprintHeaders), currentRequest(std::move(request)),
      current(LifecycleState::ViewerRequest), started(false), shortCircuit(false),
      cacheHit(false), originCalled(false) {}

void LifecycleEngine::enter(LifecycleState next) {
    current = next;
    visited.push_back(next);
}

ResponseArtifact LifecycleEngine::run() {
    if (started) {
        throw std::logic_error("LifecycleEngine::run called twice");
    }
    started = true;

    try {
        enter(LifecycleState::ViewerRequest);
        if (!runRequestStage(Stage::ViewerRequest)) {
            enter(LifecycleState::OriginRequest);
            if (!runRequestStage(Stage::OriginRequest)) {
                enter(LifecycleState::FetchOrigin);
                fetchOrigin();

                enter(LifecycleState::OriginResponse);
                runResponseStage(Stage::OriginResponse);

                enter(LifecycleState::ViewerResponse);
                runResponseStage(Stage::ViewerResponse);
            }
        }
    } catch (...) {
        // Failures end the run too; the error itself goes to the caller untouched.
        enter(LifecycleState::Done);
        throw;
    }

    enter(LifecycleState::Done);
    if (!currentResponse) {
        throw IncompleteLifecycle();
    }
    return *currentResponse;
}

StageResult LifecycleEngine::invoke(const HandlerRef &handler, Stage stage) {
    StageEvent event;
    event.config = context;
    event.config.stage = stage;
    event.request = currentRequest;
    event.response = currentResponse ? &*currentResponse : nullptr;

    try {
        return handler.fn(event);
    } catch (const std::exception &e) {
        throw HandlerExecutionError(stage, handler.name + ": " + e.what());
    } catch (...) {
        throw HandlerExecutionError(stage, handler.name + ": unknown exception");
    }
}

bool LifecycleEngine::runRequestStage(Stage stage) {
    const HandlerRef *handler = behavior.handlerFor(stage);
    if (!handler) {
        return false;
    }

    StageResult result = invoke(*handler, stage);
    switch (result.kind()) {
        case StageResult::Kind::Request:
            currentRequest = std::move(result.request());
            Logger::getInstance().logStage(context.requestId, stageName(stage), handler->name + " forwarded request");
            return false;
        case StageResult::Kind::Response:
            currentResponse = std::move(result.response());
            shortCircuit = true;
            Logger::getInstance().logStage(context.requestId, stageName(stage),
                                           handler->name + " short-circuit " + statusLine(*currentResponse));
            return true;
        case StageResult::Kind::Empty:
            break;
    }
    throw InvalidHandlerResult(stage, "'" + handler->name + "' returned neither a request nor a response");
}

void LifecycleEngine::fetchOrigin() {
    Logger &log = Logger::getInstance();

    cacheKey = computeFingerprint(currentRequest, fingerprintHeaders);
    std::optional<CacheEntry> hit = cache.lookup(cacheKey, context.requestId);
    if (hit) {
        log.logCachedAt(context.requestId, hit->getStoredAtString());
        currentResponse = std::move(hit->response);
        cacheHit = true;
        return;
    }
    log.logCacheStatus(context.requestId, "not in cache");

    if (!behavior.origin) {
        throw NoOriginConfigured(behavior.pattern);
    }

    originCalled = true;
    ResponseArtifact fetched;
    try {
        fetched = originClient.fetch(currentRequest, *behavior.origin, context.requestId);
    } catch (const OriginUnavailable &) {
        throw;
    } catch (const std::exception &e) {
        throw OriginUnavailable(e.what());
    }

    cache.store(cacheKey, fetched, context.requestId);
    log.logCacheStatus(context.requestId, "cached");
    currentResponse = std::move(fetched);
}

void LifecycleEngine::runResponseStage(Stage stage) {
    const HandlerRef *handler = behavior.handlerFor(stage);
    if (!handler) {
        return;
    }

    StageResult result = invoke(*handler, stage);
    if (!result.isResponse()) {
        throw InvalidHandlerResult(stage, "'" + handler->name + "' must return a response");
    }
    currentResponse = std::move(result.response());
    Logger::getInstance().logStage(context.requestId, stageName(stage),
                                   handler->name + " " + statusLine(*currentResponse));
}
