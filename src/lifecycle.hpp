#ifndef LIFECYCLE_HPP
#define LIFECYCLE_HPP

#include "behaviorRegistry.hpp"
#include "cacheStore.hpp"
#include "eventModel.hpp"
#include "originClient.hpp"
#include <optional>
#include <string>
#include <vector>

enum class LifecycleState{
    ViewerRequest,
    OriginRequest,
    FetchOrigin,
    OriginResponse,
    ViewerResponse,
    Done
};

const char *lifecycleStateName(LifecycleState state);

// Runs one request through the four stages. Created per request; borrows the
// behavior, cache and origin client, owns its copy of the event.
class LifecycleEngine{
public:
    LifecycleEngine(const Behavior &behavior, CacheStore &cache, OriginClient &originClient,
                    RequestEvent request, EventContext context,
                    const std::vector<std::string> &fingerprintHeaders);

    LifecycleEngine(LifecycleEngine const&) = delete;
    LifecycleEngine& operator=(LifecycleEngine const&) = delete;

    // Throws an EdgeError subclass on failure; DONE is reached either way.
    // A second call throws std::logic_error.
    ResponseArtifact run();

    LifecycleState state() const { return current; }
    const std::vector<LifecycleState> &transitions() const { return visited; }

    bool shortCircuited() const { return shortCircuit; }
    bool servedFromCache() const { return cacheHit; }
    bool originContacted() const { return originCalled; }
    const std::string &fingerprint() const { return cacheKey; }
    const RequestEvent &request() const { return currentRequest; }

private:
    const Behavior &behavior;
    CacheStore &cache;
    OriginClient &originClient;
    EventContext context;
    const std::vector<std::string> &fingerprintHeaders;

    RequestEvent currentRequest;
    std::optional<ResponseArtifact> currentResponse;

    LifecycleState current;
    std::vector<LifecycleState> visited;
    bool started;
    bool shortCircuit;
    bool cacheHit;
    bool originCalled;
    std::string cacheKey;

    void enter(LifecycleState next);
    StageResult invoke(const HandlerRef &handler, Stage stage);

    // true when the handler answered with a response
    bool runRequestStage(Stage stage);
    void fetchOrigin();
    void runResponseStage(Stage stage);
};

#endif // LIFECYCLE_HPP
