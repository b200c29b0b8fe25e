#ifndef BEHAVIORREGISTRY_HPP
#define BEHAVIORREGISTRY_HPP

#include "eventModel.hpp"
#include "handlerCatalog.hpp"
#include "originClient.hpp"
#include "pathPattern.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static const char *const CATCH_ALL_PATTERN = "*";

struct Behavior{
    std::string pattern;
    std::shared_ptr<const Matcher> matcher;
    std::array<std::optional<HandlerRef>, STAGE_COUNT> stages;
    std::optional<OriginTarget> origin;

    // nullptr when the stage is a pass-through.
    const HandlerRef *handlerFor(Stage stage) const;
};

struct BehaviorRegistration{
    std::string pattern;
    Stage stage;
    HandlerRef handler;
};

struct OriginMapping{
    std::string pattern;
    std::string target;
};

struct RegistryOptions{
    // Reject a second handler for the same (pattern, stage) instead of replacing.
    bool strictRegistrations = false;
};

class BehaviorRegistry{
public:
    // Throws InvalidPattern, or ConfigError for bad origins and strict duplicates.
    static std::shared_ptr<const BehaviorRegistry> build(const std::vector<BehaviorRegistration> &registrations,
                                                         const std::vector<OriginMapping> &origins,
                                                         const RegistryOptions &options = RegistryOptions());

    // Never nullptr: falls back to the catch-all.
    const Behavior *resolve(const std::string &path) const;

    const Behavior &catchAll() const { return behaviorList.back(); }
    // Registration order; the catch-all is always last.
    const std::vector<Behavior> &behaviors() const { return behaviorList; }
    const Behavior *find(const std::string &pattern) const;

    void logBehaviors() const;

private:
    BehaviorRegistry() {}

    std::vector<Behavior> behaviorList;
};

#endif // BEHAVIORREGISTRY_HPP
