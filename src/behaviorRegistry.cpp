#include "behaviorRegistry.hpp"
#include "edgeErrors.hpp"
#include "logger.hpp"
#include <map>

const HandlerRef *Behavior::handlerFor(Stage stage) const {
    const auto &slot = stages[(size_t)stage];
    return slot ? &*slot : nullptr;
}

std::shared_ptr<const BehaviorRegistry> BehaviorRegistry::build(const std::vector<BehaviorRegistration> &registrations,
                                                                const std::vector<OriginMapping> &origins,
                                                                const RegistryOptions &options){
    // Built privately and only handed out once complete.
    std::shared_ptr<BehaviorRegistry> registry(new BehaviorRegistry());
    std::map<std::string, size_t> index;
    std::optional<Behavior> catchAll;

    auto behaviorFor = [&](const std::string &pattern) -> Behavior & {
        if (pattern == CATCH_ALL_PATTERN) {
            if (!catchAll) {
                catchAll = Behavior();
                catchAll->pattern = pattern;
                catchAll->matcher = PathPatternMatcher::getInstance().compile(pattern);
            }
            return *catchAll;
        }
        auto it = index.find(pattern);
        if (it != index.end()) {
            return registry->behaviorList[it->second];
        }
        Behavior b;
        b.pattern = pattern;
        b.matcher = PathPatternMatcher::getInstance().compile(pattern);
        index[pattern] = registry->behaviorList.size();
        registry->behaviorList.push_back(std::move(b));
        return registry->behaviorList.back();
    };

    for (const auto &reg : registrations) {
        Behavior &b = behaviorFor(reg.pattern);
        auto &slot = b.stages[(size_t)reg.stage];
        if (slot) {
            std::string msg = "duplicate " + std::string(stageName(reg.stage)) + " handler for path pattern " +
                              reg.pattern + ": '" + slot->name + "' then '" + reg.handler.name + "'";
            if (options.strictRegistrations) {
                throw ConfigError(msg);
            }
            Logger::getInstance().logWarning(NO_REQUEST, msg + ", keeping the last");
        }
        slot = reg.handler;
    }

    for (const auto &mapping : origins) {
        Behavior &b = behaviorFor(mapping.pattern);
        if (b.origin) {
            Logger::getInstance().logWarning(NO_REQUEST, "origin for path pattern " + mapping.pattern +
                                             " redefined, keeping " + mapping.target);
        }
        b.origin = parseOriginTarget(mapping.target);
    }

    if (!catchAll) {
        behaviorFor(CATCH_ALL_PATTERN);
    }
    registry->behaviorList.push_back(std::move(*catchAll));
    return registry;
}

const Behavior *BehaviorRegistry::resolve(const std::string &path) const {
    for (size_t i = 0; i + 1 < behaviorList.size(); ++i) {
        if (behaviorList[i].matcher->matches(path)) {
            return &behaviorList[i];
        }
    }
    return &behaviorList.back();
}

const Behavior *BehaviorRegistry::find(const std::string &pattern) const {
    for (const auto &b : behaviorList) {
        if (b.pattern == pattern) return &b;
    }
    return nullptr;
}

void BehaviorRegistry::logBehaviors() const {
    Logger &log = Logger::getInstance();
    for (const auto &b : behaviorList) {
        log.logNote(NO_REQUEST, "behavior " + b.pattern);
        for (size_t s = 0; s < STAGE_COUNT; ++s) {
            if (b.stages[s]) {
                log.logNote(NO_REQUEST, std::string(stageName((Stage)s)) + " => " + b.stages[s]->name);
            }
        }
        if (b.origin) {
            log.logNote(NO_REQUEST, "origin => " + b.origin->baseUrl);
        }
    }
}
