#ifndef HANDLERCATALOG_HPP
#define HANDLERCATALOG_HPP

#include "eventModel.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// May throw; the lifecycle turns any exception into HandlerExecutionError.
typedef std::function<StageResult(const StageEvent &)> StageHandler;

struct HandlerRef{
    std::string name;
    StageHandler fn;
};

class HandlerCatalog;

// Symbol every plugin exports.
extern "C" {
typedef void (*PluginInitFn)(HandlerCatalog &catalog);
}
#define EDGESIM_PLUGIN_INIT_SYMBOL "EdgeSimPluginInit"

// Named handlers available to behavior configuration.
class HandlerCatalog{
public:
    HandlerCatalog() {}

    HandlerCatalog(HandlerCatalog const&) = delete;
    HandlerCatalog& operator=(HandlerCatalog const&) = delete;

    // Replaces an existing handler with the same name.
    void registerHandler(const std::string &name, StageHandler fn);

    bool contains(const std::string &name) const;
    // Throws ConfigError for unknown names.
    HandlerRef lookup(const std::string &name) const;
    std::vector<std::string> names() const;

    // dlopen + EdgeSimPluginInit. Throws ConfigError.
    void loadPlugin(const std::string &path);
    const std::vector<std::string> &loadedPlugins() const { return pluginPaths; }

private:
    mutable std::mutex catalogMutex;
    std::map<std::string, StageHandler> handlers;
    // Never dlclose'd: registries hold copies of handlers living in the plugin.
    std::vector<void *> pluginHandles;
    std::vector<std::string> pluginPaths;
};

#endif // HANDLERCATALOG_HPP
