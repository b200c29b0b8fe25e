#include "handlerCatalog.hpp"
#include "edgeErrors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <dlfcn.h>

void HandlerCatalog::registerHandler(const std::string &name, StageHandler fn) {
    if (name.empty() || !fn) {
        throw ConfigError("Handler registration needs a name and a callable");
    }
    std::lock_guard<std::mutex> lock(catalogMutex);
    if (handlers.count(name)) {
        Logger::getInstance().logWarning(NO_REQUEST, "handler '" + name + "' re-registered, replacing");
    }
    handlers[name] = std::move(fn);
}

bool HandlerCatalog::contains(const std::string &name) const {
    std::lock_guard<std::mutex> lock(catalogMutex);
    return handlers.count(name) != 0;
}

HandlerRef HandlerCatalog::lookup(const std::string &name) const {
    std::lock_guard<std::mutex> lock(catalogMutex);
    auto it = handlers.find(name);
    if (it == handlers.end()) {
        throw ConfigError("Unknown handler '" + name + "'");
    }
    return HandlerRef{it->first, it->second};
}

std::vector<std::string> HandlerCatalog::names() const {
    std::lock_guard<std::mutex> lock(catalogMutex);
    std::vector<std::string> out;
    for (const auto &kv : handlers) out.push_back(kv.first);
    return out;
}

void HandlerCatalog::loadPlugin(const std::string &path) {
    {
        std::lock_guard<std::mutex> lock(catalogMutex);
        if (std::find(pluginPaths.begin(), pluginPaths.end(), path) != pluginPaths.end()) {
            Logger::getInstance().logWarning(NO_REQUEST, "multiple loading of plugin " + path);
            return;
        }
    }

    Logger::getInstance().logNote(NO_REQUEST, "loading plugin '" + path + "'");

    void *handle = dlopen(path.c_str(), RTLD_NOW);
    if (!handle) {
        const char *err = dlerror();
        throw ConfigError("unable to load '" + path + "': " + (err ? err : "unknown error"));
    }

    dlerror();
    void *sym = dlsym(handle, EDGESIM_PLUGIN_INIT_SYMBOL);
    const char *symErr = dlerror();
    if (!sym || symErr) {
        std::string msg = "unable to find " EDGESIM_PLUGIN_INIT_SYMBOL " function in '" + path + "'";
        if (symErr) msg += std::string(": ") + symErr;
        dlclose(handle);
        throw ConfigError(msg);
    }

    // Init runs without the lock held: it calls back into registerHandler.
    PluginInitFn init = reinterpret_cast<PluginInitFn>(sym);
    init(*this);

    std::lock_guard<std::mutex> lock(catalogMutex);
    pluginHandles.push_back(handle);
    pluginPaths.push_back(path);
}
