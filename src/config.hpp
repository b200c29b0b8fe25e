#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "behaviorRegistry.hpp"
#include "handlerCatalog.hpp"
#include <memory>
#include <string>
#include <vector>

struct BehaviorConfig{
    std::string pattern = CATCH_ALL_PATTERN;
    std::string eventType;
    std::string handler;
};

struct EdgeConfig{
    int port = 8080;
    size_t threads = 4;
    std::string cacheDir;       // defaults to <tmp>/edge-lambda
    std::string logFile;        // empty: stderr
    std::string pluginDir;      // base for relative plugin paths
    std::vector<std::string> plugins;
    std::vector<std::string> fingerprintHeaders;
    int originTimeoutMs = 30000;
    std::string distributionDomainName = "d111111abcdef8.cloudfront.net";
    std::string distributionId = "EDFDVBD6EXAMPLE";
    bool strictRegistrations = false;
    std::vector<BehaviorConfig> behaviors;
    std::vector<OriginMapping> origins;
};

EdgeConfig defaultConfig();

// Both throw ConfigError with the offending key or YAML position in the message.
EdgeConfig parseConfig(const std::string &yamlText);
EdgeConfig loadConfigFile(const std::string &path);

std::string resolvePluginPath(const std::string &pluginDir, const std::string &plugin);

// Loads the configured plugins into catalog, then builds the registry.
// Throws ConfigError or InvalidPattern; nothing is published on failure.
std::shared_ptr<const BehaviorRegistry> buildRegistry(const EdgeConfig &config, HandlerCatalog &catalog);

#endif // CONFIG_HPP
