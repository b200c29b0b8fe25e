#include "config.hpp"
#include "edgeErrors.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

EdgeConfig defaultConfig() {
    EdgeConfig config;
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    config.cacheDir = (tmp / "edge-lambda").string();
    return config;
}

static std::string where(const YAML::Node &node) {
    const YAML::Mark mark = node.Mark();
    if (mark.is_null()) return "";
    return " (line " + std::to_string(mark.line + 1) + ")";
}

// Every key in a map must be one we know.
static void checkKeys(const YAML::Node &map, const std::set<std::string> &allowed, const std::string &context) {
    if (!map.IsMap()) {
        throw ConfigError(context + " must be a map" + where(map));
    }
    for (const auto &kv : map) {
        std::string key = kv.first.as<std::string>();
        if (!allowed.count(key)) {
            throw ConfigError("Unknown key '" + key + "' in " + context + where(kv.first));
        }
    }
}

static std::vector<std::string> stringList(const YAML::Node &node, const std::string &context) {
    if (!node.IsSequence()) {
        throw ConfigError(context + " must be a list" + where(node));
    }
    std::vector<std::string> out;
    for (const auto &item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

static void parseBehaviors(const YAML::Node &node, EdgeConfig &config) {
    if (!node.IsSequence()) {
        throw ConfigError("behaviors must be a list" + where(node));
    }
    for (const auto &item : node) {
        checkKeys(item, {"path_pattern", "event_type", "handler"}, "behavior");
        BehaviorConfig b;
        if (item["path_pattern"]) b.pattern = item["path_pattern"].as<std::string>();
        if (!item["event_type"] || !item["handler"]) {
            throw ConfigError("behavior needs event_type and handler" + where(item));
        }
        b.eventType = item["event_type"].as<std::string>();
        b.handler = item["handler"].as<std::string>();
        try {
            parseStage(b.eventType);
        } catch (const std::invalid_argument &e) {
            throw ConfigError(std::string(e.what()) + where(item["event_type"]));
        }
        config.behaviors.push_back(b);
    }
}

static void parseOrigins(const YAML::Node &node, EdgeConfig &config) {
    if (!node.IsSequence()) {
        throw ConfigError("origins must be a list" + where(node));
    }
    for (const auto &item : node) {
        checkKeys(item, {"path_pattern", "target"}, "origin");
        if (!item["path_pattern"] || !item["target"]) {
            throw ConfigError("origin needs path_pattern and target" + where(item));
        }
        OriginMapping m;
        m.pattern = item["path_pattern"].as<std::string>();
        m.target = item["target"].as<std::string>();
        // Validate early so a bad origin never reaches registry build.
        parseOriginTarget(m.target);
        config.origins.push_back(m);
    }
}

EdgeConfig parseConfig(const std::string &yamlText) {
    EdgeConfig config = defaultConfig();
    try {
        YAML::Node root = YAML::Load(yamlText);
        if (root.IsNull()) {
            return config;
        }
        checkKeys(root, {"listen", "cache_dir", "log_file", "plugin_dir", "plugins", "fingerprint_headers",
                         "origin_timeout_ms", "distribution", "strict_registrations", "behaviors", "origins"},
                  "configuration");

        if (const YAML::Node listen = root["listen"]) {
            checkKeys(listen, {"port", "threads"}, "listen");
            if (listen["port"]) config.port = listen["port"].as<int>();
            if (listen["threads"]) config.threads = listen["threads"].as<size_t>();
        }
        if (root["cache_dir"]) config.cacheDir = root["cache_dir"].as<std::string>();
        if (root["log_file"]) config.logFile = root["log_file"].as<std::string>();
        if (root["plugin_dir"]) config.pluginDir = root["plugin_dir"].as<std::string>();
        if (root["plugins"]) config.plugins = stringList(root["plugins"], "plugins");
        if (root["fingerprint_headers"]) {
            config.fingerprintHeaders = stringList(root["fingerprint_headers"], "fingerprint_headers");
        }
        if (root["origin_timeout_ms"]) config.originTimeoutMs = root["origin_timeout_ms"].as<int>();
        if (const YAML::Node dist = root["distribution"]) {
            checkKeys(dist, {"domain_name", "id"}, "distribution");
            if (dist["domain_name"]) config.distributionDomainName = dist["domain_name"].as<std::string>();
            if (dist["id"]) config.distributionId = dist["id"].as<std::string>();
        }
        if (root["strict_registrations"]) config.strictRegistrations = root["strict_registrations"].as<bool>();
        if (root["behaviors"]) parseBehaviors(root["behaviors"], config);
        if (root["origins"]) parseOrigins(root["origins"], config);
    } catch (const YAML::Exception &e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    if (config.port < 0 || config.port > 65535) {
        throw ConfigError("listen.port out of range: " + std::to_string(config.port));
    }
    if (config.threads == 0) {
        throw ConfigError("listen.threads must be at least 1");
    }
    if (config.originTimeoutMs <= 0) {
        throw ConfigError("origin_timeout_ms must be positive");
    }
    if (config.cacheDir.empty()) {
        throw ConfigError("cache_dir must not be empty");
    }
    return config;
}

EdgeConfig loadConfigFile(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Cannot open configuration file " + path);
    }
    std::ostringstream text;
    text << in.rdbuf();
    try {
        return parseConfig(text.str());
    } catch (const ConfigError &e) {
        throw ConfigError(path + ": " + e.what());
    }
}

std::string resolvePluginPath(const std::string &pluginDir, const std::string &plugin) {
    fs::path p(plugin);
    if (p.is_absolute() || pluginDir.empty()) {
        return p.string();
    }
    return (fs::path(pluginDir) / p).string();
}

std::shared_ptr<const BehaviorRegistry> buildRegistry(const EdgeConfig &config, HandlerCatalog &catalog) {
    for (const auto &plugin : config.plugins) {
        catalog.loadPlugin(resolvePluginPath(config.pluginDir, plugin));
    }

    std::vector<BehaviorRegistration> registrations;
    for (const auto &b : config.behaviors) {
        BehaviorRegistration reg;
        reg.pattern = b.pattern;
        reg.stage = parseStage(b.eventType);
        reg.handler = catalog.lookup(b.handler);
        registrations.push_back(reg);
    }

    RegistryOptions options;
    options.strictRegistrations = config.strictRegistrations;
    return BehaviorRegistry::build(registrations, config.origins, options);
}
