//edge_sim/src/main.cpp

#include "config.hpp"
#include "connHandler.hpp"
#include "edgeErrors.hpp"
#include "handlerCatalog.hpp"
#include "logger.hpp"
#include "router.hpp"
#include "server.hpp"
#include "threadPool.hpp"

#include <getopt.h>
#include <unistd.h>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

static void usage(const char *prog){
    std::cout << "Usage: " << prog << " [options]\n"
              << "  -c, --config FILE      YAML behavior/origin configuration\n"
              << "  -p, --port PORT        listen port (default 8080)\n"
              << "  -d, --cache-dir DIR    durable response cache directory\n"
              << "  -l, --log-file FILE    log file (default stderr)\n"
              << "  -t, --threads N        worker threads (default 4)\n"
              << "  -h, --help             show this help\n"
              << "Send PURGE to any path to clear the cache, SIGHUP to reload the configuration.\n";
}

struct CliOptions{
    std::string configPath;
    int port = -1;
    std::string cacheDir;
    std::string logFile;
    bool logFileSet = false;
    long threads = -1;
};

static int parseNumber(const char *arg, const char *what){
    try {
        size_t used = 0;
        int v = std::stoi(arg, &used);
        if (arg[used] != '\0') throw std::invalid_argument(what);
        return v;
    } catch (const std::logic_error &) {
        throw ConfigError(std::string("Invalid ") + what + ": " + arg);
    }
}

// false when the process should exit right away (help shown).
static bool parseArgs(int argc, char **argv, CliOptions &cli){
    static const struct option longOpts[] = {
        {"config",    required_argument, nullptr, 'c'},
        {"port",      required_argument, nullptr, 'p'},
        {"cache-dir", required_argument, nullptr, 'd'},
        {"log-file",  required_argument, nullptr, 'l'},
        {"threads",   required_argument, nullptr, 't'},
        {"help",      no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while((opt = getopt_long(argc, argv, "c:p:d:l:t:h", longOpts, nullptr)) != -1){
        switch(opt){
            case 'c': cli.configPath = optarg; break;
            case 'p':
                cli.port = parseNumber(optarg, "port");
                if (cli.port < 0 || cli.port > 65535) throw ConfigError(std::string("port out of range: ") + optarg);
                break;
            case 'd': cli.cacheDir = optarg; break;
            case 'l': cli.logFile = optarg; cli.logFileSet = true; break;
            case 't':
                cli.threads = parseNumber(optarg, "thread count");
                if (cli.threads < 1) throw ConfigError(std::string("thread count must be at least 1: ") + optarg);
                break;
            case 'h': usage(argv[0]); return false;
            default:
                usage(argv[0]);
                throw ConfigError("Invalid command line");
        }
    }
    return true;
}

static EdgeConfig readConfig(const CliOptions &cli){
    EdgeConfig config = cli.configPath.empty() ? defaultConfig() : loadConfigFile(cli.configPath);
    if (cli.port >= 0) config.port = cli.port;
    if (!cli.cacheDir.empty()) config.cacheDir = cli.cacheDir;
    if (cli.logFileSet) config.logFile = cli.logFile;
    if (cli.threads > 0) config.threads = (size_t)cli.threads;
    return config;
}

// SIGHUP: re-read the configuration and swap the registry. Failures keep the old one.
static void reloadLoop(const CliOptions cli, Router &router, HandlerCatalog &catalog){
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGHUP);
    for(;;){
        int sig = 0;
        if(sigwait(&set, &sig) != 0) continue;

        Logger::getInstance().logNote(NO_REQUEST, "SIGHUP: reloading configuration");
        try {
            EdgeConfig config = readConfig(cli);
            router.reload(buildRegistry(config, catalog));
            router.registry()->logBehaviors();
        } catch (const std::exception &e) {
            Logger::getInstance().logError(NO_REQUEST, std::string("reload failed, keeping previous behaviors: ") + e.what());
        }
    }
}

int main(int argc, char **argv){
    CliOptions cli;
    EdgeConfig config;
    try {
        if(!parseArgs(argc, argv, cli)){
            return 0;
        }
        config = readConfig(cli);
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    Logger &log = Logger::getInstance();
    log.open(config.logFile);

    HandlerCatalog catalog;
    std::unique_ptr<Router> router;
    Server server(config.port);
    //basic guarentee
    //Nothing is served unless every behavior, plugin and the cache are ready.
    try {
        Server::setUpSignalHandler();
        // Before any thread exists, so only the reload thread receives SIGHUP.
        Server::blockSignal(SIGHUP);

        RouterOptions options;
        options.fingerprintHeaders = config.fingerprintHeaders;
        options.distributionDomainName = config.distributionDomainName;
        options.distributionId = config.distributionId;

        router.reset(new Router(std::unique_ptr<CacheStore>(new CacheStore(config.cacheDir)),
                                std::unique_ptr<OriginClient>(new HttpOriginClient(config.originTimeoutMs)),
                                options));
        router->reload(buildRegistry(config, catalog));

        log.logNote(NO_REQUEST, "cache directory file://" + router->cache().directory());
        router->registry()->logBehaviors();

        server.init();
        std::cout << "Edge simulator listening on port " << server.get_port() << std::endl;
    }
    catch (const std::exception &e) {
        log.logError(NO_REQUEST, std::string("startup failed: ") + e.what());
        std::cerr << "Startup error: " << e.what() << std::endl;
        return 1;
    }

    std::thread(reloadLoop, cli, std::ref(*router), std::ref(catalog)).detach();

    ThreadPool pool(config.threads);
    Router &shared = *router;

    while (true) {
        //basic guarantee
        //a failed accept or a failing connection never stops the loop
        sockaddr_storage clientAddr;
        socklen_t addrSize = sizeof(clientAddr);
        int clientFd = server.acceptConnection(clientAddr, addrSize);
        if (clientFd < 0) {
            continue;
        }

        bool queued = pool.enqueue([clientFd, clientAddr, &shared]() {
            connHandler handler(clientFd, clientAddr, shared);
            handler.handleConnection();
        });
        if (!queued) {
            close(clientFd);
        }
    }
    return 0;
}
