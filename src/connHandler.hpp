#ifndef CONNHANDLER_HPP
#define CONNHANDLER_HPP

#include <string>
#include <netinet/in.h>
#include <atomic>

class Router;

// One accepted client connection: one request in, one response out.
class connHandler {
public:
    connHandler(int clientFd, const sockaddr_storage &clientAddr, Router &router);
    ~connHandler();

    connHandler(const connHandler&) = delete;
    connHandler& operator=(const connHandler&) = delete;

    void handleConnection();

private:
    int clientFd;
    const sockaddr_storage clientAddr;
    Router &router;
    static std::atomic<int> requestCounter;

    std::string getClientIp() const;
    void respondRaw(const std::string &requestId, const std::string &statusLine);
};

#endif // CONNHANDLER_HPP
