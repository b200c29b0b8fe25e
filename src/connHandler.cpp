#include "connHandler.hpp"
#include "router.hpp"
#include "utils.hpp"
#include "logger.hpp"

#include <unistd.h>
#include <arpa/inet.h>
#include <stdexcept>

std::atomic<int> connHandler::requestCounter{1};

connHandler::connHandler(int clientFd, const sockaddr_storage &clientAddr, Router &router)
    : clientFd(clientFd), clientAddr(clientAddr), router(router) {}

connHandler::~connHandler(){
    if(clientFd >= 0){
        close(clientFd);
    }
}

std::string connHandler::getClientIp() const{
    char ip_str[INET6_ADDRSTRLEN] = {0};
    if(clientAddr.ss_family == AF_INET6){
        const sockaddr_in6 *a6 = reinterpret_cast<const sockaddr_in6 *>(&clientAddr);
        inet_ntop(AF_INET6, &a6->sin6_addr, ip_str, sizeof ip_str);
    } else {
        const sockaddr_in *a4 = reinterpret_cast<const sockaddr_in *>(&clientAddr);
        inet_ntop(AF_INET, &a4->sin_addr, ip_str, sizeof ip_str);
    }
    return std::string(ip_str);
}

void connHandler::respondRaw(const std::string &requestId, const std::string &line){
    Logger::getInstance().logRespond(requestId, line);
    std::string msg = line + "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
    sendAll(clientFd, msg.data(), msg.size());
}

void connHandler::handleConnection(){
    std::string reqId = std::to_string(requestCounter.fetch_add(1));

    RequestEvent req;
    try{
        // Read a full HTTP request (headers + optional body)
        req = readHttpRequestFromFd(clientFd);
    } catch (const std::runtime_error &e) {
        Logger::getInstance().logError(reqId, std::string("Bad request: ") + e.what());
        respondRaw(reqId, "HTTP/1.1 400 Bad Request");
        return;
    }

    req.clientIp = getClientIp();
    for(const auto &cookieHeader : req.headers.getAll("Cookie")){
        for(const auto &kv : parseCookies(cookieHeader)){
            req.cookies[kv.first] = kv.second;
        }
    }

    Logger::getInstance().logNewRequest(reqId, req.method + " " + req.url, req.clientIp);

    ResponseArtifact response = router.handle(req, reqId);
    response.headers.set("Connection", "close");

    Logger::getInstance().logRespond(reqId, statusLine(response));
    std::string wire = serializeResponseForClient(response, req.method == "HEAD");
    if(!sendAll(clientFd, wire.data(), wire.size())){
        Logger::getInstance().logError(reqId, "send to client failed");
    }
}
