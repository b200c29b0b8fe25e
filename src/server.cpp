//server.cpp
#include "server.hpp"
#include "logger.hpp"
#include <netdb.h>
#include <pthread.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

//no throw
Server::Server(int port) : port(port), serverFd(-1){}

Server::~Server() {
    shutdown();
}

void Server::shutdown(){
    if(serverFd != -1){
        if(close(serverFd) < 0){
            Logger::getInstance().logError(NO_REQUEST, std::string("close error: ") + std::strerror(errno));
        }
        serverFd = -1;
    }
}

//basic guarantee
//When errors occur, resources are released, and the server state remains consistent.
void Server::init(){
    struct addrinfo hints, *serverInfo;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    int status = getaddrinfo(nullptr, std::to_string(port).c_str(), &hints, &serverInfo);
    if(status != 0){
        throw std::runtime_error(std::string("getaddrinfo error: ") + gai_strerror(status));
    }

    int opt = 1;
    int lastErr = 0;
    struct addrinfo *p;
    for(p = serverInfo; p != nullptr; p = p->ai_next){
        serverFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if(serverFd < 0){
            lastErr = errno;
            continue;
        }

        if(setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0 ||
           bind(serverFd, p->ai_addr, p->ai_addrlen) < 0 ||
           listen(serverFd, SOMAXCONN) < 0){
            lastErr = errno;
            close(serverFd);
            serverFd = -1;
            continue;
        }
        break;
    }
    freeaddrinfo(serverInfo);

    if(p == nullptr){
        throw std::runtime_error("Failed to bind port " + std::to_string(port) + ": " + std::strerror(lastErr));
    }

    if(port == 0){
        struct sockaddr_in addr;
        socklen_t len = sizeof(addr);
        if(getsockname(serverFd, (struct sockaddr *)&addr, &len) != 0){
            int err = errno;
            shutdown();
            throw std::runtime_error(std::string("getsockname error: ") + std::strerror(err));
        }
        port = ntohs(addr.sin_port);
    }
}

//basic guarantee
int Server::acceptConnection(sockaddr_storage &clientAddr, socklen_t &clientAddrSize){
    int clientFd = accept(serverFd, (struct sockaddr *)&clientAddr, &clientAddrSize);
    if(clientFd < 0 && errno != EINTR){
        Logger::getInstance().logError(NO_REQUEST, std::string("accept error: ") + std::strerror(errno));
    }
    return clientFd;
}

void Server::setUpSignalHandler(){
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = Server::signalHandler;
    sa.sa_flags = SA_RESTART;
    //make sure won't block other signals wihle executing signalHandler
    sigemptyset(&sa.sa_mask);
    if(sigaction(SIGINT, &sa, nullptr) < 0 || sigaction(SIGTERM, &sa, nullptr) < 0){
        throw std::runtime_error(std::string("signal handler error: ") + std::strerror(errno));
    }
    // A client hanging up mid-response must not kill the process.
    signal(SIGPIPE, SIG_IGN);
}

void Server::blockSignal(int sig){
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, sig);
    int err = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if(err != 0){
        throw std::runtime_error(std::string("pthread_sigmask error: ") + std::strerror(err));
    }
}

void Server::signalHandler(int signum){
    const char *msg;
    switch(signum){
        case SIGINT:
            msg = "Caught Ctrl+C, shutting down...\n";
            break;
        case SIGTERM:
            msg = "Caught kill command, shutting down...\n";
            break;
        default:
            msg = "Unknown signal, shutting down...\n";
            break;
    }
    ssize_t ignored = write(STDOUT_FILENO, msg, strlen(msg));
    (void)ignored;
    _exit(EXIT_SUCCESS);
}
