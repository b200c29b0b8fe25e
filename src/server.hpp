// src/server.hpp

#ifndef SERVER_HPP
#define SERVER_HPP
#include <netinet/in.h>
#include <sys/socket.h>

#include <csignal>

class Server{
    private:
        int port;
        int serverFd;

        static void signalHandler(int signum);

    public:
        // port 0 picks a free port; get_port() reports it after init().
        explicit Server(int port);
        ~Server();

        Server(const Server&) = delete;
        Server& operator=(const Server&) = delete;

        int get_port() const {
            return port;
        }

        int get_serverFd() const {
            return serverFd;
        }

        // Throws std::runtime_error if no address could be bound.
        void init();
        // -1 on failure (errno set); the listener stays usable.
        int acceptConnection(sockaddr_storage &clientAddr, socklen_t &clientAddrSize);
        void shutdown();

        static void setUpSignalHandler();
        // Blocks sig in the calling thread (and threads it creates later).
        static void blockSignal(int sig);
};

#endif
