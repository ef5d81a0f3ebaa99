#include "core/Socket.hpp"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <netinet/tcp.h>   // TCP_NODELAY

#include "monitor/Trace.hpp"

Socket::Socket() {
    serverFd = socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd < 0) {
        FAKEREST_ERR("NET", "Cannot create socket");
        return;
    }

    int opt = 1;

    // restart without waiting for TIME_WAIT
    if (setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        FAKEREST_ERR("NET", "setsockopt SO_REUSEADDR failed");
    }

    if (setsockopt(serverFd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        FAKEREST_ERR("NET", "setsockopt TCP_NODELAY failed");
    }
}

Socket::~Socket() {
    if (serverFd >= 0) ::close(serverFd);
}

bool Socket::bind(const std::string& host, int port) {
    if (serverFd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(static_cast<uint16_t>(port));

    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        FAKEREST_ERR("NET", "Invalid IPv4 address: " << host);
        return false;
    }

    return ::bind(serverFd, (sockaddr*)&addr, sizeof(addr)) >= 0;
}

bool Socket::listen() {
    return ::listen(serverFd, 1024) >= 0;
}

int Socket::acceptClient(std::string& peer) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);

    int fd = ::accept(serverFd, (sockaddr*)&addr, &len);
    if (fd < 0) return fd;

    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
        peer = "unknown";
    } else {
        peer = std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
    }
    return fd;
}

void Socket::interrupt() {
    if (serverFd >= 0) ::shutdown(serverFd, SHUT_RDWR);
}

void Socket::closeSocket() {
    if (serverFd >= 0) {
        ::close(serverFd);
        serverFd = -1;
    }
}
