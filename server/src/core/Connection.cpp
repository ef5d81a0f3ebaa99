#include "core/Connection.hpp"

#include <errno.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "core/Errors.hpp"
#include "monitor/Trace.hpp"

Connection::Connection(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)) {}

Connection::~Connection() {
    if (fd_ >= 0) ::close(fd_);
}

void Connection::configure(int idleTimeoutMs) {
    int flag = 1;
    if (setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        FAKEREST_ERR("NET", "TCP_NODELAY failed for " << peer_);
    }

    if (idleTimeoutMs <= 0) return;  // no timeout

    timeval tv{};
    tv.tv_sec = idleTimeoutMs / 1000;
    tv.tv_usec = (idleTimeoutMs % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw IoError(std::string("cannot set socket timeouts: ") + strerror(errno));
    }
}

std::size_t Connection::read(char* buf, std::size_t len) {
    while (true) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0) return static_cast<std::size_t>(n);

        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw IoError("idle timeout reading from " + peer_);
        }
        throw IoError("recv from " + peer_ + ": " + strerror(errno));
    }
}

void Connection::sendAll(const std::string& data) {
    std::size_t total = 0;

    while (total < data.size()) {
        ssize_t sent = ::send(fd_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw IoError("send to " + peer_ + ": " + strerror(errno));
        }
        total += static_cast<std::size_t>(sent);
    }
}
