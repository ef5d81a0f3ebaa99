#pragma once
#include <string>

#include "core/RequestParser.hpp"

// Owns an accepted client socket; closes it on destruction.
class Connection : public ByteSource {
public:
    Connection(int fd, std::string peer);
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // SO_RCVTIMEO / SO_SNDTIMEO, plus TCP_NODELAY.
    void configure(int idleTimeoutMs);

    // recv() wrapper: 0 on orderly close, IoError on failure or idle timeout.
    std::size_t read(char* buf, std::size_t len) override;

    // Writes everything or throws IoError.
    void sendAll(const std::string& data);

    const std::string& peer() const { return peer_; }

private:
    int fd_;
    std::string peer_;
};
