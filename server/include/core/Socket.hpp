#pragma once
#include <string>

// Listening TCP socket.
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool bind(const std::string& host, int port);
    bool listen();

    // Returns the client fd (or -1) and fills `peer` with "ip:port".
    int acceptClient(std::string& peer);

    // Wakes a blocked acceptClient(); safe to call from a signal handler.
    void interrupt();

    void closeSocket();

    bool isValid() const { return serverFd >= 0; }

private:
    int serverFd;
};
