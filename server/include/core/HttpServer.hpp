#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "core/RequestParser.hpp"
#include "core/ResponseResolver.hpp"
#include "monitor/Logger.hpp"

class Config;
class Connection;
class Socket;
class ThreadPool;

class HttpServer {
public:
    explicit HttpServer(const Config& cfg);
    ~HttpServer();

    // Binds, listens and runs the accept loop until stop(). False if the
    // listener could not be set up.
    bool start();

    // Async-signal-safe: only flips the flag and wakes accept().
    void stop();

private:
    std::string  host;
    int          port;
    int          threadCount;
    int          idleTimeoutMs;
    ParserLimits limits;

    std::atomic<bool> isRunning{false};
    std::size_t       nextTaskId = 0;

    // shares the immutable route table with every task
    ResponseResolver resolver;

    std::unique_ptr<Socket>     serverSocket;
    std::unique_ptr<ThreadPool> threadPool;
    std::unique_ptr<Logger>     logger;

private:
    // serveConnection() plus the access-log row.
    void handleClient(Connection& conn);
};

// One connection, start to finish: read the header block, resolve, write the
// response. Legacy mode writes nothing when resolution throws. Never throws;
// the returned row describes what happened.
LogEntry serveConnection(Connection& conn, const ResponseResolver& resolver,
                         const ParserLimits& limits, int idleTimeoutMs);
