#include "core/HttpServer.hpp"

#include <errno.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

#include "core/Connection.hpp"
#include "core/Errors.hpp"
#include "core/Socket.hpp"
#include "monitor/Logger.hpp"
#include "monitor/Trace.hpp"
#include "threadpool/ThreadPool.hpp"
#include "utils/Config.hpp"

HttpServer::HttpServer(const Config& cfg)
    : host(cfg.host),
      port(cfg.port),
      threadCount(cfg.threads),
      idleTimeoutMs(cfg.idleTimeoutMs),
      limits(cfg.limits),
      resolver(cfg.routes, cfg.mode) {
    serverSocket = std::make_unique<Socket>();
    threadPool = std::make_unique<ThreadPool>(threadCount);
    logger = std::make_unique<Logger>(cfg.accessLog);
}

HttpServer::~HttpServer() {
    // drain in-flight connections before the logger goes away
    threadPool->shutdown();
}

bool HttpServer::start() {
    FAKEREST_LOG("SERVER", "Starting on " << host << ":" << port << " with "
                 << resolver.routes()->size() << " routes, " << threadCount << " workers, "
                 << (resolver.mode() == ResolverMode::Strict ? "strict" : "legacy") << " mode");

    if (!serverSocket->isValid() || !serverSocket->bind(host, port)) {
        FAKEREST_ERR("SERVER", "Cannot bind " << host << ":" << port << ": " << strerror(errno));
        return false;
    }

    if (!serverSocket->listen()) {
        FAKEREST_ERR("SERVER", "Listen failed: " << strerror(errno));
        return false;
    }

    isRunning = true;
    FAKEREST_LOG("SERVER", "Accept loop running...");

    // each accepted connection is one task on the pool
    while (isRunning) {
        std::string peer;
        int clientFd = serverSocket->acceptClient(peer);

        if (clientFd < 0) {
            if (isRunning && errno != EINTR) {
                FAKEREST_ERR("NET", "accept() failed, errno=" << errno);
            }
            continue;
        }

        auto conn = std::make_shared<Connection>(clientFd, peer);
        std::size_t taskId = nextTaskId++;

        std::size_t queued = threadPool->enqueue(Task(taskId, peer, [this, conn]() {
            handleClient(*conn);
        }));

        FAKEREST_LOG("NET", "task " << taskId << " accepted " << peer << " (pending=" << queued << ")");
    }

    serverSocket->closeSocket();
    FAKEREST_LOG("SERVER", "Stopped.");
    return true;
}

void HttpServer::stop() {
    isRunning = false;
    serverSocket->interrupt();
}

void HttpServer::handleClient(Connection& conn) {
    LogEntry e = serveConnection(conn, resolver, limits, idleTimeoutMs);
    logger->log(e);
}

LogEntry serveConnection(Connection& conn, const ResponseResolver& resolver,
                         const ParserLimits& limits, int idleTimeoutMs) {
    auto t0 = std::chrono::steady_clock::now();

    LogEntry e;
    e.timestamp = nowIso8601();
    e.peer = conn.peer();

    try {
        conn.configure(idleTimeoutMs);

        Request req = RequestParser::readFrom(conn, limits);
        e.method = req.methodToken;
        e.path = req.uri;

        Response res;
        if (resolver.mode() == ResolverMode::Strict) {
            Resolution r = resolver.evaluate(req);
            if (r.outcome != Outcome::Matched) {
                FAKEREST_LOG("ROUTE", req.methodToken << " " << req.uri << ": " << r.reason);
            }
            e.outcome = toString(r.outcome);
            res = std::move(r.response);
        } else {
            res = resolver.resolve(req);
            e.outcome = "resolved";
        }

        conn.sendAll(res.build());

        e.status = res.status.code;
        e.body_size = res.body.size();
    } catch (const ParsingError& ex) {
        FAKEREST_ERR("PARSE", conn.peer() << ": " << ex.what());
        e.outcome = "parse_error";
    } catch (const IoError& ex) {
        FAKEREST_ERR("NET", conn.peer() << ": " << ex.what());
        e.outcome = "io_error";
    } catch (const FakeRestError& ex) {
        // legacy mode: route errors abort the connection without a response
        FAKEREST_ERR("ROUTE", conn.peer() << " " << e.method << " " << e.path << ": " << ex.what());
        e.outcome = "aborted";
    }

    auto t1 = std::chrono::steady_clock::now();
    e.response_time_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    return e;
}
