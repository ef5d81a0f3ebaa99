#pragma once
#include <string>
#include <mutex>
#include <fstream>

// One CSV row per served (or aborted) request.
struct LogEntry {
    std::string timestamp;
    std::string peer;

    std::string method;
    std::string path;

    int status = 0;           // 0 when the connection was aborted without a response
    std::string outcome;
    std::size_t body_size = 0;
    double response_time_ms = 0.0;
};

class Logger {
public:
    Logger(const std::string& filePath);
    ~Logger();

    void log(const LogEntry& e);
    void flush();

private:
    std::ofstream file;
    std::mutex mtx;
    int counter = 0;
};

// ISO-8601 local time, second precision.
std::string nowIso8601();
