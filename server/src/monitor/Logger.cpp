#include "monitor/Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "monitor/Trace.hpp"

// Quote a CSV field when it contains a separator, quote or newline.
static std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;

    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string nowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

Logger::Logger(const std::string& filePath) {
    std::error_code ec;
    auto parent = std::filesystem::path(filePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    file.open(filePath, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        FAKEREST_ERR("LOG", "cannot open access log " << filePath << ", access logging disabled");
        return;
    }

    if (file.tellp() == 0) {
        file << "timestamp,"
        "peer,"
        "method,"
        "path,"
        "status,"
        "outcome,"
        "body_size,"
        "response_ms\n";
    }
}

Logger::~Logger() {
    flush();
    file.close();
}

void Logger::log(const LogEntry& e) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!file.is_open()) return;

    file << e.timestamp << ","
     << csvField(e.peer) << ","
     << csvField(e.method) << ","
     << csvField(e.path) << ","
     << e.status << ","
     << e.outcome << ","
     << e.body_size << ","
     << e.response_time_ms << "\n";

    counter++;
    if (counter % 50 == 0)
        file.flush();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    file.flush();
}
