#include "core/HttpServer.hpp"
#include "core/Errors.hpp"
#include "utils/Config.hpp"
#include <signal.h>
#include <exception>
#include <iostream>
#include <string>
#include <algorithm>
#include <stdexcept>

static HttpServer* g_server = nullptr;

static void onSignal(int) {
    if (g_server) g_server->stop();
}

static void usage(const char* prog) {
    std::cout << "usage: " << prog
              << " [--config=path] [--port=n] [--threads=n] [--mode=legacy|strict]\n";
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    std::string configPath = "config/server.json";
    std::string port, threads, mode;

    // Read CLI args: --key=value
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            configPath = arg.substr(9);
        } else if (arg.rfind("--port=", 0) == 0) {
            port = arg.substr(7);
        } else if (arg.rfind("--threads=", 0) == 0) {
            threads = arg.substr(10);
        } else if (arg.rfind("--mode=", 0) == 0) {
            mode = arg.substr(7);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::cerr << "[MAIN] Unknown argument: " << arg << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    std::cout << "[MAIN] Config file = " << configPath << "\n";

    try {
        Config cfg(configPath);

        if (!port.empty())    cfg.port = std::stoi(port);
        if (!threads.empty()) cfg.threads = std::max(1, std::stoi(threads));
        if (!mode.empty())    cfg.mode = modeFromString(mode);

        if (cfg.port <= 0 || cfg.port > 65535) {
            throw ConfigParsingError("port out of range: " + std::to_string(cfg.port));
        }

        HttpServer server(cfg);
        g_server = &server;
        signal(SIGINT, onSignal);
        signal(SIGTERM, onSignal);

        bool ok = server.start();
        g_server = nullptr;
        return ok ? 0 : 1;
    } catch (const ConfigParsingError& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[MAIN] Bad numeric argument: " << e.what() << std::endl;
    } catch (const std::out_of_range& e) {
        std::cerr << "[MAIN] Numeric argument out of range: " << e.what() << std::endl;
    }
    return 1;
}
