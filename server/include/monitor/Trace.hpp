#pragma once
#include <chrono>
#include <iostream>
#include <thread>

inline long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

#define FAKEREST_LOG(tag, msg)                                \
    std::cout << "[" << nowMs() << "ms]"                      \
              << "[TID " << std::this_thread::get_id() << "]" \
              << "[" << tag << "] " << msg << std::endl

#define FAKEREST_ERR(tag, msg)                                \
    std::cerr << "[" << nowMs() << "ms]"                      \
              << "[TID " << std::this_thread::get_id() << "]" \
              << "[" << tag << "] " << msg << std::endl
