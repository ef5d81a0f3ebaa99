// Task.hpp
#pragma once
#include <functional>
#include <string>
#include <cstddef>

// One accepted connection, handled start to finish by a single worker.
struct Task {
    std::size_t id{};
    std::string peer;

    std::function<void()> fn;

    Task() = default;

    Task(std::size_t id_, std::string peer_, std::function<void()> fn_)
        : id(id_),
          peer(std::move(peer_)),
          fn(std::move(fn_)) {}
};
