#pragma once

#include <thread>
#include <chrono>
#include <functional>
#include <future>
#include <type_traits>
#include <vector>

// Thread utilities for launching and joining async work
class ThreadUtils {
public:
    static void sleepFor(std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    }

    // Always runs on a new thread, never deferred
    template<typename Func, typename... Args>
    static std::future<std::invoke_result_t<std::decay_t<Func>, std::decay_t<Args>...>>
    async(Func&& func, Args&&... args) {
        return std::async(std::launch::async,
                         std::forward<Func>(func),
                         std::forward<Args>(args)...);
    }

    // Collects every result in launch order
    template<typename T>
    static std::vector<T> waitAll(std::vector<std::future<T>>& futures) {
        std::vector<T> results;
        results.reserve(futures.size());
        for (auto& future : futures) {
            results.push_back(future.get());
        }
        return results;
    }
};
