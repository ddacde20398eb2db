#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief RAII wrapper that joins the thread on destruction.
 */
struct ThreadGuard {
    std::thread t;
    ThreadGuard() = default;
    explicit ThreadGuard(std::thread&& t_) : t(std::move(t_)) {}
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ThreadGuard(ThreadGuard&&) = default;
    ThreadGuard& operator=(ThreadGuard&& other) {
        join();
        t = std::move(other.t);
        return *this;
    }
    ~ThreadGuard() { join(); }

    void join() {
        if (t.joinable())
            t.join();
    }
};

/**
 * @brief Worker count for a pool: @p requested, or the hardware concurrency
 * when it is 0, never more than @p jobs and never less than 1.
 */
inline size_t resolve_concurrency(size_t requested, size_t jobs) {
    size_t n = requested;
    if (n == 0) {
        n = std::thread::hardware_concurrency();
        if (n == 0)
            n = 1;
    }
    if (jobs > 0 && n > jobs)
        n = jobs;
    return n == 0 ? 1 : n;
}

/** Start @p count threads running @p fn; they are joined when the vector dies. */
template <class Fn> std::vector<ThreadGuard> spawn_workers(size_t count, Fn fn) {
    std::vector<ThreadGuard> threads;
    threads.reserve(count);
    for (size_t i = 0; i < count; ++i)
        threads.emplace_back(std::thread(fn));
    return threads;
}

#endif // THREAD_UTILS_HPP
