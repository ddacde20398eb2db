#ifndef DEBOUNCE_HPP
#define DEBOUNCE_HPP
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>
#include "thread_utils.hpp"

/**
 * @brief Per-path debounce table for watch mode.
 *
 * Every submitted path waits for a quiet period before the handler runs.
 * Each path has at most one handler call in flight; events that arrive while
 * it runs, or during the quiet period, collapse into a single follow-up call.
 *
 * The table is owned by one dispatcher thread. submit() and the workers only
 * post messages to it; handler calls run on a small worker pool so different
 * paths can be processed in parallel.
 */
class WatchDispatcher {
  public:
    using Handler = std::function<void(const std::filesystem::path&)>;

    WatchDispatcher(std::chrono::milliseconds quiet_period, Handler handler, size_t workers = 1);
    ~WatchDispatcher();

    /** Record an event for @p path. Thread-safe. */
    void submit(const std::filesystem::path& path);

    /**
     * @brief Block until no path is pending or in flight.
     *
     * @return `false` if @p timeout elapsed first.
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    /** Number of handler calls completed so far. */
    size_t completed() const;

    /** Stop the threads; pending paths are dropped, in-flight calls finish. */
    void stop();

    WatchDispatcher(const WatchDispatcher&) = delete;
    WatchDispatcher& operator=(const WatchDispatcher&) = delete;

  private:
    struct Message {
        enum Kind { Event, Done } kind;
        std::filesystem::path path;
        std::chrono::steady_clock::time_point at;
    };

    void dispatch_loop();
    void worker_loop();

    const std::chrono::milliseconds quiet_;
    Handler handler_;
    mutable std::mutex mtx_;
    std::condition_variable inbox_cv_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    std::deque<Message> inbox_;
    std::deque<std::filesystem::path> jobs_;
    bool idle_ = true;
    bool stopping_ = false;
    size_t completed_ = 0;
    std::vector<ThreadGuard> threads_;
};

#endif // DEBOUNCE_HPP
