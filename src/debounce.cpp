#include "debounce.hpp"
#include <map>
#include <string>
#include "logger.hpp"

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

WatchDispatcher::WatchDispatcher(std::chrono::milliseconds quiet_period, Handler handler,
                                 size_t workers)
    : quiet_(quiet_period), handler_(std::move(handler)) {
    if (workers == 0)
        workers = 1;
    threads_.reserve(workers + 1);
    threads_.emplace_back(std::thread([this]() { dispatch_loop(); }));
    for (size_t i = 0; i < workers; ++i)
        threads_.emplace_back(std::thread([this]() { worker_loop(); }));
}

WatchDispatcher::~WatchDispatcher() { stop(); }

void WatchDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopping_ && threads_.empty())
            return;
        stopping_ = true;
    }
    inbox_cv_.notify_all();
    job_cv_.notify_all();
    for (auto& t : threads_)
        t.join();
    threads_.clear();
    idle_cv_.notify_all();
}

void WatchDispatcher::submit(const fs::path& path) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopping_)
            return;
        inbox_.push_back({Message::Event, path, Clock::now()});
        idle_ = false;
    }
    inbox_cv_.notify_one();
}

bool WatchDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return idle_cv_.wait_for(lk, timeout, [this] { return (idle_ && inbox_.empty()) || stopping_; });
}

size_t WatchDispatcher::completed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completed_;
}

void WatchDispatcher::dispatch_loop() {
    struct Entry {
        Clock::time_point due;
        bool pending = false;
        bool in_flight = false;
    };
    // Only this thread reads or writes the table.
    std::map<fs::path, Entry> table;

    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopping_) {
        while (!inbox_.empty()) {
            Message m = std::move(inbox_.front());
            inbox_.pop_front();
            if (m.kind == Message::Event) {
                Entry& e = table[m.path];
                e.pending = true;
                e.due = m.at + quiet_;
            } else {
                auto it = table.find(m.path);
                if (it == table.end())
                    continue;
                it->second.in_flight = false;
                if (!it->second.pending)
                    table.erase(it);
            }
        }

        const Clock::time_point now = Clock::now();
        Clock::time_point next = Clock::time_point::max();
        for (auto& [path, e] : table) {
            if (!e.pending || e.in_flight)
                continue;
            if (e.due <= now) {
                e.pending = false;
                e.in_flight = true;
                jobs_.push_back(path);
                job_cv_.notify_one();
            } else if (e.due < next) {
                next = e.due;
            }
        }

        idle_ = table.empty();
        if (idle_)
            idle_cv_.notify_all();

        auto wake = [this] { return !inbox_.empty() || stopping_; };
        if (next == Clock::time_point::max())
            inbox_cv_.wait(lk, wake);
        else
            inbox_cv_.wait_until(lk, next, wake);
    }
}

void WatchDispatcher::worker_loop() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
        job_cv_.wait(lk, [this] { return !jobs_.empty() || stopping_; });
        if (stopping_)
            break;
        fs::path path = std::move(jobs_.front());
        jobs_.pop_front();
        lk.unlock();
        try {
            handler_(path);
        } catch (const std::exception& e) {
            log_error(std::string("Watch handler failed: ") + e.what(), {{"path", path.string()}});
        }
        lk.lock();
        ++completed_;
        inbox_.push_back({Message::Done, path, Clock::now()});
        inbox_cv_.notify_one();
    }
}
