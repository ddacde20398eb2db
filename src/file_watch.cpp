#include "file_watch.hpp"

#include <array>
#include <cerrno>
#include <system_error>

#include "file_filter.hpp"
#include "logger.hpp"

#if defined(__linux__)
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

FileWatcher::FileWatcher(std::vector<fs::path> roots, Callback callback, Backend backend,
                         std::chrono::milliseconds poll_interval)
    : roots_(std::move(roots)), callback_(std::move(callback)), poll_interval_(poll_interval) {
#if defined(__linux__)
    if (backend == Backend::Native && start_inotify()) {
        native_ = true;
        running_.store(true);
        thread_ = std::thread([this]() { run_inotify(); });
        return;
    }
#else
    (void)backend;
#endif
    Snapshot initial = take_snapshot();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        poll_count_ = initial.size();
    }
    running_.store(true);
    thread_ = std::thread([this, initial]() mutable {
        Snapshot prev = std::move(initial);
        std::unique_lock<std::mutex> lk(mtx_);
        while (running_) {
            stop_cv_.wait_for(lk, poll_interval_, [this] { return !running_.load(); });
            if (!running_)
                break;
            lk.unlock();
            Snapshot cur = take_snapshot();
            for (const auto& [path, stamp] : cur) {
                auto it = prev.find(path);
                if (it == prev.end() || it->second != stamp)
                    notify_change(path);
            }
            prev = std::move(cur);
            lk.lock();
            poll_count_ = prev.size();
        }
    });
}

FileWatcher::~FileWatcher() {
    stop();
#if defined(__linux__)
    for (const auto& kv : watches_)
        inotify_rm_watch(inotify_fd_, kv.first);
    if (inotify_fd_ >= 0)
        close(inotify_fd_);
#endif
}

void FileWatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_.store(false);
    }
    stop_cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

bool FileWatcher::active() const { return running_.load(); }

size_t FileWatcher::watch_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
#if defined(__linux__)
    if (native_)
        return watches_.size();
#endif
    return poll_count_;
}

void FileWatcher::notify_change(const fs::path& path) {
    if (!callback_)
        return;
    try {
        callback_(path);
    } catch (const std::exception& e) {
        log_error(std::string("Watch callback failed: ") + e.what(), {{"path", path.string()}});
    }
}

FileWatcher::Snapshot FileWatcher::take_snapshot() const {
    Snapshot snap;
    auto record = [&snap](const fs::path& p) {
        std::error_code ec;
        FileStamp st;
        st.mtime = fs::last_write_time(p, ec);
        if (ec)
            return;
        st.size = fs::file_size(p, ec);
        if (!ec)
            snap[p] = st;
    };
    for (const auto& root : roots_) {
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            record(root);
            continue;
        }
        if (!fs::is_directory(root, ec))
            continue;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied,
                                            ec);
        fs::recursive_directory_iterator end;
        for (; !ec && it != end; it.increment(ec)) {
            if (it->is_symlink(ec))
                continue;
            if (it->is_directory(ec)) {
                if (filter::skip_directory(it->path().filename().string()))
                    it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(ec))
                record(it->path());
        }
    }
    return snap;
}

#if defined(__linux__)

namespace {
constexpr uint32_t kDirMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY;
}

bool FileWatcher::start_inotify() {
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        std::error_code ec(errno, std::system_category());
        log_warning("inotify_init1 failed; falling back to polling: " + ec.message());
        return false;
    }
    for (const auto& root : roots_) {
        std::error_code ec;
        if (fs::is_directory(root, ec)) {
            add_watch_tree(root, false);
        } else {
            fs::path parent = root.parent_path();
            if (parent.empty())
                parent = ".";
            add_watch(parent, false, root.filename().string());
        }
    }
    if (watches_.empty()) {
        log_warning("No watch could be added; falling back to polling");
        close(inotify_fd_);
        inotify_fd_ = -1;
        return false;
    }
    return true;
}

void FileWatcher::add_watch(const fs::path& dir, bool all, const std::string& name) {
    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kDirMask);
    if (wd < 0) {
        std::error_code ec(errno, std::system_category());
        log_warning("inotify_add_watch failed: " + ec.message(), {{"path", dir.string()}});
        return;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    auto [it, inserted] = watches_.try_emplace(wd);
    WatchDir& w = it->second;
    if (inserted) {
        w.dir = dir;
        w.all = all;
    } else if (all) {
        w.all = true;
        w.names.clear();
    }
    if (!w.all && !name.empty())
        w.names.insert(name);
}

void FileWatcher::add_watch_tree(const fs::path& dir, bool notify_files) {
    add_watch(dir, true, "");
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_symlink(ec))
            continue;
        if (it->is_directory(ec)) {
            if (filter::skip_directory(it->path().filename().string())) {
                it.disable_recursion_pending();
                continue;
            }
            add_watch(it->path(), true, "");
        } else if (notify_files && it->is_regular_file(ec)) {
            // Written before the watch existed; no event will come for it.
            notify_change(it->path());
        }
    }
}

void FileWatcher::run_inotify() {
    alignas(inotify_event) std::array<char, 8192> buf{};
    while (running_) {
        pollfd pfd{inotify_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, 100);
        if (ready <= 0)
            continue;
        ssize_t len = read(inotify_fd_, buf.data(), buf.size());
        if (len <= 0)
            continue;
        ssize_t i = 0;
        while (i < len) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf.data() + i);
            i += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
            if (ev->mask & IN_Q_OVERFLOW) {
                log_warning("inotify event queue overflowed; some changes were missed");
                continue;
            }
            WatchDir w;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                auto it = watches_.find(ev->wd);
                if (it == watches_.end())
                    continue;
                if (ev->mask & IN_IGNORED) {
                    watches_.erase(it);
                    continue;
                }
                w = it->second;
            }
            if (ev->len == 0)
                continue;
            const std::string name = ev->name;
            const fs::path path = w.dir / name;
            if (ev->mask & IN_ISDIR) {
                if (w.all && (ev->mask & (IN_CREATE | IN_MOVED_TO)) &&
                    !filter::skip_directory(name))
                    add_watch_tree(path, true);
                continue;
            }
            if (!w.all && !w.names.count(name))
                continue;
            notify_change(path);
        }
    }
}

#endif
