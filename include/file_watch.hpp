#ifndef FILE_WATCH_HPP
#define FILE_WATCH_HPP
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Recursive file change watcher.
 *
 * Starts a background thread that invokes a callback with the path of every
 * file that is created, written, or moved into a watched tree. Directories
 * are watched recursively (dependency/build directories are skipped) and
 * directories created later are picked up. A file root is watched through its
 * parent directory and only events for that file are reported.
 *
 * The implementation uses inotify on Linux. Elsewhere, or when inotify is
 * unavailable, it falls back to polling modification times.
 */
class FileWatcher {
  public:
    using Callback = std::function<void(const std::filesystem::path&)>;

    enum class Backend { Native, Polling };

    FileWatcher(std::vector<std::filesystem::path> roots, Callback callback,
                Backend backend = Backend::Native,
                std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
    ~FileWatcher();

    /** @brief Check if the watcher thread is active. */
    bool active() const;

    /** @return `true` when events come from inotify rather than polling. */
    bool native() const { return native_; }

    /** Number of directories (native) or files (polling) being tracked. */
    size_t watch_count() const;

    /** @brief Stop the background thread. Called by the destructor. */
    void stop();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

  private:
    struct FileStamp {
        std::filesystem::file_time_type mtime;
        std::uintmax_t size = 0;
        bool operator!=(const FileStamp& o) const { return mtime != o.mtime || size != o.size; }
    };
    using Snapshot = std::map<std::filesystem::path, FileStamp>;

    void notify_change(const std::filesystem::path& path);
    Snapshot take_snapshot() const;

    std::vector<std::filesystem::path> roots_;
    Callback callback_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> running_{false};
    bool native_ = false;
    mutable std::mutex mtx_;
    std::condition_variable stop_cv_;
    size_t poll_count_ = 0;
    std::thread thread_;

#if defined(__linux__)
    /** One inotify watch: a directory plus, for file roots, the names of interest. */
    struct WatchDir {
        std::filesystem::path dir;
        bool all = true;
        std::set<std::string> names;
    };

    bool start_inotify();
    void add_watch(const std::filesystem::path& dir, bool all, const std::string& name);
    void add_watch_tree(const std::filesystem::path& dir, bool notify_files);
    void run_inotify();

    int inotify_fd_ = -1;
    std::map<int, WatchDir> watches_;
#endif
};

#endif // FILE_WATCH_HPP
