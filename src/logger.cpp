#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<LogMessage> g_log_queue;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static bool g_writing = false;
static std::atomic<bool> g_running{false};
// Accepting messages; stays set while init_logger() swaps files.
static std::atomic<bool> g_enabled{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug")
        out = LogLevel::DEBUG;
    else if (v == "info")
        out = LogLevel::INFO;
    else if (v == "warning" || v == "warn")
        out = LogLevel::WARNING;
    else if (v == "error" || v == "err")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    } else {
        g_log_ofs.clear();
    }
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    g_enabled.store(true);
    // Without a file, messages stay queued for the next successful init.
    if (!g_log_ofs.is_open())
        return;
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_rotation(size_t max_files) { g_max_files.store(max_files); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    if (g_running.load())
        g_drained_cv.wait(lk, [] { return g_log_queue.empty() && !g_writing; });
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0)
            ok = false;
    }
    return gzclose(out) == Z_OK && ok;
}

// Shift log.N -> log.N+1 (dropping the oldest) and move the active file to
// log.1, compressing it when requested.
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    const std::string suffix = gz ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (gz) {
        fs::path packed = first;
        packed += ".gz";
        if (gzip_file(first.string(), packed.string()))
            fs::remove(first, ec);
    }
}

static std::string format_entry(const LogMessage& m) {
    const std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = log_level_name(m.level);
        j["msg"] = m.msg;
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::string line = "[" + ts + "] [" + log_level_name(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

static void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open() || m.level < g_min_level.load())
        return;
    const std::string line = format_entry(m);
    g_log_ofs << line << '\n';
    if (g_max_size.load() > 0) {
        g_log_ofs.flush();
        std::error_code ec;
        if (fs::file_size(g_log_path, ec) > g_max_size.load() && !ec) {
            g_log_ofs.close();
            if (g_max_files.load() > 0)
                rotate_files();
            g_log_ofs.open(g_log_path, std::ios::trunc);
        }
    }
}

static void enqueue_message(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load() || !g_enabled.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push(LogMessage{level, msg, fields});
    }
    g_queue_cv.notify_one();
}

void log_event(LogLevel level, const std::string& message) { enqueue_message(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    enqueue_message(level, message, fields);
}

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_writing = true;
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_writing = false;
        if (g_log_queue.empty())
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_enabled.store(false);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    std::queue<LogMessage>().swap(g_log_queue);
}
