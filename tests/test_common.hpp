#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "char_class.hpp"
#include "config_utils.hpp"
#include "file_filter.hpp"
#include "file_processor.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "scanner.hpp"
#include "scrub_config.hpp"
#include "scrubber.hpp"
#include "time_utils.hpp"
#include "utf8_utils.hpp"
#include "walker.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace ghostscrub::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive) {
        fs::remove_all(target, ec);
        if (!ec)
            return true;
        if (ec == std::errc::no_such_file_or_directory)
            return true;
        return false;
    }
    fs::remove(target, ec);
    if (!ec)
        return true;
    if (ec == std::errc::no_such_file_or_directory)
        return true;
    return false;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
#if defined(_WIN32)
    constexpr int kMaxAttempts = 10;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        if (remove_once(target, recursive, ec))
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
#else
    if (remove_once(target, recursive, ec))
        return;
#endif
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/** Fresh empty directory under the system temp dir. */
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("ghostscrub_" + name);
    remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_bytes(const fs::path& path, const std::string& bytes) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::string read_bytes(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

/** Builds an argv array that outlives the call to parse_options(). */
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "ghostscrub");
        for (auto& s : storage)
            ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

/** Poll @p pred until it holds or @p timeout expires. */
template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}
} // namespace ghostscrub::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::ghostscrub::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::ghostscrub::test_support::remove_all((path))
#endif

using ghostscrub::test_support::Argv;
using ghostscrub::test_support::eventually;
using ghostscrub::test_support::make_temp_dir;
using ghostscrub::test_support::read_bytes;
using ghostscrub::test_support::write_bytes;
