#include "file_processor.hpp"
#include <atomic>
#include <cerrno>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <thread>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path& target) {
    static std::atomic<unsigned long> counter{0};
    std::ostringstream name;
    name << '.' << target.filename().string() << ".ghostscrub-tmp-" << std::hex
         << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '-' << counter++;
    return target.parent_path() / name.str();
}

FileReport failure(const fs::path& path, FileStatus status, const std::string& msg) {
    FileReport rep;
    rep.path = path;
    rep.status = status;
    rep.error = msg;
    log_error(msg, {{"path", path.string()}, {"status", file_status_name(status)}});
    return rep;
}

} // namespace

const char* file_status_name(FileStatus status) {
    switch (status) {
    case FileStatus::Cleaned:
        return "cleaned";
    case FileStatus::WouldClean:
        return "would-clean";
    case FileStatus::Unchanged:
        return "unchanged";
    case FileStatus::ReadError:
        return "read-error";
    case FileStatus::DecodeError:
        return "decode-error";
    case FileStatus::WriteError:
        return "write-error";
    }
    return "unchanged";
}

bool read_file_bytes(const fs::path& path, std::string& out, std::string& error) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        std::error_code ec(errno, std::generic_category());
        error = "Cannot open " + path.string() + ": " + ec.message();
        return false;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) {
        error = "Failed to read " + path.string();
        return false;
    }
    out = ss.str();
    return true;
}

bool atomic_write_file(const fs::path& path, const std::string& bytes, std::string& error) {
    const fs::path tmp = temp_sibling(path);
    std::error_code ec;
    auto discard = [&](const std::string& why) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        error = "Failed to write " + path.string() + ": " + why;
        return false;
    };
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return discard("cannot create temporary file " + tmp.filename().string());
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (!ofs)
            return discard("write to temporary file failed");
    }
    fs::file_status st = fs::status(path, ec);
    if (!ec) {
        fs::permissions(tmp, st.permissions(), fs::perm_options::replace, ec);
        if (ec)
            return discard("cannot copy permissions: " + ec.message());
    }
    fs::rename(tmp, path, ec);
    if (ec)
        return discard(ec.message());
    return true;
}

FileReport process_file(const fs::path& path, const scrub::CharacterPolicy& policy,
                        bool dry_run) {
    std::string bytes;
    std::string err;
    if (!read_file_bytes(path, bytes, err))
        return failure(path, FileStatus::ReadError, err);

    FileReport rep;
    rep.path = path;
    try {
        rep.result = scrub::scrub_text(bytes, policy);
    } catch (const scrub::DecodeError& e) {
        return failure(path, FileStatus::DecodeError, path.string() + ": " + e.what());
    }

    if (!rep.result.modified) {
        rep.status = FileStatus::Unchanged;
        log_debug("No changes needed", {{"path", path.string()}});
        return rep;
    }
    if (dry_run) {
        rep.status = FileStatus::WouldClean;
        log_info("Would clean file", {{"path", path.string()},
                                      {"changes", std::to_string(rep.change_count())}});
        return rep;
    }
    if (!atomic_write_file(path, rep.result.cleaned, err)) {
        FileReport bad = failure(path, FileStatus::WriteError, err);
        bad.result = std::move(rep.result);
        return bad;
    }
    rep.status = FileStatus::Cleaned;
    log_info("Cleaned file",
             {{"path", path.string()}, {"changes", std::to_string(rep.change_count())}});
    return rep;
}
