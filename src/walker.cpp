#include "walker.hpp"
#include <algorithm>
#include <set>
#include <system_error>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kIgnoreFileName = ".ghostscrubignore";

class Collector {
  public:
    Collector(const filter::FileFilter& filter, WalkResult& out) : filter_(filter), out_(out) {}

    void add_input(const fs::path& input) {
        std::error_code ec;
        fs::file_status st = fs::status(input, ec);
        if (!ec && fs::is_regular_file(st)) {
            add_file(input, input.filename(), filter_);
        } else if (!ec && fs::is_directory(st)) {
            walk(input);
        } else if (fs::exists(fs::symlink_status(input, ec))) {
            out_.errors.push_back("Not a regular file or directory: " + input.string());
        } else {
            expand_glob(input.string());
        }
    }

  private:
    const filter::FileFilter& filter_;
    WalkResult& out_;
    std::set<fs::path> seen_;

    void add_file(const fs::path& path, const fs::path& rel, const filter::FileFilter& f) {
        if (!f.accepts(rel.lexically_normal())) {
            ++out_.skipped;
            log_debug("Skipped by filter", {{"path", path.string()}});
            return;
        }
        std::error_code ec;
        fs::path key = fs::weakly_canonical(path, ec);
        if (ec)
            key = path.lexically_normal();
        if (seen_.insert(key).second)
            out_.files.push_back(path);
    }

    void walk(const fs::path& root) {
        filter::FileFilter local = filter_;
        std::vector<std::string> extra = filter::read_ignore_file(root / kIgnoreFileName);
        if (!extra.empty()) {
            log_debug("Loaded ignore file",
                      {{"path", (root / kIgnoreFileName).string()},
                       {"patterns", std::to_string(extra.size())}});
            local.add_exclude_patterns(extra);
        }

        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied,
                                            ec);
        if (ec) {
            out_.errors.push_back("Cannot read directory " + root.string() + ": " + ec.message());
            return;
        }
        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                out_.errors.push_back("Error walking " + root.string() + ": " + ec.message());
                ec.clear();
                continue;
            }
            const fs::path& p = it->path();
            if (it->is_symlink(ec)) {
                log_debug("Skipping symlink", {{"path", p.string()}});
                continue;
            }
            if (it->is_directory(ec)) {
                if (filter::skip_directory(p.filename().string()))
                    it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(ec))
                continue;
            add_file(p, p.lexically_relative(root), local);
        }
    }

    // The literal directories in front of the first wildcard segment are the
    // search root; the rest is matched against paths below it.
    void expand_glob(const std::string& pattern) {
        if (!has_glob_chars(pattern)) {
            out_.errors.push_back("No such file or directory: " + pattern);
            return;
        }
        fs::path base;
        std::string rest;
        for (const auto& part : fs::path(pattern)) {
            const std::string seg = part.generic_string();
            if (rest.empty() && !has_glob_chars(seg)) {
                base /= part;
            } else if (!seg.empty()) {
                if (!rest.empty())
                    rest += '/';
                rest += seg;
            }
        }
        const bool relative_base = base.empty();
        const fs::path root = relative_base ? fs::path(".") : base;
        const size_t depth_limit =
            static_cast<size_t>(std::count(rest.begin(), rest.end(), '/')) + 1;
        const bool any_depth = rest == "**" || rest.rfind("**/", 0) == 0 ||
                               rest.find("/**") != std::string::npos;

        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            log_warning("No files match pattern", {{"pattern", pattern}});
            return;
        }
        std::vector<fs::path> files;
        std::vector<fs::path> dirs;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied,
                                            ec);
        if (ec) {
            out_.errors.push_back("Cannot read directory " + root.string() + ": " + ec.message());
            return;
        }
        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                out_.errors.push_back("Error walking " + root.string() + ": " + ec.message());
                ec.clear();
                continue;
            }
            if (it->is_symlink(ec))
                continue;
            const fs::path rel = it->path().lexically_relative(root);
            const fs::path found = relative_base ? rel : it->path();
            const bool matched = filter::path_glob_match(rest, rel);
            if (it->is_directory(ec)) {
                if (filter::skip_directory(rel.filename().string())) {
                    it.disable_recursion_pending();
                } else if (matched) {
                    dirs.push_back(found);
                    it.disable_recursion_pending();
                } else if (!any_depth && static_cast<size_t>(it.depth()) + 1 >= depth_limit) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (matched && it->is_regular_file(ec))
                files.push_back(found);
        }

        if (files.empty() && dirs.empty()) {
            log_warning("No files match pattern", {{"pattern", pattern}});
            return;
        }
        std::sort(files.begin(), files.end());
        std::sort(dirs.begin(), dirs.end());
        for (const auto& f : files)
            add_file(f, f.filename(), filter_);
        for (const auto& d : dirs)
            walk(d);
    }
};

} // namespace

bool has_glob_chars(const std::string& text) {
    return text.find_first_of("*?[") != std::string::npos;
}

WalkResult collect_files(const std::vector<fs::path>& inputs, const filter::FileFilter& filter) {
    WalkResult result;
    Collector collector(filter, result);
    for (const auto& input : inputs) {
        if (input.empty())
            continue;
        collector.add_input(input);
    }
    for (const auto& err : result.errors)
        log_error(err);
    log_debug("Collected files", {{"files", std::to_string(result.files.size())},
                                  {"skipped", std::to_string(result.skipped)}});
    return result;
}
