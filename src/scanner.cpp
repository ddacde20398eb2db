#include "scanner.hpp"

#include <mutex>
#include <string>

#include "logger.hpp"
#include "thread_utils.hpp"

namespace fs = std::filesystem;

std::vector<FileReport> scrub_files(const std::vector<fs::path>& files,
                                    const scrub::CharacterPolicy& policy, bool dry_run,
                                    size_t concurrency, const ReportCallback& on_report,
                                    const std::atomic<bool>* running) {
    std::vector<FileReport> reports(files.size());
    if (files.empty())
        return reports;

    const size_t workers = resolve_concurrency(concurrency, files.size());
    log_debug("Starting scrub", {{"files", std::to_string(files.size())},
                                 {"threads", std::to_string(workers)},
                                 {"dry_run", dry_run ? "true" : "false"}});

    std::atomic<size_t> next_index{0};
    std::mutex report_mtx;
    auto worker = [&]() {
        while (!running || running->load()) {
            size_t idx = next_index.fetch_add(1);
            if (idx >= files.size())
                break;
            FileReport rep;
            try {
                rep = process_file(files[idx], policy, dry_run);
            } catch (const std::exception& e) {
                // Filesystem or allocation failure outside the per-file error paths.
                rep.path = files[idx];
                rep.status = FileStatus::ReadError;
                rep.error = files[idx].string() + ": " + e.what();
                log_error(std::string("Worker exception: ") + e.what(),
                          {{"path", files[idx].string()}});
            }
            std::lock_guard<std::mutex> lk(report_mtx);
            reports[idx] = std::move(rep);
            if (on_report)
                on_report(reports[idx]);
        }
    };

    {
        std::vector<ThreadGuard> threads = spawn_workers(workers, worker);
    }
    if (logger_initialized())
        log_debug("Scrub complete");
    return reports;
}
