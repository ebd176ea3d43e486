#include "pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <limits>
#include <stop_token>
#include <thread>

namespace tei_standoff {

bool parse_documents_parallel(
    const std::vector<ParseJob>& jobs,
    const MarkupConfig& config,
    std::size_t workers,
    std::vector<ParseJobResult>& out_results,
    BatchStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    const DocumentParser parser = [](const ParseJob& job,
                                     const MarkupConfig& job_config,
                                     DiagnosticSink& sink,
                                     ParseStats& stats,
                                     Error& parse_error) {
        return parse_file(
            job.source,
            job.prefix,
            job.text_path,
            job.annotation_dir,
            job_config,
            sink,
            stats,
            parse_error
        );
    };
    return parse_documents_parallel(jobs, config, workers, parser, out_results, out_stats, error, progress_callback);
}

bool parse_documents_parallel(
    const std::vector<ParseJob>& jobs,
    const MarkupConfig& config,
    std::size_t workers,
    const DocumentParser& parser,
    std::vector<ParseJobResult>& out_results,
    BatchStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    out_stats = BatchStats{};
    out_stats.documents_total = jobs.size();
    out_results.clear();

    if (jobs.empty()) {
        return true;
    }

    if (workers == 0) {
        workers = 1;
    }

    const std::size_t workers_used = std::min(workers, jobs.size());
    out_stats.workers_used = workers_used;

    out_results.resize(jobs.size());

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> completed{0};

    const auto started = std::chrono::steady_clock::now();

    std::jthread reporter;
    if (progress_callback) {
        reporter = std::jthread([&](std::stop_token stop_token) {
            std::size_t last_completed = std::numeric_limits<std::size_t>::max();
            while (!stop_token.stop_requested()) {
                const std::size_t done = completed.load(std::memory_order_relaxed);
                if (done != last_completed) {
                    progress_callback(done, jobs.size());
                    last_completed = done;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            const std::size_t final_done = completed.load(std::memory_order_relaxed);
            if (final_done != last_completed) {
                progress_callback(final_done, jobs.size());
            }
        });
    }

    std::vector<std::jthread> pool;
    pool.reserve(workers_used);

    auto worker_fn = [&](std::stop_token stop_token) {
        while (!stop_token.stop_requested()) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= jobs.size()) {
                return;
            }

            const ParseJob& job = jobs[index];
            ParseJobResult& result = out_results[index];
            DiagnosticSink sink;
            Error parse_error;

            try {
                result.ok = parser(job, config, sink, result.stats, parse_error);
                if (!result.ok) {
                    result.error = parse_error.message;
                }
            } catch (const std::exception& ex) {
                result.ok = false;
                result.error = ex.what();
            } catch (...) {
                result.ok = false;
                result.error = "Unknown parse error";
            }

            result.diagnostics = sink.events();
            completed.fetch_add(1, std::memory_order_relaxed);
        }
    };

    for (std::size_t i = 0; i < workers_used; ++i) {
        pool.emplace_back(worker_fn);
    }

    for (auto& thread : pool) {
        thread.join();
    }
    if (reporter.joinable()) {
        reporter.request_stop();
        reporter.join();
    }

    const auto ended = std::chrono::steady_clock::now();
    out_stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);

    const double wall_seconds = static_cast<double>(out_stats.wall_time.count()) / 1000.0;
    if (wall_seconds > 0.0) {
        out_stats.documents_per_second = static_cast<double>(jobs.size()) / wall_seconds;
    }

    out_stats.documents_failed = static_cast<std::size_t>(
        std::count_if(out_results.begin(), out_results.end(), [](const ParseJobResult& r) { return !r.ok; })
    );
    if (out_stats.documents_failed > 0) {
        error = std::to_string(out_stats.documents_failed) + " of " + std::to_string(jobs.size()) +
            " documents failed";
        return false;
    }

    return true;
}

}  // namespace tei_standoff
