/**
 * @file ingest_workspace.cpp
 * @brief Index a workspace from the command line
 *
 * USAGE:
 *   ingest_workspace <config.json> <path> [<path>...]
 *
 * Directories are walked recursively for source files; plain files are taken
 * as given. Ctrl+C cancels the run; chunks already delivered stay in the
 * dedup cache so the next run resumes where this one stopped.
 *
 * EXAMPLE CONFIG:
 * {
 *   "url": "http://localhost:8000",
 *   "api_key": "secret",
 *   "batch_size": 5,
 *   "performance": { "enable_semantic_chunking": true }
 * }
 */

#include "ingest/core/cancellation.hpp"
#include "ingest/core/config.hpp"
#include "ingest/delivery/orchestrator.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using namespace ingest;

// ════════════════════════════════════════════════════════════
// Signal handling
// ════════════════════════════════════════════════════════════

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted.store(true);
    }
}

// ════════════════════════════════════════════════════════════
// File discovery
// ════════════════════════════════════════════════════════════

const std::set<std::string> kSupportedExtensions = {
    ".py", ".ts", ".js", ".jsx", ".tsx", ".java", ".go", ".rs",
    ".cpp", ".c", ".h", ".hpp", ".cs", ".php", ".rb"
};

bool is_supported(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kSupportedExtensions.count(ext) > 0;
}

bool is_skipped_directory(const fs::path& path, const fs::path& cache_dir) {
    const std::string name = path.filename().string();
    if (name == ".git" || name == "node_modules" || name == "build") {
        return true;
    }
    std::error_code ec;
    return fs::equivalent(path, cache_dir, ec);
}

std::vector<fs::path> discover_files(const std::vector<fs::path>& roots, const fs::path& cache_dir) {
    std::vector<fs::path> files;

    for (const auto& root : roots) {
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            files.push_back(root);
            continue;
        }
        if (!fs::is_directory(root, ec)) {
            spdlog::warn("[Discover] skipping {}: not a file or directory", root.string());
            continue;
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::warn("[Discover] cannot walk {}: {}", root.string(), ec.message());
            continue;
        }
        const auto end = fs::end(it);
        for (; it != end; it.increment(ec)) {
            if (ec) {
                spdlog::warn("[Discover] {}", ec.message());
                break;
            }
            if (it->is_directory(ec) && is_skipped_directory(it->path(), cache_dir)) {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(ec) && is_supported(it->path())) {
                files.push_back(it->path());
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    return spdlog::level::info;
}

// ════════════════════════════════════════════════════════════
// Main
// ════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    if (argc < 3) {
        spdlog::error("Usage: {} <config.json> <path> [<path>...]", argv[0]);
        return 2;
    }

    auto config = core::load_config(argv[1]);
    if (config.is_error()) {
        spdlog::error("Failed to load config: {}", config.error().message);
        return 1;
    }
    spdlog::set_level(parse_level(config.value().log_level));

    std::vector<fs::path> roots(argv + 2, argv + argc);
    auto files = discover_files(roots, config.value().cache_dir);
    if (files.empty()) {
        spdlog::warn("No supported files found");
        return 0;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    delivery::DeliveryOrchestrator::Options options;
    options.workspace_root = roots.size() == 1 && fs::is_directory(roots.front()) ? roots.front() : fs::current_path();
    delivery::DeliveryOrchestrator orchestrator(config.value(), bus, options);

    CancellationToken token;
    std::signal(SIGINT, signal_handler);

    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (g_interrupted.load()) {
                spdlog::warn("Interrupted, cancelling...");
                token.cancel("SIGINT");
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    delivery::JobCallbacks callbacks;
    callbacks.on_progress = [](std::size_t current, std::size_t total, const std::string& file) {
        spdlog::info("[{}/{}] {}", current, total, file);
    };
    callbacks.on_job_complete = [](const std::string& job_id, bool success,
                                   std::size_t chunks, std::uint64_t tokens) {
        spdlog::debug("[Job] id={} success={} chunks={} tokens~{}", job_id, success, chunks, tokens);
    };

    spdlog::info("Indexing {} files to {}", files.size(), config.value().base_url());
    auto summary = orchestrator.index_files(files, callbacks, token);

    finished.store(true);
    watcher.join();
    orchestrator.shutdown();

    metrics.print_stats();
    spdlog::info("Files indexed: {}  failed: {}  unchanged: {}{}",
                 summary.success_count, summary.error_count, summary.skipped_unchanged,
                 summary.cancelled ? "  (cancelled)" : "");
    for (const auto& error : summary.errors) {
        spdlog::error("  {}", error);
    }

    if (summary.cancelled) {
        return 130;
    }
    return summary.error_count == 0 ? 0 : 1;
}
