#ifndef LOGGER_HPP
#define LOGGER_HPP

// Requires C++17 for <filesystem>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

// ––––––––––––––––––
// Configuration Flags
// ––––––––––––––––––
// Enable/disable logging (default: enabled, CMake option ADSIM_ENABLE_LOGGING)
#ifndef LOG_ENABLED
#define LOG_ENABLED 1
#endif

// Enable/disable benchmarking (default: disabled, CMake option ADSIM_ENABLE_BENCHMARK)
#ifndef BENCHMARK_ENABLED
#define BENCHMARK_ENABLED 0
#endif

// Optional: compile-time top-level output directory.
// Example: g++ -DOUTPUT_DIR="\"/home/myuser\"" ...
// Overridden at runtime by logger::set_output_root() or the ADSIM_OUTPUT_DIR environment variable.

#ifndef LOG_FIRST_N_CALLS
#define LOG_FIRST_N_CALLS 100  // log first 100 calls
#endif

#ifndef LOG_EVERY_N_CALLS
#define LOG_EVERY_N_CALLS 1000  // log every 1000th call
#endif

namespace logger {

inline void register_cleanup_handlers();

// top-level directory holding the run folders; empty until resolved
inline std::filesystem::path output_root;
// timestamped run folder (parent of logs/ bench/ obs/)
inline std::filesystem::path run_folder;

// protect one-time init & run_folder changes
inline std::mutex init_mutex;

// protect log_streams map
inline std::mutex log_streams_mutex;
inline std::unordered_map<std::string, std::shared_ptr<std::ofstream>> log_streams;

// single write mutex used to make each LOG line atomic across simulation threads
inline std::mutex write_mutex;

// Select the directory that receives run folders. Has no effect once the run folder exists.
inline void set_output_root(const std::filesystem::path& root) {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (run_folder.empty()) output_root = root;
}

// Priority: set_output_root() > $ADSIM_OUTPUT_DIR > OUTPUT_DIR > current directory
inline std::filesystem::path resolve_output_root() {
    if (!output_root.empty()) return output_root;
    if (const char* env = std::getenv("ADSIM_OUTPUT_DIR"); env != nullptr && *env != '\0') {
        return std::filesystem::path(env);
    }
#ifdef OUTPUT_DIR
    return std::filesystem::path(OUTPUT_DIR);
#else
    return std::filesystem::current_path();
#endif
}

// run_YYYY-MM-DD_HH-MM-SS
inline std::string make_timestamped_folder_name() {
    auto t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream name;
    name << "run_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    return name.str();
}

inline void init_folders() {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (!run_folder.empty()) return;  // already inited

    run_folder = resolve_output_root() / make_timestamped_folder_name();
    for (const char* sub : {"logs", "bench", "obs"}) {
        std::filesystem::create_directories(run_folder / sub);
    }
}

inline std::string log_dir() {
    init_folders();
    return (run_folder / "logs").string();
}

// Target folder for exported trajectories
inline std::string obs_dir() {
    init_folders();
    return (run_folder / "obs").string();
}

// Ensure a stream (path relative to run_folder, e.g. "logs/solver.log") is open and cached.
inline std::shared_ptr<std::ofstream> ensure_log_stream(const std::string& relpath) {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    auto it = log_streams.find(relpath);
    if (it != log_streams.end()) return it->second;

    init_folders();
    register_cleanup_handlers();

    std::filesystem::path p = run_folder / relpath;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    auto ofs = std::make_shared<std::ofstream>(p.string(), std::ios::app | std::ios::binary);
    if (!ofs->is_open()) {
        ofs->open((run_folder / "unnamed.log").string(), std::ios::app | std::ios::binary);
    }

    log_streams.emplace(relpath, ofs);
    return ofs;
}

inline void flush_all_logs() {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    for (auto& kv : log_streams) {
        if (kv.second && kv.second->is_open()) kv.second->flush();
    }
}

inline void close_all_logs() {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    for (auto& kv : log_streams) {
        if (kv.second && kv.second->is_open()) kv.second->close();
    }
    log_streams.clear();
}

// Flush/close logs on normal exit and on termination signals
inline void register_cleanup_handlers() {
    static std::once_flag registered;
    std::call_once(registered, [] {
        std::atexit([]() {
            flush_all_logs();
            close_all_logs();
        });

        auto signal_handler = [](int signal) {
            flush_all_logs();
            close_all_logs();
            // Re-raise the signal to allow default handling
            std::signal(signal, SIG_DFL);
            std::raise(signal);
        };

        std::signal(SIGABRT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);
    });
}

// Append one pre-formatted entry to <run folder>/<subdir>/<file>; each entry is written atomically
inline void write_entry(const char* subdir, const std::string& file, const std::string& entry) {
    std::shared_ptr<std::ofstream> stream = ensure_log_stream(std::string(subdir) + "/" + file);
    std::lock_guard<std::mutex> lock(write_mutex);
    *stream << entry;
}

}  // namespace logger

// ––––––––––––––––––
// Macros
// ––––––––––––––––––

// Formats msg (<<-style stream expression, e.g. "Started id=" << id) and writes it below subdir
#define LOGGER_WRITE(subdir, file, msg)                     \
    do {                                                    \
        std::ostringstream _oss;                            \
        _oss << msg;                                        \
        logger::write_entry(subdir, (file), _oss.str());    \
    } while (0)

// LOG(file, msg): file name inside the run's logs/ folder (can include subdirs)
#if LOG_ENABLED
#define LOG(file, msg) LOGGER_WRITE("logs", file, msg)
#else
#define LOG(file, msg) \
    do {               \
    } while (0)
#endif

// LOG_BENCHMARK(file, msg): like LOG, but into bench/ and switched by BENCHMARK_ENABLED
#if BENCHMARK_ENABLED
#define LOG_BENCHMARK(file, msg) LOGGER_WRITE("bench", file, msg)
#else
#define LOG_BENCHMARK(file, msg) \
    do {                         \
    } while (0)
#endif

// BENCHMARK(var, { code })
// - Runs `code` and, if BENCHMARK_ENABLED, stores the elapsed seconds in the existing realtype `var`
// Usage:
//   realtype dt_s = 0.0;
//   BENCHMARK(dt_s, { /* work to measure */ });
//   LOG_BENCHMARK("timings.log", "rhs time (s): " << dt_s);
#if BENCHMARK_ENABLED
#define BENCHMARK(var, code)                                                      \
    do {                                                                          \
        auto _bench_start = std::chrono::high_resolution_clock::now();            \
        code;                                                                     \
        auto _bench_end = std::chrono::high_resolution_clock::now();              \
        var = std::chrono::duration<realtype>(_bench_end - _bench_start).count(); \
    } while (0)
#else
#define BENCHMARK(var, code) \
    do {                     \
        code;                \
    } while (0)
#endif

#endif  // LOGGER_HPP
