// Tracker/src/Logger.cpp
#include "Logger.hpp"

#include <filesystem>
#include <cstdlib>
#include <system_error>
#include <stdexcept>

namespace {
namespace fs = std::filesystem;

// Resolve the base directory for logs.
//
// Priority:
//   1) env PT_LOG_DIR
//   2) <PROJECT_SOURCE_DIR>/data/raw
//   3) ./data/raw
//
// If env RUN_ID is set, we append it as a subdirectory so each run gets its
// own folder, e.g. data/raw/run7/Loading_progress.csv
fs::path resolve_base_dir() {
    if (const char* env = std::getenv("PT_LOG_DIR")) {
        if (*env) {
            fs::path p(env);
            if (const char* run = std::getenv("RUN_ID")) {
                if (*run) p /= run;
            }
            return p;
        }
    }

#ifdef PROJECT_SOURCE_DIR
    fs::path base = fs::path(PROJECT_SOURCE_DIR) / "data" / "raw";
#else
    fs::path base = fs::current_path() / "data" / "raw";
#endif

    if (const char* run = std::getenv("RUN_ID")) {
        if (*run) base /= run;
    }
    return base;
}

// Get or open the CSV for a source, writing the header on first open.
std::ofstream& get_stream_for_source(
    const std::string& source,
    std::map<std::string, std::ofstream>& per_source,
    const std::vector<std::string>& cols
) {
    auto it = per_source.find(source);
    if (it != per_source.end()) {
        return it->second;
    }

    fs::path base_dir = resolve_base_dir();
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Logger: failed to create log directory " + base_dir.string() +
            " : " + ec.message()
        );
    }

    fs::path csv_path = base_dir / (source + ".csv");
    std::ofstream out(csv_path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            "Logger: failed to open log file " + csv_path.string()
        );
    }

    out << "tick,time_s";
    for (const auto& c : cols) {
        out << ',' << c;
    }
    out << '\n';
    out.flush();

    auto [new_it, _] = per_source.emplace(source, std::move(out));
    return new_it->second;
}

} // anonymous namespace

// ---------------- Logger public API ----------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    close();
}

void Logger::log_wide(const std::string& source,
                      int tick, double time,
                      const std::vector<std::string>& cols,
                      const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ofstream& out = get_stream_for_source(source, per_source_, cols);

    out << tick << ',' << time;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        double v = (i < vals.size() ? vals[i] : 0.0);
        out << ',' << v;
    }
    out << '\n';
    out.flush();
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& kv : per_source_) {
        if (kv.second.is_open()) kv.second.close();
    }
    per_source_.clear();
}
