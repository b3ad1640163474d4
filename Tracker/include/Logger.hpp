#pragma once
#include <mutex>
#include <map>
#include <string>
#include <fstream>
#include <vector>

// Per-source CSV logger shared by every thread in the process.
class Logger {
public:
    static Logger& instance();
    ~Logger();

    // One row per call: tick,time_s,<columns...>
    void log_wide(const std::string& source,
                  int tick, double time,
                  const std::vector<std::string>& columns,
                  const std::vector<double>& values);

    // Flush and close every open file; the next row reopens (and truncates).
    void close();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mtx_;
    std::map<std::string, std::ofstream> per_source_;
};
