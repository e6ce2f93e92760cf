#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace arsc {
namespace log_utils {

// "850 ms", "12.4 s", "3m 07s", "2h 5m 0s"
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) return std::to_string(ms) + " ms";

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    std::ostringstream oss;
    if (total_minutes < 60) {
        oss << total_minutes << "m " << std::setw(2) << std::setfill('0') << seconds << "s";
    } else {
        oss << (total_minutes / 60) << "h " << (total_minutes % 60) << "m " << seconds << "s";
    }
    return oss.str();
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

/**
 * "Processed i/n genomes" progress on stderr.
 *
 * On a terminal the line is rewritten in place; otherwise a line is printed
 * every `every` genomes and for the last one, so logs stay readable.
 */
class ProgressLine {
public:
    explicit ProgressLine(bool enabled, size_t every = 100)
        : enabled_(enabled), every_(every == 0 ? 1 : every),
          is_tty_(isatty(fileno(stderr)) != 0) {}

    void update(size_t done, size_t total) {
        if (!enabled_) return;
        if (is_tty_) {
            std::cerr << "\r  Processed " << done << "/" << total << " genomes" << std::flush;
            dirty_ = true;
        } else if (done % every_ == 0 || done == total) {
            std::cerr << "  Processed " << done << "/" << total << " genomes\n";
        }
    }

    void finish() {
        if (dirty_) std::cerr << "\n";
        dirty_ = false;
    }

private:
    bool enabled_;
    size_t every_;
    bool is_tty_;
    bool dirty_ = false;
};

}  // namespace log_utils
}  // namespace arsc
