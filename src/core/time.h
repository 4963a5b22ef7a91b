#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <cstdint>
#include <string>

namespace core {

/// Returns current Unix timestamp in seconds since epoch.
int64_t get_time();

/// Formats a Unix timestamp (seconds) as ISO 8601: "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

// ---------------------------------------------------------------------------
// StopWatch - steady-clock timer for BENCH log lines.
// ---------------------------------------------------------------------------

class StopWatch {
public:
    /// Constructs and immediately starts the stopwatch.
    StopWatch();

    int64_t elapsed_ms() const;
    int64_t elapsed_us() const;

    void reset();

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
