// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/time.h"

#include <array>
#include <ctime>

namespace core {

int64_t get_time()
{
    using namespace std::chrono;
    return duration_cast<seconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

std::string format_iso8601(int64_t timestamp)
{
    std::time_t tt = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf.data());
}

// ---------------------------------------------------------------------------
// StopWatch
// ---------------------------------------------------------------------------

StopWatch::StopWatch()
    : start_(std::chrono::steady_clock::now())
{
}

int64_t StopWatch::elapsed_ms() const
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - start_).count();
}

int64_t StopWatch::elapsed_us() const
{
    using namespace std::chrono;
    return duration_cast<microseconds>(steady_clock::now() - start_).count();
}

void StopWatch::reset()
{
    start_ = std::chrono::steady_clock::now();
}

} // namespace core
