// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/penalizer.h"

#include "core/logging.h"

namespace chain {

void LoggingPenalizer::penalize(const std::string& source,
                                const std::string& reason) {
    LOG_WARN(core::LogCategory::VALIDATION,
             "Penalize peer '" + (source.empty() ? std::string("local") : source) +
             "': " + reason);
}

} // namespace chain
