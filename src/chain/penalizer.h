#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <string>

namespace chain {

// ---------------------------------------------------------------------------
// PeerPenalizer -- the single call the ledger makes back into networking
// ---------------------------------------------------------------------------
// Invoked when a peer delivers a block that passes header checks but
// funds a transaction it never spends. The source string is whatever the
// caller passed to accept_block(); an empty source is still reported.
// ---------------------------------------------------------------------------
class PeerPenalizer {
public:
    virtual ~PeerPenalizer() = default;

    virtual void penalize(const std::string& source,
                          const std::string& reason) = 0;
};

/// Logs the offence and does nothing else. Used where there is no peer
/// layer to report to, such as local replay.
class LoggingPenalizer : public PeerPenalizer {
public:
    void penalize(const std::string& source,
                  const std::string& reason) override;
};

} // namespace chain
