#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TALLY_CONSENSUS_LEDGER_STATE_H
#define TALLY_CONSENSUS_LEDGER_STATE_H

#include "core/types.h"
#include "consensus/maturity_queue.h"
#include "consensus/registry.h"
#include "primitives/ids.h"
#include "primitives/outputs.h"

#include <optional>

namespace consensus {

using SiacoinRegistry =
    Registry<primitives::SiacoinOutputID, primitives::SiacoinOutput>;
using SiafundRegistry =
    Registry<primitives::SiafundOutputID, primitives::SiafundOutput>;
using ContractRegistry =
    Registry<primitives::FileContractID, primitives::FileContract>;

// ---------------------------------------------------------------------------
// LedgerView -- read-only access to the live ledger
// ---------------------------------------------------------------------------
// Values are returned by copy so callers never hold references into state
// that a later block may rewrite.
// ---------------------------------------------------------------------------
class LedgerView {
public:
    virtual ~LedgerView() = default;

    [[nodiscard]] virtual BlockHeight height() const = 0;

    [[nodiscard]] virtual std::optional<primitives::SiacoinOutput>
    get_siacoin_output(const primitives::SiacoinOutputID& id) const = 0;

    [[nodiscard]] virtual std::optional<primitives::SiafundOutput>
    get_siafund_output(const primitives::SiafundOutputID& id) const = 0;

    [[nodiscard]] virtual std::optional<primitives::FileContract>
    get_file_contract(const primitives::FileContractID& id) const = 0;
};

// ---------------------------------------------------------------------------
// LedgerState -- the consensus state proper
// ---------------------------------------------------------------------------
// Mutated only by DiffCommitter (registries and queue) and by the block
// processor (height). Not synchronized; the owner provides locking.
// ---------------------------------------------------------------------------
class LedgerState : public LedgerView {
public:
    LedgerState() = default;

    [[nodiscard]] BlockHeight height() const override { return height_; }
    void set_height(BlockHeight h) noexcept { height_ = h; }

    [[nodiscard]] std::optional<primitives::SiacoinOutput>
    get_siacoin_output(const primitives::SiacoinOutputID& id) const override;

    [[nodiscard]] std::optional<primitives::SiafundOutput>
    get_siafund_output(const primitives::SiafundOutputID& id) const override;

    [[nodiscard]] std::optional<primitives::FileContract>
    get_file_contract(const primitives::FileContractID& id) const override;

    SiacoinRegistry& siacoin_outputs() noexcept { return siacoin_outputs_; }
    SiafundRegistry& siafund_outputs() noexcept { return siafund_outputs_; }
    ContractRegistry& file_contracts() noexcept { return file_contracts_; }
    MaturityQueue& delayed_outputs() noexcept { return delayed_outputs_; }

    const SiacoinRegistry& siacoin_outputs() const noexcept {
        return siacoin_outputs_;
    }
    const SiafundRegistry& siafund_outputs() const noexcept {
        return siafund_outputs_;
    }
    const ContractRegistry& file_contracts() const noexcept {
        return file_contracts_;
    }
    const MaturityQueue& delayed_outputs() const noexcept {
        return delayed_outputs_;
    }

    /// SHA3-256 of the canonical encoding of height, registries and queue.
    /// Two states are identical exactly when their digests match.
    [[nodiscard]] core::uint256 digest() const;

    bool operator==(const LedgerState& o) const {
        return height_ == o.height_ &&
               siacoin_outputs_ == o.siacoin_outputs_ &&
               siafund_outputs_ == o.siafund_outputs_ &&
               file_contracts_ == o.file_contracts_ &&
               delayed_outputs_ == o.delayed_outputs_;
    }

    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_u64(s, height_);
        siacoin_outputs_.serialize(s);
        siafund_outputs_.serialize(s);
        file_contracts_.serialize(s);
        delayed_outputs_.serialize(s);
    }

private:
    BlockHeight height_ = 0;
    SiacoinRegistry siacoin_outputs_;
    SiafundRegistry siafund_outputs_;
    ContractRegistry file_contracts_;
    MaturityQueue delayed_outputs_;
};

} // namespace consensus

#endif // TALLY_CONSENSUS_LEDGER_STATE_H
