#pragma once
// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA3-256 over the OpenSSL 3 EVP API. Every content-addressed identifier in
// the ledger (block, transaction, output, contract) is one of these digests.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>

// Keep OpenSSL headers out of every translation unit that hashes.
struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

/// One-shot SHA3-256 of a byte span. Throws std::runtime_error if OpenSSL
/// fails to provide the digest.
[[nodiscard]] core::uint256 keccak256(std::span<const uint8_t> data);

[[nodiscard]] core::uint256 keccak256(const void* data, size_t len);

/// Streaming SHA3-256. Move-only; finalize() consumes the context and
/// reset() makes the hasher reusable.
class Keccak256Hasher {
public:
    Keccak256Hasher();
    ~Keccak256Hasher();

    Keccak256Hasher(const Keccak256Hasher&) = delete;
    Keccak256Hasher& operator=(const Keccak256Hasher&) = delete;

    Keccak256Hasher(Keccak256Hasher&& other) noexcept;
    Keccak256Hasher& operator=(Keccak256Hasher&& other) noexcept;

    Keccak256Hasher& write(std::span<const uint8_t> data);

    [[nodiscard]] core::uint256 finalize();

    void reset();

private:
    void init();

    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

}  // namespace crypto
