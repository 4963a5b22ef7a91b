// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

namespace {

core::uint256 to_uint256(const uint8_t (&buf)[32]) {
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(buf, 32));
}

}  // namespace

// ===================================================================
// One-shot
// ===================================================================

core::uint256 keccak256(std::span<const uint8_t> data) {
    return keccak256(data.data(), data.size());
}

core::uint256 keccak256(const void* data, size_t len) {
    uint8_t out[32];
    unsigned int out_len = 0;
    // EVP_Digest handles context setup and teardown internally.
    if (EVP_Digest(data, len, out, &out_len, EVP_sha3_256(), nullptr) != 1 ||
        out_len != 32) {
        throw std::runtime_error("keccak256: EVP_Digest() failed");
    }
    return to_uint256(out);
}

// ===================================================================
// Keccak256Hasher
// ===================================================================

void Keccak256Hasher::init() {
    if (!ctx_) {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) {
            throw std::runtime_error(
                "Keccak256Hasher: EVP_MD_CTX_new() allocation failed");
        }
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_DigestInit_ex() failed");
    }
    finalized_ = false;
}

Keccak256Hasher::Keccak256Hasher() {
    init();
}

Keccak256Hasher::~Keccak256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Keccak256Hasher::Keccak256Hasher(Keccak256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Keccak256Hasher& Keccak256Hasher::operator=(
    Keccak256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Keccak256Hasher& Keccak256Hasher::write(std::span<const uint8_t> data) {
    if (finalized_ || !ctx_) {
        throw std::logic_error(
            "Keccak256Hasher::write() after finalize()");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_DigestUpdate() failed");
    }
    return *this;
}

core::uint256 Keccak256Hasher::finalize() {
    if (finalized_ || !ctx_) {
        throw std::logic_error("Keccak256Hasher::finalize() called twice");
    }
    uint8_t out[32];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_, out, &out_len) != 1 || out_len != 32) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return to_uint256(out);
}

void Keccak256Hasher::reset() {
    init();
}

}  // namespace crypto
