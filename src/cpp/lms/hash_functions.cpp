/**
 * LMS Hash Function Implementation
 *
 * Uses OpenSSL EVP SHA-256.
 */

#include "hash_functions.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <array>
#include <algorithm>

namespace lms {

HashFunction::HashFunction(size_t n) : ctx_(nullptr), n_(n) {
    if (n != 32 && n != 24) {
        throw std::invalid_argument("Hash output length must be 24 or 32 bytes");
    }

    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to init SHA-256");
    }
}

HashFunction::~HashFunction() {
    EVP_MD_CTX_free(ctx_);
}

void HashFunction::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to init SHA-256");
    }
}

HashFunction& HashFunction::update(std::span<const uint8_t> data) {
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256");
    }
    return *this;
}

HashFunction& HashFunction::update_u32(uint32_t x) {
    const std::array<uint8_t, 4> bytes = {
        static_cast<uint8_t>(x >> 24), static_cast<uint8_t>(x >> 16),
        static_cast<uint8_t>(x >> 8), static_cast<uint8_t>(x)};
    return update(bytes);
}

HashFunction& HashFunction::update_u16(uint16_t x) {
    const std::array<uint8_t, 2> bytes = {
        static_cast<uint8_t>(x >> 8), static_cast<uint8_t>(x)};
    return update(bytes);
}

HashFunction& HashFunction::update_u8(uint8_t x) {
    const std::array<uint8_t, 1> bytes = {x};
    return update(bytes);
}

void HashFunction::final(std::span<uint8_t> out) {
    if (out.size() != n_) {
        throw std::invalid_argument("Hash output buffer has wrong length");
    }

    std::array<uint8_t, 32> digest{};
    unsigned int len = 32;
    if (EVP_DigestFinal_ex(ctx_, digest.data(), &len) != 1) {
        throw std::runtime_error("SHA-256 failed");
    }

    // SHA-256/192 keeps the leftmost 24 bytes
    std::copy_n(digest.begin(), n_, out.begin());
    reset();
}

std::vector<uint8_t> HashFunction::final() {
    std::vector<uint8_t> out(n_);
    final(out);
    return out;
}

} // namespace lms
