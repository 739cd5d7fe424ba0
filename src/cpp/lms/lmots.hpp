/**
 * LM-OTS (Leighton-Micali One-Time Signatures) Implementation
 * RFC 8554 Section 4
 *
 * Private keys are derived pseudorandomly from a tree-wide SEED as in
 * RFC 8554 Appendix A, so a key is just (type, I, q, SEED).
 */

#ifndef LMS_LMOTS_HPP
#define LMS_LMOTS_HPP

#include "params.hpp"
#include "hash_functions.hpp"
#include "utils.hpp"
#include <vector>
#include <span>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace lms {

// Domain separation constants (RFC 8554 Section 3.2)
constexpr uint16_t D_PBLC = 0x8080;
constexpr uint16_t D_MESG = 0x8181;
constexpr uint16_t D_LEAF = 0x8282;
constexpr uint16_t D_INTR = 0x8383;

constexpr size_t IDENTIFIER_SIZE = 16;

using LmsIdentifier = std::array<uint8_t, IDENTIFIER_SIZE>;

/**
 * LM-OTS private key for leaf q of the tree identified by I
 */
struct LmotsPrivateKey {
    LmotsAlgorithmType type;
    LmsIdentifier id;
    uint32_t q;
    std::vector<uint8_t> seed;
};

/**
 * LM-OTS signature: type, randomizer C and p chain values y[i]
 */
struct LmotsSignature {
    LmotsAlgorithmType type;
    std::vector<uint8_t> c;
    std::vector<std::vector<uint8_t>> y;
};

/**
 * Iterate the Winternitz chain i from step `start` up to (excluding) `end`.
 *
 * tmp = H(I || u32str(q) || u16str(i) || u8str(j) || tmp)
 */
inline void chain(
    HashFunction& hash,
    const LmsIdentifier& id,
    uint32_t q,
    uint16_t i,
    uint32_t start,
    uint32_t end,
    std::span<uint8_t> tmp) {

    for (uint32_t j = start; j < end; ++j) {
        hash.update(id).update_u32(q).update_u16(i).update_u8(static_cast<uint8_t>(j)).update(tmp);
        hash.final(tmp);
    }
}

/**
 * x_q[i] = H(I || u32str(q) || u16str(i) || u8str(0xff) || SEED)
 */
inline std::vector<uint8_t> lmots_private_element(
    HashFunction& hash,
    const LmotsPrivateKey& key,
    uint16_t i) {

    hash.update(key.id).update_u32(key.q).update_u16(i).update_u8(0xff).update(key.seed);
    return hash.final();
}

/**
 * Q || Cksm(Q) where Q = H(I || u32str(q) || u16str(D_MESG) || C || message)
 */
inline std::vector<uint8_t> lmots_message_digest(
    HashFunction& hash,
    const LmotsParams& params,
    const LmsIdentifier& id,
    uint32_t q,
    std::span<const uint8_t> C,
    std::span<const uint8_t> message) {

    hash.update(id).update_u32(q).update_u16(D_MESG).update(C).update(message);
    auto Q = hash.final();

    uint16_t cksm = checksum(params, Q);
    append_u16(Q, cksm);
    return Q;
}

/**
 * Algorithm 1: generate the LM-OTS public key value K for a private key.
 *
 * K = H(I || u32str(q) || u16str(D_PBLC) || y[0] || ... || y[p-1])
 */
inline std::vector<uint8_t> lmots_public_key(const LmotsPrivateKey& key) {
    const auto& params = get_lmots_parameters(key.type);

    HashFunction hash(params.n);
    HashFunction pk_hash(params.n);
    pk_hash.update(key.id).update_u32(key.q).update_u16(D_PBLC);

    for (size_t i = 0; i < params.p; ++i) {
        auto tmp = lmots_private_element(hash, key, static_cast<uint16_t>(i));
        chain(hash, key.id, key.q, static_cast<uint16_t>(i), 0, params.coef_max(), tmp);
        pk_hash.update(tmp);
    }

    return pk_hash.final();
}

/**
 * Algorithm 3: generate an LM-OTS signature with a caller-chosen randomizer C.
 *
 * @param message Message to sign
 * @param key Private key
 * @param c n-byte randomizer
 * @throws std::invalid_argument if the seed or C is not n bytes
 */
inline LmotsSignature lmots_sign(
    std::span<const uint8_t> message,
    const LmotsPrivateKey& key,
    std::span<const uint8_t> c) {

    const auto& params = get_lmots_parameters(key.type);
    if (key.seed.size() != params.n) {
        throw std::invalid_argument("LM-OTS seed must be n bytes");
    }
    if (c.size() != params.n) {
        throw std::invalid_argument("LM-OTS randomizer must be n bytes");
    }

    HashFunction hash(params.n);

    LmotsSignature sig;
    sig.type = key.type;
    sig.c.assign(c.begin(), c.end());
    sig.y.reserve(params.p);

    auto Q = lmots_message_digest(hash, params, key.id, key.q, sig.c, message);

    for (size_t i = 0; i < params.p; ++i) {
        uint32_t a = coef(Q, i, params.w);
        auto tmp = lmots_private_element(hash, key, static_cast<uint16_t>(i));
        chain(hash, key.id, key.q, static_cast<uint16_t>(i), 0, a, tmp);
        sig.y.push_back(std::move(tmp));
    }

    return sig;
}

/**
 * Algorithm 3 with a fresh random C.
 */
inline LmotsSignature lmots_sign(
    std::span<const uint8_t> message,
    const LmotsPrivateKey& key) {

    const auto& params = get_lmots_parameters(key.type);
    return lmots_sign(message, key, random_bytes(params.n));
}

/**
 * Algorithm 4b: compute the candidate public key Kc from a signature.
 *
 * @throws std::invalid_argument if the signature shape does not match its type
 */
inline std::vector<uint8_t> lmots_compute_pubkey_from_sig(
    const LmotsSignature& sig,
    std::span<const uint8_t> message,
    const LmsIdentifier& id,
    uint32_t q) {

    const auto& params = get_lmots_parameters(sig.type);
    if (sig.c.size() != params.n || sig.y.size() != params.p) {
        throw std::invalid_argument("Malformed LM-OTS signature");
    }

    HashFunction hash(params.n);
    auto Q = lmots_message_digest(hash, params, id, q, sig.c, message);

    HashFunction pk_hash(params.n);
    pk_hash.update(id).update_u32(q).update_u16(D_PBLC);

    for (size_t i = 0; i < params.p; ++i) {
        if (sig.y[i].size() != params.n) {
            throw std::invalid_argument("Malformed LM-OTS signature element");
        }
        uint32_t a = coef(Q, i, params.w);
        std::vector<uint8_t> tmp = sig.y[i];
        chain(hash, id, q, static_cast<uint16_t>(i), a, params.coef_max(), tmp);
        pk_hash.update(tmp);
    }

    return pk_hash.final();
}

} // namespace lms

#endif // LMS_LMOTS_HPP
