/**
 * LMS (Leighton-Micali Signatures) Implementation
 * RFC 8554 Section 5
 *
 * Single-tree LMS: tree construction, signing under a chosen leaf,
 * verification, and parsing of the RFC 8554 byte encodings.
 */

#ifndef LMS_LMS_HPP
#define LMS_LMS_HPP

#include "params.hpp"
#include "hash_functions.hpp"
#include "lmots.hpp"
#include "utils.hpp"
#include <vector>
#include <span>
#include <tuple>
#include <memory>
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace lms {

/**
 * LMS public key: u32str(type) || u32str(otstype) || I || T[1]
 */
struct PublicKey {
    LmsAlgorithmType lms_type;
    LmotsAlgorithmType lmots_type;
    LmsIdentifier id;
    std::vector<uint8_t> root;
};

/**
 * LMS signature: u32str(q) || lmots_signature || u32str(type) || path
 */
struct Signature {
    uint32_t q;
    LmotsSignature ots;
    LmsAlgorithmType lms_type;
    std::vector<std::vector<uint8_t>> path;
};

/**
 * A fully computed LMS Merkle tree together with its private key material.
 *
 * Nodes are numbered as in RFC 8554 Section 5.3: the root is node 1 and
 * the leaves are nodes 2^h .. 2^(h+1)-1.
 */
class LmsTree {
public:
    LmsTree(LmsAlgorithmType lms_type,
            LmotsAlgorithmType lmots_type,
            const LmsIdentifier& id,
            std::vector<uint8_t> seed)
        : lms_params_(get_lms_parameters(lms_type)),
          lmots_params_(get_lmots_parameters(lmots_type)),
          id_(id),
          seed_(std::move(seed)),
          q_(0) {

        if (lms_params_.n != lmots_params_.n) {
            throw std::invalid_argument("LMS and LM-OTS types use different hash lengths");
        }
        if (seed_.size() != lmots_params_.n) {
            throw std::invalid_argument("Tree seed must be n bytes");
        }

        compute_nodes();
    }

    LmsTree(const LmsTree&) = delete;
    LmsTree& operator=(const LmsTree&) = delete;

    [[nodiscard]] const LmsParams& lms_params() const noexcept { return lms_params_; }
    [[nodiscard]] const LmotsParams& lmots_params() const noexcept { return lmots_params_; }
    [[nodiscard]] const LmsIdentifier& id() const noexcept { return id_; }

    [[nodiscard]] uint32_t leaf_count() const noexcept { return lms_params_.leaf_count(); }

    /**
     * Index of the first unused leaf. Always 0 for a freshly built tree.
     */
    [[nodiscard]] uint32_t base_offset() const noexcept { return q_; }

    /**
     * Private key of leaf q.
     *
     * @throws std::out_of_range if q is not a leaf of this tree
     */
    [[nodiscard]] LmotsPrivateKey private_key(uint32_t q) const {
        if (q >= leaf_count()) {
            throw std::out_of_range("Leaf index outside of tree");
        }
        return LmotsPrivateKey{lmots_params_.type, id_, q, seed_};
    }

    [[nodiscard]] std::vector<uint8_t> root() const {
        auto r = node(1);
        return std::vector<uint8_t>(r.begin(), r.end());
    }

    [[nodiscard]] PublicKey public_key() const {
        return PublicKey{lms_params_.type, lmots_params_.type, id_, root()};
    }

    /**
     * Authentication path of leaf q: the siblings of every node on the way
     * from the leaf to the root.
     */
    [[nodiscard]] std::vector<std::vector<uint8_t>> auth_path(uint32_t q) const {
        if (q >= leaf_count()) {
            throw std::out_of_range("Leaf index outside of tree");
        }

        std::vector<std::vector<uint8_t>> path;
        path.reserve(lms_params_.h);

        uint32_t r = leaf_count() + q;
        for (size_t i = 0; i < lms_params_.h; ++i) {
            auto sibling = node(r ^ 1);
            path.emplace_back(sibling.begin(), sibling.end());
            r >>= 1;
        }
        return path;
    }

private:
    [[nodiscard]] std::span<const uint8_t> node(uint32_t r) const {
        return std::span<const uint8_t>(nodes_).subspan(static_cast<size_t>(r) * lms_params_.n, lms_params_.n);
    }

    [[nodiscard]] std::span<uint8_t> node(uint32_t r) {
        return std::span<uint8_t>(nodes_).subspan(static_cast<size_t>(r) * lms_params_.n, lms_params_.n);
    }

    void compute_nodes() {
        const size_t n = lms_params_.n;
        const uint32_t leaves = leaf_count();
        nodes_.assign(static_cast<size_t>(2) * leaves * n, 0);

        HashFunction hash(n);

        for (uint32_t q = 0; q < leaves; ++q) {
            uint32_t r = leaves + q;
            auto K = lmots_public_key(private_key(q));
            hash.update(id_).update_u32(r).update_u16(D_LEAF).update(K);
            hash.final(node(r));
        }

        for (uint32_t r = leaves - 1; r >= 1; --r) {
            hash.update(id_).update_u32(r).update_u16(D_INTR)
                .update(node(2 * r)).update(node(2 * r + 1));
            hash.final(node(r));
        }
    }

    const LmsParams& lms_params_;
    const LmotsParams& lmots_params_;
    LmsIdentifier id_;
    std::vector<uint8_t> seed_;
    uint32_t q_;
    std::vector<uint8_t> nodes_;
};

/**
 * Build an LMS tree from an explicit identifier and seed (deterministic).
 */
inline std::tuple<PublicKey, std::unique_ptr<LmsTree>> create_lms_tree(
    LmsAlgorithmType lms_type,
    LmotsAlgorithmType lmots_type,
    const LmsIdentifier& id,
    std::span<const uint8_t> seed) {

    auto tree = std::make_unique<LmsTree>(
        lms_type, lmots_type, id, std::vector<uint8_t>(seed.begin(), seed.end()));
    auto pk = tree->public_key();
    return {std::move(pk), std::move(tree)};
}

/**
 * Algorithm 5: build an LMS tree from fresh random I and SEED.
 */
inline std::tuple<PublicKey, std::unique_ptr<LmsTree>> create_lms_tree(
    LmsAlgorithmType lms_type,
    LmotsAlgorithmType lmots_type) {

    const auto& lmots_params = get_lmots_parameters(lmots_type);

    LmsIdentifier id{};
    auto id_bytes = random_bytes(IDENTIFIER_SIZE);
    std::copy(id_bytes.begin(), id_bytes.end(), id.begin());

    auto seed = random_bytes(lmots_params.n);
    return create_lms_tree(lms_type, lmots_type, id, seed);
}

/**
 * Generate an LMS signature for message under leaf q.
 *
 * @param message Message to sign
 * @param private_key LM-OTS private key of leaf q
 * @param q Leaf index
 * @param tree Tree providing the authentication path
 * @throws std::invalid_argument if the key does not belong to leaf q of tree
 */
inline Signature lms_sign_message(
    std::span<const uint8_t> message,
    const LmotsPrivateKey& private_key,
    uint32_t q,
    const LmsTree& tree) {

    if (private_key.q != q || private_key.id != tree.id()) {
        throw std::invalid_argument("Private key does not belong to the requested leaf");
    }
    if (private_key.type != tree.lmots_params().type) {
        throw std::invalid_argument("Private key type does not match tree");
    }

    Signature sig;
    sig.q = q;
    sig.ots = lmots_sign(message, private_key);
    sig.lms_type = tree.lms_params().type;
    sig.path = tree.auth_path(q);
    return sig;
}

/**
 * Algorithm 6a: verify an LMS signature.
 *
 * @return True if the signature is valid for message under pk
 */
inline bool verify_lms_signature(
    std::span<const uint8_t> message,
    const PublicKey& pk,
    const Signature& sig) {

    if (sig.lms_type != pk.lms_type || sig.ots.type != pk.lmots_type) {
        return false;
    }

    const auto& lms_params = get_lms_parameters(pk.lms_type);
    const auto& lmots_params = get_lmots_parameters(pk.lmots_type);
    const size_t n = lms_params.n;

    if (pk.root.size() != n || sig.q >= lms_params.leaf_count()) {
        return false;
    }
    if (sig.ots.c.size() != n || sig.ots.y.size() != lmots_params.p) {
        return false;
    }
    if (sig.path.size() != lms_params.h) {
        return false;
    }
    for (const auto& y : sig.ots.y) {
        if (y.size() != n) return false;
    }
    for (const auto& p : sig.path) {
        if (p.size() != n) return false;
    }

    auto Kc = lmots_compute_pubkey_from_sig(sig.ots, message, pk.id, sig.q);

    HashFunction hash(n);
    uint32_t node_num = lms_params.leaf_count() + sig.q;
    hash.update(pk.id).update_u32(node_num).update_u16(D_LEAF).update(Kc);
    auto tmp = hash.final();

    for (size_t i = 0; node_num > 1; ++i) {
        hash.update(pk.id).update_u32(node_num / 2).update_u16(D_INTR);
        if (node_num % 2 == 1) {
            hash.update(sig.path[i]).update(tmp);
        } else {
            hash.update(tmp).update(sig.path[i]);
        }
        hash.final(tmp);
        node_num /= 2;
    }

    return ct_equal(tmp, pk.root);
}

/**
 * Parse an RFC 8554 encoded LMS public key.
 *
 * @throws std::invalid_argument on unknown types or wrong length
 */
inline PublicKey parse_public_key(std::span<const uint8_t> bytes) {
    auto lms_type = lms_type_from_u32(load_u32(bytes, 0));
    auto lmots_type = lmots_type_from_u32(load_u32(bytes, 4));
    if (!lms_type || !lmots_type) {
        throw std::invalid_argument("Unsupported algorithm type in public key");
    }

    const auto& params = get_lms_parameters(*lms_type);
    if (bytes.size() != params.pk_size()) {
        throw std::invalid_argument("Public key has wrong length");
    }

    PublicKey pk;
    pk.lms_type = *lms_type;
    pk.lmots_type = *lmots_type;
    std::copy_n(bytes.begin() + 8, IDENTIFIER_SIZE, pk.id.begin());
    pk.root.assign(bytes.begin() + 8 + IDENTIFIER_SIZE, bytes.end());
    return pk;
}

/**
 * Parse an RFC 8554 encoded LMS signature.
 *
 * @throws std::invalid_argument on unknown types or wrong length
 */
inline Signature parse_signature(std::span<const uint8_t> bytes) {
    Signature sig;
    sig.q = load_u32(bytes, 0);

    auto lmots_type = lmots_type_from_u32(load_u32(bytes, 4));
    if (!lmots_type) {
        throw std::invalid_argument("Unsupported LM-OTS type in signature");
    }
    const auto& ots = get_lmots_parameters(*lmots_type);
    const size_t n = ots.n;

    size_t offset = 8;
    if (bytes.size() < offset + n * (1 + ots.p) + 4) {
        throw std::invalid_argument("Signature too short");
    }

    sig.ots.type = *lmots_type;
    sig.ots.c.assign(bytes.begin() + offset, bytes.begin() + offset + n);
    offset += n;
    sig.ots.y.reserve(ots.p);
    for (size_t i = 0; i < ots.p; ++i) {
        sig.ots.y.emplace_back(bytes.begin() + offset, bytes.begin() + offset + n);
        offset += n;
    }

    auto lms_type = lms_type_from_u32(load_u32(bytes, offset));
    if (!lms_type) {
        throw std::invalid_argument("Unsupported LMS type in signature");
    }
    offset += 4;

    const auto& params = get_lms_parameters(*lms_type);
    if (params.n != n || bytes.size() != params.sig_size(ots)) {
        throw std::invalid_argument("Signature has wrong length");
    }

    sig.lms_type = *lms_type;
    sig.path.reserve(params.h);
    for (size_t i = 0; i < params.h; ++i) {
        sig.path.emplace_back(bytes.begin() + offset, bytes.begin() + offset + n);
        offset += n;
    }
    return sig;
}

} // namespace lms

#endif // LMS_LMS_HPP
