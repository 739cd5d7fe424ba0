/**
 * Signing & Verification Service
 *
 * The four LMS operations the generator consumes. LmsSigningService
 * forwards them to the lms library; tests substitute their own.
 */

#ifndef LMSGEN_SIGNING_SERVICE_HPP
#define LMSGEN_SIGNING_SERVICE_HPP

#include "lms/lms.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <tuple>

namespace lmsgen {

class SigningService {
public:
    virtual ~SigningService() = default;

    /**
     * Build a full key tree from fresh key material.
     */
    [[nodiscard]] virtual std::tuple<lms::PublicKey, std::unique_ptr<lms::LmsTree>> build_tree(
        lms::LmsAlgorithmType lms_type,
        lms::LmotsAlgorithmType lmots_type) = 0;

    /**
     * Sign message under leaf_index with the leaf's private key.
     */
    [[nodiscard]] virtual lms::Signature sign(
        std::span<const uint8_t> message,
        const lms::LmotsPrivateKey& private_key,
        uint32_t leaf_index,
        const lms::LmsTree& tree) = 0;

    [[nodiscard]] virtual bool verify(
        std::span<const uint8_t> message,
        const lms::PublicKey& public_key,
        const lms::Signature& signature) = 0;

    [[nodiscard]] virtual const lms::LmotsParams& lmots_parameters(lms::LmotsAlgorithmType type) = 0;
};

/**
 * Service backed by the in-tree RFC 8554 implementation.
 */
class LmsSigningService : public SigningService {
public:
    [[nodiscard]] std::tuple<lms::PublicKey, std::unique_ptr<lms::LmsTree>> build_tree(
        lms::LmsAlgorithmType lms_type,
        lms::LmotsAlgorithmType lmots_type) override {
        return lms::create_lms_tree(lms_type, lmots_type);
    }

    [[nodiscard]] lms::Signature sign(
        std::span<const uint8_t> message,
        const lms::LmotsPrivateKey& private_key,
        uint32_t leaf_index,
        const lms::LmsTree& tree) override {
        return lms::lms_sign_message(message, private_key, leaf_index, tree);
    }

    [[nodiscard]] bool verify(
        std::span<const uint8_t> message,
        const lms::PublicKey& public_key,
        const lms::Signature& signature) override {
        return lms::verify_lms_signature(message, public_key, signature);
    }

    [[nodiscard]] const lms::LmotsParams& lmots_parameters(lms::LmotsAlgorithmType type) override {
        return lms::get_lmots_parameters(type);
    }
};

} // namespace lmsgen

#endif // LMSGEN_SIGNING_SERVICE_HPP
