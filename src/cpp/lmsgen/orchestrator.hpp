/**
 * Signing Orchestrator
 *
 * Builds one key tree and produces one signature per sampled leaf.
 */

#ifndef LMSGEN_ORCHESTRATOR_HPP
#define LMSGEN_ORCHESTRATOR_HPP

#include "resolver.hpp"
#include "signing_service.hpp"
#include <cstdint>
#include <vector>

namespace lmsgen {

struct SigningRequest {
    ResolvedAlgorithm algorithm;
    std::vector<uint8_t> message;
    std::vector<uint32_t> leaf_offsets;     // Offsets from the tree's base leaf
    uint32_t negative_tests = 0;            // Trailing offsets signed then corrupted
    bool self_check = true;                 // Re-verify N=32 signatures; N=24 is always re-verified
};

struct SignedVector {
    uint32_t leaf_index;
    bool expect_success;
    lms::Signature signature;
};

struct SignedBatch {
    lms::PublicKey public_key;
    std::vector<SignedVector> vectors;
};

/**
 * Flip the lowest bit of the first Winternitz chain value.
 */
void corrupt_signature(lms::Signature& signature);

class SigningOrchestrator {
public:
    explicit SigningOrchestrator(SigningService& service) : service_(service) {}

    /**
     * Sign request.message once per leaf offset, in order.
     *
     * @throws InvalidParameter if negative_tests exceeds the number of leaves
     * @throws ServiceError if the service fails
     * @throws SelfCheckError if a re-verified signature verifies differently
     *         than expected (always checked for N=24, for N=32 when self_check is on)
     */
    [[nodiscard]] SignedBatch sign_batch(const SigningRequest& request);

private:
    SigningService& service_;
};

} // namespace lmsgen

#endif // LMSGEN_ORCHESTRATOR_HPP
