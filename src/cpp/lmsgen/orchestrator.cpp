/**
 * Signing Orchestrator Implementation
 */

#include "orchestrator.hpp"
#include "errors.hpp"
#include <string>
#include <exception>
#include <stdexcept>
#include <tuple>

namespace lmsgen {

namespace {

template<typename Fn>
auto call_service(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const GeneratorError&) {
        throw;
    } catch (const std::exception& e) {
        throw ServiceError(std::string(operation) + " failed: " + e.what());
    }
}

} // anonymous namespace

void corrupt_signature(lms::Signature& signature) {
    if (signature.ots.y.empty() || signature.ots.y[0].empty()) {
        throw std::invalid_argument("Cannot corrupt an empty signature");
    }
    signature.ots.y[0][0] ^= 0x01;
}

SignedBatch SigningOrchestrator::sign_batch(const SigningRequest& request) {
    const size_t count = request.leaf_offsets.size();
    if (request.negative_tests > count) {
        throw InvalidParameter("negative-tests", request.negative_tests,
            "Invalid number of negative tests: " + std::to_string(request.negative_tests) +
            " expected at most " + std::to_string(count));
    }

    auto built = call_service("Tree construction", [&] {
        return service_.build_tree(request.algorithm.lms_type, request.algorithm.lmots_type);
    });
    auto& public_key = std::get<0>(built);
    const auto& tree = std::get<1>(built);

    SignedBatch batch;
    batch.vectors.reserve(count);

    const size_t first_negative = count - request.negative_tests;
    const bool verify_each =
        request.self_check || lms::get_lms_parameters(request.algorithm.lms_type).n == 24;

    for (size_t i = 0; i < count; ++i) {
        const uint32_t leaf_index = tree->base_offset() + request.leaf_offsets[i];
        const bool expect_success = i < first_negative;

        auto signature = call_service("Signing", [&] {
            auto private_key = tree->private_key(leaf_index);
            return service_.sign(request.message, private_key, leaf_index, *tree);
        });

        if (!expect_success) {
            corrupt_signature(signature);
        }

        if (verify_each) {
            bool valid = call_service("Verification", [&] {
                return service_.verify(request.message, public_key, signature);
            });
            if (valid != expect_success) {
                throw SelfCheckError(leaf_index, expect_success);
            }
        }

        batch.vectors.push_back(SignedVector{leaf_index, expect_success, std::move(signature)});
    }

    batch.public_key = std::move(public_key);
    return batch;
}

} // namespace lmsgen
