/**
 * Fixture Generator Implementation
 */

#include "generator.hpp"
#include "emitter.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace lmsgen {

namespace {

void validate_test_counts(const GeneratorConfig& config) {
    if (config.tests < MIN_TESTS || config.tests > MAX_TESTS) {
        throw InvalidParameter("tests", config.tests,
            "Invalid number of tests: " + std::to_string(config.tests) +
            " expected a number between " + std::to_string(MIN_TESTS) +
            " and " + std::to_string(MAX_TESTS));
    }
    if (config.negative_tests > config.tests) {
        throw InvalidParameter("negative-tests", config.negative_tests,
            "Invalid number of negative tests: " + std::to_string(config.negative_tests) +
            " expected at most " + std::to_string(config.tests));
    }
}

void check_length(const char* what, size_t actual, size_t expected) {
    if (actual != expected) {
        throw ServiceError(std::string(what) + " encoded to " + std::to_string(actual) +
                           " bytes, expected " + std::to_string(expected));
    }
}

} // anonymous namespace

size_t expected_public_key_size(const ResolvedAlgorithm& algorithm) {
    const auto& lms_params = lms::get_lms_parameters(algorithm.lms_type);
    return 24 + lms_params.n;
}

size_t expected_signature_size(const ResolvedAlgorithm& algorithm) {
    const auto& lms_params = lms::get_lms_parameters(algorithm.lms_type);
    const auto& ots_params = lms::get_lmots_parameters(algorithm.lmots_type);
    return 12 + lms_params.n * (1 + ots_params.p + lms_params.h);
}

OutputFixture FixtureGenerator::generate(const GeneratorConfig& config) {
    const ResolvedAlgorithm algorithm = resolve_algorithm(config.params);
    validate_test_counts(config);
    check_output_path(config.filename);

    log_ << "Going to create tests for N: " << config.params.n
         << ", W: " << config.params.w
         << ", tree_height: " << config.params.tree_height << std::endl;

    auto offsets = sampler_.sample(config.tests, config.params.tree_height);

    log_ << "going to use the following keys: [";
    for (size_t i = 0; i < offsets.size(); ++i) {
        if (i > 0) log_ << ", ";
        log_ << offsets[i];
    }
    log_ << "]" << std::endl;

    SigningRequest request;
    request.algorithm = algorithm;
    request.message.assign(config.message.begin(), config.message.end());
    request.leaf_offsets = std::move(offsets);
    request.negative_tests = config.negative_tests;
    request.self_check = config.self_check;

    SigningOrchestrator orchestrator(service_);
    SignedBatch batch = orchestrator.sign_batch(request);

    LayoutEncoder encoder(LayoutDescriptor::for_algorithm(algorithm));
    const size_t pk_size = expected_public_key_size(algorithm);
    const size_t sig_size = expected_signature_size(algorithm);

    OutputFixture fixture;
    fixture.message = std::move(request.message);
    fixture.structural_params = encoder.layout().params();
    fixture.algorithm = algorithm;

    try {
        fixture.public_key_bytes = encoder.encode_public_key(batch.public_key);
        check_length("Public key", fixture.public_key_bytes.size(), pk_size);

        fixture.test_vectors.reserve(batch.vectors.size());
        for (const auto& vec : batch.vectors) {
            auto bytes = encoder.encode_signature(vec.signature);
            check_length("Signature", bytes.size(), sig_size);
            fixture.test_vectors.push_back(TestVector{vec.leaf_index, vec.expect_success, std::move(bytes)});
        }
    } catch (const std::invalid_argument& e) {
        throw ServiceError(std::string("Service output does not match the layout: ") + e.what());
    }

    return fixture;
}

void FixtureGenerator::run(const GeneratorConfig& config) {
    OutputFixture fixture = generate(config);
    write_fixture(config.filename, fixture);

    size_t negatives = 0;
    for (const auto& test : fixture.test_vectors) {
        if (!test.expect_success) ++negatives;
    }

    log_ << "Wrote " << fixture.test_vectors.size() << " tests ("
         << negatives << " negative) to " << config.filename << std::endl;
    log_ << "  Public Key:      " << fixture.public_key_bytes.size() << " bytes" << std::endl;
    if (!fixture.test_vectors.empty()) {
        log_ << "  Signature Size:  " << fixture.test_vectors.front().signature_bytes.size()
             << " bytes" << std::endl;
    }
}

} // namespace lmsgen
