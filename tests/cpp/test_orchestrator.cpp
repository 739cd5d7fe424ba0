/**
 * Signing Orchestrator Tests
 */

#include "lmsgen/orchestrator.hpp"
#include "lmsgen/errors.hpp"
#include "test_harness.hpp"
#include <memory>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace lmsgen;

namespace {

const std::string MESSAGE_TEXT = "this is the message I want signed";

SigningRequest make_request(uint32_t n, uint32_t w, uint32_t h, std::vector<uint32_t> offsets) {
    SigningRequest request;
    request.algorithm = resolve_algorithm({n, w, h});
    request.message.assign(MESSAGE_TEXT.begin(), MESSAGE_TEXT.end());
    request.leaf_offsets = std::move(offsets);
    return request;
}

// Signs correctly but reports every signature as invalid
class RejectingService : public LmsSigningService {
public:
    bool verify(std::span<const uint8_t>, const lms::PublicKey&, const lms::Signature&) override {
        return false;
    }
};

// Reports every signature as valid, including corrupted ones
class AcceptingService : public LmsSigningService {
public:
    bool verify(std::span<const uint8_t>, const lms::PublicKey&, const lms::Signature&) override {
        return true;
    }
};

class CountingVerifyService : public LmsSigningService {
public:
    bool verify(std::span<const uint8_t> message, const lms::PublicKey& pk, const lms::Signature& sig) override {
        ++verify_calls;
        return LmsSigningService::verify(message, pk, sig);
    }

    int verify_calls = 0;
};

class FailingSignService : public LmsSigningService {
public:
    lms::Signature sign(std::span<const uint8_t>, const lms::LmotsPrivateKey&,
                        uint32_t, const lms::LmsTree&) override {
        ++sign_calls;
        throw std::runtime_error("hardware fault");
    }

    int sign_calls = 0;
};

class FailingBuildService : public LmsSigningService {
public:
    std::tuple<lms::PublicKey, std::unique_ptr<lms::LmsTree>> build_tree(
        lms::LmsAlgorithmType, lms::LmotsAlgorithmType) override {
        throw std::runtime_error("out of entropy");
    }
};

} // anonymous namespace

void test_batches() {
    LmsSigningService service;
    SigningOrchestrator orchestrator(service);

    TEST("N=32 W=8 H=5 single vector") {
        auto request = make_request(32, 8, 5, {17});
        auto batch = orchestrator.sign_batch(request);
        ASSERT_EQ(batch.vectors.size(), 1u);
        ASSERT_EQ(batch.vectors[0].leaf_index, 17u);
        ASSERT_TRUE(batch.vectors[0].expect_success);
        ASSERT_EQ(batch.vectors[0].signature.q, 17u);
        ASSERT_TRUE(batch.public_key.lms_type == lms::LmsAlgorithmType::LmsSha256N32H5);
        ASSERT_TRUE(lms::verify_lms_signature(request.message, batch.public_key, batch.vectors[0].signature));
    TEST_END

    TEST("N=24 W=1 H=10 five vectors") {
        auto request = make_request(24, 1, 10, {1000, 3, 512, 77, 1023});
        auto batch = orchestrator.sign_batch(request);
        ASSERT_EQ(batch.vectors.size(), 5u);

        std::set<uint32_t> leaves;
        for (size_t i = 0; i < batch.vectors.size(); ++i) {
            const auto& vec = batch.vectors[i];
            ASSERT_EQ(vec.leaf_index, request.leaf_offsets[i]);
            ASSERT_TRUE(vec.leaf_index < 1024u);
            ASSERT_TRUE(vec.expect_success);
            ASSERT_TRUE(lms::verify_lms_signature(request.message, batch.public_key, vec.signature));
            leaves.insert(vec.leaf_index);
        }
        ASSERT_EQ(leaves.size(), 5u);
    TEST_END

    TEST("trailing leaves become negative vectors") {
        auto request = make_request(32, 4, 5, {0, 9, 31});
        request.negative_tests = 2;
        auto batch = orchestrator.sign_batch(request);
        ASSERT_EQ(batch.vectors.size(), 3u);
        ASSERT_TRUE(batch.vectors[0].expect_success);
        ASSERT_FALSE(batch.vectors[1].expect_success);
        ASSERT_FALSE(batch.vectors[2].expect_success);
        for (const auto& vec : batch.vectors) {
            ASSERT_EQ(lms::verify_lms_signature(request.message, batch.public_key, vec.signature),
                      vec.expect_success);
        }
    TEST_END

    TEST("all vectors negative") {
        auto request = make_request(24, 8, 5, {4, 5});
        request.negative_tests = 2;
        auto batch = orchestrator.sign_batch(request);
        ASSERT_FALSE(batch.vectors[0].expect_success);
        ASSERT_FALSE(batch.vectors[1].expect_success);
    TEST_END

    TEST("more negative tests than leaves is rejected") {
        auto request = make_request(32, 8, 5, {1});
        request.negative_tests = 2;
        try {
            (void)orchestrator.sign_batch(request);
            throw std::runtime_error("expected InvalidParameter");
        } catch (const InvalidParameter& e) {
            ASSERT_EQ(e.field(), std::string("negative-tests"));
            ASSERT_TRUE(e.code() == ExitCode::InvalidTestCount);
        }
    TEST_END

    TEST("corrupt_signature flips one bit") {
        auto request = make_request(32, 8, 5, {2});
        auto batch = orchestrator.sign_batch(request);
        auto sig = batch.vectors[0].signature;
        const uint8_t before = sig.ots.y[0][0];
        corrupt_signature(sig);
        ASSERT_EQ(static_cast<unsigned>(sig.ots.y[0][0] ^ before), 1u);
        ASSERT_FALSE(lms::verify_lms_signature(request.message, batch.public_key, sig));

        lms::Signature empty{};
        ASSERT_THROWS(corrupt_signature(empty), std::invalid_argument);
    TEST_END
}

void test_self_check() {
    TEST("rejected signature aborts the run") {
        RejectingService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(32, 8, 5, {6, 7});
        try {
            (void)orchestrator.sign_batch(request);
            throw std::runtime_error("expected SelfCheckError");
        } catch (const SelfCheckError& e) {
            ASSERT_EQ(e.leaf_index(), 6u);
            ASSERT_TRUE(e.code() == ExitCode::SelfCheckFailure);
        }
    TEST_END

    TEST("self-check off trusts the service") {
        RejectingService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(32, 8, 5, {6, 7});
        request.self_check = false;
        auto batch = orchestrator.sign_batch(request);
        ASSERT_EQ(batch.vectors.size(), 2u);
    TEST_END

    TEST("N=24 signatures are re-verified with self-check off") {
        CountingVerifyService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(24, 8, 5, {1, 2, 3});
        request.self_check = false;
        auto batch = orchestrator.sign_batch(request);
        ASSERT_EQ(batch.vectors.size(), 3u);
        ASSERT_EQ(service.verify_calls, 3);
    TEST_END

    TEST("N=32 self-check off skips verification") {
        CountingVerifyService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(32, 8, 5, {1, 2, 3});
        request.self_check = false;
        (void)orchestrator.sign_batch(request);
        ASSERT_EQ(service.verify_calls, 0);
    TEST_END

    TEST("N=24 rejected signature aborts with self-check off") {
        RejectingService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(24, 4, 5, {6});
        request.self_check = false;
        ASSERT_THROWS(orchestrator.sign_batch(request), SelfCheckError);
    TEST_END

    TEST("accepted corrupted signature aborts the run") {
        AcceptingService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(24, 8, 5, {1, 2});
        request.negative_tests = 1;
        try {
            (void)orchestrator.sign_batch(request);
            throw std::runtime_error("expected SelfCheckError");
        } catch (const SelfCheckError& e) {
            ASSERT_EQ(e.leaf_index(), 2u);
        }
    TEST_END
}

void test_service_failures() {
    TEST("signing failure becomes ServiceError") {
        FailingSignService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(32, 8, 5, {0, 1, 2});
        try {
            (void)orchestrator.sign_batch(request);
            throw std::runtime_error("expected ServiceError");
        } catch (const ServiceError& e) {
            ASSERT_TRUE(e.code() == ExitCode::ServiceFailure);
            ASSERT_TRUE(std::string(e.what()).find("hardware fault") != std::string::npos);
        }
        ASSERT_EQ(service.sign_calls, 1);
    TEST_END

    TEST("tree construction failure becomes ServiceError") {
        FailingBuildService service;
        SigningOrchestrator orchestrator(service);
        auto request = make_request(32, 8, 5, {0});
        ASSERT_THROWS(orchestrator.sign_batch(request), ServiceError);
    TEST_END
}

int main() {
    std::cout << "=== Signing Orchestrator Tests ===" << std::endl << std::endl;

    test_batches();

    std::cout << std::endl << "--- Self-check ---" << std::endl;
    test_self_check();

    std::cout << std::endl << "--- Service failures ---" << std::endl;
    test_service_failures();

    return report_results();
}
