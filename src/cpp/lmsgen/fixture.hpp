/**
 * Fixture Data Model
 *
 * The fully encoded content of one generated test file.
 */

#ifndef LMSGEN_FIXTURE_HPP
#define LMSGEN_FIXTURE_HPP

#include "encoder.hpp"
#include "resolver.hpp"
#include <cstdint>
#include <vector>

namespace lmsgen {

struct TestVector {
    uint32_t leaf_index;
    bool expect_success;
    std::vector<uint8_t> signature_bytes;
};

struct OutputFixture {
    std::vector<uint8_t> message;
    std::vector<uint8_t> public_key_bytes;
    StructuralParams structural_params;
    ResolvedAlgorithm algorithm;
    std::vector<TestVector> test_vectors;
};

} // namespace lmsgen

#endif // LMSGEN_FIXTURE_HPP
