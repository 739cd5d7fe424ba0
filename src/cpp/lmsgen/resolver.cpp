/**
 * Algorithm Parameter Resolver Implementation
 */

#include "resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

namespace lmsgen {

namespace {

template<size_t N>
bool contains(const std::array<uint32_t, N>& values, uint32_t value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // anonymous namespace

void validate_parameters(const AlgorithmParameterSet& params) {
    if (!contains(VALID_TREE_HEIGHTS, params.tree_height)) {
        throw InvalidParameter("tree-height", params.tree_height,
            "Invalid tree height: " + std::to_string(params.tree_height) +
            " expected one of 5, 10, 15, 20");
    }

    if (!contains(VALID_N, params.n)) {
        throw InvalidParameter("n", params.n,
            "Invalid N: " + std::to_string(params.n) + " expected one of 32 or 24");
    }

    if (!contains(VALID_W, params.w)) {
        throw InvalidParameter("w", params.w,
            "Invalid W: " + std::to_string(params.w) + " expected one of 1, 2, 4, 8");
    }
}

ResolvedAlgorithm resolve_algorithm(const AlgorithmParameterSet& params) {
    validate_parameters(params);

    auto lms_it = std::find_if(LMS_TYPE_TABLE.begin(), LMS_TYPE_TABLE.end(),
        [&](const LmsTypeEntry& e) { return e.n == params.n && e.h == params.tree_height; });
    auto lmots_it = std::find_if(LMOTS_TYPE_TABLE.begin(), LMOTS_TYPE_TABLE.end(),
        [&](const LmotsTypeEntry& e) { return e.n == params.n && e.w == params.w; });

    // Unreachable while the tables pass their static_asserts
    if (lms_it == LMS_TYPE_TABLE.end()) {
        throw InvalidParameter("tree-height", params.tree_height,
            "No LMS algorithm type for N=" + std::to_string(params.n) +
            " and tree height " + std::to_string(params.tree_height));
    }
    if (lmots_it == LMOTS_TYPE_TABLE.end()) {
        throw InvalidParameter("w", params.w,
            "No LM-OTS algorithm type for N=" + std::to_string(params.n) +
            " and W=" + std::to_string(params.w));
    }

    return ResolvedAlgorithm{lms_it->type, lmots_it->type};
}

} // namespace lmsgen
