/**
 * Algorithm Parameter Resolver
 *
 * Maps (n, w, tree_height) onto the LMS and LM-OTS algorithm types through
 * two lookup tables keyed by (n, h) and (n, w).
 */

#ifndef LMSGEN_RESOLVER_HPP
#define LMSGEN_RESOLVER_HPP

#include "lms/params.hpp"
#include <cstdint>
#include <array>

namespace lmsgen {

inline constexpr std::array<uint32_t, 2> VALID_N = {32, 24};
inline constexpr std::array<uint32_t, 4> VALID_W = {1, 2, 4, 8};
inline constexpr std::array<uint32_t, 4> VALID_TREE_HEIGHTS = {5, 10, 15, 20};

/**
 * The tunable knobs of one fixture
 */
struct AlgorithmParameterSet {
    uint32_t n;             // Hash output size in bytes
    uint32_t w;             // Winternitz width in bits
    uint32_t tree_height;   // Merkle tree height
};

struct ResolvedAlgorithm {
    lms::LmsAlgorithmType lms_type;
    lms::LmotsAlgorithmType lmots_type;

    bool operator==(const ResolvedAlgorithm&) const = default;
};

struct LmsTypeEntry {
    uint32_t n;
    uint32_t h;
    lms::LmsAlgorithmType type;
};

struct LmotsTypeEntry {
    uint32_t n;
    uint32_t w;
    lms::LmotsAlgorithmType type;
};

inline constexpr std::array<LmsTypeEntry, 8> LMS_TYPE_TABLE = {{
    {32, 5, lms::LmsAlgorithmType::LmsSha256N32H5},
    {32, 10, lms::LmsAlgorithmType::LmsSha256N32H10},
    {32, 15, lms::LmsAlgorithmType::LmsSha256N32H15},
    {32, 20, lms::LmsAlgorithmType::LmsSha256N32H20},
    {24, 5, lms::LmsAlgorithmType::LmsSha256N24H5},
    {24, 10, lms::LmsAlgorithmType::LmsSha256N24H10},
    {24, 15, lms::LmsAlgorithmType::LmsSha256N24H15},
    {24, 20, lms::LmsAlgorithmType::LmsSha256N24H20},
}};

inline constexpr std::array<LmotsTypeEntry, 8> LMOTS_TYPE_TABLE = {{
    {32, 1, lms::LmotsAlgorithmType::LmotsSha256N32W1},
    {32, 2, lms::LmotsAlgorithmType::LmotsSha256N32W2},
    {32, 4, lms::LmotsAlgorithmType::LmotsSha256N32W4},
    {32, 8, lms::LmotsAlgorithmType::LmotsSha256N32W8},
    {24, 1, lms::LmotsAlgorithmType::LmotsSha256N24W1},
    {24, 2, lms::LmotsAlgorithmType::LmotsSha256N24W2},
    {24, 4, lms::LmotsAlgorithmType::LmotsSha256N24W4},
    {24, 8, lms::LmotsAlgorithmType::LmotsSha256N24W8},
}};

namespace detail {

template<typename Table, typename Keys, typename KeyOf>
constexpr bool covers_exactly_once(const Table& table, const Keys& keys, KeyOf key_of) {
    if (table.size() != VALID_N.size() * keys.size()) {
        return false;
    }
    for (uint32_t n : VALID_N) {
        for (uint32_t key : keys) {
            int matches = 0;
            for (const auto& entry : table) {
                if (entry.n == n && key_of(entry) == key) ++matches;
            }
            if (matches != 1) return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::covers_exactly_once(LMS_TYPE_TABLE, VALID_TREE_HEIGHTS,
                                          [](const LmsTypeEntry& e) { return e.h; }),
              "LMS type table must map every (n, h) pair exactly once");
static_assert(detail::covers_exactly_once(LMOTS_TYPE_TABLE, VALID_W,
                                          [](const LmotsTypeEntry& e) { return e.w; }),
              "LM-OTS type table must map every (n, w) pair exactly once");

/**
 * Resolve a parameter set to its algorithm types.
 *
 * Checks tree height, then n, then w.
 *
 * @throws InvalidParameter naming the first out-of-range field
 */
[[nodiscard]] ResolvedAlgorithm resolve_algorithm(const AlgorithmParameterSet& params);

/**
 * Validate the three fields without resolving.
 *
 * @throws InvalidParameter naming the first out-of-range field
 */
void validate_parameters(const AlgorithmParameterSet& params);

} // namespace lmsgen

#endif // LMSGEN_RESOLVER_HPP
