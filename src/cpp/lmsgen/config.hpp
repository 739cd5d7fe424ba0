/**
 * Generator Configuration
 *
 * Command-line options of create_lms_tests:
 *
 *   --n <24|32>               Hash output size in bytes
 *   --w <1|2|4|8>             Winternitz width
 *   --tree-height <5..20>     Merkle tree height (5, 10, 15 or 20)
 *   --tests <1..16>           Number of signatures to embed
 *   --filename <path>         Output Rust file
 *   --negative-tests <m>      Corrupt the last m signatures (default: 0)
 *   --message <text>          Message to sign
 *   --seed <u64>              Seed the leaf sampler for a reproducible pick
 *   --no-self-check           Skip re-verifying N=32 signatures before emitting
 *   --help                    Show usage
 */

#ifndef LMSGEN_CONFIG_HPP
#define LMSGEN_CONFIG_HPP

#include "resolver.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lmsgen {

inline constexpr const char* DEFAULT_MESSAGE = "this is the message I want signed";
inline constexpr uint32_t MIN_TESTS = 1;
inline constexpr uint32_t MAX_TESTS = 16;

struct GeneratorConfig {
    AlgorithmParameterSet params{};
    uint32_t tests = 0;
    uint32_t negative_tests = 0;
    std::string filename;
    std::string message = DEFAULT_MESSAGE;
    std::optional<uint64_t> seed;
    bool self_check = true;
    bool help = false;
};

/**
 * Parse command-line arguments (without the program name).
 *
 * Only syntax is checked here; value ranges are checked by the generator.
 * When --help is given the remaining required options may be absent.
 *
 * @throws UsageError for unknown options, missing values, non-numeric
 *         values or missing required options
 */
[[nodiscard]] GeneratorConfig parse_arguments(const std::vector<std::string>& args);

[[nodiscard]] GeneratorConfig parse_arguments(int argc, char* argv[]);

void print_usage(std::ostream& out);

} // namespace lmsgen

#endif // LMSGEN_CONFIG_HPP
