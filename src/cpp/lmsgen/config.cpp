/**
 * Generator Configuration Implementation
 */

#include "config.hpp"
#include "errors.hpp"
#include <limits>
#include <stdexcept>

namespace lmsgen {

namespace {

uint64_t parse_number(const std::string& option, const std::string& text, uint64_t max) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        throw UsageError("Invalid value for " + option + ": '" + text + "'");
    }

    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos, 10);
    } catch (const std::invalid_argument&) {
        throw UsageError("Invalid value for " + option + ": '" + text + "'");
    } catch (const std::out_of_range&) {
        throw UsageError("Value for " + option + " is out of range: '" + text + "'");
    }

    if (pos != text.size()) {
        throw UsageError("Invalid value for " + option + ": '" + text + "'");
    }
    if (value > max) {
        throw UsageError("Value for " + option + " is out of range: '" + text + "'");
    }
    return value;
}

uint32_t parse_u32(const std::string& option, const std::string& text) {
    return static_cast<uint32_t>(parse_number(option, text, std::numeric_limits<uint32_t>::max()));
}

} // anonymous namespace

GeneratorConfig parse_arguments(const std::vector<std::string>& args) {
    GeneratorConfig config;

    std::optional<uint32_t> n;
    std::optional<uint32_t> w;
    std::optional<uint32_t> tree_height;
    std::optional<uint32_t> tests;
    std::optional<std::string> filename;

    size_t i = 0;
    auto next_value = [&](const std::string& option) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw UsageError("Missing value for " + option);
        }
        return args[++i];
    };

    while (i < args.size()) {
        const std::string& arg = args[i];

        if (arg == "--n") {
            n = parse_u32(arg, next_value(arg));
        } else if (arg == "--w") {
            w = parse_u32(arg, next_value(arg));
        } else if (arg == "--tree-height") {
            tree_height = parse_u32(arg, next_value(arg));
        } else if (arg == "--tests") {
            tests = parse_u32(arg, next_value(arg));
        } else if (arg == "--filename") {
            filename = next_value(arg);
        } else if (arg == "--negative-tests") {
            config.negative_tests = parse_u32(arg, next_value(arg));
        } else if (arg == "--message") {
            config.message = next_value(arg);
        } else if (arg == "--seed") {
            config.seed = parse_number(arg, next_value(arg), std::numeric_limits<uint64_t>::max());
        } else if (arg == "--no-self-check") {
            config.self_check = false;
        } else if (arg == "--help" || arg == "-h") {
            config.help = true;
        } else {
            throw UsageError("Unknown option: " + arg);
        }
        ++i;
    }

    if (config.help) {
        return config;
    }

    if (!n) throw UsageError("Missing required option --n");
    if (!w) throw UsageError("Missing required option --w");
    if (!tree_height) throw UsageError("Missing required option --tree-height");
    if (!tests) throw UsageError("Missing required option --tests");
    if (!filename || filename->empty()) throw UsageError("Missing required option --filename");

    config.params = AlgorithmParameterSet{*n, *w, *tree_height};
    config.tests = *tests;
    config.filename = *filename;
    return config;
}

GeneratorConfig parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_arguments(args);
}

void print_usage(std::ostream& out) {
    out << "LMS Test Fixture Generator" << std::endl;
    out << std::string(60, '=') << std::endl;
    out << "\nUsage: create_lms_tests --n <n> --w <w> --tree-height <h> --tests <k> --filename <path> [options]" << std::endl;
    out << "\nRequired:" << std::endl;
    out << "  --n <n>                  Hash output size in bytes: 32 or 24" << std::endl;
    out << "  --w <w>                  Winternitz width: 1, 2, 4 or 8" << std::endl;
    out << "  --tree-height <h>        Merkle tree height: 5, 10, 15 or 20" << std::endl;
    out << "  --tests <k>              Number of signatures, " << MIN_TESTS << " to " << MAX_TESTS << std::endl;
    out << "  --filename <path>        Output Rust test file" << std::endl;
    out << "\nOptions:" << std::endl;
    out << "  --negative-tests <m>     Corrupt the last m signatures (default: 0)" << std::endl;
    out << "  --message <text>         Message to sign (default: \"" << DEFAULT_MESSAGE << "\")" << std::endl;
    out << "  --seed <u64>             Seed for the leaf sampler (default: random)" << std::endl;
    out << "  --no-self-check          Do not re-verify N=32 signatures (N=24 is always checked)" << std::endl;
    out << "  --help                   Show this message" << std::endl;
    out << "\nExamples:" << std::endl;
    out << "  create_lms_tests --n 32 --w 8 --tree-height 5 --tests 1 --filename lms_tests_n32_w8.rs" << std::endl;
    out << "  create_lms_tests --n 24 --w 1 --tree-height 10 --tests 5 \\" << std::endl;
    out << "      --negative-tests 1 --filename lms_tests_n24_w1.rs" << std::endl;
}

} // namespace lmsgen
