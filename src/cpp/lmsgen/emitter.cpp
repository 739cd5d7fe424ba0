/**
 * Fixture Emitter Implementation
 */

#include "emitter.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace lmsgen {

namespace fs = std::filesystem;

namespace {

constexpr const char* FILE_HEADER = R"(/*++

Licensed under the Apache-2.0 license.

Abstract:

    File contains test cases for LMS signature verification. This file is machine generated.

--*/

#![no_std]
#![no_main]

use caliptra_drivers::{Lms, LmsResult, Sha256};
use caliptra_lms_types::{LmsPublicKey, LmsSignature};
use caliptra_registers::sha256::Sha256Reg;
use caliptra_test_harness::test_suite;

struct LmsTest<'a> {
    test_passed: bool,
    signature: &'a [u8],
}
)";

constexpr const char* SUITE_PROLOGUE = R"(
fn test_lms_random_suite() {
    let mut sha256 = unsafe { Sha256::new(Sha256Reg::new()) };
)";

constexpr const char* VERIFY_AND_FOOTER = R"(        assert!(head.is_empty());
        let lms_sig = thing2[0];
        let verify_result = Lms::default().verify_lms_signature_generic(
            &mut sha256,
            &MESSAGE,
            &lms_public_key,
            &lms_sig,
        );
        if t.test_passed {
            // if the test is supposed to pass then we better have no errors and a successful verification
            let result = verify_result.unwrap();
            assert_eq!(result, LmsResult::Success)
        } else {
            // if the test is supposed to fail it could be for a number of reasons that could raise a variety of errors
            // if the verification didn't error, then extract the LMS result and ensure it is a failed verification
            if verify_result.is_ok() {
                let result = verify_result.unwrap();
                assert_eq!(result, LmsResult::SigVerifyFailed)
            }
        }
    }
}

test_suite! {
    test_lms_random_suite,
}
)";

constexpr const char* PUBLIC_KEY_TYPE = "LmsPublicKey<LMS_N_WORDS>";
constexpr const char* SIGNATURE_TYPE = "LmsSignature<LMS_N_WORDS, LMOTS_P, LMS_TREE_HEIGHT>";

std::string hex_u32(uint32_t value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(8) << std::setfill('0') << value;
    return ss.str();
}

/**
 * Structure parameters as named constants, with compile-time checks that
 * the consumer's structures have the sizes this generator encoded for.
 */
void render_layout_header(std::ostream& out, const OutputFixture& fixture) {
    LayoutDescriptor layout(fixture.structural_params);
    const auto& params = layout.params();

    out << "\n// Structure layout v" << layout.version()
        << ": LMS type " << hex_u32(static_cast<uint32_t>(fixture.algorithm.lms_type))
        << ", LM-OTS type " << hex_u32(static_cast<uint32_t>(fixture.algorithm.lmots_type)) << "\n";
    out << "const LMS_N_WORDS: usize = " << params.n_words << ";\n";
    out << "const LMOTS_P: usize = " << params.p << ";\n";
    out << "const LMS_TREE_HEIGHT: usize = " << params.h << ";\n";
    out << "const PUBLIC_KEY_SIZE: usize = " << layout.public_key_size() << ";\n";
    out << "const SIGNATURE_SIZE: usize = " << layout.signature_size() << ";\n";
    out << "const _: () = assert!(core::mem::size_of::<" << PUBLIC_KEY_TYPE << ">() == PUBLIC_KEY_SIZE);\n";
    out << "const _: () = assert!(core::mem::size_of::<" << SIGNATURE_TYPE << ">() == SIGNATURE_SIZE);\n";
}

} // anonymous namespace

std::string format_byte_array(std::span<const uint8_t> bytes) {
    std::string result = "[";
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) result += ", ";
        result += std::to_string(static_cast<unsigned>(bytes[i]));
    }
    result += "]";
    return result;
}

std::string render_fixture(const OutputFixture& fixture) {
    std::ostringstream out;

    out << FILE_HEADER;
    render_layout_header(out, fixture);
    out << SUITE_PROLOGUE;

    out << "    const MESSAGE: [u8; " << fixture.message.size() << "] = "
        << format_byte_array(fixture.message) << ";\n";
    out << "    const PUBLIC_KEY_BYTES: [u8; PUBLIC_KEY_SIZE] = "
        << format_byte_array(fixture.public_key_bytes) << ";\n";
    out << "    let (head, thing1, _tail): (&[u8], &[" << PUBLIC_KEY_TYPE << "], &[u8]) =\n"
        << "        unsafe { PUBLIC_KEY_BYTES.align_to::<" << PUBLIC_KEY_TYPE << ">() };\n";
    out << "    assert!(head.is_empty());\n";
    out << "    let lms_public_key = thing1[0];\n";

    out << "    const TESTS: [LmsTest; " << fixture.test_vectors.size() << "] = [\n";
    for (const auto& test : fixture.test_vectors) {
        out << "        // q = " << test.leaf_index << "\n";
        out << "        LmsTest { test_passed: " << (test.expect_success ? "true" : "false")
            << ", signature: &" << format_byte_array(test.signature_bytes) << " },\n";
    }
    out << "    ];\n";

    out << "    for t in TESTS {\n";
    out << "        assert_eq!(t.signature.len(), SIGNATURE_SIZE);\n";
    out << "        let (head, thing2, _tail): (&[u8], &[" << SIGNATURE_TYPE << "], &[u8]) =\n"
        << "            unsafe { t.signature.align_to::<" << SIGNATURE_TYPE << ">() };\n";
    out << VERIFY_AND_FOOTER;

    return out.str();
}

void check_output_path(const std::string& path) {
    if (path.empty()) {
        throw OutputError("Output filename is empty");
    }

    fs::path target(path);
    fs::path parent = target.parent_path();
    if (parent.empty()) {
        parent = fs::path(".");
    }

    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        throw OutputError("Output directory " + parent.string() + " does not exist");
    }
    if (fs::is_directory(target, ec)) {
        throw OutputError("Output path " + path + " is a directory");
    }
}

void write_fixture(const std::string& path, const OutputFixture& fixture) {
    const std::string text = render_fixture(fixture);

    fs::path target(path);
    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw OutputError("Failed to create " + temp.string());
        }
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        file.close();
        if (!file) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw OutputError("Failed to write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw OutputError("Failed to move output into place at " + path + ": " + ec.message());
    }
}

} // namespace lmsgen
