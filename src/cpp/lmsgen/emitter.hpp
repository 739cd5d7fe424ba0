/**
 * Fixture Emitter
 *
 * Renders an OutputFixture as a Caliptra firmware test program (Rust,
 * no_std) that reinterprets the embedded bytes as LmsPublicKey /
 * LmsSignature and runs the driver's LMS verification on each vector.
 */

#ifndef LMSGEN_EMITTER_HPP
#define LMSGEN_EMITTER_HPP

#include "fixture.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace lmsgen {

/**
 * Format bytes as a Rust array literal: [1, 2, 3]
 */
[[nodiscard]] std::string format_byte_array(std::span<const uint8_t> bytes);

/**
 * Render the complete test program.
 */
[[nodiscard]] std::string render_fixture(const OutputFixture& fixture);

/**
 * Write the rendered fixture to path, replacing any existing file.
 *
 * The text goes to a temporary file next to path that is renamed into
 * place, so path is either untouched or complete.
 *
 * @throws OutputError if the file cannot be written
 */
void write_fixture(const std::string& path, const OutputFixture& fixture);

/**
 * Check that path names a file in an existing directory and is not itself
 * a directory. Lets a run fail before any signing work is done.
 *
 * @throws OutputError if the fixture could not be written to path
 */
void check_output_path(const std::string& path);

} // namespace lmsgen

#endif // LMSGEN_EMITTER_HPP
