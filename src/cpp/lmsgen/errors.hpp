/**
 * Fixture Generator Errors
 *
 * Every failure of the generation pipeline is reported as a GeneratorError
 * carrying the process exit code the command-line tool returns for it.
 */

#ifndef LMSGEN_ERRORS_HPP
#define LMSGEN_ERRORS_HPP

#include <cstdint>
#include <string>
#include <stdexcept>

namespace lmsgen {

/**
 * Process exit codes, one per error kind
 */
enum class ExitCode : int {
    Success = 0,
    UsageError = 1,
    InvalidN = 2,
    InvalidW = 3,
    InvalidTreeHeight = 4,
    InvalidTestCount = 5,
    TooManyTests = 6,
    ServiceFailure = 10,
    SelfCheckFailure = 11,
    OutputFailure = 12
};

class GeneratorError : public std::runtime_error {
public:
    GeneratorError(ExitCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ExitCode code() const noexcept { return code_; }

private:
    ExitCode code_;
};

/**
 * Malformed command line: unknown option, missing value, non-numeric value
 */
class UsageError : public GeneratorError {
public:
    explicit UsageError(const std::string& message)
        : GeneratorError(ExitCode::UsageError, message) {}
};

/**
 * A parameter outside its accepted set. field is the command-line name
 * of the parameter ("n", "w", "tree-height", "tests", "negative-tests").
 */
class InvalidParameter : public GeneratorError {
public:
    InvalidParameter(const std::string& field, uint64_t value, const std::string& message);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] uint64_t value() const noexcept { return value_; }

private:
    std::string field_;
    uint64_t value_;
};

/**
 * More leaves requested than the tree has (or none at all)
 */
class TooManyTests : public GeneratorError {
public:
    TooManyTests(uint64_t count, uint32_t tree_height);

    [[nodiscard]] uint64_t count() const noexcept { return count_; }
    [[nodiscard]] uint32_t tree_height() const noexcept { return tree_height_; }

private:
    uint64_t count_;
    uint32_t tree_height_;
};

/**
 * The signing service failed to build a tree, sign or verify
 */
class ServiceError : public GeneratorError {
public:
    explicit ServiceError(const std::string& message)
        : GeneratorError(ExitCode::ServiceFailure, message) {}

protected:
    ServiceError(ExitCode code, const std::string& message)
        : GeneratorError(code, message) {}
};

/**
 * A freshly produced signature did not verify the way it was expected to
 */
class SelfCheckError : public ServiceError {
public:
    SelfCheckError(uint32_t leaf_index, bool expect_success);

    [[nodiscard]] uint32_t leaf_index() const noexcept { return leaf_index_; }

private:
    uint32_t leaf_index_;
};

/**
 * The output file could not be written
 */
class OutputError : public GeneratorError {
public:
    explicit OutputError(const std::string& message)
        : GeneratorError(ExitCode::OutputFailure, message) {}
};

} // namespace lmsgen

#endif // LMSGEN_ERRORS_HPP
