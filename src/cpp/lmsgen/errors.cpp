/**
 * Fixture Generator Errors Implementation
 */

#include "errors.hpp"

namespace lmsgen {

namespace {

ExitCode exit_code_for_field(const std::string& field) {
    if (field == "n") return ExitCode::InvalidN;
    if (field == "w") return ExitCode::InvalidW;
    if (field == "tree-height") return ExitCode::InvalidTreeHeight;
    if (field == "tests" || field == "negative-tests") return ExitCode::InvalidTestCount;
    return ExitCode::UsageError;
}

} // anonymous namespace

InvalidParameter::InvalidParameter(const std::string& field, uint64_t value, const std::string& message)
    : GeneratorError(exit_code_for_field(field), message),
      field_(field),
      value_(value) {}

TooManyTests::TooManyTests(uint64_t count, uint32_t tree_height)
    : GeneratorError(ExitCode::TooManyTests,
                     "Can't create " + std::to_string(count) +
                     " tests with a tree height of " + std::to_string(tree_height)),
      count_(count),
      tree_height_(tree_height) {}

SelfCheckError::SelfCheckError(uint32_t leaf_index, bool expect_success)
    : ServiceError(ExitCode::SelfCheckFailure,
                   std::string(expect_success ? "Signature for leaf " : "Corrupted signature for leaf ") +
                   std::to_string(leaf_index) +
                   (expect_success ? " failed self-verification" : " unexpectedly verified")),
      leaf_index_(leaf_index) {}

} // namespace lmsgen
