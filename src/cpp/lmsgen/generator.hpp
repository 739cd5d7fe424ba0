/**
 * Fixture Generator
 *
 * Runs the pipeline for one configuration:
 *   resolve -> sample leaves -> sign -> encode -> emit
 *
 * All configuration errors, and an output path in a missing directory, are
 * raised before the signing service is used.
 */

#ifndef LMSGEN_GENERATOR_HPP
#define LMSGEN_GENERATOR_HPP

#include "config.hpp"
#include "fixture.hpp"
#include "sampler.hpp"
#include "signing_service.hpp"
#include <iostream>
#include <ostream>

namespace lmsgen {

/**
 * Expected encoded sizes for an algorithm, from its N, P and H.
 */
[[nodiscard]] size_t expected_public_key_size(const ResolvedAlgorithm& algorithm);
[[nodiscard]] size_t expected_signature_size(const ResolvedAlgorithm& algorithm);

class FixtureGenerator {
public:
    FixtureGenerator(SigningService& service, LeafSampler& sampler, std::ostream& log = std::cout)
        : service_(service), sampler_(sampler), log_(log) {}

    /**
     * Build the fixture in memory.
     *
     * @throws InvalidParameter, TooManyTests for configuration errors
     * @throws OutputError if config.filename cannot be a file target
     * @throws ServiceError, SelfCheckError if signing fails
     */
    [[nodiscard]] OutputFixture generate(const GeneratorConfig& config);

    /**
     * Build the fixture and write it to config.filename.
     *
     * @throws OutputError if the file cannot be written, plus everything
     *         generate() throws
     */
    void run(const GeneratorConfig& config);

private:
    SigningService& service_;
    LeafSampler& sampler_;
    std::ostream& log_;
};

} // namespace lmsgen

#endif // LMSGEN_GENERATOR_HPP
