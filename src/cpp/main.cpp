/**
 * LMS Test Fixture Generator
 *
 * Produces a Caliptra firmware test program that checks the LMS verifier
 * against freshly signed messages.
 *
 * Usage:
 *   create_lms_tests --n 32 --w 8 --tree-height 5 --tests 1 --filename lms_tests_n32_w8.rs
 */

#include "lmsgen/config.hpp"
#include "lmsgen/errors.hpp"
#include "lmsgen/generator.hpp"
#include "lmsgen/sampler.hpp"
#include "lmsgen/signing_service.hpp"
#include <iostream>
#include <exception>
#include <memory>

int main(int argc, char* argv[]) {
    try {
        lmsgen::GeneratorConfig config = lmsgen::parse_arguments(argc, argv);

        if (config.help) {
            lmsgen::print_usage(std::cout);
            return 0;
        }

        std::unique_ptr<lmsgen::LeafSampler> sampler;
        if (config.seed) {
            sampler = std::make_unique<lmsgen::RandomLeafSampler>(*config.seed);
        } else {
            sampler = std::make_unique<lmsgen::RandomLeafSampler>();
        }

        lmsgen::LmsSigningService service;
        lmsgen::FixtureGenerator generator(service, *sampler);
        generator.run(config);

    } catch (const lmsgen::UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Run with --help for usage." << std::endl;
        return static_cast<int>(e.code());
    } catch (const lmsgen::GeneratorError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(e.code());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(lmsgen::ExitCode::ServiceFailure);
    }

    return 0;
}
