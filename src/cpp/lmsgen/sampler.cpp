/**
 * Leaf Sampler Implementation
 */

#include "sampler.hpp"
#include "errors.hpp"
#include <numeric>
#include <utility>

namespace lmsgen {

namespace {

constexpr uint32_t MAX_TREE_HEIGHT = 31;

} // anonymous namespace

RandomLeafSampler::RandomLeafSampler() : engine_(std::random_device{}()) {}

RandomLeafSampler::RandomLeafSampler(uint64_t seed) : engine_(seed) {}

std::vector<uint32_t> RandomLeafSampler::sample(uint32_t count, uint32_t tree_height) {
    if (tree_height > MAX_TREE_HEIGHT) {
        throw TooManyTests(count, tree_height);
    }

    const uint64_t leaves = uint64_t{1} << tree_height;
    if (count == 0 || count > leaves) {
        throw TooManyTests(count, tree_height);
    }

    std::vector<uint32_t> candidates(static_cast<size_t>(leaves));
    std::iota(candidates.begin(), candidates.end(), 0u);

    // Partial Fisher-Yates: the first count slots end up a uniform sample
    for (uint32_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<uint64_t> dis(i, leaves - 1);
        std::swap(candidates[i], candidates[static_cast<size_t>(dis(engine_))]);
    }

    candidates.resize(count);
    return candidates;
}

} // namespace lmsgen
