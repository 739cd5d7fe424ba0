/**
 * Leaf Sampler
 *
 * Picks which tree leaves a fixture exercises.
 */

#ifndef LMSGEN_SAMPLER_HPP
#define LMSGEN_SAMPLER_HPP

#include <cstdint>
#include <vector>
#include <random>

namespace lmsgen {

/**
 * Abstract source of leaf index subsets.
 */
class LeafSampler {
public:
    virtual ~LeafSampler() = default;

    /**
     * Draw count distinct leaf indices uniformly without replacement from
     * [0, 2^tree_height). The order of the result is random.
     *
     * @throws TooManyTests if count is 0 or exceeds 2^tree_height
     */
    [[nodiscard]] virtual std::vector<uint32_t> sample(uint32_t count, uint32_t tree_height) = 0;
};

/**
 * Sampler backed by a Mersenne Twister, seeded from std::random_device or
 * from a fixed seed for reproducible runs.
 */
class RandomLeafSampler : public LeafSampler {
public:
    RandomLeafSampler();
    explicit RandomLeafSampler(uint64_t seed);

    [[nodiscard]] std::vector<uint32_t> sample(uint32_t count, uint32_t tree_height) override;

private:
    std::mt19937_64 engine_;
};

} // namespace lmsgen

#endif // LMSGEN_SAMPLER_HPP
