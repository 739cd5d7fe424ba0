/**
 * Leaf Sampler Tests
 */

#include "lmsgen/sampler.hpp"
#include "lmsgen/errors.hpp"
#include "test_harness.hpp"
#include <algorithm>
#include <set>

using namespace lmsgen;

void test_sampling() {
    TEST("samples are distinct and in range") {
        RandomLeafSampler sampler;
        for (uint32_t h : {5u, 10u, 15u, 20u}) {
            for (uint32_t k : {1u, 5u, 16u}) {
                auto leaves = sampler.sample(k, h);
                ASSERT_EQ(leaves.size(), k);
                std::set<uint32_t> unique(leaves.begin(), leaves.end());
                ASSERT_EQ(unique.size(), k);
                for (uint32_t q : leaves) {
                    ASSERT_TRUE(q < (1u << h));
                }
            }
        }
    TEST_END

    TEST("count equal to leaf count samples every leaf once") {
        RandomLeafSampler sampler;
        auto leaves = sampler.sample(32, 5);
        ASSERT_EQ(leaves.size(), 32u);
        std::sort(leaves.begin(), leaves.end());
        for (uint32_t i = 0; i < 32; ++i) {
            ASSERT_EQ(leaves[i], i);
        }
    TEST_END

    TEST("seeded samplers are reproducible") {
        RandomLeafSampler a(1234);
        RandomLeafSampler b(1234);
        ASSERT_TRUE(a.sample(8, 10) == b.sample(8, 10));
        ASSERT_TRUE(a.sample(16, 20) == b.sample(16, 20));
    TEST_END

    TEST("different seeds give different picks") {
        RandomLeafSampler a(1);
        RandomLeafSampler b(2);
        ASSERT_FALSE(a.sample(16, 20) == b.sample(16, 20));
    TEST_END

    TEST("order is not sorted by construction") {
        // 16 of 1024 drawn in ascending order would be a 1 in 16! event
        RandomLeafSampler sampler(42);
        auto leaves = sampler.sample(16, 10);
        ASSERT_FALSE(std::is_sorted(leaves.begin(), leaves.end()));
    TEST_END
}

void test_failures() {
    TEST("more samples than leaves fails") {
        RandomLeafSampler sampler;
        try {
            (void)sampler.sample(33, 5);
            throw std::runtime_error("expected TooManyTests");
        } catch (const TooManyTests& e) {
            ASSERT_EQ(e.count(), 33u);
            ASSERT_EQ(e.tree_height(), 5u);
            ASSERT_TRUE(e.code() == ExitCode::TooManyTests);
            ASSERT_EQ(std::string(e.what()), std::string("Can't create 33 tests with a tree height of 5"));
        }
    TEST_END

    TEST("zero samples fails") {
        RandomLeafSampler sampler;
        ASSERT_THROWS(sampler.sample(0, 5), TooManyTests);
    TEST_END

    TEST("oversized tree height fails") {
        RandomLeafSampler sampler;
        ASSERT_THROWS(sampler.sample(1, 32), TooManyTests);
    TEST_END
}

int main() {
    std::cout << "=== Leaf Sampler Tests ===" << std::endl << std::endl;

    test_sampling();
    test_failures();

    return report_results();
}
