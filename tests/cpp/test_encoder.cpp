/**
 * Binary Layout Encoder Tests
 */

#include "lmsgen/encoder.hpp"
#include "lmsgen/resolver.hpp"
#include "test_harness.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace lmsgen;

namespace {

const std::vector<uint8_t> MESSAGE = {'e', 'n', 'c', 'o', 'd', 'e'};

struct Fixture {
    lms::PublicKey pk;
    std::unique_ptr<lms::LmsTree> tree;
};

Fixture build(lms::LmsAlgorithmType lms_type, lms::LmotsAlgorithmType lmots_type) {
    const auto& params = lms::get_lms_parameters(lms_type);
    lms::LmsIdentifier id{};
    id.fill(0xa5);
    std::vector<uint8_t> seed(params.n, 0x3c);

    auto built = lms::create_lms_tree(lms_type, lmots_type, id, seed);
    return Fixture{std::move(std::get<0>(built)), std::move(std::get<1>(built))};
}

uint32_t read_u32(const std::vector<uint8_t>& bytes, size_t offset) {
    return lms::load_u32(bytes, offset);
}

} // anonymous namespace

void test_layout() {
    TEST("sizes follow 24+N and 12+N(1+P+H) for every algorithm") {
        for (uint32_t n : VALID_N) {
            for (uint32_t w : VALID_W) {
                for (uint32_t h : VALID_TREE_HEIGHTS) {
                    auto algorithm = resolve_algorithm({n, w, h});
                    auto layout = LayoutDescriptor::for_algorithm(algorithm);
                    const size_t p = lms::get_lmots_parameters(algorithm.lmots_type).p;
                    ASSERT_EQ(layout.public_key_size(), 24u + n);
                    ASSERT_EQ(layout.signature_size(), 12u + n * (1u + p + h));
                    ASSERT_EQ(layout.params().n_words, n / 4);
                    ASSERT_EQ(layout.params().h, h);
                }
            }
        }
    TEST_END

    TEST("public key size depends on N only") {
        std::map<uint32_t, size_t> by_n;
        for (uint32_t n : VALID_N) {
            for (uint32_t w : VALID_W) {
                for (uint32_t h : VALID_TREE_HEIGHTS) {
                    auto size = LayoutDescriptor::for_algorithm(resolve_algorithm({n, w, h})).public_key_size();
                    auto [it, inserted] = by_n.emplace(n, size);
                    ASSERT_EQ(it->second, size);
                }
            }
        }
        ASSERT_EQ(by_n[32], 56u);
        ASSERT_EQ(by_n[24], 48u);
    TEST_END

    TEST("field offsets") {
        LayoutDescriptor layout(StructuralParams{8, 34, 5});
        ASSERT_EQ(layout.public_key_field("tree_type").offset, 0u);
        ASSERT_EQ(layout.public_key_field("otstype").offset, 4u);
        ASSERT_EQ(layout.public_key_field("id").offset, 8u);
        ASSERT_EQ(layout.public_key_field("digest").offset, 24u);
        ASSERT_EQ(layout.public_key_field("digest").size, 32u);

        ASSERT_EQ(layout.signature_field("q").offset, 0u);
        ASSERT_EQ(layout.signature_field("ots_type").offset, 4u);
        ASSERT_EQ(layout.signature_field("nonce").offset, 8u);
        ASSERT_EQ(layout.signature_field("y").offset, 40u);
        ASSERT_EQ(layout.signature_field("y").size, 34u * 32u);
        ASSERT_EQ(layout.signature_field("tree_type").offset, 40u + 34u * 32u);
        ASSERT_EQ(layout.signature_field("tree_path").offset, 44u + 34u * 32u);
        ASSERT_EQ(layout.signature_size(), 1292u);
        ASSERT_EQ(layout.version(), LAYOUT_VERSION);
    TEST_END

    TEST("unknown field name") {
        LayoutDescriptor layout(StructuralParams{6, 26, 10});
        ASSERT_THROWS(layout.public_key_field("root"), std::out_of_range);
        ASSERT_THROWS(layout.signature_field("path"), std::out_of_range);
    TEST_END
}

void test_encoding(const std::string& name, lms::LmsAlgorithmType lms_type, lms::LmotsAlgorithmType lmots_type) {
    Fixture fixture;
    TEST(name + " deterministic tree") {
        fixture = build(lms_type, lmots_type);
        ASSERT_TRUE(fixture.tree != nullptr);
    TEST_END
    if (!fixture.tree) {
        return;
    }

    const auto& pk = fixture.pk;
    const auto& tree = *fixture.tree;
    LayoutEncoder encoder(LayoutDescriptor::for_algorithm({lms_type, lmots_type}));

    TEST(name + " public key bytes") {
        auto bytes = encoder.encode_public_key(pk);
        ASSERT_EQ(bytes.size(), encoder.layout().public_key_size());
        ASSERT_EQ(read_u32(bytes, 0), static_cast<uint32_t>(lms_type));
        ASSERT_EQ(read_u32(bytes, 4), static_cast<uint32_t>(lmots_type));
        ASSERT_TRUE(std::equal(pk.id.begin(), pk.id.end(), bytes.begin() + 8));
        ASSERT_TRUE(std::equal(pk.root.begin(), pk.root.end(), bytes.begin() + 24));
    TEST_END

    TEST(name + " encoded signature re-verifies") {
        const uint32_t q = tree.leaf_count() - 3;
        auto sig = lms::lms_sign_message(MESSAGE, tree.private_key(q), q, tree);
        auto sig_bytes = encoder.encode_signature(sig);
        auto pk_bytes = encoder.encode_public_key(pk);

        ASSERT_EQ(sig_bytes.size(), encoder.layout().signature_size());
        ASSERT_EQ(read_u32(sig_bytes, 0), q);
        ASSERT_EQ(read_u32(sig_bytes, 4), static_cast<uint32_t>(lmots_type));
        ASSERT_EQ(read_u32(sig_bytes, encoder.layout().signature_field("tree_type").offset),
                  static_cast<uint32_t>(lms_type));

        auto parsed_pk = lms::parse_public_key(pk_bytes);
        auto parsed_sig = lms::parse_signature(sig_bytes);
        ASSERT_TRUE(lms::verify_lms_signature(MESSAGE, parsed_pk, parsed_sig));
    TEST_END

    TEST(name + " shape mismatches are rejected") {
        auto sig = lms::lms_sign_message(MESSAGE, tree.private_key(0), 0, tree);

        auto short_path = sig;
        short_path.path.pop_back();
        ASSERT_THROWS(encoder.encode_signature(short_path), std::invalid_argument);

        auto short_y = sig;
        short_y.ots.y.back().pop_back();
        ASSERT_THROWS(encoder.encode_signature(short_y), std::invalid_argument);

        auto long_nonce = sig;
        long_nonce.ots.c.push_back(0);
        ASSERT_THROWS(encoder.encode_signature(long_nonce), std::invalid_argument);

        auto bad_pk = pk;
        bad_pk.root.pop_back();
        ASSERT_THROWS(encoder.encode_public_key(bad_pk), std::invalid_argument);
    TEST_END
}

int main() {
    std::cout << "=== Binary Layout Encoder Tests ===" << std::endl << std::endl;

    test_layout();

    std::cout << std::endl << "--- Encoding ---" << std::endl;
    test_encoding("N32-W8-H5", lms::LmsAlgorithmType::LmsSha256N32H5, lms::LmotsAlgorithmType::LmotsSha256N32W8);
    test_encoding("N24-W8-H5", lms::LmsAlgorithmType::LmsSha256N24H5, lms::LmotsAlgorithmType::LmotsSha256N24W8);
    test_encoding("N24-W2-H5", lms::LmsAlgorithmType::LmsSha256N24H5, lms::LmotsAlgorithmType::LmotsSha256N24W2);

    return report_results();
}
