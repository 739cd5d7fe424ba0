/**
 * Binary Layout Encoder
 *
 * Serializes LMS public keys and signatures into the memory layout of the
 * verifier's typed structures, which reinterpret the bytes without copying:
 *
 *   LmsPublicKey<NW>:
 *     tree_type u32be | otstype u32be | id[16] | digest[NW*4]
 *
 *   LmsSignature<NW, P, H>:
 *     q u32be | ots_type u32be | nonce[NW*4] | y[P][NW*4]
 *     | tree_type u32be | tree_path[H][NW*4]
 *
 * All fields are byte aligned, so the structures carry no padding. Bump
 * LAYOUT_VERSION whenever the consumer's structures change.
 */

#ifndef LMSGEN_ENCODER_HPP
#define LMSGEN_ENCODER_HPP

#include "resolver.hpp"
#include "lms/lms.hpp"
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <vector>
#include <utility>

namespace lmsgen {

inline constexpr uint32_t LAYOUT_VERSION = 1;

/**
 * Const generic parameters of the consumer's structures
 */
struct StructuralParams {
    uint32_t n_words;   // N / 4
    uint32_t p;         // Winternitz chain count
    uint32_t h;         // Tree height

    bool operator==(const StructuralParams&) const = default;
};

struct LayoutField {
    std::string_view name;
    size_t offset;
    size_t size;
};

/**
 * Field offsets and sizes of both structures for one StructuralParams.
 */
class LayoutDescriptor {
public:
    explicit LayoutDescriptor(const StructuralParams& params);

    [[nodiscard]] static LayoutDescriptor for_algorithm(const ResolvedAlgorithm& algorithm);

    [[nodiscard]] const StructuralParams& params() const noexcept { return params_; }
    [[nodiscard]] uint32_t version() const noexcept { return LAYOUT_VERSION; }
    [[nodiscard]] size_t element_size() const noexcept { return static_cast<size_t>(params_.n_words) * 4; }

    [[nodiscard]] const std::vector<LayoutField>& public_key_fields() const noexcept { return pk_fields_; }
    [[nodiscard]] const std::vector<LayoutField>& signature_fields() const noexcept { return sig_fields_; }

    [[nodiscard]] size_t public_key_size() const noexcept;
    [[nodiscard]] size_t signature_size() const noexcept;

    /**
     * @throws std::out_of_range for an unknown field name
     */
    [[nodiscard]] const LayoutField& public_key_field(std::string_view name) const;
    [[nodiscard]] const LayoutField& signature_field(std::string_view name) const;

private:
    StructuralParams params_;
    std::vector<LayoutField> pk_fields_;
    std::vector<LayoutField> sig_fields_;
};

class LayoutEncoder {
public:
    explicit LayoutEncoder(LayoutDescriptor layout) : layout_(std::move(layout)) {}

    [[nodiscard]] const LayoutDescriptor& layout() const noexcept { return layout_; }

    /**
     * @throws std::invalid_argument if the key does not fit the layout
     */
    [[nodiscard]] std::vector<uint8_t> encode_public_key(const lms::PublicKey& pk) const;

    /**
     * @throws std::invalid_argument if the signature does not fit the layout
     */
    [[nodiscard]] std::vector<uint8_t> encode_signature(const lms::Signature& sig) const;

private:
    LayoutDescriptor layout_;
};

} // namespace lmsgen

#endif // LMSGEN_ENCODER_HPP
