/**
 * Binary Layout Encoder Implementation
 */

#include "encoder.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <span>
#include <initializer_list>
#include <utility>
#include <cstddef>

namespace lmsgen {

namespace {

std::vector<LayoutField> build_fields(
    std::initializer_list<std::pair<std::string_view, size_t>> sizes) {

    std::vector<LayoutField> fields;
    size_t offset = 0;
    for (const auto& [name, size] : sizes) {
        fields.push_back(LayoutField{name, offset, size});
        offset += size;
    }
    return fields;
}

const LayoutField& find_field(const std::vector<LayoutField>& fields, std::string_view name) {
    auto it = std::find_if(fields.begin(), fields.end(),
        [&](const LayoutField& f) { return f.name == name; });
    if (it == fields.end()) {
        throw std::out_of_range("Unknown layout field: " + std::string(name));
    }
    return *it;
}

size_t total_size(const std::vector<LayoutField>& fields) noexcept {
    if (fields.empty()) return 0;
    return fields.back().offset + fields.back().size;
}

/**
 * Copies values into fixed fields of a pre-sized buffer
 */
class FieldWriter {
public:
    FieldWriter(std::vector<uint8_t>& out, std::string_view structure)
        : out_(out), structure_(structure) {}

    void put_u32(const LayoutField& field, uint32_t value) {
        check_width(field, 4);
        out_[field.offset] = static_cast<uint8_t>(value >> 24);
        out_[field.offset + 1] = static_cast<uint8_t>(value >> 16);
        out_[field.offset + 2] = static_cast<uint8_t>(value >> 8);
        out_[field.offset + 3] = static_cast<uint8_t>(value);
    }

    void put_bytes(const LayoutField& field, std::span<const uint8_t> data) {
        check_width(field, data.size());
        std::copy(data.begin(), data.end(), out_.begin() + static_cast<std::ptrdiff_t>(field.offset));
    }

    /**
     * Write rows of element_size bytes back to back into an array field.
     */
    void put_array(const LayoutField& field,
                   const std::vector<std::vector<uint8_t>>& rows,
                   size_t element_size) {
        check_width(field, rows.size() * element_size);
        size_t offset = field.offset;
        for (const auto& row : rows) {
            if (row.size() != element_size) {
                throw std::invalid_argument(std::string(structure_) + "." + std::string(field.name) +
                    ": element is " + std::to_string(row.size()) + " bytes, expected " +
                    std::to_string(element_size));
            }
            std::copy(row.begin(), row.end(), out_.begin() + static_cast<std::ptrdiff_t>(offset));
            offset += element_size;
        }
    }

private:
    void check_width(const LayoutField& field, size_t size) const {
        if (size != field.size) {
            throw std::invalid_argument(std::string(structure_) + "." + std::string(field.name) +
                ": got " + std::to_string(size) + " bytes, layout expects " +
                std::to_string(field.size));
        }
    }

    std::vector<uint8_t>& out_;
    std::string_view structure_;
};

} // anonymous namespace


LayoutDescriptor::LayoutDescriptor(const StructuralParams& params) : params_(params) {
    const size_t elem = element_size();

    pk_fields_ = build_fields({
        {"tree_type", 4},
        {"otstype", 4},
        {"id", lms::IDENTIFIER_SIZE},
        {"digest", elem},
    });

    sig_fields_ = build_fields({
        {"q", 4},
        {"ots_type", 4},
        {"nonce", elem},
        {"y", static_cast<size_t>(params_.p) * elem},
        {"tree_type", 4},
        {"tree_path", static_cast<size_t>(params_.h) * elem},
    });
}

LayoutDescriptor LayoutDescriptor::for_algorithm(const ResolvedAlgorithm& algorithm) {
    const auto& lms_params = lms::get_lms_parameters(algorithm.lms_type);
    const auto& ots_params = lms::get_lmots_parameters(algorithm.lmots_type);

    return LayoutDescriptor(StructuralParams{
        static_cast<uint32_t>(lms_params.n / 4),
        static_cast<uint32_t>(ots_params.p),
        static_cast<uint32_t>(lms_params.h)});
}

size_t LayoutDescriptor::public_key_size() const noexcept {
    return total_size(pk_fields_);
}

size_t LayoutDescriptor::signature_size() const noexcept {
    return total_size(sig_fields_);
}

const LayoutField& LayoutDescriptor::public_key_field(std::string_view name) const {
    return find_field(pk_fields_, name);
}

const LayoutField& LayoutDescriptor::signature_field(std::string_view name) const {
    return find_field(sig_fields_, name);
}


std::vector<uint8_t> LayoutEncoder::encode_public_key(const lms::PublicKey& pk) const {
    std::vector<uint8_t> out(layout_.public_key_size());
    FieldWriter writer(out, "LmsPublicKey");

    writer.put_u32(layout_.public_key_field("tree_type"), static_cast<uint32_t>(pk.lms_type));
    writer.put_u32(layout_.public_key_field("otstype"), static_cast<uint32_t>(pk.lmots_type));
    writer.put_bytes(layout_.public_key_field("id"), pk.id);
    writer.put_bytes(layout_.public_key_field("digest"), pk.root);

    return out;
}

std::vector<uint8_t> LayoutEncoder::encode_signature(const lms::Signature& sig) const {
    const size_t elem = layout_.element_size();

    std::vector<uint8_t> out(layout_.signature_size());
    FieldWriter writer(out, "LmsSignature");

    writer.put_u32(layout_.signature_field("q"), sig.q);
    writer.put_u32(layout_.signature_field("ots_type"), static_cast<uint32_t>(sig.ots.type));
    writer.put_bytes(layout_.signature_field("nonce"), sig.ots.c);
    writer.put_array(layout_.signature_field("y"), sig.ots.y, elem);
    writer.put_u32(layout_.signature_field("tree_type"), static_cast<uint32_t>(sig.lms_type));
    writer.put_array(layout_.signature_field("tree_path"), sig.path, elem);

    return out;
}

} // namespace lmsgen
