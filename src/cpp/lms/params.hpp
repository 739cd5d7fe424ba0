/**
 * LMS / LM-OTS Parameter Sets (RFC 8554 Section 4.1 and 5.1, NIST SP 800-208)
 *
 * Defines the SHA-256 based LMS and LM-OTS algorithm types with N=32 and
 * N=24 (SHA-256/192) outputs.
 */

#ifndef LMS_PARAMS_HPP
#define LMS_PARAMS_HPP

#include <cstdint>
#include <cstddef>
#include <string_view>
#include <array>
#include <optional>
#include <stdexcept>

namespace lms {

/**
 * LMS algorithm type code points (RFC 8554 Table 2, SP 800-208 Table 3)
 */
enum class LmsAlgorithmType : uint32_t {
    LmsSha256N32H5 = 0x05,
    LmsSha256N32H10 = 0x06,
    LmsSha256N32H15 = 0x07,
    LmsSha256N32H20 = 0x08,
    LmsSha256N24H5 = 0x0A,
    LmsSha256N24H10 = 0x0B,
    LmsSha256N24H15 = 0x0C,
    LmsSha256N24H20 = 0x0D
};

/**
 * LM-OTS algorithm type code points (RFC 8554 Table 1, SP 800-208 Table 2)
 */
enum class LmotsAlgorithmType : uint32_t {
    LmotsSha256N32W1 = 0x01,
    LmotsSha256N32W2 = 0x02,
    LmotsSha256N32W4 = 0x03,
    LmotsSha256N32W8 = 0x04,
    LmotsSha256N24W1 = 0x05,
    LmotsSha256N24W2 = 0x06,
    LmotsSha256N24W4 = 0x07,
    LmotsSha256N24W8 = 0x08
};

/**
 * LM-OTS parameter set
 */
struct LmotsParams {
    LmotsAlgorithmType type;
    std::string_view name;
    size_t n;       // Hash output length in bytes
    size_t w;       // Winternitz width in bits
    size_t p;       // Number of n-byte elements in the signature
    size_t ls;      // Checksum left shift

    [[nodiscard]] constexpr uint32_t coef_max() const noexcept {
        return (1u << w) - 1;
    }

    [[nodiscard]] constexpr size_t sig_size() const noexcept {
        // u32str(type) || C || y[0] || ... || y[p-1]
        return 4 + n + p * n;
    }
};

/**
 * LMS parameter set
 */
struct LmsParams {
    LmsAlgorithmType type;
    std::string_view name;
    size_t n;       // Hash output length in bytes (m in RFC 8554)
    size_t h;       // Tree height

    [[nodiscard]] constexpr uint32_t leaf_count() const noexcept {
        return 1u << h;
    }

    [[nodiscard]] constexpr size_t pk_size() const noexcept {
        // u32str(type) || u32str(otstype) || I || T[1]
        return 4 + 4 + 16 + n;
    }

    [[nodiscard]] constexpr size_t sig_size(const LmotsParams& ots) const noexcept {
        // u32str(q) || lmots_signature || u32str(type) || path[0..h-1]
        return 4 + ots.sig_size() + 4 + h * n;
    }
};

inline constexpr std::array<LmotsParams, 8> ALL_LMOTS_PARAMS = {{
    {LmotsAlgorithmType::LmotsSha256N32W1, "LMOTS_SHA256_N32_W1", 32, 1, 265, 7},
    {LmotsAlgorithmType::LmotsSha256N32W2, "LMOTS_SHA256_N32_W2", 32, 2, 133, 6},
    {LmotsAlgorithmType::LmotsSha256N32W4, "LMOTS_SHA256_N32_W4", 32, 4, 67, 4},
    {LmotsAlgorithmType::LmotsSha256N32W8, "LMOTS_SHA256_N32_W8", 32, 8, 34, 0},
    {LmotsAlgorithmType::LmotsSha256N24W1, "LMOTS_SHA256_N24_W1", 24, 1, 200, 8},
    {LmotsAlgorithmType::LmotsSha256N24W2, "LMOTS_SHA256_N24_W2", 24, 2, 101, 6},
    {LmotsAlgorithmType::LmotsSha256N24W4, "LMOTS_SHA256_N24_W4", 24, 4, 51, 4},
    {LmotsAlgorithmType::LmotsSha256N24W8, "LMOTS_SHA256_N24_W8", 24, 8, 26, 0},
}};

inline constexpr std::array<LmsParams, 8> ALL_LMS_PARAMS = {{
    {LmsAlgorithmType::LmsSha256N32H5, "LMS_SHA256_M32_H5", 32, 5},
    {LmsAlgorithmType::LmsSha256N32H10, "LMS_SHA256_M32_H10", 32, 10},
    {LmsAlgorithmType::LmsSha256N32H15, "LMS_SHA256_M32_H15", 32, 15},
    {LmsAlgorithmType::LmsSha256N32H20, "LMS_SHA256_M32_H20", 32, 20},
    {LmsAlgorithmType::LmsSha256N24H5, "LMS_SHA256_M24_H5", 24, 5},
    {LmsAlgorithmType::LmsSha256N24H10, "LMS_SHA256_M24_H10", 24, 10},
    {LmsAlgorithmType::LmsSha256N24H15, "LMS_SHA256_M24_H15", 24, 15},
    {LmsAlgorithmType::LmsSha256N24H20, "LMS_SHA256_M24_H20", 24, 20},
}};

/**
 * Look up an LM-OTS type from its wire value. Returns nullopt for unknown
 * code points.
 */
[[nodiscard]] constexpr std::optional<LmotsAlgorithmType> lmots_type_from_u32(uint32_t value) noexcept {
    for (const auto& params : ALL_LMOTS_PARAMS) {
        if (static_cast<uint32_t>(params.type) == value) {
            return params.type;
        }
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<LmsAlgorithmType> lms_type_from_u32(uint32_t value) noexcept {
    for (const auto& params : ALL_LMS_PARAMS) {
        if (static_cast<uint32_t>(params.type) == value) {
            return params.type;
        }
    }
    return std::nullopt;
}

/**
 * Get the parameters of an LM-OTS algorithm type.
 *
 * @throws std::invalid_argument for an unsupported type
 */
[[nodiscard]] inline const LmotsParams& get_lmots_parameters(LmotsAlgorithmType type) {
    for (const auto& params : ALL_LMOTS_PARAMS) {
        if (params.type == type) {
            return params;
        }
    }
    throw std::invalid_argument("Unsupported LM-OTS algorithm type");
}

/**
 * Get the parameters of an LMS algorithm type.
 *
 * @throws std::invalid_argument for an unsupported type
 */
[[nodiscard]] inline const LmsParams& get_lms_parameters(LmsAlgorithmType type) {
    for (const auto& params : ALL_LMS_PARAMS) {
        if (params.type == type) {
            return params;
        }
    }
    throw std::invalid_argument("Unsupported LMS algorithm type");
}

} // namespace lms

#endif // LMS_PARAMS_HPP
