/**
 * LMS Utility Functions Implementation
 */

#include "utils.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <string>

namespace lms {

uint32_t coef(std::span<const uint8_t> S, size_t i, size_t w) {
    if (w != 1 && w != 2 && w != 4 && w != 8) {
        throw std::invalid_argument("coef: w must be 1, 2, 4 or 8");
    }
    size_t byte_index = (i * w) / 8;
    if (byte_index >= S.size()) {
        throw std::out_of_range("coef: index out of range");
    }
    uint32_t mask = (1u << w) - 1;
    size_t shift = 8 - (w * (i % (8 / w)) + w);
    return mask & (static_cast<uint32_t>(S[byte_index]) >> shift);
}

uint16_t checksum(const LmotsParams& params, std::span<const uint8_t> S) {
    if (S.size() < params.n) {
        throw std::invalid_argument("Cksm: message hash shorter than n");
    }
    uint32_t sum = 0;
    for (size_t i = 0; i < (params.n * 8) / params.w; ++i) {
        sum += params.coef_max() - coef(S, i, params.w);
    }
    return static_cast<uint16_t>(sum << params.ls);
}

std::vector<uint8_t> random_bytes(size_t n) {
    std::vector<uint8_t> buffer(n);
    if (RAND_bytes(buffer.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error("RAND_bytes failed for " + std::to_string(n) + " bytes of key material");
    }
    return buffer;
}

} // namespace lms
