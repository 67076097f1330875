#pragma once

#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace obscur::core::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 over the OpenSSL EVP_KDF API.
 *
 * Extract and Expand run as separate phases because NIP-44 derives a
 * conversation key with Extract alone and per-message keys with Expand alone.
 */
class Hkdf {
public:
    /**
     * @brief HKDF-Extract: 32-byte pseudorandom key from input key material.
     */
    static Result<std::vector<uint8_t>, ObscurFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt);

    /**
     * @brief HKDF-Expand: output_size bytes from a 32-byte pseudorandom key.
     */
    static Result<std::vector<uint8_t>, ObscurFailure> Expand(
        std::span<const uint8_t> prk,
        size_t output_size,
        std::span<const uint8_t> info);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
