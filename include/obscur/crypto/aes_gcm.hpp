#pragma once
#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace obscur::core::crypto {

/**
 * AES-256-GCM over OpenSSL EVP.
 *
 * Encrypt returns ciphertext with the 16-byte tag appended. The nonce must be
 * unique per key; every caller in this library draws a fresh random 12-byte
 * IV per message, which is why no counter state lives here.
 *
 * The Seal/Open helpers produce and consume the `iv[12] || ct || tag` layout
 * shared by invite payloads and at-rest records.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ObscurFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, ObscurFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag);
    [[nodiscard]] static Result<std::vector<uint8_t>, ObscurFailure>
    Seal(std::span<const uint8_t> key, std::span<const uint8_t> plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, ObscurFailure>
    Open(std::span<const uint8_t> key, std::span<const uint8_t> sealed);
private:
    AesGcm() = delete;
};
}
