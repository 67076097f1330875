#pragma once

#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace obscur::core::crypto {

/**
 * @brief NIP-44 version 2 payload encryption.
 *
 * payload = base64(0x02 || nonce[32] || chacha20(padded) || hmac[32])
 *
 * The conversation key is HKDF-extract("nip44-v2", shared_x). Each payload
 * expands a fresh 32-byte nonce into the ChaCha20 key, ChaCha20 nonce and
 * HMAC key. The MAC covers nonce || ciphertext and is checked in constant
 * time before decryption.
 */
class Nip44 {
public:
    static Result<std::vector<uint8_t>, ObscurFailure> ConversationKey(
        std::span<const uint8_t> private_seed,
        std::span<const uint8_t> peer_public_key);

    static Result<std::string, ObscurFailure> Encrypt(
        std::string_view plaintext,
        std::span<const uint8_t> conversation_key);

    /// Deterministic variant used when the caller supplies the nonce.
    static Result<std::string, ObscurFailure> EncryptWithNonce(
        std::string_view plaintext,
        std::span<const uint8_t> conversation_key,
        std::span<const uint8_t> nonce);

    static Result<std::string, ObscurFailure> Decrypt(
        std::string_view payload,
        std::span<const uint8_t> conversation_key);

    /// Padded length for an unpadded plaintext of unpadded_len bytes.
    [[nodiscard]] static size_t CalcPaddedLength(size_t unpadded_len) noexcept;

private:
    Nip44() = delete;
};

}
