#pragma once

#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include "obscur/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace obscur::core::crypto {

struct IdentityKeyPair {
    std::vector<uint8_t> seed;
    std::vector<uint8_t> public_key;
};

/**
 * @brief Ed25519 identity keys and the X25519 agreement derived from them.
 *
 * A private key is the 32-byte Ed25519 seed; the libsodium 64-byte secret key
 * is re-expanded from it on every use and wiped afterwards.
 */
class IdentityKeys {
public:
    static Result<IdentityKeyPair, ObscurFailure> Generate();

    static Result<std::vector<uint8_t>, ObscurFailure> PublicKeyFromSeed(
        std::span<const uint8_t> seed);

    /**
     * @brief Detached Ed25519 signature over message.
     */
    static Result<std::vector<uint8_t>, ObscurFailure> Sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> seed);

    /**
     * @brief Never fails; malformed inputs verify as false.
     */
    static bool Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key) noexcept;

    /**
     * @brief X25519 over the Curve25519 images of both keys.
     *
     * Symmetric: Agree(seedA, pubB) == Agree(seedB, pubA).
     */
    static Result<std::vector<uint8_t>, ObscurFailure> Agree(
        std::span<const uint8_t> seed,
        std::span<const uint8_t> peer_public_key);

    static std::array<uint8_t, Constants::SHA_256_SIZE> Sha256(std::span<const uint8_t> data);

    static std::array<uint8_t, Constants::SHA_256_SIZE> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    static std::string Sha256Hex(std::string_view text);

private:
    IdentityKeys() = delete;
};

}
