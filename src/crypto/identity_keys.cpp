#include "obscur/crypto/identity_keys.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/crypto/encoding.hpp"

#include <fmt/format.h>
#include <sodium.h>

namespace obscur::core::crypto {

namespace {
    using BytesResult = Result<std::vector<uint8_t>, ObscurFailure>;

    std::optional<ObscurFailure> CheckSize(std::span<const uint8_t> value, size_t expected, std::string_view what) {
        if (value.size() != expected) {
            return ObscurFailure::Validation(
                fmt::format("{} must be {} bytes, got {}", what, expected, value.size()));
        }
        return std::nullopt;
    }

    void Wipe(std::span<uint8_t> buffer) {
        auto _wipe = SodiumInterop::SecureWipe(buffer);
        (void) _wipe;
    }
}

Result<IdentityKeyPair, ObscurFailure> IdentityKeys::Generate() {
    auto seed = SodiumInterop::GetRandomBytes(Constants::ED_25519_SEED_SIZE);
    auto public_key = PublicKeyFromSeed(seed);
    if (public_key.IsErr()) {
        Wipe(seed);
        return Result<IdentityKeyPair, ObscurFailure>::Err(std::move(public_key).UnwrapErr());
    }
    return Result<IdentityKeyPair, ObscurFailure>::Ok(
        IdentityKeyPair{std::move(seed), std::move(public_key).Unwrap()});
}

BytesResult IdentityKeys::PublicKeyFromSeed(std::span<const uint8_t> seed) {
    if (auto invalid = CheckSize(seed, Constants::ED_25519_SEED_SIZE, "Private key")) {
        return BytesResult::Err(std::move(*invalid));
    }
    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    const int rc = crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data());
    Wipe(sk);
    if (rc != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ObscurFailure::Crypto("Failed to derive Ed25519 public key"));
    }
    return BytesResult::Ok(std::move(pk));
}

BytesResult IdentityKeys::Sign(std::span<const uint8_t> message, std::span<const uint8_t> seed) {
    if (auto invalid = CheckSize(seed, Constants::ED_25519_SEED_SIZE, "Private key")) {
        return BytesResult::Err(std::move(*invalid));
    }
    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != SodiumConstants::SUCCESS) {
        Wipe(sk);
        return BytesResult::Err(ObscurFailure::Crypto("Failed to expand Ed25519 seed"));
    }
    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    const int rc = crypto_sign_detached(signature.data(), nullptr,
                                        message.data(), message.size(), sk.data());
    Wipe(sk);
    if (rc != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ObscurFailure::Crypto("Ed25519 signing failed"));
    }
    return BytesResult::Ok(std::move(signature));
}

bool IdentityKeys::Verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) noexcept {
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE ||
        public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == SodiumConstants::SUCCESS;
}

BytesResult IdentityKeys::Agree(std::span<const uint8_t> seed, std::span<const uint8_t> peer_public_key) {
    if (auto invalid = CheckSize(seed, Constants::ED_25519_SEED_SIZE, "Private key")) {
        return BytesResult::Err(std::move(*invalid));
    }
    if (auto invalid = CheckSize(peer_public_key, Constants::ED_25519_PUBLIC_KEY_SIZE, "Public key")) {
        return BytesResult::Err(std::move(*invalid));
    }
    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    std::vector<uint8_t> x_sk(Constants::X_25519_KEY_SIZE);
    std::vector<uint8_t> x_peer(Constants::X_25519_KEY_SIZE);
    std::vector<uint8_t> shared(Constants::X_25519_KEY_SIZE);
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != SodiumConstants::SUCCESS ||
        crypto_sign_ed25519_sk_to_curve25519(x_sk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        Wipe(sk);
        Wipe(x_sk);
        return BytesResult::Err(ObscurFailure::Crypto("Failed to convert private key to X25519"));
    }
    Wipe(sk);
    if (crypto_sign_ed25519_pk_to_curve25519(x_peer.data(), peer_public_key.data()) != SodiumConstants::SUCCESS) {
        Wipe(x_sk);
        return BytesResult::Err(ObscurFailure::Validation("Public key is not a valid curve point"));
    }
    const int rc = crypto_scalarmult(shared.data(), x_sk.data(), x_peer.data());
    Wipe(x_sk);
    if (rc != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ObscurFailure::Crypto("X25519 key agreement failed"));
    }
    return BytesResult::Ok(std::move(shared));
}

std::array<uint8_t, Constants::SHA_256_SIZE> IdentityKeys::Sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, Constants::SHA_256_SIZE> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::array<uint8_t, Constants::SHA_256_SIZE> IdentityKeys::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    std::array<uint8_t, Constants::SHA_256_SIZE> mac{};
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

std::string IdentityKeys::Sha256Hex(std::string_view text) {
    const auto bytes = Encoding::ToBytes(text);
    return Encoding::ToHex(Sha256(bytes));
}

}
