#include "obscur/crypto/nip44.hpp"
#include "obscur/crypto/encoding.hpp"
#include "obscur/crypto/hkdf.hpp"
#include "obscur/crypto/identity_keys.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/core/constants.hpp"

#include <fmt/format.h>
#include <sodium.h>

namespace obscur::core::crypto {

namespace {
    using StringResult = Result<std::string, ObscurFailure>;

    struct MessageKeys {
        std::vector<uint8_t> chacha_key;
        std::vector<uint8_t> chacha_nonce;
        std::vector<uint8_t> hmac_key;

        ~MessageKeys() {
            { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(chacha_key)); (void) _wipe; }
            { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(hmac_key)); (void) _wipe; }
        }
    };

    Result<MessageKeys, ObscurFailure> DeriveMessageKeys(
        std::span<const uint8_t> conversation_key,
        std::span<const uint8_t> nonce) {
        auto expanded = Hkdf::Expand(conversation_key, Nip44Constants::MESSAGE_KEYS_SIZE, nonce);
        if (expanded.IsErr()) {
            return Result<MessageKeys, ObscurFailure>::Err(std::move(expanded).UnwrapErr());
        }
        auto& okm = expanded.Unwrap();
        const auto chacha_key_end = okm.begin() + Nip44Constants::CHACHA_KEY_SIZE;
        const auto chacha_nonce_end = chacha_key_end + Nip44Constants::CHACHA_NONCE_SIZE;
        MessageKeys keys{
            std::vector<uint8_t>(okm.begin(), chacha_key_end),
            std::vector<uint8_t>(chacha_key_end, chacha_nonce_end),
            std::vector<uint8_t>(chacha_nonce_end, okm.end())};
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(okm)); (void) _wipe; }
        return Result<MessageKeys, ObscurFailure>::Ok(std::move(keys));
    }

    std::vector<uint8_t> Mac(const MessageKeys& keys,
                             std::span<const uint8_t> nonce,
                             std::span<const uint8_t> ciphertext) {
        std::vector<uint8_t> aad(nonce.begin(), nonce.end());
        aad.insert(aad.end(), ciphertext.begin(), ciphertext.end());
        const auto mac = IdentityKeys::HmacSha256(keys.hmac_key, aad);
        return {mac.begin(), mac.end()};
    }

    void XorChaCha20(const MessageKeys& keys, std::span<uint8_t> buffer) {
        crypto_stream_chacha20_ietf_xor(buffer.data(), buffer.data(), buffer.size(),
                                        keys.chacha_nonce.data(), keys.chacha_key.data());
    }
}

size_t Nip44::CalcPaddedLength(size_t unpadded_len) noexcept {
    if (unpadded_len <= Nip44Constants::MIN_PADDED_SIZE) {
        return Nip44Constants::MIN_PADDED_SIZE;
    }
    size_t next_power = 1;
    while (next_power < unpadded_len) {
        next_power <<= 1;
    }
    const size_t chunk = next_power <= 256 ? 32 : next_power / 8;
    return chunk * ((unpadded_len - 1) / chunk + 1);
}

Result<std::vector<uint8_t>, ObscurFailure> Nip44::ConversationKey(
    std::span<const uint8_t> private_seed,
    std::span<const uint8_t> peer_public_key) {
    auto shared = IdentityKeys::Agree(private_seed, peer_public_key);
    if (shared.IsErr()) {
        return shared;
    }
    const auto salt = Encoding::ToBytes(Nip44Constants::SALT);
    auto key = Hkdf::Extract(shared.Unwrap(), salt);
    { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(shared.Unwrap())); (void) _wipe; }
    return key;
}

StringResult Nip44::Encrypt(std::string_view plaintext, std::span<const uint8_t> conversation_key) {
    const auto nonce = SodiumInterop::GetRandomBytes(Nip44Constants::NONCE_SIZE);
    return EncryptWithNonce(plaintext, conversation_key, nonce);
}

StringResult Nip44::EncryptWithNonce(
    std::string_view plaintext,
    std::span<const uint8_t> conversation_key,
    std::span<const uint8_t> nonce) {
    if (plaintext.size() < Nip44Constants::MIN_PLAINTEXT_SIZE ||
        plaintext.size() > Nip44Constants::MAX_PLAINTEXT_SIZE) {
        return StringResult::Err(ObscurFailure::Validation(
            fmt::format("NIP-44 plaintext length {} is out of range", plaintext.size())));
    }
    if (nonce.size() != Nip44Constants::NONCE_SIZE) {
        return StringResult::Err(ObscurFailure::Validation("NIP-44 nonce must be 32 bytes"));
    }
    auto keys = DeriveMessageKeys(conversation_key, nonce);
    if (keys.IsErr()) {
        return StringResult::Err(std::move(keys).UnwrapErr());
    }
    const size_t padded_len = CalcPaddedLength(plaintext.size());
    std::vector<uint8_t> buffer(Nip44Constants::LENGTH_PREFIX_SIZE + padded_len, 0);
    buffer[0] = static_cast<uint8_t>(plaintext.size() >> 8);
    buffer[1] = static_cast<uint8_t>(plaintext.size() & 0xFF);
    std::copy(plaintext.begin(), plaintext.end(), buffer.begin() + Nip44Constants::LENGTH_PREFIX_SIZE);
    XorChaCha20(keys.Unwrap(), buffer);
    const auto mac = Mac(keys.Unwrap(), nonce, buffer);

    std::vector<uint8_t> payload;
    payload.reserve(1 + nonce.size() + buffer.size() + mac.size());
    payload.push_back(Nip44Constants::VERSION);
    payload.insert(payload.end(), nonce.begin(), nonce.end());
    payload.insert(payload.end(), buffer.begin(), buffer.end());
    payload.insert(payload.end(), mac.begin(), mac.end());
    return StringResult::Ok(Encoding::ToBase64(payload));
}

StringResult Nip44::Decrypt(std::string_view payload, std::span<const uint8_t> conversation_key) {
    auto decoded = Encoding::FromBase64(payload);
    if (decoded.IsErr()) {
        return StringResult::Err(std::move(decoded).UnwrapErr());
    }
    const auto& raw = decoded.Unwrap();
    constexpr size_t min_size = 1 + Nip44Constants::NONCE_SIZE +
        Nip44Constants::LENGTH_PREFIX_SIZE + Nip44Constants::MIN_PADDED_SIZE + Nip44Constants::MAC_SIZE;
    if (raw.size() < min_size) {
        return StringResult::Err(ObscurFailure::Decode("NIP-44 payload is too short"));
    }
    if (raw[0] != Nip44Constants::VERSION) {
        return StringResult::Err(ObscurFailure::Decode(
            fmt::format("Unsupported NIP-44 version {}", raw[0])));
    }
    std::span<const uint8_t> view(raw);
    const auto nonce = view.subspan(1, Nip44Constants::NONCE_SIZE);
    const auto ciphertext = view.subspan(1 + Nip44Constants::NONCE_SIZE,
        raw.size() - 1 - Nip44Constants::NONCE_SIZE - Nip44Constants::MAC_SIZE);
    const auto mac = view.subspan(raw.size() - Nip44Constants::MAC_SIZE);

    auto keys = DeriveMessageKeys(conversation_key, nonce);
    if (keys.IsErr()) {
        return StringResult::Err(std::move(keys).UnwrapErr());
    }
    const auto expected_mac = Mac(keys.Unwrap(), nonce, ciphertext);
    auto mac_ok = SodiumInterop::ConstantTimeEquals(expected_mac, mac);
    if (mac_ok.IsErr() || !mac_ok.Unwrap()) {
        return StringResult::Err(ObscurFailure::Crypto("NIP-44 MAC verification failed"));
    }

    std::vector<uint8_t> padded(ciphertext.begin(), ciphertext.end());
    XorChaCha20(keys.Unwrap(), padded);
    const size_t unpadded_len = (static_cast<size_t>(padded[0]) << 8) | padded[1];
    if (unpadded_len < Nip44Constants::MIN_PLAINTEXT_SIZE ||
        padded.size() != Nip44Constants::LENGTH_PREFIX_SIZE + CalcPaddedLength(unpadded_len)) {
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(padded)); (void) _wipe; }
        return StringResult::Err(ObscurFailure::Decode("NIP-44 padding is invalid"));
    }
    std::string plaintext(padded.begin() + Nip44Constants::LENGTH_PREFIX_SIZE,
                          padded.begin() + Nip44Constants::LENGTH_PREFIX_SIZE + static_cast<std::ptrdiff_t>(unpadded_len));
    { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(padded)); (void) _wipe; }
    return StringResult::Ok(std::move(plaintext));
}

}
