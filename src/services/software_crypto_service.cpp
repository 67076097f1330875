#include "obscur/services/software_crypto_service.hpp"
#include "obscur/crypto/aes_gcm.hpp"
#include "obscur/crypto/encoding.hpp"
#include "obscur/crypto/identity_keys.hpp"
#include "obscur/crypto/nip44.hpp"
#include "obscur/crypto/security_utils.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/logging/logger.hpp"
#include "obscur/core/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace obscur::core::services {

using crypto::AesGcm;
using crypto::Encoding;
using crypto::IdentityKeys;
using crypto::Nip44;
using crypto::SecurityUtils;
using crypto::SodiumInterop;
using BytesResult = Result<std::vector<uint8_t>, ObscurFailure>;
using StringResult = Result<std::string, ObscurFailure>;
using EventResult = Result<NostrEvent, ObscurFailure>;

namespace {
    constexpr std::string_view IV_SEPARATOR = "?iv=";

    std::string_view Trim(std::string_view value) {
        const auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

    bool IsHex(std::string_view value) {
        return std::all_of(value.begin(), value.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    BytesResult DecodeKey(std::string_view hex, std::string_view what) {
        if (hex.starts_with(BridgeConstants::NATIVE_SESSION_PREFIX)) {
            return BytesResult::Err(ObscurFailure::Validation(
                fmt::format("{} is a native session handle and cannot be used in software", what)));
        }
        if (hex.size() != Constants::HEX_KEY_LENGTH || !IsHex(hex)) {
            return BytesResult::Err(ObscurFailure::Validation(
                fmt::format("{} must be {} hex characters", what, Constants::HEX_KEY_LENGTH)));
        }
        return Encoding::FromHex(hex);
    }

    void Wipe(std::vector<uint8_t>& buffer) {
        SecurityUtils::ClearSensitiveBuffer(buffer);
    }

    int64_t NowSeconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    BytesResult DmKey(std::string_view privkey, std::string_view pubkey) {
        auto seed = DecodeKey(privkey, "Private key");
        if (seed.IsErr()) {
            return seed;
        }
        auto peer = DecodeKey(pubkey, "Public key");
        if (peer.IsErr()) {
            Wipe(seed.Unwrap());
            return peer;
        }
        auto shared = IdentityKeys::Agree(seed.Unwrap(), peer.Unwrap());
        Wipe(seed.Unwrap());
        if (shared.IsErr()) {
            return shared;
        }
        const auto digest = IdentityKeys::Sha256(shared.Unwrap());
        Wipe(shared.Unwrap());
        return BytesResult::Ok(std::vector<uint8_t>(digest.begin(), digest.end()));
    }

    Result<NostrEvent, ObscurFailure> ParseEvent(const std::string& json_text) {
        try {
            return EventResult::Ok(nlohmann::json::parse(json_text).get<NostrEvent>());
        } catch (const nlohmann::json::exception& ex) {
            return EventResult::Err(ObscurFailure::Decode(
                fmt::format("Malformed event JSON: {}", ex.what())));
        }
    }
}

Result<std::shared_ptr<SoftwareCryptoService>, ObscurFailure> SoftwareCryptoService::Create() {
    auto init = SodiumInterop::Initialize();
    if (init.IsErr()) {
        return Result<std::shared_ptr<SoftwareCryptoService>, ObscurFailure>::Err(
            ObscurFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    return Result<std::shared_ptr<SoftwareCryptoService>, ObscurFailure>::Ok(
        std::shared_ptr<SoftwareCryptoService>(new SoftwareCryptoService()));
}

Result<Keypair, ObscurFailure> SoftwareCryptoService::GenerateKeyPair() {
    auto generated = IdentityKeys::Generate();
    if (generated.IsErr()) {
        return Result<Keypair, ObscurFailure>::Err(std::move(generated).UnwrapErr());
    }
    auto& pair = generated.Unwrap();
    Keypair keypair{Encoding::ToHex(pair.public_key), Encoding::ToHex(pair.seed)};
    Wipe(pair.seed);
    return Result<Keypair, ObscurFailure>::Ok(std::move(keypair));
}

StringResult SoftwareCryptoService::EncryptDm(
    std::string_view plaintext,
    std::string_view recipient_pubkey,
    std::string_view sender_privkey) {
    auto key = DmKey(sender_privkey, recipient_pubkey);
    if (key.IsErr()) {
        return StringResult::Err(std::move(key).UnwrapErr());
    }
    const auto iv = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto plaintext_bytes = Encoding::ToBytes(plaintext);
    auto encrypted = AesGcm::Encrypt(key.Unwrap(), iv, plaintext_bytes);
    Wipe(key.Unwrap());
    Wipe(plaintext_bytes);
    if (encrypted.IsErr()) {
        return StringResult::Err(std::move(encrypted).UnwrapErr());
    }
    return StringResult::Ok(
        Encoding::ToBase64(encrypted.Unwrap()) + std::string(IV_SEPARATOR) + Encoding::ToBase64(iv));
}

StringResult SoftwareCryptoService::DecryptDm(
    std::string_view ciphertext,
    std::string_view sender_pubkey,
    std::string_view recipient_privkey) {
    const auto separator = ciphertext.find(IV_SEPARATOR);
    if (separator == std::string_view::npos) {
        return StringResult::Err(ObscurFailure::Decode("DM ciphertext is missing its IV"));
    }
    auto body = Encoding::FromBase64(ciphertext.substr(0, separator));
    auto iv = Encoding::FromBase64(ciphertext.substr(separator + IV_SEPARATOR.size()));
    if (body.IsErr()) {
        return StringResult::Err(std::move(body).UnwrapErr());
    }
    if (iv.IsErr()) {
        return StringResult::Err(std::move(iv).UnwrapErr());
    }
    auto key = DmKey(recipient_privkey, sender_pubkey);
    if (key.IsErr()) {
        return StringResult::Err(std::move(key).UnwrapErr());
    }
    auto decrypted = AesGcm::Decrypt(key.Unwrap(), iv.Unwrap(), body.Unwrap());
    Wipe(key.Unwrap());
    if (decrypted.IsErr()) {
        return StringResult::Err(std::move(decrypted).UnwrapErr());
    }
    std::string plaintext = Encoding::ToString(decrypted.Unwrap());
    Wipe(decrypted.Unwrap());
    return StringResult::Ok(std::move(plaintext));
}

EventResult SoftwareCryptoService::SignEvent(const UnsignedEvent& event, std::string_view privkey) {
    auto seed = DecodeKey(privkey, "Private key");
    if (seed.IsErr()) {
        return EventResult::Err(std::move(seed).UnwrapErr());
    }
    auto public_key = IdentityKeys::PublicKeyFromSeed(seed.Unwrap());
    if (public_key.IsErr()) {
        Wipe(seed.Unwrap());
        return EventResult::Err(std::move(public_key).UnwrapErr());
    }
    UnsignedEvent normalized = event;
    normalized.pubkey = Encoding::ToHex(public_key.Unwrap());
    if (normalized.created_at == 0) {
        normalized.created_at = NowSeconds();
    }
    auto computed_id = models::ComputeEventId(normalized);
    if (computed_id.IsErr()) {
        Wipe(seed.Unwrap());
        return EventResult::Err(std::move(computed_id).UnwrapErr());
    }
    const std::string id = std::move(computed_id).Unwrap();
    auto id_bytes = Encoding::FromHex(id);
    auto signature = IdentityKeys::Sign(id_bytes.Unwrap(), seed.Unwrap());
    Wipe(seed.Unwrap());
    if (signature.IsErr()) {
        return EventResult::Err(std::move(signature).UnwrapErr());
    }
    return EventResult::Ok(NostrEvent{
        id,
        normalized.pubkey,
        normalized.created_at,
        normalized.kind,
        std::move(normalized.tags),
        std::move(normalized.content),
        Encoding::ToHex(signature.Unwrap())});
}

bool SoftwareCryptoService::VerifyEventSignature(const NostrEvent& event) {
    auto expected_id = models::ComputeEventId(event.ToUnsigned());
    if (expected_id.IsErr()) {
        return false;
    }
    if (!SecurityUtils::ConstantTimeStringCompare(expected_id.Unwrap(), event.id)) {
        return false;
    }
    auto id_bytes = Encoding::FromHex(event.id);
    auto signature = Encoding::FromHex(event.sig);
    auto public_key = Encoding::FromHex(event.pubkey);
    if (id_bytes.IsErr() || signature.IsErr() || public_key.IsErr()) {
        return false;
    }
    return IdentityKeys::Verify(id_bytes.Unwrap(), signature.Unwrap(), public_key.Unwrap());
}

EventResult SoftwareCryptoService::SealLayer(
    const NostrEvent& inner,
    int kind,
    models::Tags tags,
    std::string_view recipient_pubkey) {
    auto ephemeral = GenerateKeyPair();
    if (ephemeral.IsErr()) {
        return EventResult::Err(std::move(ephemeral).UnwrapErr());
    }
    auto& keypair = ephemeral.Unwrap();
    auto seed = Encoding::FromHex(keypair.private_key);
    auto peer = DecodeKey(recipient_pubkey, "Recipient public key");
    if (peer.IsErr()) {
        Wipe(seed.Unwrap());
        SecurityUtils::ClearSensitiveString(keypair.private_key);
        return EventResult::Err(std::move(peer).UnwrapErr());
    }
    auto conversation_key = Nip44::ConversationKey(seed.Unwrap(), peer.Unwrap());
    Wipe(seed.Unwrap());
    if (conversation_key.IsErr()) {
        SecurityUtils::ClearSensitiveString(keypair.private_key);
        return EventResult::Err(std::move(conversation_key).UnwrapErr());
    }
    std::string serialized;
    try {
        serialized = nlohmann::json(inner).dump();
    } catch (const nlohmann::json::type_error& ex) {
        Wipe(conversation_key.Unwrap());
        SecurityUtils::ClearSensitiveString(keypair.private_key);
        return EventResult::Err(ObscurFailure::Encode(
            fmt::format("Inner event is not serializable: {}", ex.what())));
    }
    auto encrypted = Nip44::Encrypt(serialized, conversation_key.Unwrap());
    SecurityUtils::ClearSensitiveString(serialized);
    Wipe(conversation_key.Unwrap());
    if (encrypted.IsErr()) {
        SecurityUtils::ClearSensitiveString(keypair.private_key);
        return EventResult::Err(std::move(encrypted).UnwrapErr());
    }
    UnsignedEvent layer{keypair.public_key, NowSeconds(), kind, std::move(tags), std::move(encrypted).Unwrap()};
    auto signed_layer = SignEvent(layer, keypair.private_key);
    SecurityUtils::ClearSensitiveString(keypair.private_key);
    return signed_layer;
}

EventResult SoftwareCryptoService::OpenLayer(
    const NostrEvent& outer,
    int expected_kind,
    std::string_view recipient_privkey) {
    if (outer.kind != expected_kind) {
        return EventResult::Err(ObscurFailure::Validation(
            fmt::format("Expected event kind {}, got {}", expected_kind, outer.kind)));
    }
    if (!VerifyEventSignature(outer)) {
        return EventResult::Err(ObscurFailure::Crypto(
            fmt::format("Kind {} event signature is invalid", expected_kind)));
    }
    auto seed = DecodeKey(recipient_privkey, "Recipient private key");
    if (seed.IsErr()) {
        return EventResult::Err(std::move(seed).UnwrapErr());
    }
    auto peer = DecodeKey(outer.pubkey, "Layer public key");
    if (peer.IsErr()) {
        Wipe(seed.Unwrap());
        return EventResult::Err(std::move(peer).UnwrapErr());
    }
    auto conversation_key = Nip44::ConversationKey(seed.Unwrap(), peer.Unwrap());
    Wipe(seed.Unwrap());
    if (conversation_key.IsErr()) {
        return EventResult::Err(std::move(conversation_key).UnwrapErr());
    }
    auto decrypted = Nip44::Decrypt(outer.content, conversation_key.Unwrap());
    Wipe(conversation_key.Unwrap());
    if (decrypted.IsErr()) {
        return EventResult::Err(std::move(decrypted).UnwrapErr());
    }
    auto inner = ParseEvent(decrypted.Unwrap());
    SecurityUtils::ClearSensitiveString(decrypted.Unwrap());
    return inner;
}

EventResult SoftwareCryptoService::EncryptGiftWrap(
    const UnsignedEvent& rumor,
    std::string_view sender_privkey,
    std::string_view recipient_pubkey) {
    auto signed_rumor = SignEvent(rumor, sender_privkey);
    if (signed_rumor.IsErr()) {
        return signed_rumor;
    }
    auto seal = SealLayer(signed_rumor.Unwrap(), EventKinds::SEAL, {}, recipient_pubkey);
    if (seal.IsErr()) {
        return seal;
    }
    return SealLayer(seal.Unwrap(), EventKinds::GIFT_WRAP,
                     {{"p", std::string(recipient_pubkey)}}, recipient_pubkey);
}

EventResult SoftwareCryptoService::DecryptGiftWrap(
    const NostrEvent& gift_wrap,
    std::string_view recipient_privkey) {
    auto seal = OpenLayer(gift_wrap, EventKinds::GIFT_WRAP, recipient_privkey);
    if (seal.IsErr()) {
        return seal;
    }
    auto rumor = OpenLayer(seal.Unwrap(), EventKinds::SEAL, recipient_privkey);
    if (rumor.IsErr()) {
        return rumor;
    }
    if (!VerifyEventSignature(rumor.Unwrap())) {
        logging::Logger()->warn("Gift wrap rumor failed signature verification");
        return EventResult::Err(ObscurFailure::Crypto("Rumor signature is invalid"));
    }
    return rumor;
}

BytesResult SoftwareCryptoService::DeriveSharedSecret(std::string_view privkey, std::string_view pubkey) {
    auto seed = DecodeKey(privkey, "Private key");
    if (seed.IsErr()) {
        return seed;
    }
    auto peer = DecodeKey(pubkey, "Public key");
    if (peer.IsErr()) {
        Wipe(seed.Unwrap());
        return peer;
    }
    auto shared = IdentityKeys::Agree(seed.Unwrap(), peer.Unwrap());
    Wipe(seed.Unwrap());
    return shared;
}

StringResult SoftwareCryptoService::GenerateInviteId() {
    return StringResult::Ok(Encoding::ToHex(SodiumInterop::GetRandomBytes(Constants::INVITE_ID_SIZE)));
}

StringResult SoftwareCryptoService::SignInviteData(const InvitePayload& payload, std::string_view privkey) {
    auto seed = DecodeKey(privkey, "Private key");
    if (seed.IsErr()) {
        return StringResult::Err(std::move(seed).UnwrapErr());
    }
    const auto digest = IdentityKeys::Sha256(Encoding::ToBytes(models::CanonicalizeInvite(payload)));
    auto signature = IdentityKeys::Sign(digest, seed.Unwrap());
    Wipe(seed.Unwrap());
    if (signature.IsErr()) {
        return StringResult::Err(std::move(signature).UnwrapErr());
    }
    return StringResult::Ok(Encoding::ToHex(signature.Unwrap()));
}

bool SoftwareCryptoService::VerifyInviteSignature(
    const InvitePayload& payload,
    std::string_view signature,
    std::string_view pubkey) {
    if (signature.size() != Constants::HEX_SIGNATURE_LENGTH || !IsHex(signature) ||
        pubkey.size() != Constants::HEX_KEY_LENGTH || !IsHex(pubkey)) {
        return false;
    }
    auto signature_bytes = Encoding::FromHex(signature);
    auto public_key = Encoding::FromHex(pubkey);
    if (signature_bytes.IsErr() || public_key.IsErr()) {
        return false;
    }
    const auto digest = IdentityKeys::Sha256(Encoding::ToBytes(models::CanonicalizeInvite(payload)));
    return IdentityKeys::Verify(digest, signature_bytes.Unwrap(), public_key.Unwrap());
}

StringResult SoftwareCryptoService::EncryptInviteData(std::string_view plaintext, std::span<const uint8_t> key) {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return StringResult::Err(ObscurFailure::Validation(
            fmt::format("Invite key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
    }
    auto plaintext_bytes = Encoding::ToBytes(plaintext);
    auto sealed = AesGcm::Seal(key, plaintext_bytes);
    Wipe(plaintext_bytes);
    if (sealed.IsErr()) {
        return StringResult::Err(std::move(sealed).UnwrapErr());
    }
    return StringResult::Ok(Encoding::ToBase64(sealed.Unwrap()));
}

StringResult SoftwareCryptoService::DecryptInviteData(std::string_view encrypted, std::span<const uint8_t> key) {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return StringResult::Err(ObscurFailure::Validation(
            fmt::format("Invite key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
    }
    auto sealed = Encoding::FromBase64(encrypted);
    if (sealed.IsErr()) {
        return StringResult::Err(std::move(sealed).UnwrapErr());
    }
    auto opened = AesGcm::Open(key, sealed.Unwrap());
    if (opened.IsErr()) {
        return StringResult::Err(std::move(opened).UnwrapErr());
    }
    std::string plaintext = Encoding::ToString(opened.Unwrap());
    Wipe(opened.Unwrap());
    return StringResult::Ok(std::move(plaintext));
}

BytesResult SoftwareCryptoService::GenerateSecureRandom(int64_t length) {
    if (length <= 0) {
        return BytesResult::Err(ObscurFailure::Validation(
            fmt::format("Random length must be positive, got {}", length)));
    }
    return BytesResult::Ok(SodiumInterop::GetRandomBytes(static_cast<size_t>(length)));
}

bool SoftwareCryptoService::IsValidPubkey(std::string_view pubkey) {
    const auto trimmed = Trim(pubkey);
    return trimmed.size() == Constants::HEX_KEY_LENGTH && IsHex(trimmed);
}

std::string SoftwareCryptoService::NormalizeKey(std::string_view key) {
    std::string normalized;
    normalized.reserve(key.size());
    for (const unsigned char c : Trim(key)) {
        const char lowered = static_cast<char>(std::tolower(c));
        if ((lowered >= '0' && lowered <= '9') || (lowered >= 'a' && lowered <= 'f')) {
            normalized.push_back(lowered);
        }
    }
    return normalized.size() == Constants::HEX_KEY_LENGTH ? normalized : std::string();
}

}
