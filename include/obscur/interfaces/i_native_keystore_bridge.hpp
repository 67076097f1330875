#pragma once
#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include "obscur/models/nostr_event.hpp"
#include <string>
#include <string_view>
namespace obscur::core::interfaces {

/**
 * RPC surface of the platform keystore. Private keys never cross it; the
 * keystore answers with an opaque session handle instead. Calls may block.
 */
class INativeKeystoreBridge {
public:
    virtual ~INativeKeystoreBridge() = default;
    [[nodiscard]] virtual Result<models::Keypair, ObscurFailure> GenerateKey() = 0;
    [[nodiscard]] virtual Result<models::NostrEvent, ObscurFailure> SignEvent(
        const models::UnsignedEvent& event,
        std::string_view key_handle) = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> EncryptNip04(
        std::string_view plaintext,
        std::string_view recipient_pubkey,
        std::string_view key_handle) = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> DecryptNip04(
        std::string_view ciphertext,
        std::string_view sender_pubkey,
        std::string_view key_handle) = 0;
};
}
