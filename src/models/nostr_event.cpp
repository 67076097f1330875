#include "obscur/models/nostr_event.hpp"
#include "obscur/crypto/identity_keys.hpp"

#include <fmt/format.h>

#include <map>

namespace obscur::core::models {

Result<std::string, ObscurFailure> SerializeForId(const UnsignedEvent& event) {
    const nlohmann::json array = nlohmann::json::array(
        {0, event.pubkey, event.created_at, event.kind, event.tags, event.content});
    try {
        return Result<std::string, ObscurFailure>::Ok(array.dump());
    } catch (const nlohmann::json::type_error& ex) {
        return Result<std::string, ObscurFailure>::Err(
            ObscurFailure::Decode(fmt::format("Event is not valid UTF-8: {}", ex.what())));
    }
}

Result<std::string, ObscurFailure> ComputeEventId(const UnsignedEvent& event) {
    auto serialized = SerializeForId(event);
    if (serialized.IsErr()) {
        return serialized;
    }
    return Result<std::string, ObscurFailure>::Ok(crypto::IdentityKeys::Sha256Hex(serialized.Unwrap()));
}

std::string CanonicalizeInvite(const InvitePayload& payload) {
    std::map<std::string, std::string> fields;
    fields.emplace("publicKey", payload.public_key);
    if (payload.display_name) {
        fields.emplace("displayName", *payload.display_name);
    }
    if (payload.avatar) {
        fields.emplace("avatar", *payload.avatar);
    }
    if (payload.message) {
        fields.emplace("message", *payload.message);
    }
    if (payload.timestamp) {
        fields.emplace("timestamp", std::to_string(*payload.timestamp));
    }
    if (payload.expiration_time) {
        fields.emplace("expirationTime", std::to_string(*payload.expiration_time));
    }
    if (payload.invite_id) {
        fields.emplace("inviteId", *payload.invite_id);
    }
    std::string canonical;
    for (const auto& [key, value] : fields) {
        if (!canonical.empty()) {
            canonical += '|';
        }
        canonical += key;
        canonical += ':';
        canonical += value;
    }
    return canonical;
}

void to_json(nlohmann::json& j, const NostrEvent& event) {
    j = nlohmann::json{
        {"id", event.id},
        {"pubkey", event.pubkey},
        {"created_at", event.created_at},
        {"kind", event.kind},
        {"tags", event.tags},
        {"content", event.content},
        {"sig", event.sig}};
}

void from_json(const nlohmann::json& j, NostrEvent& event) {
    j.at("id").get_to(event.id);
    j.at("pubkey").get_to(event.pubkey);
    j.at("created_at").get_to(event.created_at);
    j.at("kind").get_to(event.kind);
    j.at("tags").get_to(event.tags);
    j.at("content").get_to(event.content);
    j.at("sig").get_to(event.sig);
}

void to_json(nlohmann::json& j, const UnsignedEvent& event) {
    j = nlohmann::json{
        {"pubkey", event.pubkey},
        {"created_at", event.created_at},
        {"kind", event.kind},
        {"tags", event.tags},
        {"content", event.content}};
}

void from_json(const nlohmann::json& j, UnsignedEvent& event) {
    j.at("pubkey").get_to(event.pubkey);
    j.at("created_at").get_to(event.created_at);
    j.at("kind").get_to(event.kind);
    j.at("tags").get_to(event.tags);
    j.at("content").get_to(event.content);
}

}
