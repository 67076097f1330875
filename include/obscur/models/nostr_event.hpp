#pragma once

#include "obscur/core/failures.hpp"
#include "obscur/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace obscur::core::models {

using Tags = std::vector<std::vector<std::string>>;

struct Keypair {
    std::string public_key;
    std::string private_key;
};

struct UnsignedEvent {
    std::string pubkey;
    int64_t created_at = 0;
    int kind = 0;
    Tags tags;
    std::string content;
};

struct NostrEvent {
    std::string id;
    std::string pubkey;
    int64_t created_at = 0;
    int kind = 0;
    Tags tags;
    std::string content;
    std::string sig;

    [[nodiscard]] UnsignedEvent ToUnsigned() const {
        return UnsignedEvent{pubkey, created_at, kind, tags, content};
    }
};

/// Invite fields covered by the invite signature. Absent optionals are not signed.
struct InvitePayload {
    std::string public_key;
    std::optional<std::string> display_name;
    std::optional<std::string> avatar;
    std::optional<std::string> message;
    std::optional<int64_t> timestamp;
    std::optional<int64_t> expiration_time;
    std::optional<std::string> invite_id;
};

/// Compact JSON of [0, pubkey, created_at, kind, tags, content].
/// Decode failure when a string field is not valid UTF-8.
Result<std::string, ObscurFailure> SerializeForId(const UnsignedEvent& event);

/// Lowercase hex SHA-256 of SerializeForId.
Result<std::string, ObscurFailure> ComputeEventId(const UnsignedEvent& event);

/// `key:value` pairs of present fields, sorted by key, joined by `|`.
std::string CanonicalizeInvite(const InvitePayload& payload);

void to_json(nlohmann::json& j, const NostrEvent& event);
void from_json(const nlohmann::json& j, NostrEvent& event);
void to_json(nlohmann::json& j, const UnsignedEvent& event);
void from_json(const nlohmann::json& j, UnsignedEvent& event);

}
