#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "obscur/models/nostr_event.hpp"

namespace obscur::core::models {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class MessageStatus {
    Sending,
    Queued,
    Accepted,
    Rejected,
    Delivered,
    Failed
};

enum class MessageKind {
    User,
    Command
};

enum class DmFormat {
    Nip04,
    Nip17
};

enum class AttachmentKind {
    Image,
    Video,
    Audio
};

struct RelayResult {
    std::string relay_url;
    bool success = false;
    std::optional<std::string> error;
    std::optional<int64_t> latency_ms;
};

struct Attachment {
    AttachmentKind kind = AttachmentKind::Image;
    std::string url;
    std::string content_type;
    std::string file_name;
};

struct ReplyTo {
    std::string message_id;
    std::string preview_text;
};

struct Message {
    std::string id;
    std::string conversation_id;
    std::string content;
    MessageKind kind = MessageKind::User;
    Timestamp timestamp{};
    bool is_outgoing = false;
    MessageStatus status = MessageStatus::Sending;
    std::optional<DmFormat> dm_format;
    std::optional<std::string> event_id;
    std::optional<int64_t> event_created_at;
    std::string sender_pubkey;
    std::string recipient_pubkey;
    std::optional<std::string> encrypted_content;
    std::vector<RelayResult> relay_results;
    std::optional<Timestamp> synced_at;
    std::optional<int> retry_count;
    std::vector<Attachment> attachments;
    std::optional<ReplyTo> reply_to;
    std::map<std::string, int> reactions;
    std::optional<Timestamp> deleted_at;
};

struct OutgoingMessage {
    std::string id;
    std::string conversation_id;
    std::string content;
    std::string recipient_pubkey;
    Timestamp created_at{};
    int retry_count = 0;
    Timestamp next_retry_at{};
    std::optional<NostrEvent> signed_event;
};

/// sending(0) < queued(1) < accepted|rejected(2) < delivered|failed(3)
[[nodiscard]] int StatusRank(MessageStatus status) noexcept;

[[nodiscard]] bool IsTerminal(MessageStatus status) noexcept;

/// Forward-only. Re-applying the current status is allowed and is a no-op.
[[nodiscard]] bool IsAllowedTransition(MessageStatus from, MessageStatus to) noexcept;

[[nodiscard]] std::string_view ToString(MessageStatus status) noexcept;

[[nodiscard]] std::string DirectConversationId(std::string_view pubkey_a, std::string_view pubkey_b);

[[nodiscard]] std::string GroupConversationId(std::string_view group_id);

[[nodiscard]] int64_t ToUnixMillis(Timestamp timestamp) noexcept;

[[nodiscard]] Timestamp FromUnixMillis(int64_t millis) noexcept;

}
