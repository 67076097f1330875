#include "obscur/models/message.hpp"
#include "obscur/core/constants.hpp"

namespace obscur::core::models {

int StatusRank(MessageStatus status) noexcept {
    switch (status) {
        case MessageStatus::Sending: return 0;
        case MessageStatus::Queued: return 1;
        case MessageStatus::Accepted:
        case MessageStatus::Rejected: return 2;
        case MessageStatus::Delivered:
        case MessageStatus::Failed: return 3;
    }
    return 0;
}

bool IsTerminal(MessageStatus status) noexcept {
    return status == MessageStatus::Delivered || status == MessageStatus::Failed;
}

bool IsAllowedTransition(MessageStatus from, MessageStatus to) noexcept {
    if (from == to) {
        return true;
    }
    if (IsTerminal(from)) {
        return false;
    }
    return StatusRank(to) > StatusRank(from);
}

std::string_view ToString(MessageStatus status) noexcept {
    switch (status) {
        case MessageStatus::Sending: return "sending";
        case MessageStatus::Queued: return "queued";
        case MessageStatus::Accepted: return "accepted";
        case MessageStatus::Rejected: return "rejected";
        case MessageStatus::Delivered: return "delivered";
        case MessageStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string DirectConversationId(std::string_view pubkey_a, std::string_view pubkey_b) {
    const bool ordered = pubkey_a <= pubkey_b;
    std::string id(ordered ? pubkey_a : pubkey_b);
    id += StorageConstants::CONVERSATION_SEPARATOR;
    id += ordered ? pubkey_b : pubkey_a;
    return id;
}

std::string GroupConversationId(std::string_view group_id) {
    std::string id(StorageConstants::GROUP_PREFIX);
    id += group_id;
    return id;
}

int64_t ToUnixMillis(Timestamp timestamp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
}

Timestamp FromUnixMillis(int64_t millis) noexcept {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

}
