#pragma once
#include "obscur/models/nostr_event.hpp"
#include "common/nostr_event.pb.h"
namespace obscur::core::utilities {
class EventCodec {
public:
    static void ToProto(const models::NostrEvent& event, proto::common::NostrEvent* out);
    [[nodiscard]] static models::NostrEvent FromProto(const proto::common::NostrEvent& proto_event);
    static void ToProto(const models::UnsignedEvent& event, proto::common::NostrEvent* out);
    [[nodiscard]] static models::UnsignedEvent UnsignedFromProto(const proto::common::NostrEvent& proto_event);
private:
    EventCodec() = delete;
};
}
