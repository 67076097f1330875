#include "obscur/utilities/event_codec.hpp"
namespace obscur::core::utilities {
namespace {
    void TagsToProto(const models::Tags& tags, proto::common::NostrEvent* out) {
        for (const auto& tag : tags) {
            auto* proto_tag = out->add_tags();
            for (const auto& value : tag) {
                proto_tag->add_values(value);
            }
        }
    }
    models::Tags TagsFromProto(const proto::common::NostrEvent& proto_event) {
        models::Tags tags;
        tags.reserve(static_cast<size_t>(proto_event.tags_size()));
        for (const auto& proto_tag : proto_event.tags()) {
            tags.emplace_back(proto_tag.values().begin(), proto_tag.values().end());
        }
        return tags;
    }
}
void EventCodec::ToProto(const models::NostrEvent& event, proto::common::NostrEvent* out) {
    out->set_id(event.id);
    out->set_pubkey(event.pubkey);
    out->set_created_at(event.created_at);
    out->set_kind(event.kind);
    TagsToProto(event.tags, out);
    out->set_content(event.content);
    out->set_sig(event.sig);
}
models::NostrEvent EventCodec::FromProto(const proto::common::NostrEvent& proto_event) {
    return models::NostrEvent{
        proto_event.id(),
        proto_event.pubkey(),
        proto_event.created_at(),
        proto_event.kind(),
        TagsFromProto(proto_event),
        proto_event.content(),
        proto_event.sig()};
}
void EventCodec::ToProto(const models::UnsignedEvent& event, proto::common::NostrEvent* out) {
    out->set_pubkey(event.pubkey);
    out->set_created_at(event.created_at);
    out->set_kind(event.kind);
    TagsToProto(event.tags, out);
    out->set_content(event.content);
}
models::UnsignedEvent EventCodec::UnsignedFromProto(const proto::common::NostrEvent& proto_event) {
    return models::UnsignedEvent{
        proto_event.pubkey(),
        proto_event.created_at(),
        proto_event.kind(),
        TagsFromProto(proto_event),
        proto_event.content()};
}
}
