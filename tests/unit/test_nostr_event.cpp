#include <catch2/catch_test_macros.hpp>
#include "obscur/models/nostr_event.hpp"
#include "helpers/message_fixtures.hpp"
using namespace obscur::core;
using namespace obscur::core::models;
using namespace obscur::core::test_helpers;
namespace {
    UnsignedEvent SampleEvent() {
        return UnsignedEvent{ALICE_PUBKEY, 1700000000, 1, {{"p", BOB_PUBKEY}}, "hello"};
    }
}
TEST_CASE("NostrEvent - Id serialization", "[event]") {
    const auto event = SampleEvent();
    SECTION("Compact array form") {
        REQUIRE(SerializeForId(event).Unwrap() ==
                std::string("[0,\"") + ALICE_PUBKEY + "\",1700000000,1,[[\"p\",\"" + BOB_PUBKEY + "\"]],\"hello\"]");
    }
    SECTION("Id is SHA-256 of the serialization") {
        REQUIRE(ComputeEventId(event).Unwrap() == "e4da8b1023fd3934072a5796db49b02ecac232f76e8d57484db152311842e8be");
    }
    SECTION("Any field change changes the id") {
        auto other = event;
        other.content = "hello!";
        REQUIRE(ComputeEventId(other).Unwrap() != ComputeEventId(event).Unwrap());
    }
    SECTION("Special characters are escaped") {
        auto quoted = event;
        quoted.content = "say \"hi\"\n";
        REQUIRE(SerializeForId(quoted).Unwrap().find("\"say \\\"hi\\\"\\n\"") != std::string::npos);
    }
    SECTION("Invalid UTF-8 content is a Decode failure") {
        auto broken = event;
        broken.content = "hi\xff";
        auto serialized = SerializeForId(broken);
        REQUIRE(serialized.IsErr());
        REQUIRE(serialized.UnwrapErr().type == ObscurFailureType::Decode);
        REQUIRE(ComputeEventId(broken).IsErr());
    }
    SECTION("Invalid UTF-8 in a tag is a Decode failure") {
        auto broken = event;
        broken.tags = {{"p", "\xc3\x28"}};
        REQUIRE(ComputeEventId(broken).UnwrapErr().type == ObscurFailureType::Decode);
    }
}
TEST_CASE("NostrEvent - Invite canonical form", "[event][invite]") {
    InvitePayload payload;
    payload.public_key = "pk";
    SECTION("Only the key") {
        REQUIRE(CanonicalizeInvite(payload) == "publicKey:pk");
    }
    SECTION("Fields are sorted by name") {
        payload.timestamp = 1000;
        payload.display_name = "Alice";
        payload.invite_id = "abc";
        payload.expiration_time = 2000;
        REQUIRE(CanonicalizeInvite(payload) ==
                "displayName:Alice|expirationTime:2000|inviteId:abc|publicKey:pk|timestamp:1000");
    }
}
TEST_CASE("NostrEvent - JSON", "[event]") {
    NostrEvent event{"id1", ALICE_PUBKEY, 1700000000, 4, {{"p", BOB_PUBKEY}}, "c?iv=x", "sig1"};
    const nlohmann::json j = event;
    REQUIRE(j["created_at"] == 1700000000);
    REQUIRE(j["tags"][0][1] == BOB_PUBKEY);
    const auto parsed = j.get<NostrEvent>();
    REQUIRE(parsed.id == event.id);
    REQUIRE(parsed.tags == event.tags);
    REQUIRE(parsed.sig == event.sig);
    REQUIRE(parsed.ToUnsigned().content == event.content);
    REQUIRE_THROWS(nlohmann::json{{"id", "x"}}.get<NostrEvent>());
}
