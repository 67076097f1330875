#include <catch2/catch_test_macros.hpp>
#include "obscur/services/crypto_service_factory.hpp"
#include "obscur/services/crypto_worker.hpp"
#include "obscur/services/in_process_channel.hpp"
#include "obscur/services/software_crypto_service.hpp"
#include "obscur/services/worker_crypto_client.hpp"
#include "obscur/core/constants.hpp"
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
using namespace obscur::core;
using namespace obscur::core::services;
using namespace obscur::core::models;
using namespace std::chrono_literals;

namespace {
    /// Keeps the registered handlers so a test can invoke a stale copy.
    class CapturingChannel final : public interfaces::IMessageChannel {
    public:
        void SendToWorker(const std::string& frame) override {
            FrameHandler handler;
            {
                std::lock_guard lock(mutex_);
                handler = to_worker_;
            }
            if (handler) {
                handler(frame);
            }
        }
        void SendToClient(const std::string& frame) override {
            std::lock_guard lock(mutex_);
            to_client_frames_.push_back(frame);
        }
        void OnWorkerFrame(FrameHandler) override {}
        void OnClientFrame(FrameHandler handler) override {
            std::lock_guard lock(mutex_);
            if (handler) {
                last_worker_handler_ = handler;
            }
            to_worker_ = std::move(handler);
        }
        FrameHandler LastWorkerHandler() {
            std::lock_guard lock(mutex_);
            return last_worker_handler_;
        }
        std::vector<std::string> ClientFrames() {
            std::lock_guard lock(mutex_);
            return to_client_frames_;
        }
    private:
        std::mutex mutex_;
        FrameHandler to_worker_;
        FrameHandler last_worker_handler_;
        std::vector<std::string> to_client_frames_;
    };

    std::vector<std::string> WaitForFrames(CapturingChannel& channel, size_t count) {
        const auto deadline = std::chrono::steady_clock::now() + 2000ms;
        auto frames = channel.ClientFrames();
        while (frames.size() < count && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
            frames = channel.ClientFrames();
        }
        return frames;
    }
}

TEST_CASE("WorkerCryptoClient - Calls cross the worker boundary", "[crypto][worker]") {
    auto created = CryptoServiceFactory::Create(configuration::CryptoBackendConfig::Worker());
    REQUIRE(created.IsOk());
    auto service = created.Unwrap();
    REQUIRE(dynamic_cast<WorkerCryptoClient*>(service.get()) != nullptr);

    const auto alice = service->GenerateKeyPair().Unwrap();
    const auto bob = service->GenerateKeyPair().Unwrap();

    SECTION("DM round trip") {
        auto ciphertext = service->EncryptDm("over the wire", bob.public_key, alice.private_key);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(service->DecryptDm(ciphertext.Unwrap(), alice.public_key, bob.private_key).Unwrap() ==
                "over the wire");
    }
    SECTION("Events keep their tags across the codec") {
        UnsignedEvent event{"", 1700000000, EventKinds::ENCRYPTED_DM, {{"p", bob.public_key}, {"e", "x", "wss://r"}}, "c"};
        auto signed_event = service->SignEvent(event, alice.private_key);
        REQUIRE(signed_event.IsOk());
        REQUIRE(signed_event.Unwrap().tags == event.tags);
        REQUIRE(service->VerifyEventSignature(signed_event.Unwrap()));
    }
    SECTION("Gift wraps") {
        UnsignedEvent rumor{alice.public_key, 1700000000, EventKinds::CHAT_RUMOR, {}, "wrapped"};
        auto wrap = service->EncryptGiftWrap(rumor, alice.private_key, bob.public_key);
        REQUIRE(wrap.IsOk());
        REQUIRE(service->DecryptGiftWrap(wrap.Unwrap(), bob.private_key).Unwrap().content == "wrapped");
    }
    SECTION("Failures keep their category") {
        auto result = service->GenerateSecureRandom(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Validation);
    }
    SECTION("Invite operations") {
        InvitePayload payload;
        payload.public_key = alice.public_key;
        payload.invite_id = service->GenerateInviteId().Unwrap();
        auto signature = service->SignInviteData(payload, alice.private_key).Unwrap();
        REQUIRE(service->VerifyInviteSignature(payload, signature, alice.public_key));
        const auto key = service->GenerateSecureRandom(32).Unwrap();
        auto sealed = service->EncryptInviteData("invite", key).Unwrap();
        REQUIRE(service->DecryptInviteData(sealed, key).Unwrap() == "invite");
    }
    SECTION("Key helpers") {
        REQUIRE(service->IsValidPubkey(alice.public_key));
        REQUIRE_FALSE(service->IsValidPubkey("short"));
        REQUIRE(service->NormalizeKey(alice.public_key) == alice.public_key);
        REQUIRE(service->DeriveSharedSecret(alice.private_key, bob.public_key).Unwrap() ==
                service->DeriveSharedSecret(bob.private_key, alice.public_key).Unwrap());
    }
    SECTION("Concurrent callers get their own answers") {
        std::vector<std::thread> threads;
        std::vector<std::string> results(8);
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i]() {
                const std::string text = "msg " + std::to_string(i);
                auto ciphertext = service->EncryptDm(text, bob.public_key, alice.private_key).Unwrap();
                results[i] = service->DecryptDm(ciphertext, alice.public_key, bob.private_key).Unwrap();
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        for (size_t i = 0; i < results.size(); ++i) {
            REQUIRE(results[i] == "msg " + std::to_string(i));
        }
    }
}

TEST_CASE("WorkerCryptoClient - Unanswered calls time out", "[crypto][worker][timeout]") {
    auto channel = std::make_shared<InProcessChannel>();
    WorkerCryptoClient client(channel, std::chrono::milliseconds(50));
    auto result = client.GenerateInviteId();
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ObscurFailureType::BridgeTimeout);
    REQUIRE(client.PendingCount() == 0);
    REQUIRE_FALSE(client.IsValidPubkey(std::string(64, 'a')));
    REQUIRE(client.NormalizeKey(std::string(64, 'a')).empty());
}

TEST_CASE("CryptoWorker - Direct dispatch", "[crypto][worker]") {
    auto channel = std::make_shared<InProcessChannel>();
    CryptoWorker worker(channel, SoftwareCryptoService::Create().Unwrap());
    SECTION("Correlation id is echoed") {
        obscur::proto::worker::CryptoRequest request;
        request.set_correlation_id("abc");
        request.set_operation(obscur::proto::worker::GENERATE_INVITE_ID);
        const auto response = worker.Handle(request);
        REQUIRE(response.correlation_id() == "abc");
        REQUIRE(response.ok());
        REQUIRE(response.text().size() == 32);
    }
    SECTION("Unknown operation is a validation failure") {
        obscur::proto::worker::CryptoRequest request;
        request.set_correlation_id("x");
        const auto response = worker.Handle(request);
        REQUIRE_FALSE(response.ok());
        REQUIRE(response.failure_type() == static_cast<int32_t>(ObscurFailureType::Validation));
    }
}

TEST_CASE("WorkerCryptoClient - Non UTF-8 input behaves like the software backend", "[crypto][worker]") {
    auto service = CryptoServiceFactory::Create(configuration::CryptoBackendConfig::Worker()).Unwrap();
    auto software = SoftwareCryptoService::Create().Unwrap();
    const auto alice = software->GenerateKeyPair().Unwrap();
    const auto bob = software->GenerateKeyPair().Unwrap();
    const std::string binary_text = std::string("hi\xff\xfe") + '\0' + "end";

    const auto started = std::chrono::steady_clock::now();
    SECTION("DM payloads round trip") {
        auto ciphertext = service->EncryptDm(binary_text, bob.public_key, alice.private_key);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(service->DecryptDm(ciphertext.Unwrap(), alice.public_key, bob.private_key).Unwrap() == binary_text);
    }
    SECTION("Verification of a non UTF-8 event answers false") {
        auto event = software->SignEvent(UnsignedEvent{"", 1700000000, 1, {}, "ok"}, alice.private_key).Unwrap();
        event.content = binary_text;
        REQUIRE_FALSE(service->VerifyEventSignature(event));
        REQUIRE_FALSE(software->VerifyEventSignature(event));
    }
    SECTION("Signing a non UTF-8 event reports the same failure") {
        const UnsignedEvent event{"", 1700000000, 1, {{"t", binary_text}}, "ok"};
        auto remote = service->SignEvent(event, alice.private_key);
        auto local = software->SignEvent(event, alice.private_key);
        REQUIRE(remote.UnwrapErr().type == ObscurFailureType::Decode);
        REQUIRE(local.UnwrapErr().type == ObscurFailureType::Decode);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
}

TEST_CASE("CryptoWorker - Malformed frames", "[crypto][worker]") {
    auto channel = std::make_shared<CapturingChannel>();
    CryptoWorker worker(channel, SoftwareCryptoService::Create().Unwrap());
    worker.Start();

    SECTION("A frame with a readable id gets a Decode answer") {
        obscur::proto::worker::FrameHeader header;
        header.set_correlation_id("broken-1");
        std::string frame;
        REQUIRE(header.SerializeToString(&frame));
        // Field 5 (event) holding a truncated varint.
        frame += std::string("\x2a\x02\x08\xff", 4);
        channel->SendToWorker(frame);

        const auto frames = WaitForFrames(*channel, 1);
        REQUIRE(frames.size() == 1);
        obscur::proto::worker::CryptoResponse response;
        REQUIRE(response.ParseFromString(frames.front()));
        REQUIRE(response.correlation_id() == "broken-1");
        REQUIRE_FALSE(response.ok());
        REQUIRE(response.failure_type() == static_cast<int32_t>(ObscurFailureType::Decode));
    }
    SECTION("Garbage without an id is dropped") {
        channel->SendToWorker(std::string("\xff\xff\xff", 3));
        std::this_thread::sleep_for(50ms);
        REQUIRE(channel->ClientFrames().empty());
    }
}

TEST_CASE("CryptoWorker - Stale handler after shutdown", "[crypto][worker]") {
    auto channel = std::make_shared<CapturingChannel>();
    {
        CryptoWorker worker(channel, SoftwareCryptoService::Create().Unwrap());
        worker.Start();
    }
    auto stale = channel->LastWorkerHandler();
    REQUIRE(static_cast<bool>(stale));
    obscur::proto::worker::CryptoRequest request;
    request.set_correlation_id("late");
    request.set_operation(obscur::proto::worker::GENERATE_INVITE_ID);
    std::string frame;
    REQUIRE(request.SerializeToString(&frame));
    REQUIRE_NOTHROW(stale(frame));
    std::this_thread::sleep_for(20ms);
    REQUIRE(channel->ClientFrames().empty());
}
