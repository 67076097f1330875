#pragma once
#include "obscur/interfaces/i_crypto_service.hpp"
#include "obscur/interfaces/i_message_channel.hpp"
#include "worker/crypto_envelope.pb.h"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
namespace obscur::core::services {

/**
 * Serves CryptoRequest frames from a channel on a dedicated thread.
 *
 * Requests are handled one at a time in arrival order. Every request gets
 * exactly one CryptoResponse carrying the same correlation id; failures are
 * reported in the response, never dropped.
 */
class CryptoWorker {
public:
    CryptoWorker(
        std::shared_ptr<interfaces::IMessageChannel> channel,
        std::shared_ptr<interfaces::ICryptoService> service);
    ~CryptoWorker();

    CryptoWorker(const CryptoWorker&) = delete;
    CryptoWorker& operator=(const CryptoWorker&) = delete;

    void Start();
    void Stop();

    [[nodiscard]] proto::worker::CryptoResponse Handle(const proto::worker::CryptoRequest& request);

private:
    // Shared with the channel handler, which may still be running on a
    // sender thread after the worker is gone.
    struct Inbox {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::deque<std::string> frames;
    };

    void Run(std::stop_token stop_token);
    void Reply(const proto::worker::CryptoResponse& response);
    void RejectFrame(const std::string& frame);

    std::shared_ptr<interfaces::IMessageChannel> channel_;
    std::shared_ptr<interfaces::ICryptoService> service_;
    std::shared_ptr<Inbox> inbox_;
    std::jthread thread_;
};
}
