#pragma once
#include "obscur/interfaces/i_message_channel.hpp"
#include <mutex>
namespace obscur::core::services {
/// Delivers frames by direct handler invocation on the sending thread.
class InProcessChannel final : public interfaces::IMessageChannel {
public:
    void SendToWorker(const std::string& frame) override;
    void SendToClient(const std::string& frame) override;
    void OnWorkerFrame(FrameHandler handler) override;
    void OnClientFrame(FrameHandler handler) override;
private:
    std::mutex mutex_;
    FrameHandler to_client_;
    FrameHandler to_worker_;
};
}
