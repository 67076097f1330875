#pragma once
#include <functional>
#include <string>
namespace obscur::core::interfaces {
/// Bidirectional byte-frame transport between a crypto client and its worker.
class IMessageChannel {
public:
    using FrameHandler = std::function<void(const std::string&)>;
    virtual ~IMessageChannel() = default;
    virtual void SendToWorker(const std::string& frame) = 0;
    virtual void SendToClient(const std::string& frame) = 0;
    virtual void OnWorkerFrame(FrameHandler handler) = 0;
    virtual void OnClientFrame(FrameHandler handler) = 0;
};
}
