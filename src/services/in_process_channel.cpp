#include "obscur/services/in_process_channel.hpp"
namespace obscur::core::services {
void InProcessChannel::SendToWorker(const std::string& frame) {
    FrameHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = to_worker_;
    }
    if (handler) {
        handler(frame);
    }
}
void InProcessChannel::SendToClient(const std::string& frame) {
    FrameHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = to_client_;
    }
    if (handler) {
        handler(frame);
    }
}
void InProcessChannel::OnWorkerFrame(FrameHandler handler) {
    std::lock_guard lock(mutex_);
    to_client_ = std::move(handler);
}
void InProcessChannel::OnClientFrame(FrameHandler handler) {
    std::lock_guard lock(mutex_);
    to_worker_ = std::move(handler);
}
}
