#ifndef _SIGNALING_SIGNALING_HUB_H_
#define _SIGNALING_SIGNALING_HUB_H_

#include "base/defines.hpp"
#include "signaling/signaling_bus.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairrtc {
namespace signaling {

class LocalSignalingBus;

// SignalingHub relays text messages between the endpoints joined to 
// the same named channel within the process.
class PAIRRTC_EXPORT SignalingHub {
public:
    SignalingHub();
    ~SignalingHub();

    // The handlers subscribed on the returned endpoint are invoked on `task_queue`,
    // which MUST outlive the endpoint.
    std::unique_ptr<LocalSignalingBus> Join(const std::string& channel_name, TaskQueue* task_queue);

    size_t endpoint_count(const std::string& channel_name) const;

private:
    friend class LocalSignalingBus;
    void Broadcast(const std::string& channel_name, const std::string& text);
    void Leave(const std::string& channel_name, LocalSignalingBus* endpoint);

private:
    DISALLOW_COPY_AND_ASSIGN(SignalingHub);
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<LocalSignalingBus*>> channels_;
};

// LocalSignalingBus
class PAIRRTC_EXPORT LocalSignalingBus final : public SignalingBus {
public:
    ~LocalSignalingBus() override;

    const std::string& channel_name() const { return channel_name_; }
    bool closed() const;

    void Publish(const Message& message) override;
    SubscriptionId Subscribe(MessageHandler handler) override;
    void Unsubscribe(SubscriptionId id) override;

    // Publishes pre-encoded text as is.
    void PublishText(const std::string& text);

    // Leaves the channel, the later publishing will be dropped.
    void Close();

private:
    friend class SignalingHub;
    LocalSignalingBus(SignalingHub* hub, std::string channel_name, TaskQueue* task_queue);

    // Called by the hub on the publisher's thread.
    void Deliver(std::string text);
    void Dispatch(const std::string& text);

private:
    SignalingHub* const hub_;
    const std::string channel_name_;
    TaskQueue* const task_queue_;

    mutable std::mutex mutex_;
    bool closed_ = false;
    SubscriptionId next_subscription_id_ = 1;
    std::map<SubscriptionId, MessageHandler> handlers_;

    ScopedTaskSafety task_safety_;
};

} // namespace signaling
} // namespace pairrtc

#endif
