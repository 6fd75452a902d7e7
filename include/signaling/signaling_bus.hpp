#ifndef _SIGNALING_SIGNALING_BUS_H_
#define _SIGNALING_SIGNALING_BUS_H_

#include "base/defines.hpp"
#include "signaling/signaling_message.hpp"

#include <cstdint>
#include <functional>

namespace pairrtc {
namespace signaling {

using SubscriptionId = uint64_t;

// SignalingBus is a best-effort publish/subscribe channel. Every subscriber 
// on the channel receives every message, including the ones it published.
class PAIRRTC_EXPORT SignalingBus {
public:
    using MessageHandler = std::function<void(const Message& message)>;
public:
    virtual ~SignalingBus() = default;

    // Never blocks and never fails, the message is dropped silently
    // if the channel is unavailable.
    virtual void Publish(const Message& message) = 0;
    virtual SubscriptionId Subscribe(MessageHandler handler) = 0;
    // A handler removed before a delivery never sees the message.
    virtual void Unsubscribe(SubscriptionId id) = 0;
};

// ScopedSubscription unsubscribes on destruction.
class PAIRRTC_EXPORT ScopedSubscription {
public:
    ScopedSubscription();
    ScopedSubscription(SignalingBus* bus, SubscriptionId id);
    ScopedSubscription(ScopedSubscription&& other);
    ScopedSubscription& operator=(ScopedSubscription&& other);
    ~ScopedSubscription();

    bool active() const { return bus_ != nullptr; }
    SubscriptionId id() const { return id_; }

    void Reset();

private:
    SignalingBus* bus_;
    SubscriptionId id_;
};

} // namespace signaling
} // namespace pairrtc

#endif
