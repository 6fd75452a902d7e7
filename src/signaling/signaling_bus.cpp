#include "signaling/signaling_bus.hpp"

namespace pairrtc {
namespace signaling {

ScopedSubscription::ScopedSubscription() 
    : bus_(nullptr), 
      id_(0) {}

ScopedSubscription::ScopedSubscription(SignalingBus* bus, SubscriptionId id) 
    : bus_(bus), 
      id_(id) {}

ScopedSubscription::ScopedSubscription(ScopedSubscription&& other) 
    : bus_(other.bus_),
      id_(other.id_) {
    other.bus_ = nullptr;
}

ScopedSubscription& ScopedSubscription::operator=(ScopedSubscription&& other) {
    if (this != &other) {
        // Release the current one before taking over.
        Reset();
        bus_ = other.bus_;
        id_ = other.id_;
        other.bus_ = nullptr;
    }
    return *this;
}

ScopedSubscription::~ScopedSubscription() {
    Reset();
}

void ScopedSubscription::Reset() {
    if (bus_) {
        bus_->Unsubscribe(id_);
        bus_ = nullptr;
    }
}

} // namespace signaling
} // namespace pairrtc
