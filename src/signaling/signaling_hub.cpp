#include "signaling/signaling_hub.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace pairrtc {
namespace signaling {

// SignalingHub
SignalingHub::SignalingHub() = default;

SignalingHub::~SignalingHub() {
    std::lock_guard lock(mutex_);
    for (const auto& [channel_name, endpoints] : channels_) {
        if (!endpoints.empty()) {
            PLOG_WARNING << "Signaling hub destroyed with " << endpoints.size() 
                         << " endpoint(s) on channel: " << channel_name;
        }
    }
}

std::unique_ptr<LocalSignalingBus> SignalingHub::Join(const std::string& channel_name, TaskQueue* task_queue) {
    if (!task_queue) {
        throw std::invalid_argument("Joining a signaling channel without task queue.");
    }
    auto endpoint = std::unique_ptr<LocalSignalingBus>(new LocalSignalingBus(this, channel_name, task_queue));
    std::lock_guard lock(mutex_);
    channels_[channel_name].push_back(endpoint.get());
    PLOG_DEBUG << "Joined signaling channel: " << channel_name 
               << ", endpoints: " << channels_[channel_name].size();
    return endpoint;
}

size_t SignalingHub::endpoint_count(const std::string& channel_name) const {
    std::lock_guard lock(mutex_);
    auto it = channels_.find(channel_name);
    return it != channels_.end() ? it->second.size() : 0;
}

void SignalingHub::Broadcast(const std::string& channel_name, const std::string& text) {
    std::lock_guard lock(mutex_);
    auto it = channels_.find(channel_name);
    if (it == channels_.end()) {
        return;
    }
    for (auto* endpoint : it->second) {
        endpoint->Deliver(text);
    }
}

void SignalingHub::Leave(const std::string& channel_name, LocalSignalingBus* endpoint) {
    std::lock_guard lock(mutex_);
    auto it = channels_.find(channel_name);
    if (it == channels_.end()) {
        return;
    }
    auto& endpoints = it->second;
    endpoints.erase(std::remove(endpoints.begin(), endpoints.end(), endpoint), endpoints.end());
    if (endpoints.empty()) {
        channels_.erase(it);
    }
    PLOG_DEBUG << "Left signaling channel: " << channel_name;
}

// LocalSignalingBus
LocalSignalingBus::LocalSignalingBus(SignalingHub* hub, std::string channel_name, TaskQueue* task_queue) 
    : hub_(hub),
      channel_name_(std::move(channel_name)),
      task_queue_(task_queue) {}

LocalSignalingBus::~LocalSignalingBus() {
    Close();
}

bool LocalSignalingBus::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

void LocalSignalingBus::Publish(const Message& message) {
    if (closed()) {
        PLOG_WARNING << "Signaling channel " << channel_name_ 
                     << " is unavailable, dropped message: " << message.kind;
        return;
    }
    PLOG_VERBOSE << "Publishing " << message.kind << " from " << message.sender_role;
    hub_->Broadcast(channel_name_, message.Serialize());
}

void LocalSignalingBus::PublishText(const std::string& text) {
    if (closed()) {
        PLOG_WARNING << "Signaling channel " << channel_name_ << " is unavailable, dropped text.";
        return;
    }
    hub_->Broadcast(channel_name_, text);
}

SubscriptionId LocalSignalingBus::Subscribe(MessageHandler handler) {
    std::lock_guard lock(mutex_);
    SubscriptionId id = next_subscription_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void LocalSignalingBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    handlers_.erase(id);
}

void LocalSignalingBus::Close() {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    hub_->Leave(channel_name_, this);
}

// Private methods
void LocalSignalingBus::Deliver(std::string text) {
    task_queue_->Post(ToQueuedTask(task_safety_, [this, text=std::move(text)](){
        Dispatch(text);
    }));
}

void LocalSignalingBus::Dispatch(const std::string& text) {
    Message message;
    try {
        message = Message::Deserialize(text);
    } catch (const std::invalid_argument& exp) {
        PLOG_WARNING << "Dropped undecodable signaling message: " << exp.what();
        return;
    }

    std::vector<SubscriptionId> ids;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, handler] : handlers_) {
            ids.push_back(id);
        }
    }

    for (auto id : ids) {
        MessageHandler handler;
        {
            std::lock_guard lock(mutex_);
            auto it = handlers_.find(id);
            // Unsubscribed by a previous handler.
            if (it == handlers_.end()) {
                continue;
            }
            handler = it->second;
        }
        handler(message);
    }
}

} // namespace signaling
} // namespace pairrtc
