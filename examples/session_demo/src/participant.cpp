#include "participant.hpp"

#include <plog/Log.h>

#include <future>

using namespace pairrtc;

struct Participant::Parts {
    Parts(signaling::SignalingHub* hub, 
          const SessionConfiguration& config, 
          TaskQueue* task_queue) 
        : bus(hub->Join(config.channel_name, task_queue)),
          transport_factory(task_queue),
          media_devices(task_queue),
          analysis_service(task_queue) {
        Session::Dependencies dependencies;
        dependencies.signaling_bus = bus.get();
        dependencies.transport_factory = &transport_factory;
        dependencies.media_devices = &media_devices;
        dependencies.media_surface = &surface;
        dependencies.frame_source = &surface;
        dependencies.analysis_service = &analysis_service;
        session = std::make_unique<Session>(config, dependencies, task_queue);
    }

    std::unique_ptr<signaling::LocalSignalingBus> bus;
    SimulatedPeerTransportFactory transport_factory;
    SimulatedMediaDevices media_devices;
    SimulatedMediaSurface surface;
    SimulatedAnalysisService analysis_service;
    // Destroyed first.
    std::unique_ptr<Session> session;
};

Participant::Participant(std::string name, 
                         signaling::SignalingHub* hub,
                         const SessionConfiguration& config) 
    : name_(std::move(name)),
      task_queue_(std::make_unique<TaskQueue>(name_ + ".queue")),
      parts_(std::make_unique<Parts>(hub, config, task_queue_.get())) {}

Participant::~Participant() {
    Release();
}

Session* Participant::session() const {
    return parts_ ? parts_->session.get() : nullptr;
}

NegotiationStateMachine::State Participant::negotiation_state() const {
    std::promise<NegotiationStateMachine::State> state;
    task_queue_->Post([this, &state](){
        state.set_value(parts_->session->negotiation_state());
    });
    return state.get_future().get();
}

// Private methods
void Participant::Release() {
    if (!parts_) {
        return;
    }
    std::promise<void> released;
    task_queue_->Post([this, &released](){
        parts_.reset();
        released.set_value();
    });
    released.get_future().wait();
    PLOG_VERBOSE << name_ << " released.";
}
