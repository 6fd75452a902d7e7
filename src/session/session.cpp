#include "session/session.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace pairrtc {

Session::Session(const SessionConfiguration& config, 
                 Dependencies dependencies, 
                 TaskQueue* task_queue) 
    : task_queue_(task_queue),
      role_authority_(std::bind(&Session::OnRoleChanged, this, std::placeholders::_1, std::placeholders::_2)),
      tracker_(std::bind(&Session::OnStatus, this, std::placeholders::_1)) {
    if (!task_queue_) {
        throw std::invalid_argument("Session requires a task queue.");
    }
    if (config.analysis_frame_count <= 0) {
        throw std::invalid_argument("Analysis frame count must be positive.");
    }
    Clock* clock = dependencies.clock;
    if (!clock) {
        real_time_clock_ = Clock::GetRealTimeClock();
        clock = real_time_clock_.get();
    }

    NegotiationStateMachine::Dependencies negotiation_dependencies;
    negotiation_dependencies.signaling_bus = dependencies.signaling_bus;
    negotiation_dependencies.transport_factory = dependencies.transport_factory;
    negotiation_dependencies.media_devices = dependencies.media_devices;
    negotiation_dependencies.media_surface = dependencies.media_surface;
    negotiation_ = std::make_unique<NegotiationStateMachine>(config, negotiation_dependencies, task_queue_, this);

    AnalysisCoordinator::Configuration analysis_config;
    analysis_config.frame_count = static_cast<size_t>(config.analysis_frame_count);
    analysis_config.frame_interval = config.analysis_frame_interval;
    analysis_coordinator_ = std::make_unique<AnalysisCoordinator>(analysis_config,
                                                                  dependencies.frame_source,
                                                                  dependencies.analysis_service,
                                                                  clock,
                                                                  task_queue_,
                                                                  std::bind(&Session::OnAnalysisCompleted, this, std::placeholders::_1, std::placeholders::_2),
                                                                  std::bind(&Session::ReportError, this, std::placeholders::_1));
    PLOG_VERBOSE << "Session created on channel: " << config.channel_name;
}

Session::~Session() {
    analysis_coordinator_.reset();
    negotiation_.reset();
    PLOG_VERBOSE << __FUNCTION__;
}

void Session::StartAsInitiator() {
    task_queue_->Post(ToQueuedTask(task_safety_, [this](){
        role_authority_.StartAsInitiator();
    }));
}

void Session::JoinAsResponder() {
    task_queue_->Post(ToQueuedTask(task_safety_, [this](){
        role_authority_.JoinAsResponder();
    }));
}

void Session::EndSession() {
    task_queue_->Post(ToQueuedTask(task_safety_, [this](){
        role_authority_.EndSession();
    }));
}

void Session::RequestAnalysis() {
    task_queue_->Post(ToQueuedTask(task_safety_, [this](){
        analysis_coordinator_->RequestAnalysis(tracker_.status());
    }));
}

void Session::OnStatusChanged(StatusCallback callback) {
    task_queue_->Post(ToQueuedTask(task_safety_, [this, callback=std::move(callback)](){
        status_callback_ = callback;
    }));
}

void Session::OnError(ErrorCallback callback) {
    task_queue_->Post(ToQueuedTask(task_safety_, [this, callback=std::move(callback)](){
        error_callback_ = callback;
    }));
}

void Session::OnAnalysisResult(AnalysisResultCallback callback) {
    task_queue_->Post(ToQueuedTask(task_safety_, [this, callback=std::move(callback)](){
        analysis_result_callback_ = callback;
    }));
}

Role Session::role() const {
    RTC_RUN_ON(task_queue_);
    return role_authority_.role();
}

const SessionStatus& Session::status() const {
    RTC_RUN_ON(task_queue_);
    return tracker_.status();
}

NegotiationStateMachine::State Session::negotiation_state() const {
    RTC_RUN_ON(task_queue_);
    return negotiation_->state();
}

const std::vector<AnalysisResult>& Session::analysis_history() const {
    RTC_RUN_ON(task_queue_);
    return analysis_coordinator_->history();
}

// Private methods
void Session::OnRoleChanged(Role old_role, Role new_role) {
    tracker_.OnRoleChanged(new_role);
    negotiation_->OnRoleChanged(new_role);
}

void Session::OnStatus(const SessionStatus& status) {
    if (status_callback_) {
        status_callback_(status);
    }
}

void Session::OnAnalysisCompleted(const AnalysisResult& latest, const std::vector<AnalysisResult>& history) {
    if (analysis_result_callback_) {
        analysis_result_callback_(latest, history);
    }
}

void Session::ReportError(const SessionError& error) {
    PLOG_WARNING << "Session error: " << error;
    if (error_callback_) {
        error_callback_(error);
    }
}

void Session::OnNegotiationStateChanged(NegotiationStateMachine::State state) {
    if (state == NegotiationStateMachine::State::CLOSED) {
        tracker_.OnNegotiationClosed();
    }
}

void Session::OnLocalOfferPublished() {
    tracker_.OnLocalOfferPublished();
}

void Session::OnTransportStateChanged(PeerTransport::State state) {
    tracker_.OnTransportStateChanged(state);
}

void Session::OnRemoteStreamArrived() {
    tracker_.OnRemoteStreamArrived();
}

void Session::OnSessionError(const SessionError& error) {
    ReportError(error);
    if (error.kind == SessionError::Kind::LOCAL_MEDIA_DENIED) {
        // Equivalent to ending the session.
        role_authority_.EndSession();
    }
}

} // namespace pairrtc
