#ifndef _SESSION_SESSION_H_
#define _SESSION_SESSION_H_

#include "base/defines.hpp"
#include "analysis/analysis_coordinator.hpp"
#include "analysis/frame_analysis_service.hpp"
#include "session/connection_lifecycle_tracker.hpp"
#include "session/negotiation_state_machine.hpp"
#include "session/role_authority.hpp"
#include "session/session_configuration.hpp"
#include "session/session_error.hpp"
#include "session/session_status.hpp"
#include "signaling/signaling_bus.hpp"
#include "rtc/base/time/clock.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace pairrtc {

// Session is one participant of a two-party session. All the entry points
// are thread-safe and posted onto `task_queue`, on which the callbacks are
// invoked. The signaling bus MUST deliver on the same task queue.
class PAIRRTC_EXPORT Session final : public NegotiationStateMachine::Observer {
public:
    struct Dependencies {
        signaling::SignalingBus* signaling_bus = nullptr;
        PeerTransportFactory* transport_factory = nullptr;
        MediaDevices* media_devices = nullptr;
        MediaSurface* media_surface = nullptr;
        FrameSource* frame_source = nullptr;
        FrameAnalysisService* analysis_service = nullptr;
        // The real-time clock is used if not set.
        Clock* clock = nullptr;
    };

    using StatusCallback = std::function<void(const SessionStatus& status)>;
    using ErrorCallback = std::function<void(const SessionError& error)>;
    using AnalysisResultCallback = AnalysisCoordinator::ResultCallback;
public:
    Session(const SessionConfiguration& config, 
            Dependencies dependencies, 
            TaskQueue* task_queue);
    // MUST be destroyed on `task_queue` or after it stopped.
    ~Session() override;

    void StartAsInitiator();
    void JoinAsResponder();
    void EndSession();
    void RequestAnalysis();

    void OnStatusChanged(StatusCallback callback);
    void OnError(ErrorCallback callback);
    void OnAnalysisResult(AnalysisResultCallback callback);

    // The accessors below MUST be called on `task_queue`.
    Role role() const;
    const SessionStatus& status() const;
    NegotiationStateMachine::State negotiation_state() const;
    const std::vector<AnalysisResult>& analysis_history() const;

private:
    void OnRoleChanged(Role old_role, Role new_role);
    void OnStatus(const SessionStatus& status);
    void OnAnalysisCompleted(const AnalysisResult& latest, const std::vector<AnalysisResult>& history);
    void ReportError(const SessionError& error);

    // NegotiationStateMachine::Observer
    void OnNegotiationStateChanged(NegotiationStateMachine::State state) override;
    void OnLocalOfferPublished() override;
    void OnTransportStateChanged(PeerTransport::State state) override;
    void OnRemoteStreamArrived() override;
    void OnSessionError(const SessionError& error) override;

private:
    DISALLOW_COPY_AND_ASSIGN(Session);
    TaskQueue* const task_queue_;
    std::unique_ptr<Clock> real_time_clock_ = nullptr;

    StatusCallback status_callback_ = nullptr;
    ErrorCallback error_callback_ = nullptr;
    AnalysisResultCallback analysis_result_callback_ = nullptr;

    RoleAuthority role_authority_;
    ConnectionLifecycleTracker tracker_;
    std::unique_ptr<NegotiationStateMachine> negotiation_;
    std::unique_ptr<AnalysisCoordinator> analysis_coordinator_;

    ScopedTaskSafety task_safety_;
};

} // namespace pairrtc

#endif
