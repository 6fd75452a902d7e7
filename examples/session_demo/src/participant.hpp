#ifndef _SESSION_DEMO_PARTICIPANT_H_
#define _SESSION_DEMO_PARTICIPANT_H_

#include <session/session.hpp>
#include <signaling/signaling_hub.hpp>
#include <testing/simulated_peer_transport.hpp>
#include <testing/simulated_media.hpp>
#include <testing/simulated_analysis_service.hpp>

#include <memory>
#include <string>

// Participant runs a session with simulated media and transport on its own task queue.
class Participant {
public:
    Participant(std::string name, 
                pairrtc::signaling::SignalingHub* hub,
                const pairrtc::SessionConfiguration& config);
    ~Participant();

    const std::string& name() const { return name_; }
    pairrtc::Session* session() const;
    // Blocks until the tasks posted before it have run.
    pairrtc::NegotiationStateMachine::State negotiation_state() const;

private:
    struct Parts;
    // Destroys the parts on their own task queue.
    void Release();

private:
    const std::string name_;
    std::unique_ptr<pairrtc::TaskQueue> task_queue_;
    std::unique_ptr<Parts> parts_;
};

#endif
