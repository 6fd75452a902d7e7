// pairrtc
#include <base/init.hpp>

// boost
#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>

#include "participant.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace pairrtc;

namespace {

constexpr std::chrono::seconds kDemoTimeout{10};

} // namespace

int main(int argc, const char* argv[]) {

    SessionConfiguration config;
    if (argc > 1) {
        try {
            config = SessionConfiguration::FromFile(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration: " << e.what() << std::endl;
            return 1;
        }
    }
    
    pairrtc::Init(config.log_level);

    boost::asio::io_context ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard(ioc.get_executor());

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        ioc.stop();
        PLOG_VERBOSE << "main ioc exit";
    });

    boost::asio::steady_timer deadline(ioc, kDemoTimeout);
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        PLOG_WARNING << "Demo timed out.";
        ioc.stop();
    });

    PLOG_VERBOSE << "main start.";

    {
        std::atomic<bool> analysis_requested(false);
        signaling::SignalingHub hub;
        Participant alice("alice", &hub, config);
        Participant bob("bob", &hub, config);

        alice.session()->OnStatusChanged([&](const SessionStatus& status){
            PLOG_INFO << alice.name() << ": " << status;
            if (status.link_status == LinkStatus::CONFIRMED_CONNECTED && !analysis_requested.exchange(true)) {
                alice.session()->RequestAnalysis();
            }
        });
        alice.session()->OnError([&](const SessionError& error){
            PLOG_WARNING << alice.name() << ": " << error.message;
        });
        alice.session()->OnAnalysisResult([&](const AnalysisResult& latest, const std::vector<AnalysisResult>& history){
            PLOG_INFO << alice.name() << " analysis #" << history.size() << " [" << latest.threat_level << "] " << latest.summary;
            boost::asio::post(ioc, [&](){
                ioc.stop();
            });
        });
        bob.session()->OnStatusChanged([&](const SessionStatus& status){
            PLOG_INFO << bob.name() << ": " << status;
        });
        bob.session()->OnError([&](const SessionError& error){
            PLOG_WARNING << bob.name() << ": " << error.message;
        });

        // The offer is dropped if nobody listens on the channel yet.
        bob.session()->JoinAsResponder();
        if (bob.negotiation_state() != NegotiationStateMachine::State::AWAITING_OFFER) {
            PLOG_ERROR << bob.name() << " is not awaiting the offer, state: " << bob.negotiation_state();
            ioc.stop();
        } else {
            alice.session()->StartAsInitiator();
        }

        ioc.run();

        alice.session()->EndSession();
        bob.session()->EndSession();
    }

    pairrtc::Cleanup();

    PLOG_VERBOSE << "main exit.";

    return 0;
}
