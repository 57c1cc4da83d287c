#pragma once
#include "detector.hpp"
#include "session.hpp"
#include "sink.hpp"
#include "source.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace sdet {
// How a session obtains its stage handles. Defaults build the OpenCV capture,
// the cv::dnn OBB detector and the ffmpeg publisher.
struct StageFactory {
    std::function<std::unique_ptr<FrameSource>(const SessionConfig&)> source;
    std::function<std::unique_ptr<Detector>(const SessionConfig&)> detector;
    std::function<std::unique_ptr<FrameSink>(const SessionConfig&)> sink;

    static StageFactory defaults();
};

namespace detail { struct Session; }

// Owns at most one processing session and its lifecycle:
// Idle -> Starting -> Running -> Stopping -> Stopped, or Failed.
class Coordinator {
public:
    explicit Coordinator(StageFactory factory = StageFactory::defaults());
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Validates, loads the model and launches the stages; returns without
    // waiting for the endpoints to connect. Throws InvalidConfig (state
    // untouched), SessionAlreadyActive, or ModelLoadError (state Failed).
    void start(const SessionConfig& cfg);

    // Drains within the grace period and releases every stage. Throws
    // NoActiveSession when there is nothing to stop. On a Failed session it
    // only reaps the teardown and the phase stays Failed.
    void stop();

    // Copy of the current session state.
    SessionState status() const;

private:
    void stop_locked();
    void reap_locked();
    std::shared_ptr<StateBoard> board() const;

    StageFactory factory_;
    std::mutex control_mu_;
    mutable std::mutex board_mu_;
    std::shared_ptr<StateBoard> board_;
    std::shared_ptr<detail::Session> session_;
    std::thread supervisor_;
};
}
