#pragma once
#include "bounded_queue.hpp"
#include "metrics.hpp"
#include "retry.hpp"
#include <yaml-cpp/yaml.h>
#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace sdet {

struct SessionConfig {
    std::string input_url;
    std::string output_url;
    std::string weights;
    int fps = 0;
    int width = 0;
    int height = 0;
    float conf_threshold = 0.25f;
    float iou_threshold = 0.45f;

    std::string bitrate = "2000k";
    std::string labels;               // newline separated class names, empty = built-in
    int model_input_size = 640;
    std::string dnn_backend = "cpu";  // cpu | opencl | cuda
    int queue_capacity = 4;
    int max_latency_ms = 1000;
    int stop_grace_ms = 3000;
    int open_timeout_ms = 5000;
    int read_timeout_ms = 5000;
    int publish_timeout_ms = 2000;
    int decode_retries = 3;
    Backoff reconnect;
    DropPolicy source_drop = DropPolicy::DropNewest;
    DropPolicy stage_drop = DropPolicy::DropOldest;
    bool overlay_metrics = true;
    int stats_interval_ms = 5000;
    std::string metrics_csv;
    std::string ffmpeg = "ffmpeg";

    // Both throw InvalidConfig; neither validates, call validate() afterwards.
    static SessionConfig from_yaml(const YAML::Node& node);
    static SessionConfig load(const std::string& path);

    void validate() const;
    YAML::Node to_yaml() const;
};

enum class Phase { Idle, Starting, Running, Stopping, Stopped, Failed };
const char* phase_name(Phase p);

enum Stage { kSource = 0, kDetect, kAnnotate, kSink, kStageCount };
const char* stage_name(int stage);

struct SessionState {
    Phase phase = Phase::Idle;
    std::chrono::system_clock::time_point started_at{};
    uint64_t frames_processed = 0;
    uint64_t frames_dropped = 0;
    std::string last_error;
    double fps = 0;
    int active_stages = 0;
    std::array<size_t, 3> queue_depth{};   // source->detect, detect->annotate, annotate->sink
    std::vector<StageLatency> latency;
};

// The only writable copy of SessionState. Every writer goes through one of the
// narrow operations below; readers get a copy.
class StateBoard {
public:
    SessionState snapshot() const;
    Phase phase() const;

    void reset(Phase p);
    void set_phase(Phase p);
    void begin(std::chrono::system_clock::time_point t);
    // Moves to Failed unless the session is already past Running. False if ignored.
    bool fail(const std::string& why);
    void set_error(const std::string& why);
    // Starting/Running -> Stopping. False (and no change) from any other phase.
    bool begin_stop();
    // Starting -> Running once every endpoint stage has connected.
    void stage_connected(int stage);
    void stage_started();
    void stage_exited();

    void processed(uint64_t n = 1);
    void dropped(uint64_t n = 1);

    void set_fps(double fps);
    void set_queue_depth(const std::array<size_t, 3>& d);
    void set_latency(std::vector<StageLatency> l);

private:
    mutable std::mutex mu_;
    SessionState s_;
    bool source_up_ = false;
    bool sink_up_ = false;
};
}
