#include "sdet/session.hpp"
#include "sdet/errors.hpp"
#include <filesystem>

namespace sdet {
namespace {
template <typename T>
void read(const YAML::Node& n, const char* key, T& out) {
    if (n[key]) out = n[key].as<T>();
}

void require(const YAML::Node& n, const char* key) {
    if (!n[key]) throw InvalidConfig(std::string("missing key: ") + key);
}

void read_policy(const YAML::Node& n, const char* key, DropPolicy& out) {
    if (!n[key]) return;
    std::string s = n[key].as<std::string>();
    if (!parse_drop_policy(s, out)) throw InvalidConfig(std::string(key) + ": expected newest|oldest, got " + s);
}
}

SessionConfig SessionConfig::from_yaml(const YAML::Node& node) {
    if (!node || !node.IsMap()) throw InvalidConfig("session config must be a mapping");
    SessionConfig c;
    try {
        for (const char* k : {"input_url", "output_url", "weights", "fps", "width", "height"}) require(node, k);
        read(node, "input_url", c.input_url);
        read(node, "output_url", c.output_url);
        read(node, "weights", c.weights);
        read(node, "fps", c.fps);
        read(node, "width", c.width);
        read(node, "height", c.height);
        read(node, "conf_threshold", c.conf_threshold);
        read(node, "iou_threshold", c.iou_threshold);
        read(node, "bitrate", c.bitrate);
        read(node, "labels", c.labels);
        read(node, "model_input_size", c.model_input_size);
        read(node, "dnn_backend", c.dnn_backend);
        read(node, "queue_capacity", c.queue_capacity);
        read(node, "max_latency_ms", c.max_latency_ms);
        read(node, "stop_grace_ms", c.stop_grace_ms);
        read(node, "open_timeout_ms", c.open_timeout_ms);
        read(node, "read_timeout_ms", c.read_timeout_ms);
        read(node, "publish_timeout_ms", c.publish_timeout_ms);
        read(node, "decode_retries", c.decode_retries);
        if (const YAML::Node r = node["reconnect"]) {
            read(r, "attempts", c.reconnect.max_attempts);
            int ms = 0;
            if (r["initial_ms"]) { read(r, "initial_ms", ms); c.reconnect.initial = Millis(ms); }
            if (r["max_ms"]) { read(r, "max_ms", ms); c.reconnect.cap = Millis(ms); }
        }
        read_policy(node, "source_drop", c.source_drop);
        read_policy(node, "stage_drop", c.stage_drop);
        read(node, "overlay_metrics", c.overlay_metrics);
        read(node, "stats_interval_ms", c.stats_interval_ms);
        read(node, "metrics_csv", c.metrics_csv);
        read(node, "ffmpeg", c.ffmpeg);
    } catch (const YAML::Exception& e) {
        throw InvalidConfig(std::string("bad session config: ") + e.what());
    }
    return c;
}

SessionConfig SessionConfig::load(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw InvalidConfig("cannot read " + path + ": " + e.what());
    }
    return from_yaml(root);
}

void SessionConfig::validate() const {
    auto fail = [](const std::string& m) { throw InvalidConfig(m); };
    if (input_url.empty()) fail("input_url is empty");
    if (output_url.empty()) fail("output_url is empty");
    if (weights.empty()) fail("weights is empty");
    if (fps <= 0) fail("fps must be positive");
    if (width <= 0 || height <= 0) fail("width and height must be positive");
    if (!(conf_threshold >= 0.f && conf_threshold <= 1.f)) fail("conf_threshold must be within [0,1]");
    if (!(iou_threshold >= 0.f && iou_threshold <= 1.f)) fail("iou_threshold must be within [0,1]");
    if (model_input_size <= 0 || model_input_size % 32) fail("model_input_size must be a positive multiple of 32");
    if (dnn_backend != "cpu" && dnn_backend != "opencl" && dnn_backend != "cuda")
        fail("dnn_backend must be cpu, opencl or cuda");
    if (queue_capacity <= 0) fail("queue_capacity must be positive");
    if (max_latency_ms <= 0) fail("max_latency_ms must be positive");
    if (stop_grace_ms < 0 || open_timeout_ms < 0 || read_timeout_ms < 0 || publish_timeout_ms <= 0)
        fail("timeouts must not be negative");
    if (decode_retries < 0) fail("decode_retries must not be negative");
    if (reconnect.max_attempts < 0 || reconnect.initial.count() < 0 || reconnect.cap < reconnect.initial)
        fail("reconnect: attempts >= 0 and 0 <= initial_ms <= max_ms");
    if (stats_interval_ms <= 0) fail("stats_interval_ms must be positive");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(weights, ec)) fail("weights not found: " + weights);
    if (!labels.empty() && !std::filesystem::is_regular_file(labels, ec)) fail("labels not found: " + labels);
}

YAML::Node SessionConfig::to_yaml() const {
    YAML::Node n;
    n["input_url"] = input_url;
    n["output_url"] = output_url;
    n["weights"] = weights;
    n["fps"] = fps;
    n["width"] = width;
    n["height"] = height;
    n["conf_threshold"] = conf_threshold;
    n["iou_threshold"] = iou_threshold;
    n["bitrate"] = bitrate;
    n["queue_capacity"] = queue_capacity;
    n["source_drop"] = drop_policy_name(source_drop);
    n["stage_drop"] = drop_policy_name(stage_drop);
    return n;
}

const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Idle: return "idle";
        case Phase::Starting: return "starting";
        case Phase::Running: return "running";
        case Phase::Stopping: return "stopping";
        case Phase::Stopped: return "stopped";
        case Phase::Failed: return "failed";
    }
    return "?";
}

const char* stage_name(int stage) {
    static const char* names[kStageCount] = {"source", "detect", "annotate", "sink"};
    return stage >= 0 && stage < kStageCount ? names[stage] : "?";
}

SessionState StateBoard::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return s_;
}

Phase StateBoard::phase() const {
    std::lock_guard<std::mutex> lk(mu_);
    return s_.phase;
}

void StateBoard::reset(Phase p) {
    std::lock_guard<std::mutex> lk(mu_);
    s_ = SessionState{};
    s_.phase = p;
    source_up_ = sink_up_ = false;
}

void StateBoard::set_phase(Phase p) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.phase = p;
}

void StateBoard::begin(std::chrono::system_clock::time_point t) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.started_at = t;
}

bool StateBoard::fail(const std::string& why) {
    std::lock_guard<std::mutex> lk(mu_);
    if (s_.phase != Phase::Starting && s_.phase != Phase::Running) return false;
    s_.phase = Phase::Failed;
    s_.last_error = why;
    return true;
}

bool StateBoard::begin_stop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (s_.phase != Phase::Starting && s_.phase != Phase::Running) return false;
    s_.phase = Phase::Stopping;
    return true;
}

void StateBoard::set_error(const std::string& why) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.last_error = why;
}

void StateBoard::stage_connected(int stage) {
    std::lock_guard<std::mutex> lk(mu_);
    if (stage == kSource) source_up_ = true;
    if (stage == kSink) sink_up_ = true;
    if (s_.phase == Phase::Starting && source_up_ && sink_up_) s_.phase = Phase::Running;
}

void StateBoard::stage_started() {
    std::lock_guard<std::mutex> lk(mu_);
    ++s_.active_stages;
}

void StateBoard::stage_exited() {
    std::lock_guard<std::mutex> lk(mu_);
    --s_.active_stages;
}

void StateBoard::processed(uint64_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.frames_processed += n;
}

void StateBoard::dropped(uint64_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.frames_dropped += n;
}

void StateBoard::set_fps(double fps) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.fps = fps;
}

void StateBoard::set_queue_depth(const std::array<size_t, 3>& d) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.queue_depth = d;
}

void StateBoard::set_latency(std::vector<StageLatency> l) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.latency = std::move(l);
}
}
