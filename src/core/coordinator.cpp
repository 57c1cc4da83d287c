#include "session_runtime.hpp"
#include "sdet/errors.hpp"
#include "sdet/logger.hpp"
#include <sstream>

namespace sdet {
using detail::Session;

StageFactory StageFactory::defaults() {
    return StageFactory{make_capture_source, make_dnn_detector, make_ffmpeg_sink};
}

namespace {
constexpr auto kRefresh = std::chrono::milliseconds(250);

void publish_stats(Session& s) {
    s.board->set_fps(s.metrics.fps());
    s.board->set_queue_depth({s.raw.size(), s.detected.size(), s.annotated.size()});
    s.board->set_latency(s.metrics.summary());
}

void log_stats(const Session& s) {
    SessionState st = s.board->snapshot();
    std::ostringstream lat;
    for (auto& l : st.latency) lat << " " << l.stage << "=" << static_cast<int>(l.recent_ms + 0.5) << "ms";
    Logger::info("[session] %s fps=%.1f processed=%llu dropped=%llu queues=%zu/%zu/%zu%s", phase_name(st.phase),
                 st.fps, static_cast<unsigned long long>(st.frames_processed),
                 static_cast<unsigned long long>(st.frames_dropped), st.queue_depth[0], st.queue_depth[1],
                 st.queue_depth[2], lat.str().c_str());
}

void run_stage(std::shared_ptr<Session> s, int stage) {
    static void (*const bodies[kStageCount])(Session&) = {detail::run_source, detail::run_detect,
                                                          detail::run_annotate, detail::run_sink};
    try {
        bodies[stage](*s);
    } catch (const std::exception& e) {
        s->report_fault(stage, std::string("unexpected error: ") + e.what());
    }
    s->done[stage].store(true);
    s->board->stage_exited();
    s->notify();
}

bool wait_stages(Session& s, Clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(s.mu);
    return s.cv.wait_until(lk, deadline, [&] { return s.all_done(); });
}

// Bounded in total by the grace period: stages that are still inside an
// external call when it runs out are detached and their results discarded.
void teardown(Session& s, bool graceful) {
    const auto t0 = Clock::now();
    const auto grace = std::chrono::milliseconds(s.cfg.stop_grace_ms);
    bool drained = false;
    if (graceful) {
        s.stop.request();
        drained = wait_stages(s, t0 + grace * 4 / 5);
    }
    if (!drained) {
        s.stop.request();
        s.abort.request();
        size_t n = s.raw.abandon() + s.detected.abandon() + s.annotated.abandon();
        if (n) s.board->dropped(n);
        s.sink->abort();
        wait_stages(s, t0 + grace);
    }
    bool detect_joined = false;
    for (int i = 0; i < kStageCount; ++i) {
        if (!s.threads[i].joinable()) continue;
        if (s.done[i].load()) {
            s.threads[i].join();
            detect_joined |= (i == kDetect);
        } else {
            Logger::warn("[session] %s stage did not stop within %d ms, abandoning it", stage_name(i),
                         s.cfg.stop_grace_ms);
            s.threads[i].detach();
        }
    }
    if (detect_joined) s.detector->unload();
    publish_stats(s);
    if (!s.cfg.metrics_csv.empty() && !s.metrics.dump_csv(s.cfg.metrics_csv))
        Logger::warn("[session] cannot write %s", s.cfg.metrics_csv.c_str());
}

void supervise(std::shared_ptr<Session> s) {
    const auto interval = std::chrono::milliseconds(s->cfg.stats_interval_ms);
    auto next_log = Clock::now() + interval;
    bool graceful = true;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(s->mu);
            s->cv.wait_for(lk, kRefresh, [&] { return s->stop_requested || s->failed || s->all_done(); });
            if (s->stop_requested || s->failed || s->all_done()) {
                graceful = !s->failed;
                break;
            }
        }
        publish_stats(*s);
        if (Clock::now() >= next_log) {
            log_stats(*s);
            next_log += interval;
        }
    }
    teardown(*s, graceful);
    log_stats(*s);
}
}

Coordinator::Coordinator(StageFactory factory)
    : factory_(std::move(factory)), board_(std::make_shared<StateBoard>()) {}

Coordinator::~Coordinator() {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (session_) stop_locked();
}

std::shared_ptr<StateBoard> Coordinator::board() const {
    std::lock_guard<std::mutex> lk(board_mu_);
    return board_;
}

SessionState Coordinator::status() const { return board()->snapshot(); }

void Coordinator::start(const SessionConfig& cfg) {
    cfg.validate();
    std::lock_guard<std::mutex> lk(control_mu_);
    if (session_) {
        Phase p = board()->phase();
        if (p == Phase::Starting || p == Phase::Running || p == Phase::Stopping)
            throw SessionAlreadyActive(std::string("a session is already ") + phase_name(p));
        reap_locked();
    }

    auto board = std::make_shared<StateBoard>();
    board->reset(Phase::Starting);
    board->begin(std::chrono::system_clock::now());
    {
        std::lock_guard<std::mutex> blk(board_mu_);
        board_ = board;
    }
    Logger::info("[session] starting %s -> %s", cfg.input_url.c_str(), cfg.output_url.c_str());

    auto s = std::make_shared<Session>(cfg, board);
    try {
        s->detector = factory_.detector(s->cfg);
        s->detector->load(s->cfg.weights);
        s->source = factory_.source(s->cfg);
        s->sink = factory_.sink(s->cfg);
    } catch (const std::exception& e) {
        board->fail(e.what());
        Logger::error("[session] start failed: %s", e.what());
        throw;
    }

    for (int i = 0; i < kStageCount; ++i) {
        board->stage_started();
        s->threads[i] = std::thread(run_stage, s, i);
    }
    supervisor_ = std::thread(supervise, s);
    session_ = std::move(s);
}

void Coordinator::stop() {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (!session_) throw NoActiveSession("no session to stop");
    stop_locked();
}

void Coordinator::stop_locked() {
    auto board = session_->board;
    if (board->begin_stop()) {
        Logger::info("[session] stopping");
        {
            std::lock_guard<std::mutex> slk(session_->mu);
            session_->stop_requested = true;
        }
        session_->cv.notify_all();
        reap_locked();
        board->set_phase(Phase::Stopped);
        Logger::info("[session] stopped");
    } else {
        reap_locked();
    }
}

void Coordinator::reap_locked() {
    if (supervisor_.joinable()) supervisor_.join();
    session_.reset();
}
}
