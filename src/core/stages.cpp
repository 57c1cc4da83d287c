#include "session_runtime.hpp"
#include "sdet/annotator.hpp"
#include "sdet/errors.hpp"
#include "sdet/logger.hpp"
#include "sdet/tracer.hpp"

namespace sdet::detail {
namespace {
double age_ms(const Frame& f) {
    return std::chrono::duration<double, std::milli>(Clock::now() - f.captured).count();
}

// Counts the fault against the link budget and sleeps the backoff. False when
// the stage should exit: budget spent (session fault reported) or stop requested.
bool backoff(Session& s, Link& link, int stage, const std::string& what) {
    Millis d = link.fault();
    if (link.state() == LinkState::Failed) {
        Logger::error("[%s] %s; giving up after %d reconnect attempts", stage_name(stage), what.c_str(),
                      link.backoff().max_attempts);
        s.report_fault(stage, "gave up after " + std::to_string(link.backoff().max_attempts) +
                                  " reconnect attempts: " + what);
        return false;
    }
    Logger::warn("[%s] %s; reconnect %d/%d in %lld ms", stage_name(stage), what.c_str(), link.attempts(),
                 link.backoff().max_attempts, static_cast<long long>(d.count()));
    return s.stop.sleep_for(d);
}
}

void Session::report_fault(int stage, const std::string& what) {
    std::string msg = std::string(stage_name(stage)) + ": " + what;
    if (board->fail(msg)) {
        Logger::error("[session] failed, %s", msg.c_str());
        {
            std::lock_guard<std::mutex> lk(mu);
            failed = true;
        }
        cv.notify_all();
    } else {
        board->set_error(msg);
    }
}

void run_source(Session& s) {
    Link link(s.cfg.reconnect);
    while (!s.stop.requested()) {
        if (!s.source->is_open()) {
            try {
                s.source->open(s.cfg.input_url);
                s.board->stage_connected(kSource);
            } catch (const ConnectionError& e) {
                if (!backoff(s, link, kSource, e.what())) break;
                continue;
            }
        }
        Frame f;
        try {
            SDET_TRACE_STAGE(s.metrics, "source");
            f = s.source->next_frame();
        } catch (const StreamEnded& e) {
            s.source->close();
            if (!backoff(s, link, kSource, e.what())) break;
            continue;
        } catch (const ConnectionError& e) {
            s.source->close();
            if (!backoff(s, link, kSource, e.what())) break;
            continue;
        }
        // a relay that accepts and then hangs up must not refill the budget
        if (link.state() != LinkState::Active) link.connected();
        if (s.stop.requested()) break;
        s.push(s.raw, std::move(f));
    }
    s.source->close();
    s.raw.close();
}

void run_detect(Session& s) {
    const double budget = s.cfg.max_latency_ms;
    while (!s.abort.requested()) {
        auto item = s.raw.pop_for(kQueuePoll);
        if (!item) {
            if (s.raw.closed_and_empty()) break;
            continue;
        }
        // would arrive too late even if inference runs at its recent pace; the
        // newest frame is always inferred so the estimate keeps moving
        double expected = age_ms(*item) + s.metrics.get("detect").recent_ms;
        if (expected > budget && s.raw.size() > 0) {
            s.board->dropped();
            Logger::debug("[detect] frame %llu stale (%.0f ms > %.0f ms)", static_cast<unsigned long long>(item->seq),
                          expected, budget);
            continue;
        }
        DetectedFrame out{std::move(*item), {}};
        try {
            SDET_TRACE_STAGE(s.metrics, "detect");
            out.dets = s.detector->infer(out.frame, s.cfg.conf_threshold, s.cfg.iou_threshold);
        } catch (const InferenceError& e) {
            s.board->dropped();
            Logger::warn("[detect] %s", e.what());
            continue;
        }
        if (s.abort.requested()) break;
        s.push(s.detected, std::move(out));
    }
    s.detected.close();
}

void run_annotate(Session& s) {
    while (!s.abort.requested()) {
        auto item = s.detected.pop_for(kQueuePoll);
        if (!item) {
            if (s.detected.closed_and_empty()) break;
            continue;
        }
        Frame out;
        {
            SDET_TRACE_STAGE(s.metrics, "annotate");
            out = annotate(item->frame, item->dets);
            if (s.cfg.overlay_metrics)
                draw_hud(out.bgr, HudStats{s.metrics.fps(), s.metrics.get("e2e").recent_ms,
                                           s.metrics.get("detect").recent_ms});
        }
        s.push(s.annotated, std::move(out));
    }
    s.annotated.close();
}

void run_sink(Session& s) {
    Link link(s.cfg.reconnect);
    const cv::Size res(s.cfg.width, s.cfg.height);
    uint64_t last_seq = 0;
    while (!s.abort.requested()) {
        if (!s.sink->is_open()) {
            if (s.stop.requested()) break;
            try {
                s.sink->open(s.cfg.output_url, s.cfg.fps, res);
                s.board->stage_connected(kSink);
            } catch (const ConnectionError& e) {
                if (!backoff(s, link, kSink, e.what())) break;
                continue;
            }
        }
        auto item = s.annotated.pop_for(kQueuePoll);
        if (!item) {
            if (s.annotated.closed_and_empty()) break;
            continue;
        }
        if (item->seq <= last_seq) {
            s.board->dropped();
            Logger::warn("[sink] frame %llu after %llu, not published", static_cast<unsigned long long>(item->seq),
                         static_cast<unsigned long long>(last_seq));
            continue;
        }
        try {
            SDET_TRACE_STAGE(s.metrics, "publish");
            s.sink->publish(*item);
        } catch (const PublishTimeout& e) {
            s.board->dropped();
            s.sink->close();
            if (!backoff(s, link, kSink, e.what())) break;
            continue;
        } catch (const ConnectionError& e) {
            s.board->dropped();
            s.sink->close();
            if (!backoff(s, link, kSink, e.what())) break;
            continue;
        } catch (const EncodeError& e) {
            s.board->dropped();
            Logger::warn("[sink] frame %llu: %s", static_cast<unsigned long long>(item->seq), e.what());
            continue;
        }
        // the encoder only reaches the relay once data flows
        if (link.state() != LinkState::Active) link.connected();
        last_seq = item->seq;
        s.metrics.observe("e2e", age_ms(*item));
        s.metrics.tick();
        s.board->processed();
    }
    s.sink->close();
}
}
