#include "sdet/source.hpp"
#include "sdet/errors.hpp"
#include "sdet/logger.hpp"
#include "sdet/preprocess.hpp"
#include "sdet/session.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace sdet {
CaptureSource::CaptureSource(const SessionConfig& cfg)
    : width_(cfg.width), height_(cfg.height),
      open_timeout_ms_(cfg.open_timeout_ms), read_timeout_ms_(cfg.read_timeout_ms),
      decode_retries_(cfg.decode_retries) {}

CaptureSource::~CaptureSource() { close(); }

void CaptureSource::open(const std::string& endpoint) {
    close();
    std::vector<int> params{cv::CAP_PROP_OPEN_TIMEOUT_MSEC, open_timeout_ms_,
                            cv::CAP_PROP_READ_TIMEOUT_MSEC, read_timeout_ms_};
    bool ok = false;
    try {
        ok = cap_.open(endpoint, cv::CAP_ANY, params);
    } catch (const cv::Exception& e) {
        throw ConnectionError("open " + endpoint + ": " + e.what());
    }
    if (!ok || !cap_.isOpened()) throw ConnectionError("cannot open " + endpoint);
    Logger::info("[source] connected %s (%s, %.0fx%.0f @ %.1f)", endpoint.c_str(),
                 cap_.getBackendName().c_str(), cap_.get(cv::CAP_PROP_FRAME_WIDTH),
                 cap_.get(cv::CAP_PROP_FRAME_HEIGHT), cap_.get(cv::CAP_PROP_FPS));
}

Frame CaptureSource::next_frame() {
    if (!cap_.isOpened()) throw StreamEnded("source is not open");
    int failures = 0;
    while (true) {
        cv::Mat img;
        try {
            // grab() fails on end of stream or lost connection, retrieve() on a bad packet
            if (!cap_.grab()) throw StreamEnded("stream closed");
            if (!cap_.retrieve(img) || img.empty()) throw DecodeError("corrupt frame");
        } catch (const DecodeError& e) {
            if (++failures > decode_retries_)
                throw StreamEnded("giving up after " + std::to_string(failures) + " undecodable frames");
            Logger::warn("[source] %s, retry %d/%d", e.what(), failures, decode_retries_);
            continue;
        } catch (const cv::Exception& e) {
            throw StreamEnded(std::string("capture: ") + e.what());
        }
        Frame f;
        f.captured = Clock::now();
        f.seq = ++next_seq_;
        if (img.channels() == 1) cv::cvtColor(img, f.bgr, cv::COLOR_GRAY2BGR);
        else if (img.channels() == 4) cv::cvtColor(img, f.bgr, cv::COLOR_BGRA2BGR);
        else f.bgr = img;
        resize_inplace(f, width_, height_);
        return f;
    }
}

void CaptureSource::close() {
    if (cap_.isOpened()) cap_.release();
}

std::unique_ptr<FrameSource> make_capture_source(const SessionConfig& cfg) {
    return std::make_unique<CaptureSource>(cfg);
}
}
