#pragma once
#include "frame.hpp"
#include <opencv2/videoio.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace sdet {
struct SessionConfig;

class FrameSource {
public:
    virtual ~FrameSource() = default;
    // Throws ConnectionError when the endpoint cannot be reached in time.
    virtual void open(const std::string& endpoint) = 0;
    // Blocks for the next decoded frame. Throws StreamEnded on close or after
    // too many consecutive decode failures.
    virtual Frame next_frame() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// cv::VideoCapture client of an rtmp/rtsp/http relay (or a local file).
class CaptureSource : public FrameSource {
public:
    explicit CaptureSource(const SessionConfig& cfg);
    ~CaptureSource() override;

    void open(const std::string& endpoint) override;
    Frame next_frame() override;
    void close() override;
    bool is_open() const override { return cap_.isOpened(); }

private:
    cv::VideoCapture cap_;
    int width_, height_;
    int open_timeout_ms_, read_timeout_ms_;
    int decode_retries_;
    uint64_t next_seq_ = 0;
};

std::unique_ptr<FrameSource> make_capture_source(const SessionConfig& cfg);
}
