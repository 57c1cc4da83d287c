#pragma once
#include "frame.hpp"
#include <opencv2/core.hpp>
#include <sys/types.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sdet {
struct SessionConfig;

class FrameSink {
public:
    virtual ~FrameSink() = default;
    // Throws ConnectionError when the encoder/relay cannot be reached.
    virtual void open(const std::string& endpoint, int fps, cv::Size resolution) = 0;
    // Encodes and transmits one frame. Throws PublishTimeout when the relay does
    // not take the data in time, ConnectionError when the link is gone,
    // EncodeError for a frame it cannot encode.
    virtual void publish(const Frame& f) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    // Unblocks a publish() running on another thread. The owner still calls close().
    virtual void abort() noexcept {}
};

// Pipes raw BGR frames into an ffmpeg child that encodes H.264 and pushes
// to the relay.
class FfmpegSink : public FrameSink {
public:
    explicit FfmpegSink(const SessionConfig& cfg);
    ~FfmpegSink() override;

    void open(const std::string& endpoint, int fps, cv::Size resolution) override;
    void publish(const Frame& f) override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }
    void abort() noexcept override;

    std::vector<std::string> command(const std::string& endpoint, int fps, cv::Size resolution) const;

private:
    bool child_exited(int& status);
    void write_all(const uint8_t* p, size_t n);

    std::string ffmpeg_;
    std::string bitrate_;
    int timeout_ms_;
    cv::Size size_;
    int fd_ = -1;
    std::mutex pid_mu_;
    pid_t pid_ = -1;
};

// Muxer for an output URL: flv for rtmp, rtsp for rtsp, mpegts for udp/srt/tcp,
// empty to let ffmpeg pick from the file extension.
std::string container_for(const std::string& url);

std::unique_ptr<FrameSink> make_ffmpeg_sink(const SessionConfig& cfg);
}
