#include "sdet/sink.hpp"
#include "sdet/errors.hpp"
#include "sdet/logger.hpp"
#include "sdet/session.hpp"
#include <opencv2/imgproc.hpp>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace sdet {
namespace {
// An exec failure or a rejected argument list shows up within this window.
constexpr auto kSpawnProbe = std::chrono::milliseconds(200);
constexpr auto kExitWait = std::chrono::seconds(2);

std::once_flag g_sigpipe_once;

bool starts_with(const std::string& s, const char* p) { return s.rfind(p, 0) == 0; }
}

std::string container_for(const std::string& url) {
    if (starts_with(url, "rtmp://") || starts_with(url, "rtmps://")) return "flv";
    if (starts_with(url, "rtsp://")) return "rtsp";
    if (starts_with(url, "udp://") || starts_with(url, "srt://") || starts_with(url, "tcp://")) return "mpegts";
    return "";
}

FfmpegSink::FfmpegSink(const SessionConfig& cfg)
    : ffmpeg_(cfg.ffmpeg), bitrate_(cfg.bitrate), timeout_ms_(cfg.publish_timeout_ms) {}

FfmpegSink::~FfmpegSink() { close(); }

std::vector<std::string> FfmpegSink::command(const std::string& endpoint, int fps, cv::Size res) const {
    std::vector<std::string> cmd{
        ffmpeg_, "-hide_banner", "-loglevel", "error", "-y",
        "-f", "rawvideo", "-vcodec", "rawvideo", "-pixel_format", "bgr24",
        "-video_size", std::to_string(res.width) + "x" + std::to_string(res.height),
        "-framerate", std::to_string(fps),
        "-use_wallclock_as_timestamps", "1",
        "-i", "-",
        "-c:v", "libx264", "-pix_fmt", "yuv420p", "-preset", "ultrafast", "-tune", "zerolatency",
        "-g", std::to_string(fps * 2),
        "-b:v", bitrate_, "-maxrate", bitrate_, "-bufsize", bitrate_};
    std::string fmt = container_for(endpoint);
    if (!fmt.empty()) {
        cmd.push_back("-f");
        cmd.push_back(fmt);
    }
    cmd.push_back(endpoint);
    return cmd;
}

void FfmpegSink::open(const std::string& endpoint, int fps, cv::Size res) {
    std::call_once(g_sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });
    close();
    size_ = res;

    std::vector<std::string> cmd = command(endpoint, fps, res);
    std::vector<char*> argv;
    for (auto& a : cmd) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) throw ConnectionError(std::string("pipe: ") + std::strerror(errno));
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw ConnectionError(std::string("fork: ") + std::strerror(err));
    }
    if (pid == 0) {
        ::dup2(fds[0], STDIN_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) ::dup2(devnull, STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }
    ::close(fds[0]);
    fd_ = fds[1];
    ::fcntl(fd_, F_SETFL, ::fcntl(fd_, F_GETFL) | O_NONBLOCK);
    {
        std::lock_guard<std::mutex> lk(pid_mu_);
        pid_ = pid;
    }

    std::this_thread::sleep_for(kSpawnProbe);
    int status = 0;
    if (child_exited(status)) {
        ::close(fd_);
        fd_ = -1;
        throw ConnectionError(ffmpeg_ + " exited during startup (status " + std::to_string(status) +
                              ") for " + endpoint);
    }
    Logger::info("[sink] publishing to %s (%dx%d @ %d, %s)", endpoint.c_str(), res.width, res.height, fps,
                 bitrate_.c_str());
}

bool FfmpegSink::child_exited(int& status) {
    std::lock_guard<std::mutex> lk(pid_mu_);
    if (pid_ <= 0) return true;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return false;
    pid_ = -1;
    if (r > 0) status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return true;
}

void FfmpegSink::publish(const Frame& f) {
    if (fd_ < 0) throw ConnectionError("sink is not open");
    int status = 0;
    if (child_exited(status)) throw ConnectionError("encoder exited (status " + std::to_string(status) + ")");

    cv::Mat img = f.bgr;
    if (img.empty() || img.type() != CV_8UC3) throw EncodeError("sink only takes 8-bit BGR frames");
    if (img.size() != size_) cv::resize(f.bgr, img, size_);
    if (!img.isContinuous()) img = img.clone();
    write_all(img.data, img.total() * img.elemSize());
}

void FfmpegSink::write_all(const uint8_t* p, size_t n) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + milliseconds(timeout_ms_);
    while (n > 0) {
        ssize_t w = ::write(fd_, p, n);
        if (w > 0) {
            p += w;
            n -= static_cast<size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            throw ConnectionError(std::string("encoder pipe: ") + std::strerror(errno));

        auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (left <= 0) throw PublishTimeout("relay did not accept frame within " + std::to_string(timeout_ms_) + " ms");
        pollfd pfd{fd_, POLLOUT, 0};
        int r = ::poll(&pfd, 1, static_cast<int>(left));
        if (r < 0 && errno != EINTR) throw ConnectionError(std::string("poll: ") + std::strerror(errno));
        if (r > 0 && (pfd.revents & (POLLERR | POLLHUP))) throw ConnectionError("encoder closed its input");
    }
}

void FfmpegSink::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    int status = 0;
    const auto until = std::chrono::steady_clock::now() + kExitWait;
    while (!child_exited(status) && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    // kill and reap under one lock so abort() never signals a recycled pid
    std::lock_guard<std::mutex> lk(pid_mu_);
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        ::waitpid(pid_, &status, 0);
        pid_ = -1;
    }
}

void FfmpegSink::abort() noexcept {
    std::lock_guard<std::mutex> lk(pid_mu_);
    if (pid_ > 0) ::kill(pid_, SIGKILL);
}

std::unique_ptr<FrameSink> make_ffmpeg_sink(const SessionConfig& cfg) {
    return std::make_unique<FfmpegSink>(cfg);
}
}
