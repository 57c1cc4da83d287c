#include "sdet/control.hpp"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <sstream>

namespace sdet::control {
namespace {
YAML::Node ok(const char* status) {
    YAML::Node n;
    n["status"] = status;
    return n;
}

std::string iso8601(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
}

YAML::Node error_response(const Error& e) {
    YAML::Node n;
    n["status"] = "error";
    n["error"] = e.kind();
    n["message"] = e.what();
    return n;
}

YAML::Node start(Coordinator& c, const SessionConfig& cfg) {
    try {
        c.start(cfg);
        return ok("started");
    } catch (const Error& e) {
        return error_response(e);
    }
}

YAML::Node start(Coordinator& c, const YAML::Node& cfg) {
    try {
        return start(c, SessionConfig::from_yaml(cfg));
    } catch (const Error& e) {
        return error_response(e);
    }
}

YAML::Node stop(Coordinator& c) {
    try {
        c.stop();
        return ok("stopped");
    } catch (const Error& e) {
        return error_response(e);
    }
}

YAML::Node status(const Coordinator& c) { return to_yaml(c.status()); }

YAML::Node to_yaml(const SessionState& s) {
    YAML::Node n;
    n["phase"] = phase_name(s.phase);
    if (s.started_at != std::chrono::system_clock::time_point{}) {
        n["started_at"] = iso8601(s.started_at);
        n["uptime_s"] = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() -
                                                                         s.started_at).count();
    }
    n["frames_processed"] = s.frames_processed;
    n["frames_dropped"] = s.frames_dropped;
    n["fps"] = s.fps;
    n["last_error"] = s.last_error;
    n["active_stages"] = s.active_stages;
    YAML::Node q;
    q.SetStyle(YAML::EmitterStyle::Flow);
    for (size_t d : s.queue_depth) q.push_back(d);
    n["queue_depth"] = q;
    YAML::Node lat;
    for (auto& l : s.latency) {
        YAML::Node e;
        e["count"] = l.count;
        e["last_ms"] = l.last_ms;
        e["mean_ms"] = l.mean_ms;
        e["max_ms"] = l.max_ms;
        lat[l.stage] = e;
    }
    if (lat.size()) n["latency"] = lat;
    return n;
}

YAML::Node handle_line(Coordinator& c, const std::string& line, bool& quit) {
    std::istringstream in(line);
    std::string cmd, arg;
    in >> cmd >> arg;
    quit = false;
    if (cmd == "start") {
        if (arg.empty()) return error_response(InvalidConfig("usage: start <config.yaml>"));
        try {
            return start(c, SessionConfig::load(arg));
        } catch (const Error& e) {
            return error_response(e);
        }
    }
    if (cmd == "stop") return stop(c);
    if (cmd == "status") return status(c);
    if (cmd == "quit" || cmd == "exit") {
        quit = true;
        return ok("bye");
    }
    YAML::Node n;
    n["status"] = "error";
    n["error"] = "UnknownCommand";
    n["message"] = "expected start|stop|status|quit, got '" + cmd + "'";
    return n;
}

std::string emit(const YAML::Node& n) {
    YAML::Emitter out;
    out << YAML::Flow << n;
    return out.c_str();
}

LineReader::Result LineReader::next(std::string& line, int timeout_ms) {
    while (true) {
        auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return Result::Line;
        }
        if (eof_) {
            if (pending_.empty()) return Result::Eof;
            line.swap(pending_);
            pending_.clear();
            return Result::Line;
        }
        pollfd pfd{fd_, POLLIN, 0};
        int r = ::poll(&pfd, 1, timeout_ms);
        if (r == 0 || (r < 0 && errno == EINTR)) return Result::Timeout;
        if (r < 0) {
            eof_ = true;
            continue;
        }
        char buf[4096];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) pending_.append(buf, static_cast<size_t>(n));
        else if (n == 0 || (errno != EINTR && errno != EAGAIN)) eof_ = true;
    }
}
}
