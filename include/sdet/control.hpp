#pragma once
#include "coordinator.hpp"
#include "errors.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

// Request/response mapping for the external control layer. Responses are
// YAML maps: {status: started|stopped|error, ...}.
namespace sdet::control {
YAML::Node start(Coordinator& c, const SessionConfig& cfg);
YAML::Node start(Coordinator& c, const YAML::Node& cfg);
YAML::Node stop(Coordinator& c);
YAML::Node status(const Coordinator& c);

YAML::Node to_yaml(const SessionState& s);
YAML::Node error_response(const Error& e);

// Line protocol of the daemon: "start <config.yaml>", "stop", "status", "quit".
YAML::Node handle_line(Coordinator& c, const std::string& line, bool& quit);

// Single-line flow-style rendering.
std::string emit(const YAML::Node& n);

// Splits a file descriptor into command lines. Reads the fd directly so that
// several commands arriving in one write are all returned.
class LineReader {
public:
    enum class Result { Line, Timeout, Eof };

    explicit LineReader(int fd) : fd_(fd) {}
    // Waits up to timeout_ms for a complete line. A trailing line without a
    // newline is returned at end of input.
    Result next(std::string& line, int timeout_ms);

private:
    int fd_;
    std::string pending_;
    bool eof_ = false;
};
}
