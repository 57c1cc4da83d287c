#include "sdet/control.hpp"
#include "sdet/coordinator.hpp"
#include "sdet/logger.hpp"
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <cstdio>
#include <iostream>
#include <string>

using namespace sdet;

namespace {
std::atomic<bool> g_running{true};

void on_signal(int) { g_running = false; }

void usage(const char* prog) {
    std::fprintf(stderr,
                 "usage: %s [--config session.yaml] [--log-level debug|info|warn|error]\n"
                 "stdin commands: start <config.yaml> | stop | status | quit\n",
                 prog);
}
}

int main(int argc, char** argv) {
    std::string config;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config = argv[++i];
        else if (a == "--log-level" && i + 1 < argc) {
            LogLevel lv;
            if (!Logger::parse_level(argv[++i], lv)) { usage(argv[0]); return 2; }
            Logger::set_level(lv);
        } else { usage(argv[0]); return a == "-h" || a == "--help" ? 0 : 2; }
    }

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);
    signal(SIGPIPE, SIG_IGN);

    Coordinator coordinator;
    if (!config.empty()) {
        bool quit = false;
        YAML::Node r = control::handle_line(coordinator, "start " + config, quit);
        std::cout << control::emit(r) << std::endl;
        if (r["status"].as<std::string>() != "started") return 1;
    }

    control::LineReader in(STDIN_FILENO);
    std::string line;
    bool quit = false;
    while (!quit && g_running) {
        auto r = in.next(line, 200);
        if (r == control::LineReader::Result::Eof) break;
        if (r == control::LineReader::Result::Timeout || line.empty()) continue;
        std::cout << control::emit(control::handle_line(coordinator, line, quit)) << std::endl;
    }

    // stdin closed: keep serving the session until a signal or its end
    auto active = [&] {
        Phase p = coordinator.status().phase;
        return p == Phase::Starting || p == Phase::Running;
    };
    while (!quit && g_running && active()) ::usleep(200 * 1000);

    Phase p = coordinator.status().phase;
    if (p == Phase::Starting || p == Phase::Running) {
        Logger::info("shutting down");
        std::cout << control::emit(control::stop(coordinator)) << std::endl;
    }
    return coordinator.status().phase == Phase::Failed ? 1 : 0;
}
