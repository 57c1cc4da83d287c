#include "sdet/retry.hpp"
#include <algorithm>
#include <cmath>

namespace sdet {
Millis Backoff::delay(int attempt) const {
    if (attempt < 1) attempt = 1;
    double ms = initial.count() * std::pow(factor, attempt - 1);
    ms = std::min(ms, static_cast<double>(cap.count()));
    return Millis(static_cast<Millis::rep>(ms));
}

const char* link_state_name(LinkState s) {
    switch (s) {
        case LinkState::Connecting: return "connecting";
        case LinkState::Active: return "active";
        case LinkState::Retrying: return "retrying";
        case LinkState::Failed: return "failed";
    }
    return "?";
}

void Link::connected() {
    if (state_ == LinkState::Failed) return;
    state_ = LinkState::Active;
    attempts_ = 0;
}

Millis Link::fault() {
    if (state_ == LinkState::Failed) return Millis(0);
    if (attempts_ >= backoff_.max_attempts) {
        state_ = LinkState::Failed;
        return Millis(0);
    }
    ++attempts_;
    state_ = LinkState::Retrying;
    return backoff_.delay(attempts_);
}
}
