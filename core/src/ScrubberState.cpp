#include "logscrubber/ScrubberState.hpp"

namespace logscrubber {

ScrubberState::ScrubberState(bool enabled, HookHost& host,
                             const HookRegistry::RedactFn& redact)
    : enabled_(enabled),
      hooks_(HookRegistry::Kind::Hook, host, redact),
      methods_(HookRegistry::Kind::Method, host, redact) {}

ScrubberState::ScrubberState(const ScrubberState& other)
    : enabled_(other.enabled_),
      patterns_(other.patterns_),
      hooks_(other.hooks_),
      methods_(other.methods_) {}

std::unique_ptr<ScrubberState> ScrubberState::clone() const {
    return std::unique_ptr<ScrubberState>(new ScrubberState(*this));
}

bool ScrubberState::start(std::string& err) {
    enabled_ = true;
    std::string hookErr, methodErr;
    const bool hooksOk = hooks_.enableAll(hookErr);
    const bool methodsOk = methods_.enableAll(methodErr);
    err = hookErr;
    if (!methodErr.empty())
        err += (err.empty() ? "" : "\n") + methodErr;
    return hooksOk && methodsOk;
}

bool ScrubberState::stop(std::string& err) {
    enabled_ = false;
    std::string hookErr, methodErr;
    const bool hooksOk = hooks_.disableAll(hookErr);
    const bool methodsOk = methods_.disableAll(methodErr);
    err = hookErr;
    if (!methodErr.empty())
        err += (err.empty() ? "" : "\n") + methodErr;
    return hooksOk && methodsOk;
}

std::size_t ScrubberState::depth() const {
    std::size_t n = 0;
    for (const ScrubberState* p = parent_.get(); p; p = p->parent_.get())
        ++n;
    return n;
}

} // namespace logscrubber
