// One configuration of the scrubber: enabled flag, patterns and the hooks
// and methods it intercepts. States chain through parent for nested scopes.
#pragma once
#include "HookRegistry.hpp"
#include "PatternSet.hpp"

#include <memory>
#include <string>

namespace logscrubber {

class ScrubberState {
public:
    ScrubberState(bool enabled, HookHost& host, const HookRegistry::RedactFn& redact);

    // Copy of every field except the parent link.
    std::unique_ptr<ScrubberState> clone() const;

    bool enabled() const { return enabled_; }
    // Flip the flag and (un)install every tracked hook and method. Both keep
    // going past individual failures and report them in err.
    bool start(std::string& err);
    bool stop(std::string& err);

    PatternSet& patterns() { return patterns_; }
    const PatternSet& patterns() const { return patterns_; }
    HookRegistry& hooks() { return hooks_; }
    const HookRegistry& hooks() const { return hooks_; }
    HookRegistry& methods() { return methods_; }
    const HookRegistry& methods() const { return methods_; }

    const ScrubberState* parent() const { return parent_.get(); }
    ScrubberState* parent() { return parent_.get(); }
    void setParent(std::unique_ptr<ScrubberState> parent) { parent_ = std::move(parent); }
    std::unique_ptr<ScrubberState> takeParent() { return std::move(parent_); }
    std::size_t depth() const;

private:
    ScrubberState(const ScrubberState& other);
    ScrubberState& operator=(const ScrubberState&) = delete;

    bool enabled_;
    PatternSet patterns_;
    HookRegistry hooks_;
    HookRegistry methods_;
    std::unique_ptr<ScrubberState> parent_;
};

} // namespace logscrubber
