// Entry points of the scrubber. Owns the live ScrubberState and the chain
// of saved states used by scoped reconfiguration.
#pragma once
#include "HookPoint.hpp"
#include "PatternSet.hpp"
#include "ScrubberState.hpp"
#include "Value.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace logscrubber {

// Import-style configuration request.
struct ScrubberConfig {
    bool enable = false;
    bool disable = false;
    bool all = false;  // every source the host knows
    std::vector<std::string> hooks;
    std::vector<std::string> methods;
    std::vector<std::string> sources;
    PatternEntries patterns;

    // WARN and DIE hooks plus the "warnings" source.
    static ScrubberConfig defaults();
};

class Scrubber {
public:
    explicit Scrubber(HookHost& host, bool enabled = true);
    ~Scrubber();

    Scrubber(const Scrubber&) = delete;
    Scrubber& operator=(const Scrubber&) = delete;

    // Process-wide scrubber bound to Diagnostics::instance(), configured
    // with ScrubberConfig::defaults() on first use.
    static Scrubber& instance();

    // Stops, then starts again with the current patterns. Reinstalls
    // wrappers that someone else displaced.
    bool initialize(std::string& err);
    // Stops, replaces the pattern set, then starts.
    bool initialize(const PatternEntries& patterns, std::string& err);

    std::vector<Value> redact(std::vector<Value> values) const;
    Value redactValue(const Value& value) const;
    std::string redactText(const std::string& text) const;

    bool isEnabled() const { return live_->enabled(); }
    bool enable(std::string& err) { return live_->start(err); }
    bool disable(std::string& err) { return live_->stop(err); }

    bool addPattern(const PatternEntries& patterns, std::string& err);
    std::size_t removePattern(const std::vector<std::string>& patterns);
    const PatternSet& patterns() const { return live_->patterns(); }

    bool addHook(const std::vector<std::string>& ids, std::string& err);
    bool removeHook(const std::vector<std::string>& ids, std::string& err);
    bool addMethod(const std::vector<std::string>& ids, std::string& err);
    bool removeMethod(const std::vector<std::string>& ids, std::string& err);
    bool addSource(const std::vector<std::string>& names, std::string& err);
    bool removeSource(const std::vector<std::string>& names, std::string& err);

    // Applies a configuration request. Asking to enable and disable at once
    // is rejected before anything changes, as are patterns that fail to
    // compile. Unknown hooks or methods fail individually.
    bool configure(const ScrubberConfig& config, std::string& err);

    // Saves the live state and continues with a copy of it.
    void pushScope();
    bool pushScope(bool enabled, std::string& err);
    // Drops the live state and continues with a copy of the saved one.
    bool popScope(std::string& err);
    std::size_t scopeDepth() const { return live_->depth(); }

    // Runs fn inside a scope; the previous state is restored on every exit
    // path. Returns false if restoring reported a problem.
    bool withScope(const std::function<void(Scrubber&)>& fn, std::string& err);

    const ScrubberState& state() const { return *live_; }
    HookHost& host() { return host_; }

private:
    // Shared with every wrapper this scrubber installs. Outlives the
    // scrubber when a wrapper is still reachable after destruction.
    struct Context;

    HookRegistry::RedactFn redactFn() const;
    bool methodsOf(const std::vector<std::string>& sources,
                   std::vector<std::string>& out, std::string& err) const;

    HookHost& host_;
    std::shared_ptr<Context> context_;
    std::unique_ptr<ScrubberState> live_;
};

// Pushes a scope on construction and pops it on destruction.
class ScopedScrubber {
public:
    explicit ScopedScrubber(Scrubber& scrubber);
    ~ScopedScrubber();

    ScopedScrubber(const ScopedScrubber&) = delete;
    ScopedScrubber& operator=(const ScopedScrubber&) = delete;

    // Pops early; the destructor then does nothing.
    bool release(std::string& err);

private:
    Scrubber& scrubber_;
    bool active_ = true;
};

} // namespace logscrubber
