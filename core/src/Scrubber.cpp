#include "logscrubber/Scrubber.hpp"
#include "logscrubber/Diagnostics.hpp"
#include "logscrubber/Redactor.hpp"
#include "logscrubber/RuntimeConfig.hpp"

#include <utility>

namespace logscrubber {

ScrubberConfig ScrubberConfig::defaults() {
    ScrubberConfig cfg;
    cfg.hooks = {"WARN", "DIE"};
    cfg.sources = {"warnings"};
    return cfg;
}

struct Scrubber::Context {
    const Scrubber* owner = nullptr;
    // Patterns in force when the owner went away.
    PatternSet last;
};

Scrubber::Scrubber(HookHost& host, bool enabled)
    : host_(host),
      context_(std::make_shared<Context>()),
      live_(std::make_unique<ScrubberState>(enabled, host, redactFn())) {
    context_->owner = this;
}

Scrubber::~Scrubber() {
    std::string err;
    if (!live_->stop(err))
        trace("could not restore every handler on shutdown: %s", err.c_str());
    // Wrappers kept alive by someone else's handler chain redact with the
    // final pattern set from now on.
    context_->last = live_->patterns();
    context_->owner = nullptr;
}

Scrubber& Scrubber::instance() {
    static Scrubber* scrubber = [] {
        // Diagnostics must be constructed first so it outlives the scrubber.
        HookHost& host = Diagnostics::instance();
        static Scrubber s(host, !startDisabled());
        std::string err;
        if (!s.configure(ScrubberConfig::defaults(), err))
            host.report("LogScrubber default configuration incomplete: " + err);
        return &s;
    }();
    return *scrubber;
}

HookRegistry::RedactFn Scrubber::redactFn() const {
    // Wrappers always consult the live state, whichever scope is current.
    std::shared_ptr<const Context> context = context_;
    return [context](std::vector<Value> values) {
        if (context->owner)
            return context->owner->redact(std::move(values));
        return Redactor(context->last).redact(std::move(values));
    };
}

bool Scrubber::initialize(std::string& err) {
    std::string stopErr;
    const bool stopped = live_->stop(stopErr);
    const bool started = live_->start(err);
    if (!stopErr.empty())
        err = stopErr + (err.empty() ? "" : "\n") + err;
    return stopped && started;
}

bool Scrubber::initialize(const PatternEntries& patterns, std::string& err) {
    PatternSet compiled;
    if (!PatternSet::compile(patterns, compiled, err))
        return false;
    std::string stopErr;
    const bool stopped = live_->stop(stopErr);
    live_->patterns() = std::move(compiled);
    const bool started = live_->start(err);
    if (!stopErr.empty())
        err = stopErr + (err.empty() ? "" : "\n") + err;
    return stopped && started;
}

std::vector<Value> Scrubber::redact(std::vector<Value> values) const {
    return Redactor(live_->patterns()).redact(std::move(values));
}

Value Scrubber::redactValue(const Value& value) const {
    return Redactor(live_->patterns()).redactValue(value);
}

std::string Scrubber::redactText(const std::string& text) const {
    return live_->patterns().apply(text);
}

bool Scrubber::addPattern(const PatternEntries& patterns, std::string& err) {
    return live_->patterns().merge(patterns, err);
}

std::size_t Scrubber::removePattern(const std::vector<std::string>& patterns) {
    return live_->patterns().remove(patterns);
}

bool Scrubber::addHook(const std::vector<std::string>& ids, std::string& err) {
    return live_->hooks().add(ids, live_->enabled(), err);
}

bool Scrubber::removeHook(const std::vector<std::string>& ids, std::string& err) {
    return live_->hooks().remove(ids, err);
}

bool Scrubber::addMethod(const std::vector<std::string>& ids, std::string& err) {
    return live_->methods().add(ids, live_->enabled(), err);
}

bool Scrubber::removeMethod(const std::vector<std::string>& ids, std::string& err) {
    return live_->methods().remove(ids, err);
}

bool Scrubber::methodsOf(const std::vector<std::string>& sources,
                         std::vector<std::string>& out, std::string& err) const {
    bool ok = true;
    for (const auto& name : sources) {
        const auto members = host_.sourceMethods(name);
        if (members.empty()) {
            if (!err.empty())
                err += '\n';
            err += "source " + name + " does not exist";
            ok = false;
            continue;
        }
        out.insert(out.end(), members.begin(), members.end());
    }
    return ok;
}

bool Scrubber::addSource(const std::vector<std::string>& names, std::string& err) {
    std::vector<std::string> ids;
    std::string lookupErr;
    const bool found = methodsOf(names, ids, lookupErr);
    const bool added = addMethod(ids, err);
    if (!lookupErr.empty())
        err = lookupErr + (err.empty() ? "" : "\n") + err;
    return found && added;
}

bool Scrubber::removeSource(const std::vector<std::string>& names, std::string& err) {
    std::vector<std::string> ids;
    std::string lookupErr;
    const bool found = methodsOf(names, ids, lookupErr);
    const bool removed = removeMethod(ids, err);
    if (!lookupErr.empty())
        err = lookupErr + (err.empty() ? "" : "\n") + err;
    return found && removed;
}

bool Scrubber::configure(const ScrubberConfig& config, std::string& err) {
    if (config.enable && config.disable) {
        err = "LogScrubber cannot be enabled and disabled in the same request";
        return false;
    }
    PatternSet compiled;
    if (!PatternSet::compile(config.patterns, compiled, err))
        return false;

    bool ok = true;
    auto collect = [&err, &ok](bool stepOk, const std::string& stepErr) {
        if (stepOk)
            return;
        ok = false;
        if (!err.empty())
            err += '\n';
        err += stepErr;
    };

    std::string stepErr;
    if (config.disable) {
        collect(live_->stop(stepErr), stepErr);
        stepErr.clear();
    }
    live_->patterns().merge(compiled);

    collect(addHook(config.hooks, stepErr), stepErr);
    stepErr.clear();
    collect(addMethod(config.methods, stepErr), stepErr);
    stepErr.clear();
    const std::vector<std::string> sources = config.all ? host_.sources() : config.sources;
    if (!sources.empty()) {
        collect(addSource(sources, stepErr), stepErr);
        stepErr.clear();
    }

    if (config.enable)
        collect(live_->start(stepErr), stepErr);
    return ok;
}

void Scrubber::pushScope() {
    auto next = live_->clone();
    next->setParent(std::move(live_));
    live_ = std::move(next);
    trace("entered scope %zu", live_->depth());
}

bool Scrubber::pushScope(bool enabled, std::string& err) {
    pushScope();
    return enabled ? live_->start(err) : live_->stop(err);
}

bool Scrubber::popScope(std::string& err) {
    if (!live_->parent()) {
        err = "no saved scrubber state to restore";
        return false;
    }
    std::string stopErr;
    const bool stopped = live_->stop(stopErr);

    // Continue with a copy so later changes cannot alter the saved state.
    std::unique_ptr<ScrubberState> saved = live_->takeParent();
    std::unique_ptr<ScrubberState> restored = saved->clone();
    restored->setParent(saved->takeParent());
    live_ = std::move(restored);
    trace("left scope, depth now %zu", live_->depth());

    bool started = true;
    if (live_->enabled())
        started = live_->start(err);
    if (!stopErr.empty())
        err = stopErr + (err.empty() ? "" : "\n") + err;
    return stopped && started;
}

bool Scrubber::withScope(const std::function<void(Scrubber&)>& fn, std::string& err) {
    ScopedScrubber scope(*this);
    fn(*this);
    return scope.release(err);
}

ScopedScrubber::ScopedScrubber(Scrubber& scrubber) : scrubber_(scrubber) {
    scrubber_.pushScope();
}

ScopedScrubber::~ScopedScrubber() {
    if (!active_)
        return;
    std::string err;
    if (!release(err))
        trace("scope exit: %s", err.c_str());
}

bool ScopedScrubber::release(std::string& err) {
    if (!active_)
        return true;
    active_ = false;
    return scrubber_.popScope(err);
}

} // namespace logscrubber
