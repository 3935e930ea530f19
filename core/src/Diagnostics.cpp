// Built-in emission points: WARN/DIE hooks and the warnings::, Carp:: and
// Syslog:: callables.
#include "logscrubber/Diagnostics.hpp"

#include <cstdio>
#include <cstdlib>
#include <set>
#include <unordered_set>

#include <syslog.h>

namespace logscrubber {

namespace {

void render(const Value& v, std::string& out, std::unordered_set<const void*>& open) {
    switch (v.kind()) {
    case Value::Kind::Null:
        return;
    case Value::Kind::Sequence: {
        if (!v.sequence() || !open.insert(v.identity()).second) {
            out += "...";
            return;
        }
        out += '[';
        bool first = true;
        for (const auto& item : *v.sequence()) {
            if (!first)
                out += ", ";
            first = false;
            render(item, out, open);
        }
        out += ']';
        open.erase(v.identity());
        return;
    }
    case Value::Kind::Mapping: {
        if (!v.mapping() || !open.insert(v.identity()).second) {
            out += "...";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& kv : *v.mapping()) {
            if (!first)
                out += ", ";
            first = false;
            out += kv.first;
            out += ": ";
            render(kv.second, out, open);
        }
        out += '}';
        open.erase(v.identity());
        return;
    }
    case Value::Kind::Opaque:
        out += "<object>";
        return;
    default:
        out += v.toText();
        return;
    }
}

int syslogPriority(const Value& v) {
    static const std::map<std::string, int> names = {
        {"emerg", LOG_EMERG},   {"alert", LOG_ALERT}, {"crit", LOG_CRIT},
        {"err", LOG_ERR},       {"error", LOG_ERR},   {"warning", LOG_WARNING},
        {"notice", LOG_NOTICE}, {"info", LOG_INFO},   {"debug", LOG_DEBUG},
    };
    if (v.kind() == Value::Kind::Integer)
        return static_cast<int>(v.integer());
    const std::string text = v.toText();
    auto it = names.find(text);
    if (it != names.end())
        return it->second;
    char* end = nullptr;
    const long n = std::strtol(text.c_str(), &end, 10);
    if (!text.empty() && end && *end == '\0')
        return static_cast<int>(n);
    return LOG_INFO;
}

std::string sourceOf(const std::string& id) {
    const auto pos = id.rfind("::");
    return pos == std::string::npos ? std::string() : id.substr(0, pos);
}

} // namespace

std::string joinArgs(const std::vector<Value>& args) {
    std::string out;
    std::unordered_set<const void*> open;
    for (const auto& a : args)
        render(a, out, open);
    return out;
}

// A handler slot: the live handler of one hook or callable.
class Diagnostics::SlotPoint : public HookPoint {
public:
    SlotPoint(Handler initial, std::function<void(const std::vector<Value>&)> fallback,
              bool fatal)
        : slot_(std::move(initial)), fallback_(std::move(fallback)), fatal_(fatal) {}

    Handler current() const override { return slot_; }
    void install(Handler handler) override { slot_ = std::move(handler); }
    void fallback(const std::vector<Value>& args) override {
        if (fallback_)
            fallback_(args);
    }
    bool fatal() const override { return fatal_; }

private:
    Handler slot_;
    std::function<void(const std::vector<Value>&)> fallback_;
    bool fatal_;
};

Diagnostics::Diagnostics() {
    hooks_["WARN"] = std::make_unique<SlotPoint>(
        nullptr, [this](const std::vector<Value>& args) { emitToSink(joinArgs(args)); },
        false);
    hooks_["DIE"] = std::make_unique<SlotPoint>(
        nullptr,
        [](const std::vector<Value>& args) { throw FatalError(joinArgs(args)); },
        true);
    defineBuiltins();
}

Diagnostics::~Diagnostics() = default;

Diagnostics& Diagnostics::instance() {
    static Diagnostics d;
    return d;
}

void Diagnostics::defineBuiltins() {
    auto warnFn = [this](const std::vector<Value>& args) { warn(args); };
    auto dieFn = [this](const std::vector<Value>& args) { die(args); };

    define("warnings::warn", warnFn);
    define("warnings::warnif", warnFn);
    define("Carp::carp", warnFn);
    define("Carp::cluck", warnFn);
    define("Carp::croak", dieFn);
    define("Carp::confess", dieFn);
    define("Syslog::syslog", [](const std::vector<Value>& args) {
        if (args.empty())
            return;
        const int priority = syslogPriority(args.front());
        const std::string message =
            joinArgs(std::vector<Value>(args.begin() + 1, args.end()));
        ::syslog(priority, "%s", message.c_str());
    });
}

HookPoint* Diagnostics::hook(const std::string& id) {
    auto it = hooks_.find(id);
    return it == hooks_.end() ? nullptr : it->second.get();
}

HookPoint* Diagnostics::method(const std::string& id) {
    auto it = methods_.find(id);
    return it == methods_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Diagnostics::sourceMethods(const std::string& source) const {
    std::vector<std::string> out;
    for (const auto& kv : methods_) {
        if (sourceOf(kv.first) == source)
            out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> Diagnostics::sources() const {
    std::set<std::string> names;
    for (const auto& kv : methods_)
        names.insert(sourceOf(kv.first));
    return {names.begin(), names.end()};
}

std::optional<std::string> Diagnostics::aliasOf(const std::string& id) const {
    if (id == "warnings::warnif")
        return std::string("warnings::warn");
    return std::nullopt;
}

void Diagnostics::report(const std::string& message) {
    // Straight to the WARN fallback: a report must never pass through a
    // wrapper that could report again.
    hooks_["WARN"]->fallback({Value(message)});
}

void Diagnostics::warn(const std::vector<Value>& args) {
    HookPoint* point = hooks_["WARN"].get();
    if (const Handler h = point->current())
        (*h)(args);
    else
        point->fallback(args);
}

void Diagnostics::die(const std::vector<Value>& args) {
    if (const Handler h = hooks_["DIE"]->current())
        (*h)(args);
    throw FatalError(joinArgs(args));
}

bool Diagnostics::call(const std::string& id, const std::vector<Value>& args,
                       std::string& err) {
    HookPoint* point = method(id);
    if (!point) {
        err = id + " does not exist";
        return false;
    }
    if (const Handler h = point->current())
        (*h)(args);
    return true;
}

void Diagnostics::define(const std::string& id, HandlerFn fn) {
    auto it = methods_.find(id);
    if (it != methods_.end()) {
        it->second->install(makeHandler(std::move(fn)));
        return;
    }
    methods_[id] = std::make_unique<SlotPoint>(makeHandler(std::move(fn)), nullptr, false);
}

bool Diagnostics::undefine(const std::string& id) {
    return methods_.erase(id) > 0;
}

void Diagnostics::registerHook(const std::string& id, std::unique_ptr<HookPoint> point) {
    hooks_[id] = std::move(point);
}

Handler Diagnostics::handler(const std::string& hookId) const {
    auto it = hooks_.find(hookId);
    return it == hooks_.end() ? nullptr : it->second->current();
}

bool Diagnostics::setHandler(const std::string& hookId, Handler handler) {
    auto it = hooks_.find(hookId);
    if (it == hooks_.end())
        return false;
    it->second->install(std::move(handler));
    return true;
}

void Diagnostics::setSink(Sink sink) {
    sink_ = std::move(sink);
}

void Diagnostics::resetSink() {
    sink_ = nullptr;
}

void Diagnostics::emitToSink(const std::string& text) const {
    if (sink_) {
        sink_(text);
        return;
    }
    std::fputs(text.c_str(), stderr);
    if (text.empty() || text.back() != '\n')
        std::fputc('\n', stderr);
}

} // namespace logscrubber
