// Process-wide table of diagnostic emission points: the WARN and DIE hooks
// and the named warning/fatal/syslog callables that application code emits
// through. This is the HookHost the process-wide scrubber intercepts.
#pragma once
#include "HookPoint.hpp"

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace logscrubber {

// Raised by die() and by the fatal callables.
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Concatenates arguments without separator. Composites are rendered as
// [a, b] and {k: v}; a container met again inside itself prints as "...".
std::string joinArgs(const std::vector<Value>& args);

class Diagnostics : public HookHost {
public:
    // Receives text emitted by the WARN fallback.
    using Sink = std::function<void(const std::string& text)>;

    Diagnostics();
    ~Diagnostics() override;

    Diagnostics(const Diagnostics&) = delete;
    Diagnostics& operator=(const Diagnostics&) = delete;

    static Diagnostics& instance();

    HookPoint* hook(const std::string& id) override;
    HookPoint* method(const std::string& id) override;
    std::vector<std::string> sourceMethods(const std::string& source) const override;
    std::vector<std::string> sources() const override;
    std::optional<std::string> aliasOf(const std::string& id) const override;
    void report(const std::string& message) override;

    // Emits a warning through the live WARN handler, or the sink if unset.
    void warn(const std::vector<Value>& args);
    // Runs the live DIE handler, then throws FatalError with the arguments.
    [[noreturn]] void die(const std::vector<Value>& args);
    // Invokes a named callable. Fails if it does not exist.
    bool call(const std::string& id, const std::vector<Value>& args, std::string& err);

    // Defines or replaces the callable id ("Source::name").
    void define(const std::string& id, HandlerFn fn);
    bool undefine(const std::string& id);
    void registerHook(const std::string& id, std::unique_ptr<HookPoint> point);

    Handler handler(const std::string& hookId) const;
    bool setHandler(const std::string& hookId, Handler handler);

    void setSink(Sink sink);
    void resetSink();

private:
    class SlotPoint;

    void emitToSink(const std::string& text) const;
    void defineBuiltins();

    Sink sink_;
    std::map<std::string, std::unique_ptr<HookPoint>> hooks_;
    std::map<std::string, std::unique_ptr<SlotPoint>> methods_;
};

} // namespace logscrubber
