// Interceptable emission points. Concrete hosts (the built-in diagnostics
// table, the Qt adapter, test mocks) implement these interfaces so the
// registry stays independent of how handlers are actually installed.
#pragma once
#include "Value.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace logscrubber {

using HandlerFn = std::function<void(const std::vector<Value>& args)>;
// Handlers are compared by identity. A null Handler means "unset".
using Handler = std::shared_ptr<const HandlerFn>;

inline Handler makeHandler(HandlerFn fn) {
    return std::make_shared<const HandlerFn>(std::move(fn));
}

class HookPoint {
public:
    virtual ~HookPoint() = default;

    // Handler live right now (may be null).
    virtual Handler current() const = 0;
    virtual void install(Handler handler) = 0;

    // What the emission point does when no handler is set.
    virtual void fallback(const std::vector<Value>& args) { (void)args; }

    // Fatal points must not return to the emitter after a handler ran.
    virtual bool fatal() const { return false; }
};

class HookHost {
public:
    virtual ~HookHost() = default;

    // Signal-style hooks ("WARN", "DIE"); nullptr when unknown.
    virtual HookPoint* hook(const std::string& id) = 0;
    // Named callables ("Carp::croak"); nullptr when the callable does not exist.
    virtual HookPoint* method(const std::string& id) = 0;
    // Callables belonging to a source ("Carp" -> "Carp::carp", ...).
    virtual std::vector<std::string> sourceMethods(const std::string& source) const = 0;
    virtual std::vector<std::string> sources() const = 0;

    // Id whose original handler an aliased method falls back to.
    virtual std::optional<std::string> aliasOf(const std::string& id) const {
        (void)id;
        return std::nullopt;
    }

    // Emits a diagnostic about the scrubber itself without going through any
    // installed handler.
    virtual void report(const std::string& message) = 0;
};

} // namespace logscrubber
