#include "logscrubber/HookRegistry.hpp"
#include "logscrubber/RuntimeConfig.hpp"

#include <utility>

namespace logscrubber {

namespace {

void appendError(std::string& all, const std::string& one) {
    if (one.empty())
        return;
    if (!all.empty())
        all += '\n';
    all += one;
}

} // namespace

HookRegistry::HookRegistry(Kind kind, HookHost& host, RedactFn redact)
    : kind_(kind), host_(&host), redact_(std::move(redact)) {}

HookPoint* HookRegistry::resolve(const std::string& id) const {
    return kind_ == Kind::Hook ? host_->hook(id) : host_->method(id);
}

bool HookRegistry::add(const std::string& id, bool activate, std::string& err) {
    if (records_.count(id))
        return true;
    if (!resolve(id)) {
        err = id + " does not exist";
        return false;
    }
    HookRecord rec;
    rec.id = id;
    records_.emplace(id, std::move(rec));
    trace("tracking %s %s", noun(), id.c_str());
    return activate ? enable(id, err) : true;
}

bool HookRegistry::add(const std::vector<std::string>& ids, bool activate,
                       std::string& err) {
    bool ok = true;
    for (const auto& id : ids) {
        std::string one;
        if (!add(id, activate, one)) {
            ok = false;
            appendError(err, one);
        }
    }
    return ok;
}

Handler HookRegistry::forwardFor(const std::string& id, const Handler& live) const {
    const auto alias = host_->aliasOf(id);
    if (!alias)
        return live;
    // The aliased point shares the target's original handler.
    HookPoint* target = resolve(*alias);
    if (!target)
        return live;
    const Handler targetLive = target->current();
    auto it = records_.find(*alias);
    if (it != records_.end() && it->second.active() && targetLive == it->second.wrapper)
        return it->second.old;
    return targetLive;
}

Handler HookRegistry::makeWrapper(HookPoint* point, Handler forward) const {
    RedactFn redact = redact_;
    return makeHandler([point, forward, redact](const std::vector<Value>& args) {
        const std::vector<Value> clean = redact(args);
        if (forward)
            (*forward)(clean);
        if (!forward || point->fatal())
            point->fallback(clean);
    });
}

bool HookRegistry::enable(const std::string& id, std::string& err) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        err = id + " is not registered";
        return false;
    }
    HookPoint* point = resolve(id);
    if (!point) {
        err = id + " does not exist";
        return false;
    }
    HookRecord& rec = it->second;
    const Handler live = point->current();
    if (rec.active() && live == rec.wrapper)
        return true;

    rec.old = live;
    rec.forward = forwardFor(id, live);
    rec.wrapper = makeWrapper(point, rec.forward);
    point->install(rec.wrapper);
    trace("enabled %s %s", noun(), id.c_str());
    return true;
}

bool HookRegistry::disable(const std::string& id, std::string& err) {
    auto it = records_.find(id);
    if (it == records_.end() || !it->second.active())
        return true;
    HookRecord& rec = it->second;
    HookPoint* point = resolve(id);
    if (!point) {
        // The callable went away together with our wrapper.
        rec.old.reset();
        rec.forward.reset();
        rec.wrapper.reset();
        return true;
    }
    const Handler live = point->current();
    if (live == rec.old) {
        // Someone already put the captured handler back.
        rec.old.reset();
        rec.forward.reset();
        rec.wrapper.reset();
        trace("%s %s already restored", noun(), id.c_str());
        return true;
    }
    if (live != rec.wrapper) {
        err = std::string("LogScrubber cannot disable the ") + id + " " + noun() +
              ", it has been overridden somewhere else";
        host_->report(err);
        return false;
    }
    point->install(rec.old);
    rec.old.reset();
    rec.forward.reset();
    rec.wrapper.reset();
    trace("disabled %s %s", noun(), id.c_str());
    return true;
}

bool HookRegistry::remove(const std::string& id, std::string& err) {
    if (!records_.count(id))
        return true;
    if (!disable(id, err))
        return false;
    records_.erase(id);
    trace("forgot %s %s", noun(), id.c_str());
    return true;
}

bool HookRegistry::remove(const std::vector<std::string>& ids, std::string& err) {
    bool ok = true;
    for (const auto& id : ids) {
        std::string one;
        if (!remove(id, one)) {
            ok = false;
            appendError(err, one);
        }
    }
    return ok;
}

bool HookRegistry::enableAll(std::string& err) {
    bool ok = true;
    for (const auto& id : ids()) {
        std::string one;
        if (!enable(id, one)) {
            ok = false;
            appendError(err, one);
        }
    }
    return ok;
}

bool HookRegistry::disableAll(std::string& err) {
    bool ok = true;
    for (const auto& id : ids()) {
        std::string one;
        if (!disable(id, one)) {
            ok = false;
            appendError(err, one);
        }
    }
    return ok;
}

bool HookRegistry::tracked(const std::string& id) const {
    return records_.count(id) != 0;
}

bool HookRegistry::isActive(const std::string& id) const {
    auto it = records_.find(id);
    return it != records_.end() && it->second.active();
}

const HookRecord* HookRegistry::record(const std::string& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

std::vector<std::string> HookRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& kv : records_)
        out.push_back(kv.first);
    return out;
}

} // namespace logscrubber
