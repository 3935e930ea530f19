#include "logscrubber/MockHookHost.hpp"

namespace logscrubber {

void MockHookHost::Point::emit(const std::vector<Value>& args) {
    if (live_)
        (*live_)(args);
    else
        fallback(args);
}

// Mirrors a small diagnostics table: WARN, fatal DIE and a "Log" source.
MockHookHost::MockHookHost() {
    addHook("WARN");
    addHook("DIE", true);
    addMethod("Log::info");
    addMethod("Log::error");
}

HookPoint* MockHookHost::hook(const std::string& id) {
    auto it = hooks_.find(id);
    return it == hooks_.end() ? nullptr : it->second.get();
}

HookPoint* MockHookHost::method(const std::string& id) {
    auto it = methods_.find(id);
    return it == methods_.end() ? nullptr : it->second.get();
}

std::vector<std::string> MockHookHost::sourceMethods(const std::string& source) const {
    std::vector<std::string> out;
    const std::string prefix = source + "::";
    for (const auto& kv : methods_) {
        if (kv.first.compare(0, prefix.size(), prefix) == 0 &&
            kv.first.find("::", prefix.size()) == std::string::npos)
            out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> MockHookHost::sources() const {
    std::vector<std::string> out;
    for (const auto& kv : methods_) {
        const auto pos = kv.first.rfind("::");
        if (pos == std::string::npos)
            continue;
        const std::string source = kv.first.substr(0, pos);
        if (out.empty() || out.back() != source)
            out.push_back(source);
    }
    return out;
}

std::optional<std::string> MockHookHost::aliasOf(const std::string& id) const {
    auto it = aliases_.find(id);
    if (it == aliases_.end())
        return std::nullopt;
    return it->second;
}

MockHookHost::Point& MockHookHost::addHook(const std::string& id, bool fatal) {
    auto& slot = hooks_[id];
    slot = std::make_unique<Point>(fatal);
    return *slot;
}

MockHookHost::Point& MockHookHost::addMethod(const std::string& id) {
    auto& slot = methods_[id];
    slot = std::make_unique<Point>();
    slot->install(makeHandler([this, id](const std::vector<Value>& args) {
        calls[id].push_back(args);
    }));
    slot->installs = 0;
    return *slot;
}

} // namespace logscrubber
