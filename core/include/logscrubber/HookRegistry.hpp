// Tracks interception points and the wrappers installed on them.
#pragma once
#include "HookPoint.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace logscrubber {

struct HookRecord {
    std::string id;
    Handler old;      // live handler captured when the wrapper went in
    Handler forward;  // what the wrapper delegates to (old, unless aliased)
    Handler wrapper;  // null while the record is inactive

    bool active() const { return static_cast<bool>(wrapper); }
};

class HookRegistry {
public:
    enum class Kind { Hook, Method };
    using RedactFn = std::function<std::vector<Value>(std::vector<Value>)>;

    HookRegistry(Kind kind, HookHost& host, RedactFn redact);

    // Registers id; also installs the wrapper when activate is true.
    // Already-tracked ids are left alone. Fails if the host cannot resolve id.
    bool add(const std::string& id, bool activate, std::string& err);
    // Bulk variants process every id; failures are collected in err, one
    // per line, and do not undo the entries that succeeded.
    bool add(const std::vector<std::string>& ids, bool activate, std::string& err);

    bool enable(const std::string& id, std::string& err);
    // Restores the captured handler. A live handler that already is the
    // captured one just clears the record. Any other replacement of the
    // wrapper is reported as a conflict and nothing is changed.
    bool disable(const std::string& id, std::string& err);
    bool remove(const std::string& id, std::string& err);
    bool remove(const std::vector<std::string>& ids, std::string& err);

    bool enableAll(std::string& err);
    bool disableAll(std::string& err);

    bool tracked(const std::string& id) const;
    bool isActive(const std::string& id) const;
    const HookRecord* record(const std::string& id) const;
    std::vector<std::string> ids() const;
    std::size_t size() const { return records_.size(); }
    Kind kind() const { return kind_; }

private:
    HookPoint* resolve(const std::string& id) const;
    Handler forwardFor(const std::string& id, const Handler& live) const;
    Handler makeWrapper(HookPoint* point, Handler forward) const;
    const char* noun() const { return kind_ == Kind::Hook ? "hook" : "method"; }

    Kind kind_;
    HookHost* host_;
    RedactFn redact_;
    std::map<std::string, HookRecord> records_;
};

} // namespace logscrubber
