#pragma once
#include "HookPoint.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace logscrubber {

// In-memory HookHost. Every point records what reached its fallback, and
// reports are kept instead of printed.
class MockHookHost : public HookHost {
public:
    class Point : public HookPoint {
    public:
        explicit Point(bool fatal = false) : fatal_(fatal) {}

        Handler current() const override { return live_; }
        void install(Handler handler) override {
            live_ = std::move(handler);
            ++installs;
        }
        void fallback(const std::vector<Value>& args) override { fallbackCalls.push_back(args); }
        bool fatal() const override { return fatal_; }

        // Runs the live handler, or the fallback when none is set.
        void emit(const std::vector<Value>& args);

        std::vector<std::vector<Value>> fallbackCalls;
        int installs = 0;

    private:
        Handler live_;
        bool fatal_;
    };

    MockHookHost();

    HookPoint* hook(const std::string& id) override;
    HookPoint* method(const std::string& id) override;
    std::vector<std::string> sourceMethods(const std::string& source) const override;
    std::vector<std::string> sources() const override;
    std::optional<std::string> aliasOf(const std::string& id) const override;
    void report(const std::string& message) override { reports.push_back(message); }

    Point& addHook(const std::string& id, bool fatal = false);
    // Defines a callable whose handler records its arguments into calls[id].
    Point& addMethod(const std::string& id);
    void removeMethod(const std::string& id) { methods_.erase(id); }
    void setAlias(const std::string& id, const std::string& target) { aliases_[id] = target; }

    Point& hookPoint(const std::string& id) { return *hooks_.at(id); }
    Point& methodPoint(const std::string& id) { return *methods_.at(id); }

    std::map<std::string, std::vector<std::vector<Value>>> calls;
    std::vector<std::string> reports;

private:
    std::map<std::string, std::unique_ptr<Point>> hooks_;
    std::map<std::string, std::unique_ptr<Point>> methods_;
    std::map<std::string, std::string> aliases_;
};

} // namespace logscrubber
