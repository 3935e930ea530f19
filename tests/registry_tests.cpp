// Hook registry tests against the in-memory host (run via CTest).
#include "logscrubber/HookRegistry.hpp"
#include "logscrubber/MockHookHost.hpp"
#include "logscrubber/Redactor.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using logscrubber::Handler;
using logscrubber::HookRegistry;
using logscrubber::MockHookHost;
using logscrubber::PatternSet;
using logscrubber::Redactor;
using logscrubber::Value;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

const std::string kCard = "4007000000027";

struct Fixture {
    Fixture() {
        std::string err;
        patterns.add(kCard, "DELETED", err);
    }

    HookRegistry hooks() {
        return HookRegistry(HookRegistry::Kind::Hook, host, redactFn());
    }
    HookRegistry methods() {
        return HookRegistry(HookRegistry::Kind::Method, host, redactFn());
    }
    HookRegistry::RedactFn redactFn() {
        return [this](std::vector<Value> v) {
            return Redactor(patterns).redact(std::move(v));
        };
    }

    MockHookHost host;
    PatternSet patterns;
};

// Handler that records the first argument of every call.
Handler recorder(std::vector<std::string> &seen) {
    return logscrubber::makeHandler([&seen](const std::vector<Value> &args) {
        seen.push_back(args.empty() ? std::string() : args[0].toText());
    });
}

std::string firstArg(const std::vector<std::vector<Value>> &calls) {
    if (calls.empty() || calls.back().empty())
        return {};
    return calls.back()[0].toText();
}

void test_wrap_without_previous_handler(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    std::string err;

    t.check(reg.add("WARN", true, err), "add WARN should succeed");
    t.check(reg.isActive("WARN"), "WARN should be active after add");
    warn.emit({Value("card " + kCard)});
    t.check(firstArg(warn.fallbackCalls) == "card DELETED",
            "fallback should receive redacted text");

    t.check(reg.remove("WARN", err), "remove WARN should succeed");
    t.check(!reg.tracked("WARN"), "WARN should be forgotten after remove");
    t.check(!warn.current(), "no handler should remain after remove");
    warn.emit({Value("card " + kCard)});
    t.check(firstArg(warn.fallbackCalls) == "card " + kCard,
            "original behaviour restored after remove");
}

void test_wrap_existing_handler_and_restore(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    std::vector<std::string> seen;
    const Handler original = recorder(seen);
    warn.install(original);
    std::string err;

    t.check(reg.add("WARN", true, err), "add WARN should succeed");
    t.check(warn.current() != original, "a wrapper should be live");
    warn.emit({Value("The card number is " + kCard + ".")});
    t.check(seen.size() == 1 && seen[0] == "The card number is DELETED.",
            "original handler should see redacted text");
    t.check(warn.fallbackCalls.empty(), "fallback unused when a handler exists");

    t.check(reg.remove("WARN", err), "remove should succeed");
    t.check(warn.current() == original, "original handler restored exactly");
    warn.emit({Value(kCard)});
    t.check(seen.size() == 2 && seen[1] == kCard,
            "unredacted behaviour after remove");
}

void test_enable_is_idempotent(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    std::string err;

    t.check(reg.add("WARN", true, err), "add should succeed");
    const Handler wrapper = warn.current();
    const int installs = warn.installs;
    t.check(reg.enable("WARN", err), "second enable should succeed");
    t.check(reg.add("WARN", true, err), "second add should be a no-op");
    t.check(warn.installs == installs, "no second wrapper installed");
    t.check(warn.current() == wrapper, "live handler is still the first wrapper");

    warn.emit({Value(kCard)});
    t.check(warn.fallbackCalls.size() == 1, "one emission reaches the fallback once");
}

void test_disable_conflict_reported(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    std::string err;
    t.check(reg.add("WARN", true, err), "add should succeed");

    std::vector<std::string> seen;
    const Handler foreign = recorder(seen);
    warn.install(foreign);

    err.clear();
    t.check(!reg.disable("WARN", err), "disable should report a conflict");
    t.checkContains(err, "overridden somewhere else", "conflict message");
    t.check(f.host.reports.size() == 1, "conflict reported through the host");
    t.check(warn.current() == foreign, "foreign handler must not be overwritten");
    t.check(reg.isActive("WARN"), "record stays as it was");

    err.clear();
    t.check(!reg.remove("WARN", err), "remove should also refuse");
    t.check(reg.tracked("WARN"), "record kept after refused remove");
}

void test_disable_after_original_reinstalled(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    std::vector<std::string> seen;
    const Handler original = recorder(seen);
    warn.install(original);
    std::string err;
    t.check(reg.add("WARN", true, err), "add WARN over the original");

    warn.install(original);
    t.check(reg.remove("WARN", err), "remove succeeds when the original is back: " + err);
    t.check(err.empty(), "no error for a restored handler");
    t.check(f.host.reports.empty(), "no conflict reported");
    t.check(!reg.tracked("WARN"), "record forgotten");
    t.check(warn.current() == original, "original handler left live");
}

void test_disable_inactive_is_silent(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    std::string err;
    t.check(reg.add("WARN", false, err), "tracking without activation");
    t.check(reg.tracked("WARN") && !reg.isActive("WARN"), "tracked but inactive");
    t.check(reg.disable("WARN", err), "disabling an inactive record succeeds");
    t.check(f.host.reports.empty(), "nothing reported");
    t.check(reg.disable("NOT-TRACKED", err), "untracked ids are ignored");
}

void test_missing_target(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    std::string err;
    t.check(!reg.add("NOPE", true, err), "unknown hook should fail");
    t.check(err == "NOPE does not exist", "missing target message");
    t.check(!reg.tracked("NOPE"), "nothing recorded for a missing target");

    auto methods = f.methods();
    err.clear();
    t.check(!methods.add("Log::nope", true, err), "unknown method should fail");
    t.checkContains(err, "Log::nope", "error names the method");

    err.clear();
    t.check(!reg.enable("WARN", err), "enable of an unregistered id fails");
}

void test_bulk_partial_progress(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    std::string err;
    t.check(!reg.add(std::vector<std::string>{"WARN", "NOPE", "DIE"}, true, err),
            "bulk add with one bad id fails");
    t.checkContains(err, "NOPE does not exist", "bulk error names the bad id");
    t.check(reg.isActive("WARN") && reg.isActive("DIE"),
            "valid ids are still registered");
    t.check(reg.size() == 2, "only valid ids recorded");

    err.clear();
    t.check(reg.remove(std::vector<std::string>{"WARN", "DIE"}, err), "bulk remove");
    t.check(reg.size() == 0, "all removed");
}

void test_fatal_hook_never_returns_unredacted(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &die = f.host.hookPoint("DIE");
    std::string err;
    t.check(reg.add("DIE", true, err), "add DIE");
    die.emit({Value("fatal " + kCard)});
    t.check(die.fallbackCalls.size() == 1 &&
                firstArg(die.fallbackCalls) == "fatal DELETED",
            "fatal fallback receives redacted text");
    t.check(reg.remove("DIE", err), "remove DIE");

    std::vector<std::string> seen;
    die.install(recorder(seen));
    die.fallbackCalls.clear();
    t.check(reg.add("DIE", true, err), "add DIE over a returning handler");
    die.emit({Value("fatal " + kCard)});
    t.check(seen.size() == 1 && seen[0] == "fatal DELETED",
            "previous fatal handler sees redacted text");
    t.check(die.fallbackCalls.size() == 1 &&
                firstArg(die.fallbackCalls) == "fatal DELETED",
            "fatal fallback still runs with redacted text");
}

void test_nested_wrapped_calls(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    auto &die = f.host.hookPoint("DIE");
    // A fatal handler that warns while unwinding.
    die.install(logscrubber::makeHandler([&warn](const std::vector<Value> &args) {
        warn.emit({Value("unwinding: " + kCard), args.empty() ? Value() : args[0]});
    }));
    std::string err;
    t.check(reg.add(std::vector<std::string>{"WARN", "DIE"}, true, err), "add both");
    die.emit({Value(kCard)});
    t.check(warn.fallbackCalls.size() == 1, "nested warning emitted once");
    if (!warn.fallbackCalls.empty() && warn.fallbackCalls[0].size() == 2) {
        t.check(warn.fallbackCalls[0][0] == Value("unwinding: DELETED"),
                "nested warning text redacted");
        t.check(warn.fallbackCalls[0][1] == Value("DELETED"),
                "forwarded fatal argument redacted");
    }
}

void test_method_wrap_and_restore(TestContext &t) {
    Fixture f;
    auto reg = f.methods();
    auto &info = f.host.methodPoint("Log::info");
    const Handler original = info.current();
    std::string err;

    t.check(reg.add("Log::info", true, err), "add method");
    info.emit({Value("user card " + kCard)});
    t.check(firstArg(f.host.calls["Log::info"]) == "user card DELETED",
            "original callable receives redacted arguments");

    t.check(reg.remove("Log::info", err), "remove method");
    t.check(info.current() == original, "original callable restored");
    info.emit({Value(kCard)});
    t.check(firstArg(f.host.calls["Log::info"]) == kCard,
            "unredacted after removal");
}

void test_alias_shares_target_original(TestContext &t) {
    Fixture f;
    f.host.addMethod("Log::warn");
    f.host.addMethod("Log::warnif");
    f.host.setAlias("Log::warnif", "Log::warn");
    auto reg = f.methods();
    auto &warnif = f.host.methodPoint("Log::warnif");
    const Handler warnifOriginal = warnif.current();
    std::string err;

    t.check(reg.add("Log::warn", true, err), "add Log::warn");
    t.check(reg.add("Log::warnif", true, err), "add Log::warnif");
    warnif.emit({Value(kCard)});
    t.check(firstArg(f.host.calls["Log::warn"]) == "DELETED",
            "aliased callable forwards to the target's original handler");
    t.check(f.host.calls["Log::warnif"].empty(),
            "aliased callable's own original is not called");
    t.check(reg.record("Log::warnif")->old == warnifOriginal,
            "its own original is still what gets restored");

    t.check(reg.remove("Log::warnif", err), "remove Log::warnif");
    t.check(warnif.current() == warnifOriginal, "own original restored");
}

void test_reenable_after_takeover(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    auto &warn = f.host.hookPoint("WARN");
    std::string err;
    t.check(reg.add("WARN", true, err), "add WARN");

    std::vector<std::string> seen;
    const Handler foreign = recorder(seen);
    warn.install(foreign);
    t.check(reg.enable("WARN", err), "enable again over a foreign handler");
    t.check(reg.record("WARN")->old == foreign, "foreign handler captured as old");
    warn.emit({Value(kCard)});
    t.check(seen.size() == 1 && seen[0] == "DELETED", "foreign handler sees redacted text");

    t.check(reg.disable("WARN", err), "disable restores the foreign handler");
    t.check(warn.current() == foreign, "foreign handler is live again");
}

void test_records_copy_by_value(TestContext &t) {
    Fixture f;
    auto reg = f.hooks();
    std::string err;
    t.check(reg.add("WARN", true, err), "add WARN");
    HookRegistry copy = reg;
    t.check(copy.isActive("WARN"), "copy shares the record state");
    t.check(copy.record("WARN")->wrapper == reg.record("WARN")->wrapper,
            "copy refers to the same wrapper");
    t.check(copy.remove("WARN", err), "copy can remove");
    t.check(reg.isActive("WARN"), "original record is independent of the copy");
}

} // namespace

int main() {
    TestContext t;
    test_wrap_without_previous_handler(t);
    test_wrap_existing_handler_and_restore(t);
    test_enable_is_idempotent(t);
    test_disable_conflict_reported(t);
    test_disable_after_original_reinstalled(t);
    test_disable_inactive_is_silent(t);
    test_missing_target(t);
    test_bulk_partial_progress(t);
    test_fatal_hook_never_returns_unredacted(t);
    test_nested_wrapped_calls(t);
    test_method_wrap_and_restore(t);
    test_alias_shares_target_original(t);
    test_reenable_after_takeover(t);
    test_records_copy_by_value(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] logscrubber_registry_tests\n";
    return EXIT_SUCCESS;
}
