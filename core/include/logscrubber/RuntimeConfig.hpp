// Runtime switches read from the environment, plus the trace helper used by
// the core.
#pragma once

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace logscrubber {

// Value of a LOGSCRUBBER_* variable, trimmed and lowercased; empty when the
// variable is unset or blank.
inline std::string normalizedEnv(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    static const char kSpace[] = " \t\r\n\v\f";
    const std::string value(raw);
    const std::size_t first = value.find_first_not_of(kSpace);
    if (first == std::string::npos)
        return {};
    std::string out = value.substr(first, value.find_last_not_of(kSpace) - first + 1);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Accepts 1/true/yes/on. Anything else, including unset, leaves the switch off.
inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// LOGSCRUBBER_DEBUG=1 traces hook installation and scope changes on stderr.
inline bool debugTraceEnabled() {
    return envFlagEnabled("LOGSCRUBBER_DEBUG");
}

// LOGSCRUBBER_DISABLE=1 makes the process-wide scrubber start disabled.
inline bool startDisabled() {
    return envFlagEnabled("LOGSCRUBBER_DISABLE");
}

#if defined(__GNUC__)
__attribute__((format(printf, 1, 2)))
#endif
inline void trace(const char *fmt, ...) {
    if (!debugTraceEnabled())
        return;
    std::fprintf(stderr, "[LogScrubber] ");
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace logscrubber
