#include "logscrubber/PatternSet.hpp"

#include <re2/re2.h>

namespace logscrubber {

namespace {

// RE2 rewrite strings treat '\' as an escape; literal replacements must not
// expand backreferences.
std::string escapeRewrite(const std::string& literal) {
    std::string out;
    out.reserve(literal.size());
    for (char c : literal) {
        if (c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

bool PatternSet::add(const std::string& pattern, Replacement replacement,
                     std::string& err) {
    auto regex = std::make_shared<const re2::RE2>(pattern, re2::RE2::Quiet);
    if (!regex->ok()) {
        err = "invalid pattern \"" + pattern + "\": " + regex->error();
        return false;
    }
    entries_[pattern] = Entry{std::move(regex), std::move(replacement)};
    return true;
}

bool PatternSet::merge(const PatternEntries& entries, std::string& err) {
    PatternSet compiled;
    if (!compile(entries, compiled, err))
        return false;
    return merge(compiled);
}

bool PatternSet::merge(const PatternSet& other) {
    for (const auto& kv : other.entries_)
        entries_[kv.first] = kv.second;
    return true;
}

std::size_t PatternSet::remove(const std::vector<std::string>& patterns) {
    std::size_t removed = 0;
    for (const auto& p : patterns)
        removed += entries_.erase(p);
    return removed;
}

bool PatternSet::remove(const std::string& pattern) {
    return entries_.erase(pattern) > 0;
}

bool PatternSet::contains(const std::string& pattern) const {
    return entries_.find(pattern) != entries_.end();
}

std::vector<std::string> PatternSet::patterns() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_)
        out.push_back(kv.first);
    return out;
}

const Replacement* PatternSet::replacementFor(const std::string& pattern) const {
    auto it = entries_.find(pattern);
    return it == entries_.end() ? nullptr : &it->second.replacement;
}

std::string PatternSet::apply(std::string text) const {
    for (const auto& kv : entries_)
        applyOne(kv.first, kv.second, text);
    return text;
}

bool PatternSet::compile(const PatternEntries& entries, PatternSet& out,
                         std::string& err) {
    PatternSet tmp;
    for (const auto& e : entries) {
        if (!tmp.add(e.first, e.second, err))
            return false;
    }
    out = std::move(tmp);
    return true;
}

void PatternSet::applyOne(const std::string& pattern, const Entry& entry,
                          std::string& text) {
    if (entry.replacement.isComputed()) {
        // The function owns the whole substitution step for its pattern.
        text = entry.replacement.compute(pattern, text);
        return;
    }
    // GlobalReplace steps over whole UTF-8 characters after an empty match.
    re2::RE2::GlobalReplace(&text, *entry.regex, escapeRewrite(entry.replacement.text));
}

} // namespace logscrubber
