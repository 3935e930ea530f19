// Sensitive-value patterns and their replacements.
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace re2 {
class RE2;
}

namespace logscrubber {

// Transform step for one pattern: receives the pattern and the text as left
// by the previous patterns, and returns the new text. It runs whether or not
// the pattern occurs in the text.
using ReplaceFn = std::function<std::string(const std::string& pattern,
                                            const std::string& text)>;

struct Replacement {
    Replacement() = default;
    Replacement(const char* literal) : text(literal ? literal : "") {}
    Replacement(std::string literal) : text(std::move(literal)) {}
    Replacement(ReplaceFn fn) : compute(std::move(fn)) {}

    bool isComputed() const { return static_cast<bool>(compute); }

    std::string text;  // used when compute is empty; inserted verbatim
    ReplaceFn compute;
};

using PatternEntries = std::vector<std::pair<std::string, Replacement>>;

class PatternSet {
public:
    PatternSet() = default;

    // Compiles and stores a pattern, replacing any previous entry with the
    // same pattern text. Returns false (set unchanged) if it does not compile.
    bool add(const std::string& pattern, Replacement replacement, std::string& err);

    // All-or-nothing: nothing is stored unless every pattern compiles.
    bool merge(const PatternEntries& entries, std::string& err);
    bool merge(const PatternSet& other);

    // Returns the number of entries removed.
    std::size_t remove(const std::vector<std::string>& patterns);
    bool remove(const std::string& pattern);

    void clear() { entries_.clear(); }
    bool contains(const std::string& pattern) const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::string> patterns() const;
    const Replacement* replacementFor(const std::string& pattern) const;

    // Applies every pattern in iteration order (lexicographic by pattern
    // text), each one over the result of the previous. Overlapping patterns
    // therefore resolve by that order.
    std::string apply(std::string text) const;

    static bool compile(const PatternEntries& entries, PatternSet& out, std::string& err);

private:
    struct Entry {
        std::shared_ptr<const re2::RE2> regex;
        Replacement replacement;
    };

    static void applyOne(const std::string& pattern, const Entry& entry, std::string& text);

    std::map<std::string, Entry> entries_;
};

} // namespace logscrubber
