// Rewrites sensitive content anywhere inside a value tree.
#pragma once
#include "PatternSet.hpp"
#include "Value.hpp"

#include <unordered_set>
#include <vector>

namespace logscrubber {

class Redactor {
public:
    explicit Redactor(const PatternSet& patterns) : patterns_(patterns) {}

    // Redacts each argument of a variadic call. Sequences and mappings are
    // rewritten in place and returned with their identity; scalars come back
    // as Text; Null and opaque values are passed through.
    std::vector<Value> redact(std::vector<Value> values) const;
    Value redactValue(const Value& value) const;
    std::string redactText(const std::string& text) const { return patterns_.apply(text); }

private:
    using Visited = std::unordered_set<const void*>;

    Value visit(const Value& value, Visited& visited) const;
    void visitSequence(Sequence& seq, Visited& visited) const;
    void visitMapping(Mapping& map, Visited& visited) const;

    const PatternSet& patterns_;
};

} // namespace logscrubber
