#include "logscrubber/Redactor.hpp"

#include <utility>

namespace logscrubber {

std::vector<Value> Redactor::redact(std::vector<Value> values) const {
    if (patterns_.empty())
        return values;
    Visited visited;
    for (auto& v : values)
        v = visit(v, visited);
    return values;
}

Value Redactor::redactValue(const Value& value) const {
    if (patterns_.empty())
        return value;
    Visited visited;
    return visit(value, visited);
}

Value Redactor::visit(const Value& value, Visited& visited) const {
    if (value.isScalar())
        return Value(patterns_.apply(value.toText()));

    switch (value.kind()) {
    case Value::Kind::Sequence:
        // A container already seen in this call is returned as-is; this
        // also terminates cycles.
        if (value.sequence() && visited.insert(value.identity()).second)
            visitSequence(*value.sequence(), visited);
        return value;
    case Value::Kind::Mapping:
        if (value.mapping() && visited.insert(value.identity()).second)
            visitMapping(*value.mapping(), visited);
        return value;
    default:
        return value;
    }
}

void Redactor::visitSequence(Sequence& seq, Visited& visited) const {
    for (auto& item : seq)
        item = visit(item, visited);
}

void Redactor::visitMapping(Mapping& map, Visited& visited) const {
    std::vector<std::pair<std::string, std::string>> renames;
    for (auto& kv : map) {
        kv.second = visit(kv.second, visited);
        std::string key = patterns_.apply(kv.first);
        if (key != kv.first)
            renames.emplace_back(kv.first, std::move(key));
    }
    if (renames.empty())
        return;

    // Detach every renamed entry before reinserting, so a redacted key that
    // equals another original key cannot be renamed twice.
    std::vector<std::pair<std::string, Value>> moved;
    moved.reserve(renames.size());
    for (auto& r : renames) {
        auto it = map.find(r.first);
        moved.emplace_back(std::move(r.second), std::move(it->second));
        map.erase(it);
    }
    // An existing entry under the redacted key is overwritten.
    for (auto& m : moved)
        map[m.first] = std::move(m.second);
}

} // namespace logscrubber
