// Dynamic value passed through interception points. Composites have
// reference semantics so that shared and cyclic structures can be expressed.
#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace logscrubber {

class Value;

using Sequence = std::vector<Value>;
using Mapping = std::map<std::string, Value>;
using SequencePtr = std::shared_ptr<Sequence>;
using MappingPtr = std::shared_ptr<Mapping>;
using OpaquePtr = std::shared_ptr<void>;

class Value {
public:
    enum class Kind { Null, Boolean, Integer, Real, Text, Sequence, Mapping, Opaque };

    Value() = default;
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s ? s : "")) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(SequencePtr seq) : data_(std::move(seq)) {}
    Value(MappingPtr map) : data_(std::move(map)) {}

    static Value sequence(std::initializer_list<Value> items);
    static Value mapping(std::initializer_list<std::pair<const std::string, Value>> items);
    static Value opaque(OpaquePtr object);

    Kind kind() const;
    bool isNull() const { return kind() == Kind::Null; }
    bool isText() const { return kind() == Kind::Text; }
    // Boolean, Integer, Real or Text.
    bool isScalar() const;
    bool isComposite() const { return kind() == Kind::Sequence || kind() == Kind::Mapping; }

    // Text form of a scalar; empty for Null, composites and opaque values.
    std::string toText() const;

    const std::string& text() const;
    bool boolean() const { return std::get<bool>(data_); }
    std::int64_t integer() const { return std::get<std::int64_t>(data_); }
    double real() const { return std::get<double>(data_); }
    const SequencePtr& sequence() const { return std::get<SequencePtr>(data_); }
    const MappingPtr& mapping() const { return std::get<MappingPtr>(data_); }
    const OpaquePtr& object() const { return std::get<Opaque>(data_).ptr; }

    // Address of the shared container for composites and opaque values,
    // nullptr for everything else.
    const void* identity() const;

    // Structural comparison; composites compare by contents, opaque by identity.
    // Not cycle-safe.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    struct Opaque {
        OpaquePtr ptr;
    };

    std::variant<std::monostate, bool, std::int64_t, double, std::string,
                 SequencePtr, MappingPtr, Opaque> data_;
};

} // namespace logscrubber
