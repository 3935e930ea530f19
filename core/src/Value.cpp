#include "logscrubber/Value.hpp"

#include <cstdio>

namespace logscrubber {

Value Value::sequence(std::initializer_list<Value> items) {
    return Value(std::make_shared<Sequence>(items));
}

Value Value::mapping(std::initializer_list<std::pair<const std::string, Value>> items) {
    return Value(std::make_shared<Mapping>(items));
}

Value Value::opaque(OpaquePtr object) {
    Value v;
    v.data_ = Opaque{std::move(object)};
    return v;
}

Value::Kind Value::kind() const {
    switch (data_.index()) {
    case 0: return Kind::Null;
    case 1: return Kind::Boolean;
    case 2: return Kind::Integer;
    case 3: return Kind::Real;
    case 4: return Kind::Text;
    case 5: return Kind::Sequence;
    case 6: return Kind::Mapping;
    default: return Kind::Opaque;
    }
}

bool Value::isScalar() const {
    const Kind k = kind();
    return k == Kind::Boolean || k == Kind::Integer || k == Kind::Real ||
           k == Kind::Text;
}

std::string Value::toText() const {
    switch (kind()) {
    case Kind::Boolean:
        return boolean() ? "true" : "false";
    case Kind::Integer:
        return std::to_string(integer());
    case Kind::Real: {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.15g", real());
        return buf;
    }
    case Kind::Text:
        return text();
    default:
        return {};
    }
}

const std::string& Value::text() const {
    return std::get<std::string>(data_);
}

const void* Value::identity() const {
    switch (kind()) {
    case Kind::Sequence: return sequence().get();
    case Kind::Mapping: return mapping().get();
    case Kind::Opaque: return object().get();
    default: return nullptr;
    }
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind())
        return false;
    switch (kind()) {
    case Kind::Null: return true;
    case Kind::Boolean: return boolean() == other.boolean();
    case Kind::Integer: return integer() == other.integer();
    case Kind::Real: return real() == other.real();
    case Kind::Text: return text() == other.text();
    case Kind::Sequence:
        if (sequence() == other.sequence())
            return true;
        if (!sequence() || !other.sequence())
            return false;
        return *sequence() == *other.sequence();
    case Kind::Mapping:
        if (mapping() == other.mapping())
            return true;
        if (!mapping() || !other.mapping())
            return false;
        return *mapping() == *other.mapping();
    case Kind::Opaque:
        return object() == other.object();
    }
    return false;
}

} // namespace logscrubber
