#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace namesake::record {

class Value;
using ValuePtr = std::shared_ptr<Value>;

/**
 * Ordered field list of a mapping. Lookup is linear; records carry a handful of fields and
 * declaration order is part of the contract (first match wins during name extraction).
 */
using Mapping = std::vector<std::pair<std::string, ValuePtr>>;
using Sequence = std::vector<ValuePtr>;

/**
 * Tagged variant tree for arbitrary nested records.
 *
 * Children are held by shared pointer, so a mapping may (maliciously or by accident) refer
 * back to one of its ancestors. Consumers that walk the tree must guard against cycles.
 */
class Value {
public:
    enum class Kind { Null, Bool, Number, String, Sequence, Mapping };

    Value() = default;
    explicit Value(bool b) : data_(b) {}
    explicit Value(double d) : data_(d) {}
    explicit Value(std::string s) : data_(std::move(s)) {}
    explicit Value(const char* s) : data_(std::string(s)) {}
    explicit Value(Sequence seq) : data_(std::move(seq)) {}
    explicit Value(Mapping map) : data_(std::move(map)) {}

    static ValuePtr null() { return std::make_shared<Value>(); }
    static ValuePtr boolean(bool b) { return std::make_shared<Value>(b); }
    static ValuePtr number(double d) { return std::make_shared<Value>(d); }
    static ValuePtr string(std::string s) { return std::make_shared<Value>(std::move(s)); }
    static ValuePtr sequence(Sequence seq = {}) { return std::make_shared<Value>(std::move(seq)); }
    static ValuePtr mapping(Mapping map = {}) { return std::make_shared<Value>(std::move(map)); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool isNull() const { return kind() == Kind::Null; }
    bool isString() const { return kind() == Kind::String; }
    bool isMapping() const { return kind() == Kind::Mapping; }
    bool isSequence() const { return kind() == Kind::Sequence; }

    const std::string* asString() const { return std::get_if<std::string>(&data_); }
    const double* asNumber() const { return std::get_if<double>(&data_); }
    const bool* asBool() const { return std::get_if<bool>(&data_); }
    const Mapping* asMapping() const { return std::get_if<Mapping>(&data_); }
    Mapping* asMapping() { return std::get_if<Mapping>(&data_); }
    const Sequence* asSequence() const { return std::get_if<Sequence>(&data_); }
    Sequence* asSequence() { return std::get_if<Sequence>(&data_); }

    // Appends a field to a mapping value; no-op for other kinds.
    Value& set(std::string key, ValuePtr value);

    // Exact (case-sensitive) field lookup on a mapping.
    ValuePtr get(std::string_view key) const;

    // Structural equality. Shared subtrees compare by content, cycles compare by identity.
    friend bool operator==(const Value& a, const Value& b);

private:
    std::variant<std::monostate, bool, double, std::string, Sequence, Mapping> data_;
};

} // namespace namesake::record
