#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace alltz::json {

struct Value;
using Array = std::vector<Value>;
// Ordered so that configuration problems are reported in a stable order.
using Object = std::map<std::string, Value>;

// JSON value tree (null, bool, number, string, array, object).
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  // Returns nullptr if this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;

  const Object& object() const;
  const Array& array() const;
};

// Human-readable type name ("null", "bool", "number", ...), used in error messages.
const char* type_name(const Value& v);

// Parse a JSON document into a tree.
//
// Throws std::runtime_error with the byte offset, 1-based line/column and the
// offending line on malformed input. A leading UTF-8 BOM is ignored.
Value parse(const std::string& text);

} // namespace alltz::json
