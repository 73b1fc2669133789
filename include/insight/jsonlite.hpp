#pragma once

// insight/jsonlite.hpp — Minimal strict JSON parser and canonical writer.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map, so to_json() always emits keys in sorted order.
//     Journal records and proof inputs rely on this for stable hashing.
//   - Duplicate keys are rejected (json_duplicate_key), never last-wins.
//   - NaN/Infinity are rejected.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace insight::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse a document whose root must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parse any JSON value.
std::optional<Value> parse_value(const std::string& text, JsonError* error = nullptr);

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error = nullptr);

// Compact canonical serialization (sorted keys).
std::string to_json(const Value& v);
std::string to_json(const Object& o);

std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Return `def` when the key is absent or mistyped.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

bool has_key(const Object& obj, const std::string& key);

}  // namespace insight::jsonlite
