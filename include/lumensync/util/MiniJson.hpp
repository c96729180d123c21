// Repository: LumenSync
// Component: Minimal JSON Reader
// Purpose: Small recursive JSON parser for the config file and the TV's
//          ambilight / powerstate payloads.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_UTIL_MINI_JSON_HPP_
#define LUMENSYNC_UTIL_MINI_JSON_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lumensync::util {

class JsonValue {
 public:
  enum class Type { kNull, kBool, kNumber, kString, kArray, kObject };

  using Array = std::vector<JsonValue>;
  // Members keep document order. Duplicate keys: Find() returns the first.
  using Object = std::vector<std::pair<std::string, JsonValue>>;

  JsonValue() = default;

  static JsonValue Null() { return JsonValue(); }
  static JsonValue Bool(bool b);
  static JsonValue Number(double n);
  static JsonValue String(std::string s);
  static JsonValue MakeArray(Array items);
  static JsonValue MakeObject(Object members);

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::kNull; }
  bool is_bool() const { return type_ == Type::kBool; }
  bool is_number() const { return type_ == Type::kNumber; }
  bool is_string() const { return type_ == Type::kString; }
  bool is_array() const { return type_ == Type::kArray; }
  bool is_object() const { return type_ == Type::kObject; }

  // Accessors throw std::logic_error on a type mismatch; callers check
  // is_*() first where the document is untrusted.
  bool AsBool() const;
  double AsNumber() const;
  const std::string& AsString() const;
  const Array& AsArray() const;
  const Object& AsObject() const;

  // nullptr when this is not an object or the key is absent.
  const JsonValue* Find(const std::string& key) const;

 private:
  Type type_ = Type::kNull;
  bool bool_ = false;
  double number_ = 0.0;
  std::string string_;
  Array array_;
  Object object_;
};

const char* JsonTypeToString(JsonValue::Type type);

class JsonParseError : public std::runtime_error {
 public:
  JsonParseError(const std::string& what, size_t offset)
      : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}

  size_t offset() const { return offset_; }

 private:
  size_t offset_;
};

// Parses a complete document. Trailing non-whitespace is an error.
// Throws JsonParseError.
JsonValue ParseJson(const std::string& text);

// Quotes and escapes `s` as a JSON string literal.
std::string JsonQuote(const std::string& s);

}  // namespace lumensync::util

#endif  // LUMENSYNC_UTIL_MINI_JSON_HPP_
