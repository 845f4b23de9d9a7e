#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcda {

struct JsonParseError {
  std::string message;
  std::size_t offset = 0;  // byte offset in input
  int line = 1;            // 1-based
  int col = 1;             // 1-based

  std::string to_string() const;  // "line L, column C: message"
};

enum class JsonType { kNull, kBool, kNumber, kString, kObject, kArray };

const char* to_string(JsonType t) noexcept;

// Parsed JSON document node. Objects keep keys sorted; a repeated key keeps the
// last value.
struct JsonValue {
  JsonType type = JsonType::kNull;
  bool boolean = false;
  double number = 0.0;
  std::string string;
  std::map<std::string, JsonValue> object;
  std::vector<JsonValue> array;

  bool is_null() const noexcept { return type == JsonType::kNull; }
  bool is_object() const noexcept { return type == JsonType::kObject; }
  bool is_array() const noexcept { return type == JsonType::kArray; }
  bool is_string() const noexcept { return type == JsonType::kString; }
  bool is_number() const noexcept { return type == JsonType::kNumber; }

  // nullptr when not an object or the key is absent.
  const JsonValue* find(std::string_view key) const;
};

/// Strict RFC 8259 reader.
/// - Rejects NaN/Inf literals, leading '+', trailing commas, comments.
/// - Rejects trailing non-whitespace after the root value.
/// - Nesting deeper than 256 levels is an error.
bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

}  // namespace mcda
