#include "engine/io/json_writer.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>

namespace mcda {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);

  for (unsigned char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          // Control characters -> \u00XX
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

JsonWriter::JsonWriter(std::ostream& os, const JsonWriteOptions& opt) : os_(os), opt_(opt) {}

void JsonWriter::newline_indent(int depth) {
  if (!opt_.pretty) return;
  os_ << '\n';
  for (int i = 0; i < depth * opt_.indent_spaces; ++i) os_ << ' ';
}

// Emits the separator for the next array element or object key. A value that
// directly follows key() needs nothing.
void JsonWriter::before_value() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (scopes_.empty()) return;
  Scope& s = scopes_.back();
  if (!s.empty) os_ << ',';
  s.empty = false;
  newline_indent(static_cast<int>(scopes_.size()));
}

void JsonWriter::begin_object() {
  before_value();
  os_ << '{';
  scopes_.push_back(Scope{true, true});
}

void JsonWriter::end_object() {
  const bool had_members = !scopes_.empty() && !scopes_.back().empty;
  if (!scopes_.empty()) scopes_.pop_back();
  if (had_members) newline_indent(static_cast<int>(scopes_.size()));
  os_ << '}';
}

void JsonWriter::begin_array() {
  before_value();
  os_ << '[';
  scopes_.push_back(Scope{false, true});
}

void JsonWriter::end_array() {
  const bool had_items = !scopes_.empty() && !scopes_.back().empty;
  if (!scopes_.empty()) scopes_.pop_back();
  if (had_items) newline_indent(static_cast<int>(scopes_.size()));
  os_ << ']';
}

void JsonWriter::key(std::string_view k) {
  before_value();
  os_ << '"' << escape_json(k) << "\":";
  if (opt_.pretty) os_ << ' ';
  after_key_ = true;
}

void JsonWriter::string(std::string_view v) {
  before_value();
  os_ << '"' << escape_json(v) << '"';
}

void JsonWriter::boolean(bool v) {
  before_value();
  os_ << (v ? "true" : "false");
}

void JsonWriter::null_value() {
  before_value();
  os_ << "null";
}

void JsonWriter::number(double v) {
  if (!std::isfinite(v)) {
    null_value();
    return;
  }
  before_value();
  // Enough precision for deterministic round-trip use.
  os_ << std::setprecision(15) << v;
}

void JsonWriter::integer(std::int64_t v) {
  before_value();
  os_ << v;
}

void JsonWriter::finish() {
  if (opt_.pretty) os_ << '\n';
}

}  // namespace mcda
