#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace mcda {

struct JsonWriteOptions {
  // Pretty output = newlines + indentation
  bool pretty = true;
  int indent_spaces = 2;
};

// Escape for a JSON string body (no surrounding quotes).
std::string escape_json(std::string_view s);

// Streaming writer with deterministic formatting. Callers control key order.
// Non-finite numbers are written as null (JSON cannot represent them).
class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt = {});

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  void key(std::string_view k);

  void string(std::string_view v);
  void boolean(bool v);
  void null_value();
  void number(double v);
  void integer(std::int64_t v);

  // Terminate the document (trailing newline when pretty).
  void finish();

 private:
  struct Scope {
    bool is_object = false;
    bool empty = true;
  };

  void before_value();
  void newline_indent(int depth);

  std::ostream& os_;
  JsonWriteOptions opt_;
  std::vector<Scope> scopes_;
  bool after_key_ = false;
};

}  // namespace mcda
