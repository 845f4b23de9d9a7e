#include "engine/io/json_value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <sstream>
#include <utility>

namespace mcda {
namespace {

constexpr int kMaxDepth = 256;

// Recursive-descent reader. Tracks byte offset plus line/column so errors can
// point at the offending character.
class Parser {
 public:
  Parser(std::string_view text, JsonParseError* err)
      : begin_(text.data()), p_(text.data()), end_(text.data() + text.size()), err_(err) {}

  bool parse_document(JsonValue& out) {
    if (!parse_value(out, 0)) return false;
    skip_ws();
    if (!eof()) return fail("Trailing characters after JSON");
    return true;
  }

 private:
  bool eof() const { return p_ >= end_; }

  void advance() {
    if (*p_ == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++p_;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = static_cast<std::size_t>(p_ - begin_);
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

  void skip_ws() {
    while (!eof() && (*p_ == ' ' || *p_ == '\t' || *p_ == '\r' || *p_ == '\n')) advance();
  }

  bool consume(char ch) {
    skip_ws();
    if (eof() || *p_ != ch) return fail(std::string("Expected '") + ch + "'");
    advance();
    return true;
  }

  bool literal(const char* lit) {
    const char* q = p_;
    for (const char* s = lit; *s; ++s, ++q) {
      if (q >= end_ || *q != *s) return fail("Invalid literal");
    }
    while (p_ < q) advance();
    return true;
  }

  bool hex4(unsigned& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (eof()) return fail("Unexpected EOF in \\uXXXX escape");
      const char ch = *p_;
      unsigned v = 0;
      if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
      else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
      else return fail("Invalid hex digit in \\uXXXX escape");
      out = (out << 4) | v;
      advance();
    }
    return true;
  }

  static void append_utf8(std::string& s, unsigned cp) {
    if (cp <= 0x7F) {
      s.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool unicode_escape(std::string& out) {
    unsigned u = 0;
    if (!hex4(u)) return false;

    if (u >= 0xDC00 && u <= 0xDFFF) return fail("Unexpected low surrogate");
    if (u < 0xD800 || u > 0xDBFF) {
      append_utf8(out, u);
      return true;
    }

    // High surrogate: a \uXXXX low surrogate must follow.
    if (eof() || *p_ != '\\') return fail("High surrogate not followed by low surrogate");
    advance();
    if (eof() || *p_ != 'u') return fail("High surrogate not followed by \\u");
    advance();
    unsigned u2 = 0;
    if (!hex4(u2)) return false;
    if (u2 < 0xDC00 || u2 > 0xDFFF) return fail("Invalid low surrogate");
    append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
    return true;
  }

  bool parse_string(std::string& out) {
    skip_ws();
    if (eof() || *p_ != '"') return fail("Expected string");
    advance();
    out.clear();

    while (!eof()) {
      const char ch = *p_;
      if (ch == '"') {
        advance();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Unescaped control character in string");
      if (ch != '\\') {
        out.push_back(ch);
        advance();
        continue;
      }

      advance();
      if (eof()) return fail("Unexpected EOF in string escape");
      const char esc = *p_;
      advance();
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u':
          if (!unicode_escape(out)) return false;
          break;
        default:
          return fail("Invalid escape sequence");
      }
    }
    return fail("Unterminated string");
  }

  void digits() {
    while (!eof() && std::isdigit(static_cast<unsigned char>(*p_))) advance();
  }

  bool parse_number(double& out) {
    const char* start = p_;

    if (*p_ == '-') advance();
    if (eof()) return fail("Expected digits after '-'");

    if (*p_ == '0') {
      advance();
    } else if (*p_ >= '1' && *p_ <= '9') {
      digits();
    } else {
      return fail("Invalid number");
    }

    if (!eof() && *p_ == '.') {
      advance();
      if (eof() || !std::isdigit(static_cast<unsigned char>(*p_))) return fail("Expected digits after '.'");
      digits();
    }

    if (!eof() && (*p_ == 'e' || *p_ == 'E')) {
      advance();
      if (!eof() && (*p_ == '+' || *p_ == '-')) advance();
      if (eof() || !std::isdigit(static_cast<unsigned char>(*p_))) return fail("Expected digits in exponent");
      digits();
    }

    const std::string tmp(start, p_);
    errno = 0;
    char* endptr = nullptr;
    const double v = std::strtod(tmp.c_str(), &endptr);
    if (endptr == tmp.c_str() || *endptr != '\0') return fail("Failed to parse number");
    if (errno == ERANGE || !std::isfinite(v)) return fail("Number out of range");
    out = v;
    return true;
  }

  bool parse_array(JsonValue& out, int depth) {
    if (!consume('[')) return false;
    out.type = JsonType::kArray;
    out.array.clear();

    skip_ws();
    if (!eof() && *p_ == ']') {
      advance();
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parse_value(v, depth + 1)) return false;
      out.array.push_back(std::move(v));

      skip_ws();
      if (eof()) return fail("Unexpected EOF in array");
      if (*p_ == ',') {
        advance();
        continue;
      }
      if (*p_ == ']') {
        advance();
        return true;
      }
      return fail("Expected ',' or ']'");
    }
  }

  bool parse_object(JsonValue& out, int depth) {
    if (!consume('{')) return false;
    out.type = JsonType::kObject;
    out.object.clear();

    skip_ws();
    if (!eof() && *p_ == '}') {
      advance();
      return true;
    }

    while (true) {
      std::string key;
      if (!parse_string(key)) return false;
      if (!consume(':')) return false;

      JsonValue v;
      if (!parse_value(v, depth + 1)) return false;
      out.object[std::move(key)] = std::move(v);

      skip_ws();
      if (eof()) return fail("Unexpected EOF in object");
      if (*p_ == ',') {
        advance();
        continue;
      }
      if (*p_ == '}') {
        advance();
        return true;
      }
      return fail("Expected ',' or '}'");
    }
  }

  bool parse_value(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("Nesting too deep");
    skip_ws();
    if (eof()) return fail("Unexpected EOF");

    const char ch = *p_;
    switch (ch) {
      case '{': return parse_object(out, depth);
      case '[': return parse_array(out, depth);
      case '"':
        out.type = JsonType::kString;
        return parse_string(out.string);
      case 't':
        out.type = JsonType::kBool;
        out.boolean = true;
        return literal("true");
      case 'f':
        out.type = JsonType::kBool;
        out.boolean = false;
        return literal("false");
      case 'n':
        out.type = JsonType::kNull;
        return literal("null");
      default:
        break;
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      out.type = JsonType::kNumber;
      return parse_number(out.number);
    }
    return fail("Unexpected token");
  }

  const char* begin_;
  const char* p_;
  const char* end_;
  JsonParseError* err_;
  int line_ = 1;
  int col_ = 1;
};

}  // namespace

std::string JsonParseError::to_string() const {
  return "line " + std::to_string(line) + ", column " + std::to_string(col) + ": " + message;
}

const char* to_string(JsonType t) noexcept {
  switch (t) {
    case JsonType::kNull:   return "null";
    case JsonType::kBool:   return "boolean";
    case JsonType::kNumber: return "number";
    case JsonType::kString: return "string";
    case JsonType::kObject: return "object";
    case JsonType::kArray:  return "array";
    default:                return "unknown";
  }
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != JsonType::kObject) return nullptr;
  auto it = object.find(std::string(key));
  return it == object.end() ? nullptr : &it->second;
}

bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  Parser p(text, err);
  if (!p.parse_document(root)) return false;
  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  if (is.bad()) {
    if (err) err->message = "Failed to read input stream";
    return false;
  }
  const std::string buf = ss.str();
  return parse_json(std::string_view(buf), out, err);
}

}  // namespace mcda
