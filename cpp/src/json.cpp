#include "ocr_structured.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace ocr_structured {

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

static std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream oss;
          oss << "\\u";
          oss.setf(std::ios::hex, std::ios::basefield);
          oss.width(4);
          oss.fill('0');
          oss << (static_cast<int>(static_cast<unsigned char>(c)));
          out += oss.str();
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) {
    double n = value.as_number();
    if (std::isfinite(n)) {
      // Prefer integer formatting when exact.
      double intpart;
      if (std::modf(n, &intpart) == 0.0) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(0);
        oss << n;
        return oss.str();
      }
      std::ostringstream oss;
      oss.precision(15);
      oss << n;
      return oss.str();
    }
    return "null";
  }
  if (value.is_string()) return "\"" + json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    out += "]";
    return out;
  }
  const auto& obj = value.as_object();
  std::string out = "{";
  bool first = true;
  for (const auto& kv : obj) {
    if (!first) out += ",";
    first = false;
    out += "\"" + json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  out += "}";
  return out;
}

// ---------------- JSON parser (strict) ----------------

static constexpr int kMaxNestingDepth = 1000;

static bool is_json_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};

  explicit Parser(const std::string& in) : s(in) {}

  void skip_ws() {
    while (i < s.size() && is_json_ws(s[i])) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const { throw JsonParseError(msg, i); }

  bool consume(char c) {
    skip_ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  void enter() {
    if (++depth > kMaxNestingDepth) fail("nesting deeper than " + std::to_string(kMaxNestingDepth));
  }

  Json parse_value() {
    skip_ws();
    if (i >= s.size()) fail("unexpected end of input");
    char c = s[i];
    if (c == '{') return parse_object();
    if (c == '[') return parse_array();
    if (c == '"') return Json(parse_string());
    if (c == 't') return parse_literal("true", Json(true));
    if (c == 'f') return parse_literal("false", Json(false));
    if (c == 'n') return parse_literal("null", Json(nullptr));
    if (c == '-' || is_digit(c)) return Json(parse_number());
    fail(std::string("unexpected character '") + c + "'");
  }

  Json parse_object() {
    enter();
    ++i;  // '{'
    JsonObject obj;
    if (consume('}')) {
      --depth;
      return Json(std::move(obj));
    }
    while (true) {
      skip_ws();
      if (i >= s.size()) fail("unterminated object");
      if (s[i] != '"') fail("expected string key");
      std::string key = parse_string();
      if (!consume(':')) fail("expected ':'");
      // Duplicate keys: last occurrence wins.
      obj[std::move(key)] = parse_value();
      if (consume('}')) break;
      if (!consume(',')) fail("expected ',' or '}'");
    }
    --depth;
    return Json(std::move(obj));
  }

  Json parse_array() {
    enter();
    ++i;  // '['
    JsonArray arr;
    if (consume(']')) {
      --depth;
      return Json(std::move(arr));
    }
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      if (!consume(',')) fail("expected ',' or ']'");
    }
    --depth;
    return Json(std::move(arr));
  }

  uint32_t parse_hex4() {
    if (i + 4 > s.size()) fail("truncated \\u escape");
    uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      cp <<= 4;
      if (h >= '0' && h <= '9') {
        cp |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        cp |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        cp |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        --i;
        fail("invalid hex digit in \\u escape");
      }
    }
    return cp;
  }

  std::string parse_string() {
    ++i;  // opening quote
    std::string out;
    while (i < s.size()) {
      char c = s[i];
      if (c == '"') {
        ++i;
        return out;
      }
      if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
      ++i;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size()) fail("unterminated escape");
      char e = s[i++];
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          uint32_t cp = parse_hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (s.compare(i, 2, "\\u") != 0) fail("unpaired high surrogate");
            i += 2;
            uint32_t lo = parse_hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired low surrogate");
          }
          append_utf8(out, cp);
          break;
        }
        default:
          --i;
          fail(std::string("invalid escape '\\") + e + "'");
      }
    }
    fail("unterminated string");
  }

  double parse_number() {
    size_t start = i;
    if (s[i] == '-') ++i;
    if (i >= s.size() || !is_digit(s[i])) fail("expected digit");
    if (s[i] == '0') {
      ++i;
      if (i < s.size() && is_digit(s[i])) fail("leading zero in number");
    } else {
      while (i < s.size() && is_digit(s[i])) ++i;
    }
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (i >= s.size() || !is_digit(s[i])) fail("expected digit after '.'");
      while (i < s.size() && is_digit(s[i])) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !is_digit(s[i])) fail("expected digit in exponent");
      while (i < s.size() && is_digit(s[i])) ++i;
    }
    std::string num = s.substr(start, i - start);
    return std::strtod(num.c_str(), nullptr);
  }

  Json parse_literal(const char* word, Json result) {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) fail("expected " + w);
    i += w.size();
    return result;
  }
};

Json loads_json(const std::string& text) {
  Parser p(text);
  Json v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing data after JSON value");
  return v;
}

Json loads_leading_json(const std::string& text) {
  Parser p(text);
  return p.parse_value();
}

}  // namespace ocr_structured
