#include "ocr_structured.hpp"

#include <cctype>

#include "logging.hpp"
#include "strings.hpp"

namespace ocr_structured {

static bool is_fence_ws(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static bool starts_with_ci(const std::string& haystack, size_t pos, const char* needle) {
  for (size_t j = 0; needle[j] != '\0'; ++j) {
    if (pos + j >= haystack.size()) return false;
    char a = static_cast<char>(std::tolower(static_cast<unsigned char>(haystack[pos + j])));
    if (a != needle[j]) return false;
  }
  return true;
}

std::string preview_text(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) return text;
  size_t cut = max_bytes;
  // Do not split a UTF-8 sequence.
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  return text.substr(0, cut) + "...";
}

// ```[json]<ws>BODY``` -- the first fence with a non-empty trimmed body.
static std::optional<JsonCandidate> try_fenced_candidate(const std::string& text) {
  const size_t open = text.find("```");
  if (open == std::string::npos) return std::nullopt;

  size_t p = open + 3;
  if (starts_with_ci(text, p, "json")) p += 4;
  while (p < text.size() && is_fence_ws(text[p])) ++p;

  const size_t close = text.find("```", p);
  if (close == std::string::npos) return std::nullopt;  // unclosed fence: bracket search decides

  size_t body_begin = p;
  size_t body_end = close;
  while (body_begin < body_end && static_cast<unsigned char>(text[body_begin]) <= 0x20) ++body_begin;
  while (body_end > body_begin && static_cast<unsigned char>(text[body_end - 1]) <= 0x20) --body_end;
  if (body_begin == body_end) return std::nullopt;

  JsonCandidate c;
  c.text = text.substr(body_begin, body_end - body_begin);
  c.start = body_begin;
  c.open = c.text.front();
  c.close = c.text.back();
  c.from_fence = true;
  return c;
}

// First `open` that has some `close` after it, or npos.
static size_t find_structure_start(const std::string& text, char open, char close) {
  const size_t first = text.find(open);
  if (first == std::string::npos) return std::string::npos;
  const size_t last_close = text.rfind(close);
  if (last_close == std::string::npos || last_close < first) return std::string::npos;
  return first;
}

static JsonCandidate scan_balanced(const std::string& text, size_t start, char open, char close) {
  int depth = 0;
  bool in_str = false;
  bool escape = false;

  for (size_t idx = start; idx < text.size(); ++idx) {
    char c = text[idx];
    if (escape) {
      escape = false;
      continue;
    }
    if (c == '\\' && in_str) {
      escape = true;
      continue;
    }
    if (c == '"') {
      in_str = !in_str;
      continue;
    }
    if (in_str) continue;

    if (c == open) {
      depth++;
    } else if (c == close) {
      depth--;
      if (depth == 0) {
        JsonCandidate cand;
        cand.text = text.substr(start, idx - start + 1);
        cand.start = start;
        cand.open = open;
        cand.close = close;
        return cand;
      }
    }
  }

  throw ExtractionError(ErrorKind::UnbalancedStructure,
                        std::string("Unbalanced JSON structure: no matching '") + close + "' for '" + open +
                            "' at offset " + std::to_string(start),
                        preview_text(text.substr(start)));
}

JsonCandidate find_json_candidate(const std::string& text) {
  if (is_blank(text)) {
    throw ExtractionError(ErrorKind::EmptyInput, "Response is empty or blank");
  }

  if (auto fenced = try_fenced_candidate(text)) {
    get_logger()->trace("json candidate: fenced block at offset {}", fenced->start);
    return *fenced;
  }

  const size_t obj = find_structure_start(text, '{', '}');
  const size_t arr = find_structure_start(text, '[', ']');

  if (obj == std::string::npos && arr == std::string::npos) {
    size_t b = 0;
    while (b < text.size() && static_cast<unsigned char>(text[b]) <= 0x20) ++b;
    std::string preview = preview_text(text.substr(b));
    throw ExtractionError(ErrorKind::NoStructureFound, "No JSON structure found in response. Preview: " + preview,
                          preview);
  }

  // Both present: whichever opens first. Offsets of '{' and '[' never coincide.
  if (arr == std::string::npos || (obj != std::string::npos && obj < arr)) {
    get_logger()->trace("json candidate: object at offset {}", obj);
    return scan_balanced(text, obj, '{', '}');
  }
  get_logger()->trace("json candidate: array at offset {}", arr);
  return scan_balanced(text, arr, '[', ']');
}

Json extract_json(const std::string& text) {
  JsonCandidate cand = find_json_candidate(text);

  Json value;
  try {
    value = loads_leading_json(cand.text);
  } catch (const JsonParseError& e) {
    throw ExtractionError(ErrorKind::InvalidJson,
                          std::string("Invalid JSON: ") + e.what() + "\nExtracted: " + preview_text(cand.text),
                          cand.text, e.what());
  }

  // Only fence bodies can hold a bare scalar; the bracket scan always yields [..] or {..}.
  if (!value.is_object() && !value.is_array()) {
    throw ExtractionError(ErrorKind::InvalidJson,
                          "Invalid JSON: expected an object or array at top level\nExtracted: " +
                              preview_text(cand.text),
                          cand.text, "top-level value is not an object or array");
  }
  return value;
}

bool is_valid_json(const std::string& text) noexcept {
  if (is_blank(text)) return false;
  try {
    (void)loads_leading_json(text);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace ocr_structured
