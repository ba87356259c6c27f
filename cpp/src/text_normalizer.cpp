#include "ocr_structured.hpp"

namespace ocr_structured {

// Matches the `\s` class of the recognizer's markdown: space, \t, \n, \v, \f, \r.
static bool is_markdown_ws(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static bool is_line_start(const std::string& s, size_t i) {
  if (i == 0) return true;
  return s[i - 1] == '\n' || s[i - 1] == '\r';
}

// Trims ASCII whitespace and control characters from both ends.
static std::string trim_controls(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && static_cast<unsigned char>(s[start]) <= 0x20) ++start;
  size_t end = s.size();
  while (end > start && static_cast<unsigned char>(s[end - 1]) <= 0x20) --end;
  return s.substr(start, end - start);
}

std::string strip_code_fences(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, 3, "```") != 0) {
      out.push_back(text[i++]);
      continue;
    }
    i += 3;
    while (i < text.size() && text[i] >= 'a' && text[i] <= 'z') ++i;
    if (i < text.size() && text[i] == '\n') ++i;
  }
  return out;
}

std::string strip_bold_markers(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, 2, "**") == 0 || text.compare(i, 2, "__") == 0) {
      i += 2;
      continue;
    }
    out.push_back(text[i++]);
  }
  return out;
}

std::string strip_italic_markers(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '*' || c == '_') {
      const bool prev_same = i > 0 && text[i - 1] == c;
      const bool next_same = i + 1 < text.size() && text[i + 1] == c;
      if (!prev_same && !next_same) continue;
    }
    out.push_back(c);
  }
  return out;
}

std::string strip_header_markers(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '#' || !is_line_start(text, i)) {
      out.push_back(text[i++]);
      continue;
    }
    size_t j = i;
    while (j < text.size() && text[j] == '#') ++j;
    const size_t hashes = j - i;
    if (hashes > 6 || j >= text.size() || !is_markdown_ws(text[j])) {
      out.append(text, i, hashes);
      i = j;
      continue;
    }
    while (j < text.size() && is_markdown_ws(text[j])) ++j;
    i = j;
  }
  return out;
}

std::string unwrap_links(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '[') {
      const size_t label_end = text.find(']', i + 1);
      if (label_end != std::string::npos && label_end > i + 1 && label_end + 1 < text.size() &&
          text[label_end + 1] == '(') {
        const size_t target_end = text.find(')', label_end + 2);
        if (target_end != std::string::npos && target_end > label_end + 2) {
          out.append(text, i + 1, label_end - i - 1);
          i = target_end + 1;
          continue;
        }
      }
    }
    out.push_back(text[i++]);
  }
  return out;
}

std::string unwrap_inline_code(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '`') {
      const size_t close = text.find('`', i + 1);
      if (close != std::string::npos && close > i + 1) {
        out.append(text, i + 1, close - i - 1);
        i = close + 1;
        continue;
      }
    }
    out.push_back(text[i++]);
  }
  return out;
}

const std::vector<NormalizationPass>& normalization_passes() {
  static const std::vector<NormalizationPass> passes = {
      {"code_fences", &strip_code_fences},
      {"bold", &strip_bold_markers},
      {"italic", &strip_italic_markers},
      {"headers", &strip_header_markers},
      {"links", &unwrap_links},
      {"inline_code", &unwrap_inline_code},
  };
  return passes;
}

std::string normalize_text(const std::string& raw) {
  if (raw.empty()) return "";
  std::string result = raw;
  for (const auto& pass : normalization_passes()) {
    result = pass.apply(result);
  }
  return trim_controls(result);
}

}  // namespace ocr_structured
