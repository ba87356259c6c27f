#pragma once

#include <cctype>
#include <string>

namespace ocr_structured {

inline bool is_blank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace ocr_structured
