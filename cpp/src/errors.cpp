#include "ocr_structured.hpp"

namespace ocr_structured {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingInput: return "MissingInput";
    case ErrorKind::BlankSchema: return "BlankSchema";
    case ErrorKind::EmptyImage: return "EmptyImage";
    case ErrorKind::BlankText: return "BlankText";
    case ErrorKind::EmptyInput: return "EmptyInput";
    case ErrorKind::NoTextRecognized: return "NoTextRecognized";
    case ErrorKind::NoStructureFound: return "NoStructureFound";
    case ErrorKind::UnbalancedStructure: return "UnbalancedStructure";
    case ErrorKind::InvalidJson: return "InvalidJson";
    case ErrorKind::RecognitionFailed: return "RecognitionFailed";
    case ErrorKind::ExtractionFailed: return "ExtractionFailed";
  }
  return "Unknown";
}

const char* error_category(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingInput:
    case ErrorKind::BlankSchema:
    case ErrorKind::EmptyImage:
    case ErrorKind::BlankText:
    case ErrorKind::EmptyInput:
    case ErrorKind::NoTextRecognized:
      return "input";
    case ErrorKind::NoStructureFound:
    case ErrorKind::UnbalancedStructure:
    case ErrorKind::InvalidJson:
      return "extraction";
    case ErrorKind::RecognitionFailed:
    case ErrorKind::ExtractionFailed:
      return "upstream";
  }
  return "unknown";
}

const char* ExtractionError::stage() const noexcept {
  if (kind == ErrorKind::RecognitionFailed) return "recognition";
  if (kind == ErrorKind::ExtractionFailed) return "extraction";
  return "";
}

}  // namespace ocr_structured
