#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ocr_structured {

// ---------------- Errors ----------------

enum class ErrorKind {
  // input validation
  MissingInput,
  BlankSchema,
  EmptyImage,
  BlankText,
  EmptyInput,
  NoTextRecognized,
  // extraction
  NoStructureFound,
  UnbalancedStructure,
  InvalidJson,
  // upstream capability failures
  RecognitionFailed,
  ExtractionFailed,
};

// "MissingInput", "InvalidJson", ...
const char* error_kind_name(ErrorKind kind);

// "input" | "extraction" | "upstream"
const char* error_category(ErrorKind kind);

struct ExtractionError : public std::runtime_error {
  ErrorKind kind;
  std::string message;
  std::string excerpt;  // bounded preview of the offending text (InvalidJson: the candidate)
  std::string detail;   // underlying parser / capability message
  std::exception_ptr cause;

  explicit ExtractionError(ErrorKind kind_, std::string message_, std::string excerpt_ = "", std::string detail_ = "",
                           std::exception_ptr cause_ = nullptr)
      : std::runtime_error(message_),
        kind(kind_),
        message(std::move(message_)),
        excerpt(std::move(excerpt_)),
        detail(std::move(detail_)),
        cause(std::move(cause_)) {}

  const char* what() const noexcept override { return message.c_str(); }

  // "recognition" or "extraction" for upstream failures, "" otherwise.
  const char* stage() const noexcept;
};

// ---------------- Logging ----------------

// Sets the level of the "ocr_structured" logger: trace | debug | info | warn | error | critical | off.
// The SPDLOG_LEVEL environment variable is honoured at first use.
void set_log_level(const std::string& level);

// ---------------- Json ----------------

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();

  bool operator==(const Json& other) const { return value == other.value; }
  bool operator!=(const Json& other) const { return !(*this == other); }
};

struct JsonParseError : public std::runtime_error {
  size_t offset;
  JsonParseError(const std::string& reason, size_t offset_)
      : std::runtime_error(reason + " at offset " + std::to_string(offset_)), offset(offset_) {}
};

// Strict RFC 8259 parse of the whole text. Throws JsonParseError.
Json loads_json(const std::string& text);

// Same grammar as loads_json, but stops after the first complete value and ignores
// whatever follows it (a model's note after the JSON, for instance).
Json loads_leading_json(const std::string& text);

std::string dumps_json(const Json& value);

// ---------------- Text normalization ----------------

// Each pass is a single left-to-right substitution over its whole input.
std::string strip_code_fences(const std::string& text);
std::string strip_bold_markers(const std::string& text);
std::string strip_italic_markers(const std::string& text);
std::string strip_header_markers(const std::string& text);
std::string unwrap_links(const std::string& text);
std::string unwrap_inline_code(const std::string& text);

struct NormalizationPass {
  const char* name;
  std::string (*apply)(const std::string&);
};

// The passes in the order normalize_text applies them.
const std::vector<NormalizationPass>& normalization_passes();

// Removes markdown decoration from recognized text and trims the result. Never throws.
std::string normalize_text(const std::string& raw);

// ---------------- Response extraction ----------------

struct JsonCandidate {
  std::string text;
  size_t start{0};  // byte offset of the candidate (fence: of its trimmed body) in the input
  char open{'{'};
  char close{'}'};
  bool from_fence{false};
};

// Locates the single JSON payload in model output: a ``` fenced block first, then the
// balanced object or array that opens earliest.
// Throws ExtractionError (EmptyInput, NoStructureFound, UnbalancedStructure).
JsonCandidate find_json_candidate(const std::string& text);

// find_json_candidate() followed by a parse of its leading value. Additionally throws InvalidJson.
Json extract_json(const std::string& text);

// True when the (non-blank) text starts with a JSON value. Never throws.
bool is_valid_json(const std::string& text) noexcept;

// At most max_bytes of text, cut on a UTF-8 boundary, "..." appended when shortened.
std::string preview_text(const std::string& text, size_t max_bytes = 200);

// ---------------- Prompts ----------------

const std::string& build_ocr_prompt();

// The schema and text are substituted byte-for-byte.
std::string build_extraction_prompt(const std::string& schema, const std::string& text);

// ---------------- Orchestration ----------------

// Opaque extraction instructions; only checked for blankness.
class ExtractionSchema {
 public:
  static ExtractionSchema from_string(std::string raw);

  const std::string& raw() const { return raw_; }

  bool operator==(const ExtractionSchema& other) const { return raw_ == other.raw_; }
  bool operator!=(const ExtractionSchema& other) const { return raw_ != other.raw_; }

 private:
  explicit ExtractionSchema(std::string raw) : raw_(std::move(raw)) {}
  std::string raw_;
};

using ImageBytes = std::vector<uint8_t>;

struct ExtractionRequest {
  std::optional<ImageBytes> image;
  std::optional<std::string> text;
  std::string schema;
};

// (model, prompt, image) -> raw recognized text
using RecognitionCapability =
    std::function<std::string(const std::string& model, const std::string& prompt, const ImageBytes& image)>;

// (model, prompt) -> raw generated text
using GenerationCapability = std::function<std::string(const std::string& model, const std::string& prompt)>;

struct PipelineConfig {
  std::string vision_model{"llama3.2-vision"};
  std::string text_model{"llama3.2"};
};

class ExtractionPipeline {
 public:
  // Throws std::invalid_argument when a capability is empty.
  ExtractionPipeline(RecognitionCapability recognize, GenerationCapability generate,
                     PipelineConfig config = PipelineConfig{});

  // Image takes precedence over text whenever it is present.
  Json extract(const ExtractionRequest& request) const;
  Json extract(const std::optional<ImageBytes>& image, const std::optional<std::string>& text,
               const std::string& schema) const;

  Json parse_image(const ImageBytes& image, const std::string& schema) const;
  Json parse_image(const ImageBytes& image, const ExtractionSchema& schema) const;
  Json parse_text(const std::string& text, const std::string& schema) const;
  Json parse_text(const std::string& text, const ExtractionSchema& schema) const;

  const PipelineConfig& config() const { return config_; }

 private:
  std::string recognize_text(const ImageBytes& image) const;
  std::string generate(const std::string& text, const std::string& schema) const;

  RecognitionCapability recognize_;
  GenerationCapability generate_;
  PipelineConfig config_;
};

}  // namespace ocr_structured
