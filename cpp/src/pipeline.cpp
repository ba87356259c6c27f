#include "ocr_structured.hpp"

#include "logging.hpp"
#include "strings.hpp"

namespace ocr_structured {

[[noreturn]] static void reject(ErrorKind kind, const std::string& message) {
  get_logger()->warn("{}: {}", error_kind_name(kind), message);
  throw ExtractionError(kind, message);
}

static std::string describe(const std::exception_ptr& cause) {
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

// Wraps whatever a capability threw; the original exception stays reachable through `cause`.
static ExtractionError upstream_failure(ErrorKind kind, const char* prefix, std::exception_ptr cause) {
  const std::string detail = describe(cause);
  get_logger()->warn("{}: {}: {}", error_kind_name(kind), prefix, detail);
  return ExtractionError(kind, std::string(prefix) + ": " + detail, "", detail, std::move(cause));
}

ExtractionSchema ExtractionSchema::from_string(std::string raw) {
  if (is_blank(raw)) reject(ErrorKind::BlankSchema, "extraction schema must not be blank");
  return ExtractionSchema(std::move(raw));
}

ExtractionPipeline::ExtractionPipeline(RecognitionCapability recognize, GenerationCapability generate,
                                       PipelineConfig config)
    : recognize_(std::move(recognize)), generate_(std::move(generate)), config_(std::move(config)) {
  if (!recognize_) throw std::invalid_argument("recognition capability must not be empty");
  if (!generate_) throw std::invalid_argument("generation capability must not be empty");
}

Json ExtractionPipeline::extract(const ExtractionRequest& request) const {
  return extract(request.image, request.text, request.schema);
}

Json ExtractionPipeline::extract(const std::optional<ImageBytes>& image, const std::optional<std::string>& text,
                                 const std::string& schema) const {
  if (!image && !text) reject(ErrorKind::MissingInput, "at least one of image or text must be provided");
  if (is_blank(schema)) reject(ErrorKind::BlankSchema, "extraction schema must not be blank");

  std::string resolved;
  if (image) {
    if (text) get_logger()->debug("image and text both supplied; using the image");
    if (image->empty()) reject(ErrorKind::EmptyImage, "image must not be empty");
    resolved = normalize_text(recognize_text(*image));
    if (resolved.empty()) reject(ErrorKind::NoTextRecognized, "no text was recognized in the image");
  } else {
    if (is_blank(*text)) reject(ErrorKind::BlankText, "text must not be blank");
    resolved = *text;
  }

  const std::string response = generate(resolved, schema);
  try {
    return extract_json(response);
  } catch (const ExtractionError& e) {
    get_logger()->warn("{}: {}", error_kind_name(e.kind), e.message);
    throw;
  }
}

Json ExtractionPipeline::parse_image(const ImageBytes& image, const std::string& schema) const {
  return extract(image, std::nullopt, schema);
}

Json ExtractionPipeline::parse_image(const ImageBytes& image, const ExtractionSchema& schema) const {
  return parse_image(image, schema.raw());
}

Json ExtractionPipeline::parse_text(const std::string& text, const std::string& schema) const {
  return extract(std::nullopt, text, schema);
}

Json ExtractionPipeline::parse_text(const std::string& text, const ExtractionSchema& schema) const {
  return parse_text(text, schema.raw());
}

std::string ExtractionPipeline::recognize_text(const ImageBytes& image) const {
  get_logger()->debug("recognition: model={} image_bytes={}", config_.vision_model, image.size());
  try {
    return recognize_(config_.vision_model, build_ocr_prompt(), image);
  } catch (...) {
    throw upstream_failure(ErrorKind::RecognitionFailed, "OCR failed", std::current_exception());
  }
}

std::string ExtractionPipeline::generate(const std::string& text, const std::string& schema) const {
  get_logger()->debug("extraction: model={} text_bytes={}", config_.text_model, text.size());
  try {
    return generate_(config_.text_model, build_extraction_prompt(schema, text));
  } catch (...) {
    throw upstream_failure(ErrorKind::ExtractionFailed, "Extraction failed", std::current_exception());
  }
}

}  // namespace ocr_structured
