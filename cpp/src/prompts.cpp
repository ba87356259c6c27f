#include "ocr_structured.hpp"

namespace ocr_structured {

static const char* const kOcrPrompt = R"(You are an OCR engine.

Extract ALL readable text from the provided image.
Preserve original wording, numbers, dates, reference numbers, and currency values.
Do NOT summarize.
Do NOT interpret.
Do NOT extract fields.
Do NOT add explanations.

Return plain text only.)";

static const char* const kExtractionPreamble = R"(You are a data extraction engine. Your output must be ONLY a JSON object, nothing else.

You are given:
1. A JSON schema describing fields to extract
2. A block of unstructured text

Rules:
- Output MUST start with { and end with }
- Return ONLY valid JSON - no text before or after
- Use exactly the field names from the schema
- If a value is not found, use null
- Do NOT guess or hallucinate values
- Dates must be ISO-8601 format (YYYY-MM-DD)
- Numbers must be numeric (no currency symbols)
- Do NOT include explanations or comments
- Do NOT include markdown
- NEVER respond with anything other than a JSON object

Schema:
)";

static const char* const kExtractionTextHeader = "\n\nText:\n";
static const char* const kExtractionTrailer = "\n\nRespond with JSON only:";

const std::string& build_ocr_prompt() {
  static const std::string prompt(kOcrPrompt);
  return prompt;
}

std::string build_extraction_prompt(const std::string& schema, const std::string& text) {
  std::string out(kExtractionPreamble);
  out.reserve(out.size() + schema.size() + text.size() + 48);
  out += schema;
  out += kExtractionTextHeader;
  out += text;
  out += kExtractionTrailer;
  return out;
}

}  // namespace ocr_structured
