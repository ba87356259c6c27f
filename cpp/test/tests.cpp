#include "ocr_structured.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using namespace ocr_structured;

template <typename Fn>
static ExtractionError expect_error(ErrorKind kind, Fn fn) {
  try {
    fn();
  } catch (const ExtractionError& e) {
    if (e.kind != kind) {
      std::cerr << "  expected " << error_kind_name(kind) << ", got " << error_kind_name(e.kind) << ": " << e.what()
                << "\n";
    }
    assert(e.kind == kind);
    return e;
  }
  assert(false && "expected ExtractionError");
  return ExtractionError(kind, "");
}

// Stands in for the two model capabilities and records what they were asked.
struct FakeModels {
  std::string ocr_response;
  std::string llm_response;
  bool fail_recognition{false};
  bool fail_generation{false};

  int recognition_calls{0};
  int generation_calls{0};
  std::string vision_model;
  std::string ocr_prompt;
  ImageBytes image;
  std::string text_model;
  std::string prompt;

  ExtractionPipeline pipeline(PipelineConfig config = PipelineConfig{}) {
    return ExtractionPipeline(
        [this](const std::string& model, const std::string& p, const ImageBytes& img) {
          ++recognition_calls;
          vision_model = model;
          ocr_prompt = p;
          image = img;
          if (fail_recognition) throw std::runtime_error("vision model unreachable");
          return ocr_response;
        },
        [this](const std::string& model, const std::string& p) {
          ++generation_calls;
          text_model = model;
          prompt = p;
          if (fail_generation) throw std::runtime_error("request timed out");
          return llm_response;
        },
        std::move(config));
  }
};

static const std::string kSchema = "{\"type\": \"object\"}";
static const ImageBytes kPng = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

// ---------------- Json ----------------

static void test_loads_json_strict() {
  Json v = loads_json("{\"name\": \"test\", \"value\": 123, \"ok\": true, \"none\": null, \"list\": [1.5, -2e3]}");
  assert(v.is_object());
  const auto& o = v.as_object();
  assert(o.at("name").as_string() == "test");
  assert(o.at("value").as_number() == 123);
  assert(o.at("ok").as_bool());
  assert(o.at("none").is_null());
  assert(o.at("list").as_array().size() == 2);
  assert(o.at("list").as_array()[1].as_number() == -2000);

  const char* rejected[] = {
      "{\"a\": 1,}",          // trailing comma
      "{'a': 1}",             // single quotes
      "{a: 1}",               // unquoted key
      "[01]",                 // leading zero
      "[1.]",                 // missing fraction digits
      "[\"bad \\x escape\"]",  // unknown escape
      "[\"tab\there\"]",      // raw control character
      "{\"a\": 1} extra",     // trailing data
      "[true, nul]",
      "",
  };
  for (const char* text : rejected) {
    bool threw = false;
    try {
      (void)loads_json(text);
    } catch (const JsonParseError&) {
      threw = true;
    }
    if (!threw) std::cerr << "  accepted: " << text << "\n";
    assert(threw);
  }
}

static void test_loads_json_unicode_and_duplicates() {
  Json v = loads_json("{\"e\": \"caf\\u00e9\", \"smile\": \"\\ud83d\\ude00\", \"k\": 1, \"k\": 2}");
  const auto& o = v.as_object();
  assert(o.at("e").as_string() == "caf\xC3\xA9");
  assert(o.at("smile").as_string() == "\xF0\x9F\x98\x80");
  assert(o.at("k").as_number() == 2);

  try {
    (void)loads_json("[\"\\udc00\"]");
    assert(false && "expected JsonParseError");
  } catch (const JsonParseError& e) {
    assert(e.offset > 0);
  }
}

static void test_loads_json_depth_limit() {
  std::string ok = std::string(1000, '[') + std::string(1000, ']');
  assert(loads_json(ok).is_array());

  std::string deep = std::string(1001, '[') + std::string(1001, ']');
  try {
    (void)loads_json(deep);
    assert(false && "expected JsonParseError");
  } catch (const JsonParseError& e) {
    assert(std::string(e.what()).find("nesting") != std::string::npos);
  }
}

static void test_loads_leading_json() {
  assert(loads_leading_json("{\"a\": 1} extra").as_object().at("a").as_number() == 1);
  assert(loads_leading_json("  [1] [2]") == loads_json("[1]"));
  assert(loads_leading_json("{\"a\": 1}}").is_object());

  const char* rejected[] = {"", "   ", "note {\"a\": 1}", "{\"a\": 1,}"};
  for (const char* text : rejected) {
    bool threw = false;
    try {
      (void)loads_leading_json(text);
    } catch (const JsonParseError&) {
      threw = true;
    }
    assert(threw);
  }
}

static void test_dumps_json() {
  Json v = loads_json("{\"b\": [1, 2.5, \"x\\ny\"], \"a\": null}");
  assert(dumps_json(v) == "{\"a\":null,\"b\":[1,2.5,\"x\\ny\"]}");
  assert(loads_json(dumps_json(v)) == v);
}

// ---------------- Text normalization ----------------

static void test_normalize_literal_examples() {
  assert(normalize_text("**bold**") == "bold");
  assert(normalize_text("## Header\nBody") == "Header\nBody");
  assert(normalize_text("`code`") == "code");
  assert(normalize_text("```text\nX\n```") == "X");
  assert(normalize_text("") == "");
  assert(normalize_text("  \n\t ") == "");
}

static void test_normalize_individual_passes() {
  assert(strip_code_fences("```python\nprint(1)\n```") == "print(1)\n");
  assert(strip_code_fences("```JSON\nX```") == "JSON\nX");

  assert(strip_bold_markers("__strong__ and **bold**") == "strong and bold");
  assert(strip_bold_markers("***x***") == "*x*");

  assert(strip_italic_markers("*it* and _em_") == "it and em");
  assert(strip_italic_markers("a ** b") == "a ** b");
  assert(strip_italic_markers("snake_case") == "snakecase");

  assert(strip_header_markers("# One\n### Three\ntext # not a header") == "One\nThree\ntext # not a header");
  assert(strip_header_markers("####### seven") == "####### seven");
  assert(strip_header_markers("#hashtag") == "#hashtag");
  assert(strip_header_markers("#\n\nBody") == "Body");

  assert(unwrap_links("see [Docs](https://example.com/a) now") == "see Docs now");
  assert(unwrap_links("[](empty) [x]() [y] (z)") == "[](empty) [x]() [y] (z)");

  assert(unwrap_inline_code("run `make` then `ctest`") == "run make then ctest");
  assert(unwrap_inline_code("``x`") == "`x");
}

static void test_normalize_pass_order() {
  const auto& passes = normalization_passes();
  assert(passes.size() == 6);
  assert(std::string(passes[0].name) == "code_fences");
  assert(std::string(passes[1].name) == "bold");
  assert(std::string(passes[2].name) == "italic");
  assert(std::string(passes[3].name) == "headers");
  assert(std::string(passes[4].name) == "links");
  assert(std::string(passes[5].name) == "inline_code");

  // Bold runs before italic, so the leftover single marker is removed afterwards.
  assert(normalize_text("***x***") == "x");
  assert(normalize_text("**`x`**") == "x");

  std::string recognized =
      "```markdown\n# INVOICE\n**Vendor:** Test Vendor Inc.\n"
      "Total: *$500.00* see [terms](https://t.example)\n```";
  assert(normalize_text(recognized) == "INVOICE\nVendor: Test Vendor Inc.\nTotal: $500.00 see terms");
}

// ---------------- Response extraction ----------------

static void test_extract_with_surrounding_noise() {
  Json expected = loads_json("{\"a\": 1, \"b\": [1, 2, {\"c\": \"x\"}], \"d\": null}");
  std::string text = "Sure! Here is the result:\n" + dumps_json(expected) + "\nI hope this helps!";
  assert(extract_json(text) == expected);

  Json arr = loads_json("[{\"id\": 1}, {\"id\": 2}]");
  assert(extract_json("Items follow -> " + dumps_json(arr) + " <- done") == arr);
}

static void test_extract_fenced_block() {
  Json expected = loads_json("[{\"name\": \"Item 1\"}, {\"name\": \"Item 2\"}]");
  std::string text =
      "Here is the data you requested (see {notes} below):\n```json\n" + dumps_json(expected) +
      "\n```\nHope this helps! [1]";
  assert(extract_json(text) == expected);

  JsonCandidate cand = find_json_candidate(text);
  assert(cand.from_fence);
  assert(text.compare(cand.start, cand.text.size(), cand.text) == 0);

  assert(extract_json("```JSON\n{\"a\": 1}\n```").as_object().at("a").as_number() == 1);
  assert(extract_json("```\n{\"a\": 2}\n```").as_object().at("a").as_number() == 2);
}

static void test_extract_fence_fallbacks() {
  // Unclosed fence: bracket search takes over.
  assert(extract_json("```json\n{\"a\": 1}").as_object().at("a").as_number() == 1);
  // Empty fence body: bracket search takes over.
  assert(extract_json("``````\n{\"a\": 2}").as_object().at("a").as_number() == 2);
  // A fenced scalar is not a structured value.
  expect_error(ErrorKind::InvalidJson, [] { (void)extract_json("```json\n42\n```"); });

  // An empty first fence hands over to the bracket search, not to the next fence.
  const std::string two_fences = "```\n```\n[1] then ```json\n{\"a\": 1}\n```";
  JsonCandidate cand = find_json_candidate(two_fences);
  assert(!cand.from_fence);
  assert(cand.text == "[1]");
  assert(extract_json(two_fences) == loads_json("[1]"));
}

static void test_extract_fence_with_trailing_note() {
  Json v = extract_json("```json\n{\"total\": 42}\nNote: amounts in EUR\n```");
  assert(v == loads_json("{\"total\": 42}"));

  // The note may hold delimiters of its own; only the leading value counts.
  const std::string text = "Result:\n```json\n{\"a\": [1, 2]}\nsee {notes} and [1]\n```";
  JsonCandidate cand = find_json_candidate(text);
  assert(cand.from_fence);
  assert(cand.text == "{\"a\": [1, 2]}\nsee {notes} and [1]");
  assert(extract_json(text) == loads_json("{\"a\": [1, 2]}"));

  // Commentary in front of the value is still invalid.
  ExtractionError e =
      expect_error(ErrorKind::InvalidJson, [] { (void)extract_json("```json\nNote: {\"a\": 1}\n```"); });
  assert(e.excerpt == "Note: {\"a\": 1}");
}

static void test_extract_braces_inside_strings() {
  Json v = extract_json("{\"text\":\"a{b}c\"}");
  assert(v.as_object().at("text").as_string() == "a{b}c");

  JsonCandidate cand = find_json_candidate("x {\"text\":\"a{b}c\"} trailing }");
  assert(cand.text == "{\"text\":\"a{b}c\"}");
  assert(cand.start == 2);
  assert(!cand.from_fence);
}

static void test_extract_escaped_quote() {
  std::string text = R"(prefix {"text":"a\"}b"} suffix)";
  JsonCandidate cand = find_json_candidate(text);
  assert(cand.text == R"({"text":"a\"}b"})");
  assert(extract_json(text).as_object().at("text").as_string() == "a\"}b");

  // An escaped backslash does not escape the closing quote.
  assert(extract_json(R"({"p":"C:\\"} tail)").as_object().at("p").as_string() == "C:\\");
}

static void test_extract_earliest_opening_wins() {
  Json a = extract_json("values: [1, 2] then {\"a\": 1}");
  assert(a.is_array());
  assert(a.as_array().size() == 2);

  Json o = extract_json("record {\"a\": [1]} and list [2]");
  assert(o.is_object());

  JsonCandidate c = find_json_candidate("[x] {\"a\":1}");
  assert(c.open == '[');
  assert(c.close == ']');
}

static void test_extract_no_structure() {
  ExtractionError e = expect_error(ErrorKind::NoStructureFound, [] { (void)extract_json("no json here"); });
  assert(e.excerpt == "no json here");
  assert(e.message.find("Preview: no json here") != std::string::npos);
  assert(std::string(error_category(e.kind)) == "extraction");

  // An opening delimiter without any closing one is not a structure either.
  expect_error(ErrorKind::NoStructureFound, [] { (void)extract_json("just { an opener"); });

  std::string longtext(500, 'z');
  ExtractionError big = expect_error(ErrorKind::NoStructureFound, [&] { (void)extract_json(longtext); });
  assert(big.excerpt == std::string(200, 'z') + "...");
}

static void test_extract_unbalanced() {
  ExtractionError e =
      expect_error(ErrorKind::UnbalancedStructure, [] { (void)extract_json("result: {\"a\": {\"b\": 1}"); });
  assert(e.excerpt == "{\"a\": {\"b\": 1}");

  expect_error(ErrorKind::UnbalancedStructure, [] { (void)extract_json("[[1, 2]"); });
}

static void test_extract_invalid_and_empty() {
  ExtractionError e = expect_error(ErrorKind::InvalidJson, [] { (void)extract_json("{invalid}"); });
  assert(e.excerpt == "{invalid}");
  assert(!e.detail.empty());
  assert(e.message.find("Extracted: {invalid}") != std::string::npos);

  expect_error(ErrorKind::InvalidJson, [] { (void)extract_json("{\"a\": 1,}"); });
  expect_error(ErrorKind::EmptyInput, [] { (void)extract_json(""); });
  expect_error(ErrorKind::EmptyInput, [] { (void)extract_json("   \n"); });
}

static void test_is_valid_json() {
  assert(is_valid_json("{\"key\": \"value\"}"));
  assert(is_valid_json("[1, 2]"));
  assert(is_valid_json("42"));
  assert(!is_valid_json("{invalid}"));
  assert(!is_valid_json("Here: {\"key\": 1}"));
  assert(is_valid_json("{\"a\":1} trailing"));
  assert(is_valid_json("[1, 2]\n-- end of output"));
  assert(!is_valid_json("   "));
  assert(!is_valid_json(""));
}

static void test_preview_text_utf8_boundary() {
  std::string s = std::string(199, 'a') + "\xC3\xA9" + "tail";
  std::string p = preview_text(s);
  assert(p == std::string(199, 'a') + "...");
  assert(preview_text("short") == "short");
}

// ---------------- Prompts / schema ----------------

static void test_prompts() {
  const std::string& ocr = build_ocr_prompt();
  assert(ocr.find("You are an OCR engine.") == 0);
  assert(ocr.find("Return plain text only.") != std::string::npos);

  std::string schema = "{\"invoiceNumber\": \"string\", \"total\": \"number\"}";
  std::string text = "Invoice Number: INV-1 %s";
  std::string prompt = build_extraction_prompt(schema, text);
  assert(prompt.find("Schema:\n" + schema + "\n\nText:\n" + text + "\n\nRespond with JSON only:") !=
         std::string::npos);
}

static void test_extraction_schema() {
  ExtractionSchema s = ExtractionSchema::from_string("{\"name\": \"string\"}");
  assert(s.raw() == "{\"name\": \"string\"}");
  assert(s == ExtractionSchema::from_string("{\"name\": \"string\"}"));
  assert(s != ExtractionSchema::from_string("{\"other\": \"string\"}"));
  expect_error(ErrorKind::BlankSchema, [] { (void)ExtractionSchema::from_string(" \t"); });
}

// ---------------- Orchestration ----------------

static void test_pipeline_text_path() {
  FakeModels m;
  m.llm_response = "{\"name\": \"test\"}";
  auto pipeline = m.pipeline();

  const std::string text = "**Customer**: test";
  Json v = pipeline.parse_text(text, kSchema);
  assert(v.as_object().at("name").as_string() == "test");
  assert(m.recognition_calls == 0);
  assert(m.generation_calls == 1);
  assert(m.text_model == "llama3.2");
  // Caller-supplied text is passed through without normalization.
  assert(m.prompt == build_extraction_prompt(kSchema, text));
}

static void test_pipeline_image_path() {
  FakeModels m;
  m.ocr_response = "## INVOICE\nTotal: **$500.00**";
  m.llm_response = "```json\n{\"total\": 500.0}\n```";
  auto pipeline = m.pipeline();

  Json v = pipeline.parse_image(kPng, ExtractionSchema::from_string(kSchema));
  assert(v.as_object().at("total").as_number() == 500.0);
  assert(m.recognition_calls == 1);
  assert(m.vision_model == "llama3.2-vision");
  assert(m.ocr_prompt == build_ocr_prompt());
  assert(m.image == kPng);
  assert(m.prompt == build_extraction_prompt(kSchema, "INVOICE\nTotal: $500.00"));
}

static void test_pipeline_image_takes_precedence() {
  FakeModels m;
  m.ocr_response = "OCR extracted text";
  m.llm_response = "{\"name\": \"from image\"}";
  auto pipeline = m.pipeline();

  ExtractionRequest request;
  request.image = kPng;
  request.text = std::string("Direct text (should be ignored)");
  request.schema = kSchema;
  Json v = pipeline.extract(request);

  assert(v.as_object().at("name").as_string() == "from image");
  assert(m.recognition_calls == 1);
  assert(m.generation_calls == 1);
  assert(m.prompt.find("OCR extracted text") != std::string::npos);
  assert(m.prompt.find("Direct text") == std::string::npos);
}

static void test_pipeline_precedence_holds_on_failure() {
  FakeModels m;
  m.fail_recognition = true;
  m.llm_response = "{}";
  auto pipeline = m.pipeline();

  ExtractionError e =
      expect_error(ErrorKind::RecognitionFailed, [&] { (void)pipeline.extract(kPng, std::string("usable text"), kSchema); });
  assert(std::string(e.stage()) == "recognition");
  assert(m.generation_calls == 0);

  // An empty image is rejected even when usable text is supplied alongside.
  expect_error(ErrorKind::EmptyImage, [&] { (void)pipeline.extract(ImageBytes{}, std::string("usable text"), kSchema); });
  assert(m.recognition_calls == 1);
}

static void test_pipeline_validation() {
  FakeModels m;
  m.llm_response = "{}";
  auto pipeline = m.pipeline();

  expect_error(ErrorKind::EmptyImage, [&] { (void)pipeline.extract(ImageBytes{}, std::nullopt, kSchema); });
  expect_error(ErrorKind::BlankText, [&] { (void)pipeline.extract(std::nullopt, std::string("  \n"), kSchema); });
  ExtractionError missing =
      expect_error(ErrorKind::MissingInput, [&] { (void)pipeline.extract(std::nullopt, std::nullopt, kSchema); });
  assert(std::string(error_category(missing.kind)) == "input");
  assert(std::string(missing.stage()).empty());
  expect_error(ErrorKind::BlankSchema, [&] { (void)pipeline.parse_text("text", "   "); });
  // Missing input is reported before a blank schema.
  expect_error(ErrorKind::MissingInput, [&] { (void)pipeline.extract(std::nullopt, std::nullopt, ""); });

  assert(m.recognition_calls == 0);
  assert(m.generation_calls == 0);
}

static void test_pipeline_blank_recognition() {
  FakeModels m;
  m.ocr_response = "```\n```";
  m.llm_response = "{}";
  auto pipeline = m.pipeline();

  expect_error(ErrorKind::NoTextRecognized, [&] { (void)pipeline.parse_image(kPng, kSchema); });
  assert(m.generation_calls == 0);
}

static void test_pipeline_upstream_failure_keeps_cause() {
  FakeModels m;
  m.fail_generation = true;
  auto pipeline = m.pipeline();

  ExtractionError e = expect_error(ErrorKind::ExtractionFailed, [&] { (void)pipeline.parse_text("text", kSchema); });
  assert(std::string(e.stage()) == "extraction");
  assert(std::string(error_category(e.kind)) == "upstream");
  assert(e.detail == "request timed out");
  assert(e.message == "Extraction failed: request timed out");
  assert(e.cause);
  try {
    std::rethrow_exception(e.cause);
  } catch (const std::runtime_error& original) {
    assert(std::string(original.what()) == "request timed out");
  }
}

static void test_pipeline_extraction_errors_propagate() {
  FakeModels m;
  m.llm_response = "I could not find any fields in this document.";
  auto pipeline = m.pipeline();
  expect_error(ErrorKind::NoStructureFound, [&] { (void)pipeline.parse_text("text", kSchema); });

  m.llm_response = "{\"total\": {\"net\": 12.5}";
  expect_error(ErrorKind::UnbalancedStructure, [&] { (void)pipeline.parse_text("text", kSchema); });

  m.llm_response = "{\"total\": $12.50}";
  expect_error(ErrorKind::InvalidJson, [&] { (void)pipeline.parse_text("text", kSchema); });
}

static void test_pipeline_config_and_construction() {
  FakeModels m;
  m.ocr_response = "Customer: Jane Doe";
  m.llm_response = "{\"customerName\": \"Jane Doe\"}";
  PipelineConfig cfg;
  cfg.vision_model = "custom-vision";
  cfg.text_model = "custom-text";
  auto pipeline = m.pipeline(cfg);

  (void)pipeline.parse_image(kPng, kSchema);
  assert(m.vision_model == "custom-vision");
  assert(m.text_model == "custom-text");
  assert(pipeline.config().text_model == "custom-text");

  bool threw = false;
  try {
    ExtractionPipeline broken(RecognitionCapability{}, [](const std::string&, const std::string&) {
      return std::string("{}");
    });
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

static void test_pipeline_invoice_scenario() {
  FakeModels m;
  m.ocr_response =
      "**INVOICE**\nTest Vendor Inc.\nInvoice Number: INV-2024-001\nDate: 2024-03-15\nTotal Amount: $500.00";
  m.llm_response =
      "Here is the extracted data:\n```json\n{\"invoiceNumber\": \"INV-2024-001\", \"date\": \"2024-03-15\", "
      "\"totalAmount\": 500.00, \"vendorName\": \"Test Vendor Inc.\", \"notes\": null}\n```";
  auto pipeline = m.pipeline();

  Json v = pipeline.parse_image(kPng, "{\"invoiceNumber\": \"string\", \"totalAmount\": \"number\"}");
  const auto& o = v.as_object();
  assert(o.at("invoiceNumber").as_string() == "INV-2024-001");
  assert(o.at("date").as_string() == "2024-03-15");
  assert(o.at("totalAmount").as_number() == 500.0);
  assert(o.at("vendorName").as_string() == "Test Vendor Inc.");
  assert(o.at("notes").is_null());
  assert(m.prompt.find("INVOICE\nTest Vendor Inc.") != std::string::npos);
}

static void test_logger_survives_registry_drop() {
  spdlog::drop_all();
  set_log_level("off");
  expect_error(ErrorKind::BlankSchema, [] { (void)ExtractionSchema::from_string(" "); });

  FakeModels m;
  m.fail_generation = true;
  auto pipeline = m.pipeline();
  expect_error(ErrorKind::ExtractionFailed, [&] { (void)pipeline.parse_text("text", kSchema); });
}

int main() {
  set_log_level("off");

  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("loads_json_strict", test_loads_json_strict);
    run("loads_json_unicode_and_duplicates", test_loads_json_unicode_and_duplicates);
    run("loads_json_depth_limit", test_loads_json_depth_limit);
    run("loads_leading_json", test_loads_leading_json);
    run("dumps_json", test_dumps_json);
    run("normalize_literal_examples", test_normalize_literal_examples);
    run("normalize_individual_passes", test_normalize_individual_passes);
    run("normalize_pass_order", test_normalize_pass_order);
    run("extract_with_surrounding_noise", test_extract_with_surrounding_noise);
    run("extract_fenced_block", test_extract_fenced_block);
    run("extract_fence_fallbacks", test_extract_fence_fallbacks);
    run("extract_fence_with_trailing_note", test_extract_fence_with_trailing_note);
    run("extract_braces_inside_strings", test_extract_braces_inside_strings);
    run("extract_escaped_quote", test_extract_escaped_quote);
    run("extract_earliest_opening_wins", test_extract_earliest_opening_wins);
    run("extract_no_structure", test_extract_no_structure);
    run("extract_unbalanced", test_extract_unbalanced);
    run("extract_invalid_and_empty", test_extract_invalid_and_empty);
    run("is_valid_json", test_is_valid_json);
    run("preview_text_utf8_boundary", test_preview_text_utf8_boundary);
    run("prompts", test_prompts);
    run("extraction_schema", test_extraction_schema);
    run("pipeline_text_path", test_pipeline_text_path);
    run("pipeline_image_path", test_pipeline_image_path);
    run("pipeline_image_takes_precedence", test_pipeline_image_takes_precedence);
    run("pipeline_precedence_holds_on_failure", test_pipeline_precedence_holds_on_failure);
    run("pipeline_validation", test_pipeline_validation);
    run("pipeline_blank_recognition", test_pipeline_blank_recognition);
    run("pipeline_upstream_failure_keeps_cause", test_pipeline_upstream_failure_keeps_cause);
    run("pipeline_extraction_errors_propagate", test_pipeline_extraction_errors_propagate);
    run("pipeline_config_and_construction", test_pipeline_config_and_construction);
    run("pipeline_invoice_scenario", test_pipeline_invoice_scenario);
    run("logger_survives_registry_drop", test_logger_survives_registry_drop);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
