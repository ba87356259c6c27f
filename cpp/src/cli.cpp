#include "ocr_structured.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace ocr_structured;

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static ImageBytes read_image(const std::string& path) {
  std::string bytes = read_file(path);
  return ImageBytes(bytes.begin(), bytes.end());
}

static void usage() {
  std::cerr
      << "ocr_structured_cli <normalize|extract|validate|prompt|replay> [options]\n"
      << "  --input <file>          text to process (default: stdin)\n"
      << "  --schema <file>         extraction schema (prompt, replay)\n"
      << "  --text <file>           text to extract from (replay)\n"
      << "  --image <file>          image bytes (replay; takes precedence over --text)\n"
      << "  --ocr-response <file>   recorded recognition output (replay)\n"
      << "  --llm-response <file>   recorded extraction output (replay)\n"
      << "  --vision-model <name>   default: llama3.2-vision\n"
      << "  --text-model <name>     default: llama3.2\n"
      << "  --verbose               debug logging on stderr\n";
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage();
      return 2;
    }

    std::string mode = argv[1];
    std::string input_path;
    std::string schema_path;
    std::string text_path;
    std::string image_path;
    std::string ocr_response_path;
    std::string llm_response_path;
    PipelineConfig config;

    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (a == "--schema" && i + 1 < argc) {
        schema_path = argv[++i];
      } else if (a == "--text" && i + 1 < argc) {
        text_path = argv[++i];
      } else if (a == "--image" && i + 1 < argc) {
        image_path = argv[++i];
      } else if (a == "--ocr-response" && i + 1 < argc) {
        ocr_response_path = argv[++i];
      } else if (a == "--llm-response" && i + 1 < argc) {
        llm_response_path = argv[++i];
      } else if (a == "--vision-model" && i + 1 < argc) {
        config.vision_model = argv[++i];
      } else if (a == "--text-model" && i + 1 < argc) {
        config.text_model = argv[++i];
      } else if (a == "--verbose") {
        set_log_level("debug");
      } else {
        usage();
        return 2;
      }
    }

    if (mode == "normalize") {
      std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
      std::cout << normalize_text(input) << "\n";
      return 0;
    }

    if (mode == "extract") {
      std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
      std::cout << dumps_json(extract_json(input)) << "\n";
      return 0;
    }

    if (mode == "validate") {
      std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
      const bool ok = is_valid_json(input);
      std::cout << (ok ? "true" : "false") << "\n";
      return ok ? 0 : 1;
    }

    if (mode == "prompt") {
      if (schema_path.empty()) {
        usage();
        return 2;
      }
      std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
      std::cout << build_extraction_prompt(read_file(schema_path), input) << "\n";
      return 0;
    }

    if (mode == "replay") {
      if (schema_path.empty() || llm_response_path.empty() || (!image_path.empty() && ocr_response_path.empty())) {
        usage();
        return 2;
      }
      // Recorded model outputs stand in for the live capabilities.
      const std::string ocr_response = ocr_response_path.empty() ? "" : read_file(ocr_response_path);
      const std::string llm_response = read_file(llm_response_path);
      ExtractionPipeline pipeline(
          [&](const std::string&, const std::string&, const ImageBytes&) { return ocr_response; },
          [&](const std::string&, const std::string&) { return llm_response; }, config);

      ExtractionRequest request;
      request.schema = read_file(schema_path);
      if (!image_path.empty()) request.image = read_image(image_path);
      if (!text_path.empty()) request.text = read_file(text_path);
      std::cout << dumps_json(pipeline.extract(request)) << "\n";
      return 0;
    }

    usage();
    return 2;
  } catch (const ExtractionError& e) {
    JsonObject o;
    o["error"] = std::string(e.what());
    o["kind"] = error_kind_name(e.kind);
    o["category"] = error_category(e.kind);
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
