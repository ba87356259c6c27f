#include <node_api.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "ocr_structured.hpp"

using ocr_structured::ExtractionError;
using ocr_structured::ExtractionPipeline;
using ocr_structured::ImageBytes;
using ocr_structured::Json;
using ocr_structured::JsonCandidate;
using ocr_structured::PipelineConfig;

static void ThrowTypeError(napi_env env, const char* msg) { napi_throw_type_error(env, nullptr, msg); }

static napi_value MakeString(napi_env env, const std::string& s) {
  napi_value out;
  napi_create_string_utf8(env, s.c_str(), s.size(), &out);
  return out;
}

static bool GetStringUtf8(napi_env env, napi_value v, std::string& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_string) return false;

  size_t len = 0;
  if (napi_get_value_string_utf8(env, v, nullptr, 0, &len) != napi_ok) return false;

  out.resize(len);
  size_t written = 0;
  if (napi_get_value_string_utf8(env, v, out.data(), out.size() + 1, &written) != napi_ok) return false;
  out.resize(written);
  return true;
}

static bool GetOptionalStringProperty(napi_env env, napi_value obj, const char* key, std::optional<std::string>& out) {
  bool has = false;
  if (napi_has_named_property(env, obj, key, &has) != napi_ok) return false;
  if (!has) return true;

  napi_value v;
  if (napi_get_named_property(env, obj, key, &v) != napi_ok) return false;

  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t == napi_undefined || t == napi_null) return true;
  std::string s;
  if (!GetStringUtf8(env, v, s)) {
    ThrowTypeError(env, (std::string(key) + " must be a string").c_str());
    return false;
  }
  out = std::move(s);
  return true;
}

// Buffer or any Uint8Array.
static bool GetBytes(napi_env env, napi_value v, ImageBytes& out) {
  bool is_buffer = false;
  if (napi_is_buffer(env, v, &is_buffer) != napi_ok) return false;
  if (is_buffer) {
    void* data = nullptr;
    size_t len = 0;
    if (napi_get_buffer_info(env, v, &data, &len) != napi_ok) return false;
    const auto* p = static_cast<const uint8_t*>(data);
    out.assign(p, p + len);
    return true;
  }

  bool is_typed = false;
  if (napi_is_typedarray(env, v, &is_typed) != napi_ok || !is_typed) return false;
  napi_typedarray_type type;
  size_t len = 0;
  void* data = nullptr;
  if (napi_get_typedarray_info(env, v, &type, &len, &data, nullptr, nullptr) != napi_ok) return false;
  if (type != napi_uint8_array) return false;
  const auto* p = static_cast<const uint8_t*>(data);
  out.assign(p, p + len);
  return true;
}

static napi_value ToNapi(napi_env env, const Json& v);

static bool FromNapi(napi_env env, napi_value v, Json& out);

static bool FromNapiObject(napi_env env, napi_value v, Json& out) {
  napi_value names;
  if (napi_get_property_names(env, v, &names) != napi_ok) return false;

  uint32_t len = 0;
  if (napi_get_array_length(env, names, &len) != napi_ok) return false;

  ocr_structured::JsonObject obj;
  for (uint32_t i = 0; i < len; ++i) {
    napi_value keyv;
    if (napi_get_element(env, names, i, &keyv) != napi_ok) return false;
    std::string key;
    if (!GetStringUtf8(env, keyv, key)) return false;

    napi_value val;
    if (napi_get_property(env, v, keyv, &val) != napi_ok) return false;

    Json child;
    if (!FromNapi(env, val, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromNapiArray(napi_env env, napi_value v, Json& out) {
  uint32_t len = 0;
  if (napi_get_array_length(env, v, &len) != napi_ok) return false;
  ocr_structured::JsonArray arr;
  arr.reserve(len);
  for (uint32_t i = 0; i < len; ++i) {
    napi_value el;
    if (napi_get_element(env, v, i, &el) != napi_ok) return false;
    Json child;
    if (!FromNapi(env, el, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromNapi(napi_env env, napi_value v, Json& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;

  if (t == napi_null || t == napi_undefined) {
    out = Json(nullptr);
    return true;
  }
  if (t == napi_boolean) {
    bool b = false;
    if (napi_get_value_bool(env, v, &b) != napi_ok) return false;
    out = Json(b);
    return true;
  }
  if (t == napi_number) {
    double n = 0;
    if (napi_get_value_double(env, v, &n) != napi_ok) return false;
    out = Json(n);
    return true;
  }
  if (t == napi_string) {
    std::string s;
    if (!GetStringUtf8(env, v, s)) return false;
    out = Json(std::move(s));
    return true;
  }
  if (t == napi_object) {
    bool is_array = false;
    if (napi_is_array(env, v, &is_array) != napi_ok) return false;
    if (is_array) return FromNapiArray(env, v, out);
    return FromNapiObject(env, v, out);
  }
  return false;
}

static napi_value ToNapiObject(napi_env env, const ocr_structured::JsonObject& o) {
  napi_value obj;
  napi_create_object(env, &obj);
  for (const auto& kv : o) {
    napi_value val = ToNapi(env, kv.second);
    napi_set_named_property(env, obj, kv.first.c_str(), val);
  }
  return obj;
}

static napi_value ToNapiArray(napi_env env, const ocr_structured::JsonArray& a) {
  napi_value arr;
  napi_create_array_with_length(env, a.size(), &arr);
  for (size_t i = 0; i < a.size(); ++i) {
    napi_value val = ToNapi(env, a[i]);
    napi_set_element(env, arr, static_cast<uint32_t>(i), val);
  }
  return arr;
}

static napi_value ToNapi(napi_env env, const Json& v) {
  if (v.is_null()) {
    napi_value n;
    napi_get_null(env, &n);
    return n;
  }
  if (v.is_bool()) {
    napi_value b;
    napi_get_boolean(env, v.as_bool(), &b);
    return b;
  }
  if (v.is_number()) {
    napi_value n;
    napi_create_double(env, v.as_number(), &n);
    return n;
  }
  if (v.is_string()) {
    return MakeString(env, v.as_string());
  }
  if (v.is_array()) {
    return ToNapiArray(env, v.as_array());
  }
  return ToNapiObject(env, v.as_object());
}

// ---------------- errors ----------------

// What a throwing JavaScript capability leaves behind; the pipeline keeps it as the error's cause.
struct JsCallbackError : public std::runtime_error {
  napi_value error;
  JsCallbackError(const std::string& msg, napi_value error_) : std::runtime_error(msg), error(error_) {}
};

static std::string DescribeJsError(napi_env env, napi_value error) {
  napi_value s;
  std::string out;
  if (napi_coerce_to_string(env, error, &s) != napi_ok || !GetStringUtf8(env, s, out)) {
    bool pending = false;
    napi_is_exception_pending(env, &pending);
    if (pending) {
      napi_value ignored;
      napi_get_and_clear_last_exception(env, &ignored);
    }
    return "JavaScript callback threw";
  }
  return out;
}

static void ThrowErrorWithKind(napi_env env, const std::string& msg, const std::string& kind) {
  napi_value message = MakeString(env, msg);

  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "kind", MakeString(env, kind));
  napi_throw(env, err);
}

static void ThrowExtractionError(napi_env env, const ExtractionError& e) {
  napi_value msg = MakeString(env, e.message);

  napi_value err;
  napi_create_error(env, nullptr, msg, &err);
  napi_set_named_property(env, err, "message", msg);
  napi_set_named_property(env, err, "name", MakeString(env, "ExtractionError"));
  napi_set_named_property(env, err, "kind", MakeString(env, ocr_structured::error_kind_name(e.kind)));
  napi_set_named_property(env, err, "category", MakeString(env, ocr_structured::error_category(e.kind)));
  napi_set_named_property(env, err, "stage", MakeString(env, e.stage()));
  napi_set_named_property(env, err, "excerpt", MakeString(env, e.excerpt));
  napi_set_named_property(env, err, "detail", MakeString(env, e.detail));

  if (e.cause) {
    try {
      std::rethrow_exception(e.cause);
    } catch (const JsCallbackError& js) {
      napi_set_named_property(env, err, "cause", js.error);
    } catch (const std::exception&) {
      // native cause: its message is already in `detail`
    }
  }

  napi_throw(env, err);
}

// ---------------- pipeline ----------------

struct NodePipeline {
  napi_env env{nullptr};
  napi_ref recognize{nullptr};
  napi_ref generate{nullptr};
  std::unique_ptr<ExtractionPipeline> pipeline;
};

static void FinalizeNodePipeline(napi_env env, void* data, void* /*hint*/) {
  auto* p = static_cast<NodePipeline*>(data);
  if (p->recognize) napi_delete_reference(env, p->recognize);
  if (p->generate) napi_delete_reference(env, p->generate);
  delete p;
}

static std::string CallJsCapability(napi_env env, napi_ref fn_ref, size_t argc, napi_value* args, const char* what) {
  napi_value fn;
  napi_value global;
  if (napi_get_reference_value(env, fn_ref, &fn) != napi_ok || napi_get_global(env, &global) != napi_ok) {
    throw std::runtime_error(std::string(what) + " callback is no longer available");
  }

  napi_value result;
  napi_status st = napi_call_function(env, global, fn, argc, args, &result);
  if (st == napi_pending_exception) {
    napi_value error;
    napi_get_and_clear_last_exception(env, &error);
    throw JsCallbackError(DescribeJsError(env, error), error);
  }
  if (st != napi_ok) throw std::runtime_error(std::string(what) + " callback could not be called");

  std::string out;
  if (!GetStringUtf8(env, result, out)) throw std::runtime_error(std::string(what) + " callback must return a string");
  return out;
}

static bool IsFunction(napi_env env, napi_value v) {
  napi_valuetype t;
  return napi_typeof(env, v, &t) == napi_ok && t == napi_function;
}

static napi_value CreateExtractionPipeline(napi_env env, napi_callback_info info) {
  size_t argc = 3;
  napi_value argv[3];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 2 || argc > 3) {
    ThrowTypeError(env, "createExtractionPipeline(recognize, generate, options?) expects 2-3 arguments");
    return nullptr;
  }
  if (!IsFunction(env, argv[0]) || !IsFunction(env, argv[1])) {
    ThrowTypeError(env, "createExtractionPipeline(recognize, generate) expects functions");
    return nullptr;
  }

  PipelineConfig config;
  if (argc == 3) {
    napi_valuetype t;
    if (napi_typeof(env, argv[2], &t) != napi_ok) return nullptr;
    if (t != napi_undefined && t != napi_null) {
      if (t != napi_object) {
        ThrowTypeError(env, "createExtractionPipeline(..., options) expects options as object");
        return nullptr;
      }
      std::optional<std::string> vision_model;
      std::optional<std::string> text_model;
      if (!GetOptionalStringProperty(env, argv[2], "visionModel", vision_model)) return nullptr;
      if (!GetOptionalStringProperty(env, argv[2], "textModel", text_model)) return nullptr;
      if (vision_model) config.vision_model = *vision_model;
      if (text_model) config.text_model = *text_model;
    }
  }

  auto holder = std::make_unique<NodePipeline>();
  holder->env = env;
  napi_create_reference(env, argv[0], 1, &holder->recognize);
  napi_create_reference(env, argv[1], 1, &holder->generate);

  NodePipeline* h = holder.get();
  holder->pipeline = std::make_unique<ExtractionPipeline>(
      [h](const std::string& model, const std::string& prompt, const ImageBytes& image) {
        napi_value args[3];
        args[0] = MakeString(h->env, model);
        args[1] = MakeString(h->env, prompt);
        void* copy = nullptr;
        napi_create_buffer_copy(h->env, image.size(), image.data(), &copy, &args[2]);
        return CallJsCapability(h->env, h->recognize, 3, args, "recognize");
      },
      [h](const std::string& model, const std::string& prompt) {
        napi_value args[2];
        args[0] = MakeString(h->env, model);
        args[1] = MakeString(h->env, prompt);
        return CallJsCapability(h->env, h->generate, 2, args, "generate");
      },
      std::move(config));

  napi_value ext;
  if (napi_create_external(env, holder.get(), FinalizeNodePipeline, nullptr, &ext) != napi_ok) {
    napi_delete_reference(env, holder->recognize);
    napi_delete_reference(env, holder->generate);
    return nullptr;
  }
  holder.release();
  return ext;
}

template <typename T>
static bool GetExternalPtr(napi_env env, napi_value v, T*& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_external) return false;
  void* ptr = nullptr;
  if (napi_get_value_external(env, v, &ptr) != napi_ok) return false;
  out = static_cast<T*>(ptr);
  return out != nullptr;
}

template <typename Fn>
static napi_value RunExtraction(napi_env env, Fn fn) {
  try {
    return ToNapi(env, fn());
  } catch (const ExtractionError& e) {
    ThrowExtractionError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowErrorWithKind(env, e.what(), "internal");
    return nullptr;
  }
}

static napi_value ExtractionPipelineExtract(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc != 2) {
    ThrowTypeError(env, "extractionPipelineExtract(pipeline, request) expects 2 arguments");
    return nullptr;
  }

  NodePipeline* p = nullptr;
  if (!GetExternalPtr(env, argv[0], p)) {
    ThrowTypeError(env, "extractionPipelineExtract(pipeline) expects a pipeline external");
    return nullptr;
  }
  napi_valuetype t;
  if (napi_typeof(env, argv[1], &t) != napi_ok) return nullptr;
  if (t != napi_object) {
    ThrowTypeError(env, "extractionPipelineExtract(..., request) expects request as object");
    return nullptr;
  }

  std::optional<ImageBytes> image;
  bool has_image = false;
  if (napi_has_named_property(env, argv[1], "image", &has_image) != napi_ok) return nullptr;
  if (has_image) {
    napi_value v;
    if (napi_get_named_property(env, argv[1], "image", &v) != napi_ok) return nullptr;
    napi_valuetype it;
    if (napi_typeof(env, v, &it) != napi_ok) return nullptr;
    if (it != napi_undefined && it != napi_null) {
      ImageBytes bytes;
      if (!GetBytes(env, v, bytes)) {
        ThrowTypeError(env, "request.image must be a Buffer or Uint8Array");
        return nullptr;
      }
      image = std::move(bytes);
    }
  }

  std::optional<std::string> text;
  std::optional<std::string> schema;
  if (!GetOptionalStringProperty(env, argv[1], "text", text)) return nullptr;
  if (!GetOptionalStringProperty(env, argv[1], "schema", schema)) return nullptr;

  return RunExtraction(env, [&] { return p->pipeline->extract(image, text, schema ? *schema : std::string()); });
}

static napi_value ExtractionPipelineParseImage(napi_env env, napi_callback_info info) {
  size_t argc = 3;
  napi_value argv[3];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc != 3) {
    ThrowTypeError(env, "extractionPipelineParseImage(pipeline, image, schema) expects 3 arguments");
    return nullptr;
  }

  NodePipeline* p = nullptr;
  if (!GetExternalPtr(env, argv[0], p)) {
    ThrowTypeError(env, "extractionPipelineParseImage(pipeline) expects a pipeline external");
    return nullptr;
  }
  ImageBytes image;
  std::string schema;
  if (!GetBytes(env, argv[1], image) || !GetStringUtf8(env, argv[2], schema)) {
    ThrowTypeError(env, "extractionPipelineParseImage(pipeline, image, schema) expects a Buffer and a string");
    return nullptr;
  }

  return RunExtraction(env, [&] { return p->pipeline->parse_image(image, schema); });
}

static napi_value ExtractionPipelineParseText(napi_env env, napi_callback_info info) {
  size_t argc = 3;
  napi_value argv[3];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc != 3) {
    ThrowTypeError(env, "extractionPipelineParseText(pipeline, text, schema) expects 3 arguments");
    return nullptr;
  }

  NodePipeline* p = nullptr;
  if (!GetExternalPtr(env, argv[0], p)) {
    ThrowTypeError(env, "extractionPipelineParseText(pipeline) expects a pipeline external");
    return nullptr;
  }
  std::string text;
  std::string schema;
  if (!GetStringUtf8(env, argv[1], text) || !GetStringUtf8(env, argv[2], schema)) {
    ThrowTypeError(env, "extractionPipelineParseText(pipeline, text, schema) expects strings");
    return nullptr;
  }

  return RunExtraction(env, [&] { return p->pipeline->parse_text(text, schema); });
}

// ---------------- stateless helpers ----------------

static bool GetSingleString(napi_env env, napi_callback_info info, const char* usage, std::string& out) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return false;
  if (argc != 1 || !GetStringUtf8(env, argv[0], out)) {
    ThrowTypeError(env, usage);
    return false;
  }
  return true;
}

static napi_value NormalizeText(napi_env env, napi_callback_info info) {
  std::string text;
  if (!GetSingleString(env, info, "normalizeText(text) expects a string", text)) return nullptr;
  return MakeString(env, ocr_structured::normalize_text(text));
}

static napi_value ExtractJson(napi_env env, napi_callback_info info) {
  std::string text;
  if (!GetSingleString(env, info, "extractJson(text) expects a string", text)) return nullptr;
  return RunExtraction(env, [&] { return ocr_structured::extract_json(text); });
}

static napi_value FindJsonCandidate(napi_env env, napi_callback_info info) {
  std::string text;
  if (!GetSingleString(env, info, "findJsonCandidate(text) expects a string", text)) return nullptr;

  try {
    const JsonCandidate c = ocr_structured::find_json_candidate(text);
    napi_value obj;
    napi_create_object(env, &obj);
    napi_set_named_property(env, obj, "text", MakeString(env, c.text));
    napi_value n;
    napi_create_double(env, static_cast<double>(c.start), &n);
    napi_set_named_property(env, obj, "start", n);
    napi_set_named_property(env, obj, "open", MakeString(env, std::string(1, c.open)));
    napi_set_named_property(env, obj, "close", MakeString(env, std::string(1, c.close)));
    napi_value b;
    napi_get_boolean(env, c.from_fence, &b);
    napi_set_named_property(env, obj, "fromFence", b);
    return obj;
  } catch (const ExtractionError& e) {
    ThrowExtractionError(env, e);
    return nullptr;
  }
}

static napi_value IsValidJson(napi_env env, napi_callback_info info) {
  std::string text;
  if (!GetSingleString(env, info, "isValidJson(text) expects a string", text)) return nullptr;
  napi_value b;
  napi_get_boolean(env, ocr_structured::is_valid_json(text), &b);
  return b;
}

static napi_value DumpsJson(napi_env env, napi_callback_info info) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  Json v;
  if (argc != 1 || !FromNapi(env, argv[0], v)) {
    ThrowTypeError(env, "dumpsJson(value) expects a JSON-serializable value");
    return nullptr;
  }
  return MakeString(env, ocr_structured::dumps_json(v));
}

static napi_value BuildOcrPrompt(napi_env env, napi_callback_info /*info*/) {
  return MakeString(env, ocr_structured::build_ocr_prompt());
}

static napi_value BuildExtractionPrompt(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  std::string schema;
  std::string text;
  if (argc != 2 || !GetStringUtf8(env, argv[0], schema) || !GetStringUtf8(env, argv[1], text)) {
    ThrowTypeError(env, "buildExtractionPrompt(schema, text) expects 2 strings");
    return nullptr;
  }
  return MakeString(env, ocr_structured::build_extraction_prompt(schema, text));
}

static napi_value SetLogLevel(napi_env env, napi_callback_info info) {
  std::string level;
  if (!GetSingleString(env, info, "setLogLevel(level) expects a string", level)) return nullptr;
  ocr_structured::set_log_level(level);
  napi_value undef;
  napi_get_undefined(env, &undef);
  return undef;
}

static napi_value Init(napi_env env, napi_value exports) {
  napi_property_descriptor props[] = {
      {"normalizeText", nullptr, NormalizeText, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"extractJson", nullptr, ExtractJson, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"findJsonCandidate", nullptr, FindJsonCandidate, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"isValidJson", nullptr, IsValidJson, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"dumpsJson", nullptr, DumpsJson, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"buildOcrPrompt", nullptr, BuildOcrPrompt, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"buildExtractionPrompt", nullptr, BuildExtractionPrompt, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"setLogLevel", nullptr, SetLogLevel, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"createExtractionPipeline", nullptr, CreateExtractionPipeline, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"extractionPipelineExtract", nullptr, ExtractionPipelineExtract, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"extractionPipelineParseImage", nullptr, ExtractionPipelineParseImage, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"extractionPipelineParseText", nullptr, ExtractionPipelineParseText, nullptr, nullptr, nullptr, napi_default, nullptr},
  };

  napi_define_properties(env, exports, sizeof(props) / sizeof(props[0]), props);
  return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)
