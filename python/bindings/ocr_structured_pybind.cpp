#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "ocr_structured.hpp"

namespace py = pybind11;

using ocr_structured::ExtractionError;
using ocr_structured::ExtractionPipeline;
using ocr_structured::ImageBytes;
using ocr_structured::Json;
using ocr_structured::JsonArray;
using ocr_structured::JsonCandidate;
using ocr_structured::JsonObject;
using ocr_structured::PipelineConfig;

static py::object ToPy(const Json& v);

static bool FromPy(py::handle v, Json& out);

static py::object ToPyObject(const JsonObject& o) {
  py::dict d;
  for (const auto& kv : o) {
    d[py::str(kv.first)] = ToPy(kv.second);
  }
  return std::move(d);
}

static py::object ToPyArray(const JsonArray& a) {
  py::list out;
  for (const auto& el : a) {
    out.append(ToPy(el));
  }
  return std::move(out);
}

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) return ToPyArray(v.as_array());
  return ToPyObject(v.as_object());
}

static bool FromPyObject(py::handle v, Json& out) {
  py::dict d = py::reinterpret_borrow<py::dict>(v);
  JsonObject obj;
  for (auto item : d) {
    if (!py::isinstance<py::str>(item.first)) return false;
    std::string key = py::cast<std::string>(item.first);
    Json child;
    if (!FromPy(item.second, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromPyArray(py::handle v, Json& out) {
  py::sequence seq = py::reinterpret_borrow<py::sequence>(v);
  JsonArray arr;
  arr.reserve(seq.size());
  for (auto item : seq) {
    Json child;
    if (!FromPy(item, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromPy(py::handle v, Json& out) {
  if (v.is_none()) {
    out = Json(nullptr);
    return true;
  }
  if (py::isinstance<py::bool_>(v)) {
    out = Json(py::cast<bool>(v));
    return true;
  }
  if (py::isinstance<py::int_>(v)) {
    out = Json(py::cast<int64_t>(v));
    return true;
  }
  if (py::isinstance<py::float_>(v)) {
    out = Json(py::cast<double>(v));
    return true;
  }
  if (py::isinstance<py::str>(v)) {
    out = Json(py::cast<std::string>(v));
    return true;
  }
  if (py::isinstance<py::dict>(v)) {
    return FromPyObject(v, out);
  }
  if (py::isinstance<py::list>(v) || py::isinstance<py::tuple>(v)) {
    return FromPyArray(v, out);
  }
  return false;
}

static ImageBytes ImageFromPy(const py::bytes& b) {
  const std::string raw = b;
  return ImageBytes(raw.begin(), raw.end());
}

static py::dict CandidateToPy(const JsonCandidate& c) {
  py::dict d;
  d["text"] = c.text;
  d["start"] = c.start;
  d["open"] = std::string(1, c.open);
  d["close"] = std::string(1, c.close);
  d["from_fence"] = c.from_fence;
  return d;
}

static py::object ExtractionErrorType;

static void TranslateExtractionError(const ExtractionError& e) {
  py::object exc = ExtractionErrorType(py::str(e.message));
  exc.attr("message") = py::str(e.message);
  exc.attr("kind") = py::str(ocr_structured::error_kind_name(e.kind));
  exc.attr("category") = py::str(ocr_structured::error_category(e.kind));
  exc.attr("stage") = py::str(e.stage());
  exc.attr("excerpt") = py::str(e.excerpt);
  exc.attr("detail") = py::str(e.detail);
  if (e.cause) {
    // A failing Python callable surfaces as the exception's __cause__.
    try {
      std::rethrow_exception(e.cause);
    } catch (py::error_already_set& err) {
      exc.attr("__cause__") = err.value();
    } catch (const std::exception&) {
      // native cause: its message is already in `detail`
    }
  }
  PyErr_SetObject(ExtractionErrorType.ptr(), exc.ptr());
}

static ExtractionPipeline MakePipeline(py::function recognize, py::function generate, std::string vision_model,
                                       std::string text_model) {
  PipelineConfig config;
  config.vision_model = std::move(vision_model);
  config.text_model = std::move(text_model);
  return ExtractionPipeline(
      [recognize](const std::string& model, const std::string& prompt, const ImageBytes& image) {
        py::bytes data(reinterpret_cast<const char*>(image.data()), image.size());
        return py::cast<std::string>(recognize(model, prompt, data));
      },
      [generate](const std::string& model, const std::string& prompt) {
        return py::cast<std::string>(generate(model, prompt));
      },
      std::move(config));
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed OCR text normalization and structured extraction (pybind11)";

  ExtractionErrorType =
      py::reinterpret_steal<py::object>(PyErr_NewException("ocr_structured.ExtractionError", PyExc_Exception, nullptr));
  m.attr("ExtractionError") = ExtractionErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const ExtractionError& e) {
      TranslateExtractionError(e);
    }
  });

  m.def("normalize_text", &ocr_structured::normalize_text, py::arg("raw"));
  m.def("is_valid_json", &ocr_structured::is_valid_json, py::arg("text"));
  m.def("build_ocr_prompt", []() { return ocr_structured::build_ocr_prompt(); });
  m.def("build_extraction_prompt", &ocr_structured::build_extraction_prompt, py::arg("schema"), py::arg("text"));
  m.def("set_log_level", &ocr_structured::set_log_level, py::arg("level"));

  m.def("extract_json", [](const std::string& text) { return ToPy(ocr_structured::extract_json(text)); },
        py::arg("text"));

  m.def("find_json_candidate",
        [](const std::string& text) { return CandidateToPy(ocr_structured::find_json_candidate(text)); },
        py::arg("text"));

  m.def("dumps_json", [](py::handle v) {
    Json j;
    if (!FromPy(v, j)) throw std::runtime_error("value must be JSON-serializable");
    return ocr_structured::dumps_json(j);
  });

  py::class_<ExtractionPipeline>(m, "ExtractionPipeline")
      .def(py::init(&MakePipeline), py::arg("recognize"), py::arg("generate"),
           py::arg("vision_model") = PipelineConfig{}.vision_model, py::arg("text_model") = PipelineConfig{}.text_model)
      .def(
          "extract",
          [](const ExtractionPipeline& self, const std::string& schema, std::optional<py::bytes> image,
             std::optional<std::string> text) {
            std::optional<ImageBytes> img;
            if (image) img = ImageFromPy(*image);
            return ToPy(self.extract(img, text, schema));
          },
          py::arg("schema"), py::arg("image") = py::none(), py::arg("text") = py::none())
      .def(
          "parse_image",
          [](const ExtractionPipeline& self, const py::bytes& image, const std::string& schema) {
            return ToPy(self.parse_image(ImageFromPy(image), schema));
          },
          py::arg("image"), py::arg("schema"))
      .def(
          "parse_text",
          [](const ExtractionPipeline& self, const std::string& text, const std::string& schema) {
            return ToPy(self.parse_text(text, schema));
          },
          py::arg("text"), py::arg("schema"))
      .def_property_readonly("vision_model", [](const ExtractionPipeline& self) { return self.config().vision_model; })
      .def_property_readonly("text_model", [](const ExtractionPipeline& self) { return self.config().text_model; });
}
