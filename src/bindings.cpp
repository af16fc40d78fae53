#include "dx/catalog_question_bank.hpp"
#include "dx/diagnosis_engine.hpp"
#include "dx/errors.hpp"
#include "dx/json_file_store.hpp"
#include "dx/memory_store.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

class PyDiagnosisEngine {
public:
  PyDiagnosisEngine(const std::string& catalog_path, const std::string& storage_root,
                    py::object options_obj)
      : catalog_(std::make_shared<dx::CatalogQuestionBank>()) {
    if (!catalog_path.empty()) {
      catalog_->load_file(catalog_path);
    }
    dx::EngineOptions options;
    if (!options_obj.is_none()) {
      options = dx::bridge::engine_options_from_json(py_to_json(options_obj));
    }
    dx::EngineDependencies deps;
    deps.bank = catalog_;
    deps.directory = catalog_;
    if (storage_root.empty()) {
      deps.store = std::make_shared<dx::MemoryStore>();
    } else {
      deps.store = std::make_shared<dx::JsonFileStore>(storage_root);
    }
    engine_ = dx::make_engine(std::move(deps), options);
  }

  void load_catalog(const std::string& path) { catalog_->load_file(path); }

  py::object create_report(const std::string& user_id, const std::string& subject_id,
                           py::object config_obj) {
    dx::ReportConfig config;
    if (!config_obj.is_none()) {
      config = dx::bridge::report_config_from_json(py_to_json(config_obj));
    }
    return json_to_py(dx::bridge::to_json(engine_->create_report(user_id, subject_id, config)));
  }

  py::object start_session(const std::string& report_id, py::object config_obj) {
    dx::SessionConfig config;
    if (!config_obj.is_none()) {
      config = dx::bridge::session_config_from_json(py_to_json(config_obj));
    }
    return json_to_py(dx::bridge::to_json(engine_->start_session(report_id, config)));
  }

  py::object next_item(const std::string& session_id) {
    return json_to_py(dx::bridge::to_json(engine_->next_item(session_id)));
  }

  py::object submit_answer(const std::string& session_id, py::object answer_obj) {
    auto submission = dx::bridge::answer_submission_from_json(py_to_json(answer_obj));
    return json_to_py(dx::bridge::to_json(engine_->submit_answer(session_id, submission)));
  }

  py::object end_session(const std::string& session_id) {
    return json_to_py(dx::bridge::to_json(engine_->end_session(session_id)));
  }

  py::object cancel_session(const std::string& session_id) {
    return json_to_py(dx::bridge::to_json(engine_->cancel_session(session_id)));
  }

  py::object complete_report(const std::string& report_id) {
    return json_to_py(dx::bridge::to_json(engine_->complete_report(report_id)));
  }

  py::object get_report(const std::string& report_id) {
    return json_to_py(dx::bridge::to_json(engine_->get_report(report_id)));
  }

  py::object analyze_session(const std::string& session_id) {
    return json_to_py(dx::bridge::to_json(engine_->analyze_session(session_id)));
  }

  py::object statistics(const std::string& user_id, std::optional<std::string> subject_id) {
    return json_to_py(dx::bridge::to_json(engine_->diagnosis_statistics(user_id, subject_id)));
  }

  py::object debug_state(const std::string& session_id) {
    return json_to_py(engine_->debug_state(session_id));
  }

private:
  std::shared_ptr<dx::CatalogQuestionBank> catalog_;
  std::unique_ptr<dx::DiagnosisEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_dxcore, m) {
  py::register_exception<dx::DiagnosisError>(m, "DiagnosisError");

  py::class_<PyDiagnosisEngine>(m, "DiagnosisEngine")
      .def(py::init<std::string, std::string, py::object>(),
           py::arg("catalog_path") = std::string(),
           py::arg("storage_root") = std::string(),
           py::arg("options") = py::none())
      .def("load_catalog", &PyDiagnosisEngine::load_catalog)
      .def("create_report", &PyDiagnosisEngine::create_report, py::arg("user_id"),
           py::arg("subject_id"), py::arg("config") = py::none())
      .def("start_session", &PyDiagnosisEngine::start_session, py::arg("report_id"),
           py::arg("config") = py::none())
      .def("next_item", &PyDiagnosisEngine::next_item)
      .def("submit_answer", &PyDiagnosisEngine::submit_answer)
      .def("end_session", &PyDiagnosisEngine::end_session)
      .def("cancel_session", &PyDiagnosisEngine::cancel_session)
      .def("complete_report", &PyDiagnosisEngine::complete_report)
      .def("get_report", &PyDiagnosisEngine::get_report)
      .def("analyze_session", &PyDiagnosisEngine::analyze_session)
      .def("statistics", &PyDiagnosisEngine::statistics, py::arg("user_id"),
           py::arg("subject_id") = py::none())
      .def("debug_state", &PyDiagnosisEngine::debug_state);
}
