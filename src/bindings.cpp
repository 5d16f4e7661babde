#include "cat/session_engine.hpp"

#include "../irt/probability_model.hpp"
#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

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
      json_obj[py::cast<std::string>(item.first)] = py_to_json(item.second);
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

py::object next_to_py(const cat::SessionEngine::Next& next) {
  return json_to_py(cat::bridge::to_json(next));
}

class PySessionEngine {
public:
  PySessionEngine(py::object bank_obj, py::object config_obj) {
    auto bank = std::make_shared<const cat::ItemBank>(
        cat::bridge::item_bank_from_json(py_to_json(bank_obj)));
    cat::SessionConfig config;
    if (!config_obj.is_none()) {
      config = cat::bridge::session_config_from_json(py_to_json(config_obj));
    }
    engine_ = cat::make_engine(std::move(bank), config);
  }

  std::string create_session(py::object request_obj) {
    return engine_->create_session(
        cat::bridge::session_request_from_json(py_to_json(request_obj)));
  }

  py::object next_item(const std::string& session_id) {
    return next_to_py(engine_->next_item(session_id));
  }

  py::object submit_response(const std::string& session_id, py::object submission_obj) {
    auto submission = cat::bridge::response_submission_from_json(py_to_json(submission_obj));
    return next_to_py(engine_->submit_response(session_id, submission));
  }

  py::object report(const std::string& session_id) {
    return json_to_py(cat::bridge::to_json(engine_->report(session_id)));
  }

  py::object end_session(const std::string& session_id) {
    return json_to_py(cat::bridge::to_json(engine_->end_session(session_id)));
  }

  py::object snapshot(const std::string& session_id) {
    return json_to_py(engine_->snapshot(session_id));
  }

  std::string restore(py::object snapshot_obj) {
    return engine_->restore(py_to_json(snapshot_obj));
  }

  py::object debug_state(const std::string& session_id) {
    return json_to_py(engine_->debug_state(session_id));
  }

  py::object capabilities() const {
    return json_to_py(engine_->capabilities());
  }

  std::vector<std::string> sessions_for_learner(const std::string& learner_id) const {
    return engine_->sessions_for_learner(learner_id);
  }

private:
  std::unique_ptr<cat::SessionEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_catcore, m) {
  py::register_exception<cat::CatError>(m, "CatError", PyExc_RuntimeError);

  py::class_<PySessionEngine>(m, "SessionEngine")
      .def(py::init<py::object, py::object>(), py::arg("item_bank"),
           py::arg("config") = py::none())
      .def("create_session", &PySessionEngine::create_session)
      .def("next_item", &PySessionEngine::next_item)
      .def("submit_response", &PySessionEngine::submit_response)
      .def("report", &PySessionEngine::report)
      .def("end_session", &PySessionEngine::end_session)
      .def("snapshot", &PySessionEngine::snapshot)
      .def("restore", &PySessionEngine::restore)
      .def("debug_state", &PySessionEngine::debug_state)
      .def("capabilities", &PySessionEngine::capabilities)
      .def("sessions_for_learner", &PySessionEngine::sessions_for_learner);

  m.def("probability_correct", [](double theta, py::object parameter_obj) {
    return cat::irt::probability_correct(
        cat::bridge::item_parameter_from_json(py_to_json(parameter_obj)), theta);
  });
  m.def("fisher_information", [](double theta, py::object parameter_obj) {
    return cat::irt::fisher_information(
        cat::bridge::item_parameter_from_json(py_to_json(parameter_obj)), theta);
  });
}
