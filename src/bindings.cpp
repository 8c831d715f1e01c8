#include "adapt/assessment_engine.hpp"
#include "adapt/engine_config.hpp"
#include "adapt/item_response.hpp"
#include "adapt/profile_store.hpp"
#include "adapt/ranking.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <stdexcept>
#include <string>

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

// The ranker may run on a worker thread that outlives the call, so the
// Python callable is only touched, and finally released, with the GIL held.
//
// Caveat: a worker abandoned after its deadline still holds the callable.
// If it is still running when the interpreter finalizes, its
// gil_scoped_acquire (on the call or on release) runs against a finalized
// interpreter. Hosts using a Python ranking callback should let in-flight
// rankings settle, or keep the ranking timeout generous, before shutdown.
adapt::RankingTransport python_transport(py::function callback) {
  auto owned = std::make_unique<py::function>(std::move(callback));
  std::shared_ptr<py::function> holder(owned.release(), [](py::function* fn) {
    py::gil_scoped_acquire gil;
    delete fn;
  });
  return [holder](const nlohmann::json& request) -> std::string {
    py::gil_scoped_acquire gil;
    try {
      py::object reply = (*holder)(json_to_py(request));
      if (py::isinstance<py::str>(reply)) {
        return reply.cast<std::string>();
      }
      return py_to_json(reply).dump();
    } catch (py::error_already_set& ex) {
      throw std::runtime_error(std::string("Ranking callback failed: ") + ex.what());
    }
  };
}

class PyAssessmentEngine {
public:
  explicit PyAssessmentEngine(py::dict setup, py::object ranking_callback) {
    const auto json_setup = py_to_json(setup);
    auto engine_setup = adapt::bridge::engine_setup_from_json(json_setup, adapt::config_from_env());

    std::string backend = "local";
    if (json_setup.contains("ranking_backend") && json_setup["ranking_backend"].is_string()) {
      backend = json_setup["ranking_backend"].get<std::string>();
    }
    adapt::RankingTransport transport;
    if (!ranking_callback.is_none()) {
      transport = python_transport(ranking_callback.cast<py::function>());
      if (!json_setup.contains("ranking_backend")) {
        backend = "reply";
      }
    }
    engine_setup.ranker = adapt::make_ranker(backend, transport);

    if (json_setup.contains("profile_path") && json_setup["profile_path"].is_string()) {
      engine_setup.store =
          std::make_shared<adapt::JsonFileProfileStore>(json_setup["profile_path"].get<std::string>());
    }
    if (json_setup.contains("interaction_log_path") && json_setup["interaction_log_path"].is_string()) {
      engine_setup.interactions =
          std::make_shared<adapt::JsonFileInteractionLog>(json_setup["interaction_log_path"].get<std::string>());
    }
    engine_ = adapt::make_engine(std::move(engine_setup));
  }

  py::object next_item() {
    adapt::Next next;
    {
      py::gil_scoped_release release;
      next = engine_->next_item();
    }
    return json_to_py(adapt::bridge::to_json(next));
  }

  py::object submit(const std::string& item_id, py::dict report, double time_taken) {
    auto grading_report = adapt::grading::report_from_json(py_to_json(report));
    auto result = engine_->submit(item_id, grading_report, time_taken);
    return json_to_py(adapt::bridge::to_json(result));
  }

  bool attach_feedback(const std::string& item_id, py::object feedback) {
    return engine_->attach_feedback(item_id, py_to_json(feedback));
  }

  py::object assess_feedback(const std::string& item_id) const {
    const auto assessment = engine_->assess_feedback(item_id);
    if (!assessment) {
      return py::none();
    }
    return json_to_py(adapt::grading::to_json(*assessment));
  }

  py::object topic_statistics(const std::string& topic) const {
    return json_to_py(adapt::bridge::to_json(engine_->topic_statistics(topic)));
  }

  int attempt_count(const std::string& item_id) const {
    return engine_->learner().attempt_count(item_id);
  }

  bool log_interaction(const std::string& action, py::object details) {
    auto json_details = details.is_none() ? nlohmann::json::object() : py_to_json(details);
    return engine_->log_interaction(action, std::move(json_details));
  }

  py::object profile() const {
    return json_to_py(adapt::bridge::to_json(engine_->profile()));
  }

  py::object progress_report() const {
    return json_to_py(engine_->progress_report());
  }

  py::object concept_tree() const {
    return json_to_py(engine_->concept_tree());
  }

  py::object diagnostic() const {
    return json_to_py(engine_->diagnostic());
  }

  py::object explain(const std::string& item_id) const {
    const auto& item = engine_->catalog().at(item_id);
    return json_to_py(adapt::bridge::to_json(engine_->policy().explain(item)));
  }

  py::object topic_readiness(const std::string& topic) const {
    return json_to_py(adapt::bridge::to_json(engine_->policy().topic_readiness(topic)));
  }

  py::list recommended_items(const std::string& topic, int n) const {
    py::list ids;
    for (const auto* item : engine_->policy().recommended_items(topic, n)) {
      ids.append(item->id);
    }
    return ids;
  }

  py::list items_by_difficulty(const std::string& topic, const std::string& band) const {
    py::list ids;
    const auto parsed = adapt::difficulty_band_from_string(band);
    for (const auto* item : engine_->policy().items_by_difficulty(topic, parsed)) {
      ids.append(item->id);
    }
    return ids;
  }

  py::object last_explanation() const {
    const auto& explanation = engine_->policy().last_explanation();
    if (!explanation) {
      return py::none();
    }
    return py::str(*explanation);
  }

private:
  std::unique_ptr<adapt::AssessmentEngine> engine_;
};

} // namespace

PYBIND11_MODULE(adaptcore_py, m) {
  py::class_<PyAssessmentEngine>(m, "AssessmentEngine")
      .def(py::init<py::dict, py::object>(),
           py::arg("setup") = py::dict(),
           py::arg("ranking_callback") = py::none())
      .def("next_item", &PyAssessmentEngine::next_item)
      .def("submit", &PyAssessmentEngine::submit,
           py::arg("item_id"), py::arg("report"), py::arg("time_taken") = 0.0)
      .def("attach_feedback", &PyAssessmentEngine::attach_feedback)
      .def("assess_feedback", &PyAssessmentEngine::assess_feedback)
      .def("topic_statistics", &PyAssessmentEngine::topic_statistics)
      .def("attempt_count", &PyAssessmentEngine::attempt_count)
      .def("log_interaction", &PyAssessmentEngine::log_interaction,
           py::arg("action"), py::arg("details") = py::none())
      .def("profile", &PyAssessmentEngine::profile)
      .def("progress_report", &PyAssessmentEngine::progress_report)
      .def("concept_tree", &PyAssessmentEngine::concept_tree)
      .def("diagnostic", &PyAssessmentEngine::diagnostic)
      .def("explain", &PyAssessmentEngine::explain)
      .def("topic_readiness", &PyAssessmentEngine::topic_readiness)
      .def("recommended_items", &PyAssessmentEngine::recommended_items,
           py::arg("topic"), py::arg("n") = 5)
      .def("items_by_difficulty", &PyAssessmentEngine::items_by_difficulty)
      .def("last_explanation", &PyAssessmentEngine::last_explanation);

  m.def("probability_correct",
        [](double theta, double a, double b, double c) {
          return adapt::irt::probability_correct(theta, adapt::ItemParams{a, b, c});
        },
        py::arg("theta"), py::arg("a") = 1.0, py::arg("b") = 0.0, py::arg("c") = 0.0);
  m.def("information",
        [](double theta, double a, double b, double c) {
          return adapt::irt::information(theta, adapt::ItemParams{a, b, c});
        },
        py::arg("theta"), py::arg("a") = 1.0, py::arg("b") = 0.0, py::arg("c") = 0.0);
}
