#include "AdaptBridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "adapt/assessment_engine.hpp"
#include "adapt/engine_config.hpp"
#include "adapt/profile_store.hpp"
#include "adapt/ranking.hpp"
#include "json_bridge.hpp"

struct adapt_engine {
  std::mutex mutex;
  std::unique_ptr<adapt::AssessmentEngine> engine;
};

namespace {

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  return payload;
}

nlohmann::json parse_or_null(const char* text) {
  if (!text || *text == '\0') {
    return nullptr;
  }
  return nlohmann::json::parse(text);
}

// Runs `body` under the handle's lock and wraps its payload in an ok envelope.
template <typename Body>
char* guarded(adapt_engine* handle, Body&& body) {
  if (!handle || !handle->engine) {
    return copy_json(error_envelope("Invalid engine handle"));
  }
  try {
    std::scoped_lock guard(handle->mutex);
    nlohmann::json payload = ok_envelope();
    body(*handle->engine, payload);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

} // namespace

extern "C" {

adapt_engine* adapt_create(const char* setup_json, char** error_json) {
  if (error_json) {
    *error_json = nullptr;
  }
  try {
    nlohmann::json json_setup = parse_or_null(setup_json);
    if (json_setup.is_null()) {
      json_setup = nlohmann::json::object();
    }
    if (!json_setup.is_object()) {
      throw std::invalid_argument("Engine setup must be a JSON object");
    }
    auto setup = adapt::bridge::engine_setup_from_json(json_setup, adapt::config_from_env());

    std::string backend = "local";
    if (json_setup.contains("ranking_backend") && json_setup["ranking_backend"].is_string()) {
      backend = json_setup["ranking_backend"].get<std::string>();
    }
    // No transport crosses the C boundary, so only the local ranker is reachable here.
    setup.ranker = adapt::make_ranker(backend);

    if (json_setup.contains("profile_path") && json_setup["profile_path"].is_string()) {
      setup.store = std::make_shared<adapt::JsonFileProfileStore>(json_setup["profile_path"].get<std::string>());
    }
    if (json_setup.contains("interaction_log_path") && json_setup["interaction_log_path"].is_string()) {
      setup.interactions =
          std::make_shared<adapt::JsonFileInteractionLog>(json_setup["interaction_log_path"].get<std::string>());
    }

    auto handle = std::make_unique<adapt_engine>();
    handle->engine = adapt::make_engine(std::move(setup));
    return handle.release();
  } catch (const std::exception& ex) {
    if (error_json) {
      *error_json = copy_json(error_envelope(ex.what()));
    }
    return nullptr;
  }
}

char* adapt_next_item(adapt_engine* engine) {
  return guarded(engine, [](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    payload["next"] = adapt::bridge::to_json(e.next_item());
  });
}

char* adapt_submit(adapt_engine* engine, const char* item_id, const char* report_json, double time_taken) {
  return guarded(engine, [&](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    if (!item_id) {
      throw std::invalid_argument("Missing item id");
    }
    auto report = adapt::grading::report_from_json(parse_or_null(report_json));
    payload["result"] = adapt::bridge::to_json(e.submit(item_id, report, time_taken));
  });
}

char* adapt_attach_feedback(adapt_engine* engine, const char* item_id, const char* feedback_json) {
  return guarded(engine, [&](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    if (!item_id) {
      throw std::invalid_argument("Missing item id");
    }
    payload["attached"] = e.attach_feedback(item_id, parse_or_null(feedback_json));
  });
}

char* adapt_assess_feedback(adapt_engine* engine, const char* item_id) {
  return guarded(engine, [&](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    if (!item_id) {
      throw std::invalid_argument("Missing item id");
    }
    const auto assessment = e.assess_feedback(item_id);
    payload["feedback"] = assessment ? adapt::grading::to_json(*assessment) : nlohmann::json();
  });
}

char* adapt_topic_statistics(adapt_engine* engine, const char* topic) {
  return guarded(engine, [&](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    if (!topic) {
      throw std::invalid_argument("Missing topic");
    }
    payload["statistics"] = adapt::bridge::to_json(e.topic_statistics(topic));
  });
}

char* adapt_log_interaction(adapt_engine* engine, const char* action, const char* details_json) {
  return guarded(engine, [&](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    if (!action || *action == '\0') {
      throw std::invalid_argument("Missing action");
    }
    nlohmann::json details = parse_or_null(details_json);
    if (details.is_null()) {
      details = nlohmann::json::object();
    }
    payload["logged"] = e.log_interaction(action, std::move(details));
  });
}

char* adapt_profile(adapt_engine* engine) {
  return guarded(engine, [](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    payload["profile"] = adapt::bridge::to_json(e.profile());
  });
}

char* adapt_progress(adapt_engine* engine) {
  return guarded(engine, [](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    payload["progress"] = e.progress_report();
  });
}

char* adapt_concept_tree(adapt_engine* engine) {
  return guarded(engine, [](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    payload["tree"] = e.concept_tree();
  });
}

char* adapt_diagnostic(adapt_engine* engine) {
  return guarded(engine, [](adapt::AssessmentEngine& e, nlohmann::json& payload) {
    payload["diagnostic"] = e.diagnostic();
  });
}

void adapt_destroy(adapt_engine* engine) {
  delete engine;
}

void adapt_free_string(char* ptr) {
  std::free(ptr);
}

} // extern "C"
