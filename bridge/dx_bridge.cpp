#include "dx/dx_bridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "dx/catalog_question_bank.hpp"
#include "dx/diagnosis_engine.hpp"
#include "dx/errors.hpp"
#include "dx/json_file_store.hpp"
#include "dx/memory_store.hpp"
#include "../src/json_bridge.hpp"

namespace {

struct EngineState {
  std::mutex mutex;
  std::shared_ptr<dx::CatalogQuestionBank> catalog;
  std::shared_ptr<dx::DiagnosisStore> store;
  std::unique_ptr<dx::DiagnosisEngine> engine;
};

EngineState& state() {
  static EngineState instance;
  return instance;
}

void open_engine(EngineState& s, const nlohmann::json& options_json) {
  auto options = dx::bridge::engine_options_from_json(options_json);
  auto catalog = std::make_shared<dx::CatalogQuestionBank>();
  if (options_json.contains("catalog_path") && options_json.at("catalog_path").is_string()) {
    catalog->load_file(options_json.at("catalog_path").get<std::string>());
  }
  std::shared_ptr<dx::DiagnosisStore> store;
  if (options_json.contains("storage_root") && options_json.at("storage_root").is_string()) {
    store = std::make_shared<dx::JsonFileStore>(options_json.at("storage_root").get<std::string>());
  } else {
    store = std::make_shared<dx::MemoryStore>();
  }

  dx::EngineDependencies deps;
  deps.bank = catalog;
  deps.directory = catalog;
  deps.store = store;
  auto engine = dx::make_engine(std::move(deps), options);

  s.catalog = std::move(catalog);
  s.store = std::move(store);
  s.engine = std::move(engine);
}

dx::DiagnosisEngine& ensure_engine(EngineState& s) {
  if (!s.engine) {
    open_engine(s, nlohmann::json::object());
  }
  return *s.engine;
}

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

nlohmann::json error_envelope(const std::string& message, const char* kind) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["error"] = kind;
  payload["message"] = message;
  return payload;
}

const char* error_kind(const std::exception& ex) {
  if (dynamic_cast<const dx::InvalidStateTransition*>(&ex)) {
    return "invalid_state_transition";
  }
  if (dynamic_cast<const dx::ConfigurationError*>(&ex)) {
    return "configuration_error";
  }
  if (dynamic_cast<const dx::InvalidResponse*>(&ex)) {
    return "invalid_response";
  }
  if (dynamic_cast<const dx::NotFound*>(&ex)) {
    return "not_found";
  }
  if (dynamic_cast<const dx::PersistenceFailure*>(&ex)) {
    return "persistence_failure";
  }
  if (dynamic_cast<const nlohmann::json::exception*>(&ex)) {
    return "malformed_json";
  }
  return "internal_error";
}

// Runs `body` under the state lock and wraps its payload in an envelope.
template <typename Body>
char* guarded(Body&& body) {
  try {
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    nlohmann::json payload = ok_envelope();
    body(s, payload);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what(), error_kind(ex)));
  }
}

std::string require_arg(const char* value, const char* name) {
  if (!value || value[0] == '\0') {
    throw dx::ConfigurationError(std::string("Missing argument: ") + name);
  }
  return std::string(value);
}

nlohmann::json parse_arg(const char* value, const char* name) {
  return nlohmann::json::parse(require_arg(value, name));
}

} // namespace

extern "C" {

char* dx_open(const char* options_json) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto options = options_json ? nlohmann::json::parse(options_json)
                                      : nlohmann::json::object();
    open_engine(s, options);
    payload["options"] = dx::bridge::to_json(s.engine->options());
  });
}

void dx_close(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  s.engine.reset();
  s.store.reset();
  s.catalog.reset();
}

char* dx_load_catalog(const char* path) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto file = require_arg(path, "path");
    ensure_engine(s);
    s.catalog->load_file(file);
    payload["path"] = file;
  });
}

char* dx_create_report(const char* request_json) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto request = parse_arg(request_json, "request_json");
    if (!request.is_object() || !request.contains("user_id") || !request.contains("subject_id")) {
      throw dx::ConfigurationError("create_report needs user_id and subject_id");
    }
    dx::ReportConfig config;
    if (request.contains("config") && !request.at("config").is_null()) {
      config = dx::bridge::report_config_from_json(request.at("config"));
    }
    const auto report = ensure_engine(s).create_report(request.at("user_id").get<std::string>(),
                                                       request.at("subject_id").get<std::string>(),
                                                       config);
    payload["report"] = dx::bridge::to_json(report);
  });
}

char* dx_start_session(const char* report_id, const char* config_json) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(report_id, "report_id");
    dx::SessionConfig config;
    if (config_json) {
      config = dx::bridge::session_config_from_json(nlohmann::json::parse(config_json));
    }
    payload["session"] = dx::bridge::to_json(ensure_engine(s).start_session(id, config));
  });
}

char* dx_next_item(const char* session_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(session_id, "session_id");
    payload["next"] = dx::bridge::to_json(ensure_engine(s).next_item(id));
  });
}

char* dx_submit_answer(const char* session_id, const char* answer_json) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(session_id, "session_id");
    const auto submission =
        dx::bridge::answer_submission_from_json(parse_arg(answer_json, "answer_json"));
    payload["result"] = dx::bridge::to_json(ensure_engine(s).submit_answer(id, submission));
  });
}

char* dx_end_session(const char* session_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(session_id, "session_id");
    payload["session"] = dx::bridge::to_json(ensure_engine(s).end_session(id));
  });
}

char* dx_cancel_session(const char* session_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(session_id, "session_id");
    payload["session"] = dx::bridge::to_json(ensure_engine(s).cancel_session(id));
  });
}

char* dx_complete_report(const char* report_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(report_id, "report_id");
    payload["report"] = dx::bridge::to_json(ensure_engine(s).complete_report(id));
  });
}

char* dx_analyze_session(const char* session_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(session_id, "session_id");
    payload["analysis"] = dx::bridge::to_json(ensure_engine(s).analyze_session(id));
  });
}

char* dx_debug_state(const char* session_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto id = require_arg(session_id, "session_id");
    payload["debug"] = ensure_engine(s).debug_state(id);
  });
}

char* dx_statistics(const char* user_id, const char* subject_id) {
  return guarded([&](EngineState& s, nlohmann::json& payload) {
    const auto user = require_arg(user_id, "user_id");
    std::optional<std::string> subject;
    if (subject_id && subject_id[0] != '\0') {
      subject = std::string(subject_id);
    }
    payload["statistics"] = dx::bridge::to_json(ensure_engine(s).diagnosis_statistics(user, subject));
  });
}

void dx_free_string(char* ptr) {
  std::free(ptr);
}

} // extern "C"
