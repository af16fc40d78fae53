#include "dx/diagnosis_engine.hpp"
#include "dx/errors.hpp"
#include "json_bridge.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

namespace dx {
namespace {

void validate_range(const DifficultyRange& range, const char* field) {
  if (range.min < 1 || range.max > 5) {
    throw ConfigurationError(std::string(field) + " must lie within [1, 5], got [" +
                             std::to_string(range.min) + ", " + std::to_string(range.max) + "]");
  }
  if (range.min > range.max) {
    throw ConfigurationError(std::string(field) + ".min must not exceed " + field + ".max");
  }
}

void validate_limits(int min_questions, int max_questions, double target_precision,
                     const char* prefix) {
  const std::string p(prefix);
  if (min_questions < 1) {
    throw ConfigurationError(p + "min_questions must be >= 1");
  }
  if (min_questions > max_questions) {
    throw ConfigurationError(p + "min_questions (" + std::to_string(min_questions) +
                             ") must not exceed max_questions (" +
                             std::to_string(max_questions) + ")");
  }
  if (!(target_precision > 0.0)) {
    throw ConfigurationError(p + "target_precision must be > 0");
  }
}

} // namespace

void ReportConfig::validate() const {
  validate_range(difficulty_range, "difficulty_range");
  if (total_questions_planned < 1) {
    throw ConfigurationError("total_questions_planned must be >= 1");
  }
  if (time_limit_minutes < 0) {
    throw ConfigurationError("time_limit_minutes must not be negative");
  }
  for (const auto& id : knowledge_point_ids) {
    if (id.empty()) {
      throw ConfigurationError("knowledge_point_ids must not contain empty ids");
    }
  }
}

void SessionLimits::validate() const {
  validate_limits(min_questions, max_questions, target_precision, "");
}

void EngineOptions::validate() const {
  validate_limits(default_min_questions, default_max_questions, default_target_precision,
                  "default_");
  if (default_priority < 1 || default_priority > 5) {
    throw ConfigurationError("default_priority must be within [1, 5]");
  }
}

SessionLimits EngineOptions::resolve_limits(const SessionConfig& config) const {
  SessionLimits limits;
  limits.min_questions = config.min_questions.value_or(default_min_questions);
  limits.max_questions = config.max_questions.value_or(default_max_questions);
  limits.target_precision = config.target_precision.value_or(default_target_precision);
  limits.validate();
  return limits;
}

EngineOptions load_engine_options(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("Unable to open engine options " + path);
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigurationError("Malformed engine options " + path + ": " + ex.what());
  }
  auto options = bridge::engine_options_from_json(json);
  options.validate();
  return options;
}

} // namespace dx
