#include "json_bridge.hpp"

#include "dx/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace dx::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.is_object() || !obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object()) {
    throw std::invalid_argument(std::string("Expected object holding field '") + key + "'");
  }
  if (!obj.contains(key) || obj.at(key).is_null()) {
    throw std::invalid_argument(std::string("Missing field '") + key + "'");
  }
  return obj.at(key);
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    const double d = value.get<double>();
    if (d == std::floor(d)) {
      return static_cast<int>(d);
    }
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::uint64_t json_to_uint64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) +
                              "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_string(entry, key));
  }
  return out;
}

std::vector<double> json_to_double_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<number> for field '" + std::string(key) + "'");
  }
  std::vector<double> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_double(entry, key));
  }
  return out;
}

std::map<std::string, int> json_to_count_map(const nlohmann::json& value, std::string_view key) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for field '" + std::string(key) + "'");
  }
  std::map<std::string, int> out;
  for (const auto& [name, count] : value.items()) {
    out[name] = json_to_int(count, key);
  }
  return out;
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  if (value.has_value()) {
    return nlohmann::json(value.value());
  }
  return nullptr;
}

nlohmann::json limits_to_json(const SessionLimits& limits) {
  nlohmann::json json = nlohmann::json::object();
  json["min_questions"] = limits.min_questions;
  json["max_questions"] = limits.max_questions;
  json["target_precision"] = limits.target_precision;
  return json;
}

SessionLimits limits_from_json(const nlohmann::json& json) {
  SessionLimits limits;
  assign_if_present(json, "min_questions",
                    [&](const nlohmann::json& v) { limits.min_questions = json_to_int(v, "min_questions"); });
  assign_if_present(json, "max_questions",
                    [&](const nlohmann::json& v) { limits.max_questions = json_to_int(v, "max_questions"); });
  assign_if_present(json, "target_precision", [&](const nlohmann::json& v) {
    limits.target_precision = json_to_double(v, "target_precision");
  });
  return limits;
}

nlohmann::json progression_entry_to_json(const AbilityProgressionEntry& entry) {
  nlohmann::json json = nlohmann::json::object();
  json["question_index"] = entry.question_index;
  json["previous_estimate"] = entry.previous_estimate;
  json["correct"] = entry.correct;
  json["difficulty"] = entry.difficulty;
  json["timestamp_ms"] = entry.timestamp_ms;
  return json;
}

AbilityProgressionEntry progression_entry_from_json(const nlohmann::json& json) {
  AbilityProgressionEntry entry;
  entry.question_index = json_to_int(require_field(json, "question_index"), "question_index");
  entry.previous_estimate =
      json_to_double(require_field(json, "previous_estimate"), "previous_estimate");
  entry.correct = json_to_bool(require_field(json, "correct"), "correct");
  entry.difficulty = json_to_int(require_field(json, "difficulty"), "difficulty");
  assign_if_present(json, "timestamp_ms",
                    [&](const nlohmann::json& v) { entry.timestamp_ms = json_to_int64(v, "timestamp_ms"); });
  return entry;
}

nlohmann::json selection_entry_to_json(const SelectionLogEntry& entry) {
  nlohmann::json json = nlohmann::json::object();
  json["question_index"] = entry.question_index;
  json["suggested_difficulty"] = entry.suggested_difficulty;
  json["actual_difficulty"] = entry.actual_difficulty;
  json["question_id"] = entry.question_id;
  json["knowledge_point_id"] = entry.knowledge_point_id;
  json["reason"] = entry.reason;
  json["timestamp_ms"] = entry.timestamp_ms;
  return json;
}

SelectionLogEntry selection_entry_from_json(const nlohmann::json& json) {
  SelectionLogEntry entry;
  entry.question_index = json_to_int(require_field(json, "question_index"), "question_index");
  entry.suggested_difficulty =
      json_to_int(require_field(json, "suggested_difficulty"), "suggested_difficulty");
  entry.actual_difficulty =
      json_to_int(require_field(json, "actual_difficulty"), "actual_difficulty");
  entry.question_id = json_to_string(require_field(json, "question_id"), "question_id");
  entry.knowledge_point_id =
      json_to_string(require_field(json, "knowledge_point_id"), "knowledge_point_id");
  assign_if_present(json, "reason",
                    [&](const nlohmann::json& v) { entry.reason = json_to_string(v, "reason"); });
  assign_if_present(json, "timestamp_ms",
                    [&](const nlohmann::json& v) { entry.timestamp_ms = json_to_int64(v, "timestamp_ms"); });
  return entry;
}

nlohmann::json mastery_entry_to_json(const MasteryEntry& entry) {
  nlohmann::json json = nlohmann::json::object();
  json["score"] = entry.score;
  json["accuracy"] = entry.accuracy;
  json["total"] = entry.total;
  json["correct"] = entry.correct;
  json["average_difficulty"] = entry.average_difficulty;
  json["total_time"] = entry.total_time;
  json["average_time"] = entry.average_time;
  json["error_rate"] = entry.error_rate;
  json["error_types"] = entry.error_types;
  json["priority"] = entry.priority;
  return json;
}

MasteryEntry mastery_entry_from_json(const nlohmann::json& json) {
  MasteryEntry entry;
  entry.score = json_to_double(require_field(json, "score"), "score");
  entry.accuracy = json_to_double(require_field(json, "accuracy"), "accuracy");
  entry.total = json_to_int(require_field(json, "total"), "total");
  entry.correct = json_to_int(require_field(json, "correct"), "correct");
  entry.average_difficulty =
      json_to_double(require_field(json, "average_difficulty"), "average_difficulty");
  entry.total_time = json_to_int(require_field(json, "total_time"), "total_time");
  entry.average_time = json_to_double(require_field(json, "average_time"), "average_time");
  entry.error_rate = json_to_double(require_field(json, "error_rate"), "error_rate");
  assign_if_present(json, "error_types", [&](const nlohmann::json& v) {
    entry.error_types = json_to_count_map(v, "error_types");
  });
  entry.priority = json_to_int(require_field(json, "priority"), "priority");
  return entry;
}

nlohmann::json heatmap_to_json(const HeatmapData& data) {
  nlohmann::json json = nlohmann::json::object();
  json["knowledge_point_ids"] = data.knowledge_point_ids;
  json["knowledge_points"] = data.knowledge_points;
  json["mastery_scores"] = data.mastery_scores;
  json["difficulty_levels"] = data.difficulty_levels;
  json["time_spent"] = data.time_spent;
  json["error_rates"] = data.error_rates;
  return json;
}

HeatmapData heatmap_from_json(const nlohmann::json& json) {
  HeatmapData data;
  data.knowledge_point_ids =
      json_to_string_vector(require_field(json, "knowledge_point_ids"), "knowledge_point_ids");
  data.knowledge_points =
      json_to_string_vector(require_field(json, "knowledge_points"), "knowledge_points");
  data.mastery_scores =
      json_to_double_vector(require_field(json, "mastery_scores"), "mastery_scores");
  data.difficulty_levels =
      json_to_double_vector(require_field(json, "difficulty_levels"), "difficulty_levels");
  data.time_spent = json_to_double_vector(require_field(json, "time_spent"), "time_spent");
  data.error_rates = json_to_double_vector(require_field(json, "error_rates"), "error_rates");
  return data;
}

nlohmann::json ranked_point_to_json(const RankedPoint& point) {
  nlohmann::json json = nlohmann::json::object();
  json["knowledge_point_id"] = point.knowledge_point_id;
  json["knowledge_point_name"] = point.knowledge_point_name;
  json["mastery_score"] = point.mastery_score;
  json["priority"] = point.priority;
  return json;
}

RankedPoint ranked_point_from_json(const nlohmann::json& json) {
  RankedPoint point;
  point.knowledge_point_id =
      json_to_string(require_field(json, "knowledge_point_id"), "knowledge_point_id");
  point.knowledge_point_name =
      json_to_string(require_field(json, "knowledge_point_name"), "knowledge_point_name");
  point.mastery_score = json_to_double(require_field(json, "mastery_score"), "mastery_score");
  point.priority = json_to_int(require_field(json, "priority"), "priority");
  return point;
}

nlohmann::json path_step_to_json(const LearningPathStep& step) {
  nlohmann::json json = nlohmann::json::object();
  json["order"] = step.order;
  json["knowledge_point_id"] = step.knowledge_point_id;
  json["knowledge_point_name"] = step.knowledge_point_name;
  json["current_mastery"] = step.current_mastery;
  json["target_mastery"] = step.target_mastery;
  json["estimated_hours"] = step.estimated_hours;
  json["practice_strategy"] = to_string(step.practice_strategy);
  json["prerequisites"] = step.prerequisites;
  return json;
}

LearningPathStep path_step_from_json(const nlohmann::json& json) {
  LearningPathStep step;
  step.order = json_to_int(require_field(json, "order"), "order");
  step.knowledge_point_id =
      json_to_string(require_field(json, "knowledge_point_id"), "knowledge_point_id");
  step.knowledge_point_name =
      json_to_string(require_field(json, "knowledge_point_name"), "knowledge_point_name");
  step.current_mastery = json_to_double(require_field(json, "current_mastery"), "current_mastery");
  step.target_mastery = json_to_double(require_field(json, "target_mastery"), "target_mastery");
  step.estimated_hours = json_to_double(require_field(json, "estimated_hours"), "estimated_hours");
  step.practice_strategy = practice_strategy_from_string(
      json_to_string(require_field(json, "practice_strategy"), "practice_strategy"));
  assign_if_present(json, "prerequisites", [&](const nlohmann::json& v) {
    step.prerequisites = json_to_string_vector(v, "prerequisites");
  });
  return step;
}

nlohmann::json weakness_record_to_json(const WeaknessPoint& record) {
  nlohmann::json json = nlohmann::json::object();
  json["knowledge_point_id"] = record.knowledge_point_id;
  json["weakness_level"] = record.weakness_level;
  json["accuracy_rate"] = record.accuracy_rate;
  json["average_time"] = record.average_time;
  json["error_types"] = record.error_types;
  json["priority"] = record.priority;
  json["estimated_improvement_hours"] = record.estimated_improvement_hours;
  return json;
}

WeaknessPoint weakness_record_from_json(const nlohmann::json& json) {
  WeaknessPoint record;
  record.knowledge_point_id =
      json_to_string(require_field(json, "knowledge_point_id"), "knowledge_point_id");
  record.weakness_level = json_to_int(require_field(json, "weakness_level"), "weakness_level");
  record.accuracy_rate = json_to_double(require_field(json, "accuracy_rate"), "accuracy_rate");
  record.average_time = json_to_double(require_field(json, "average_time"), "average_time");
  assign_if_present(json, "error_types", [&](const nlohmann::json& v) {
    record.error_types = json_to_count_map(v, "error_types");
  });
  record.priority = json_to_int(require_field(json, "priority"), "priority");
  record.estimated_improvement_hours = json_to_double(
      require_field(json, "estimated_improvement_hours"), "estimated_improvement_hours");
  return record;
}

nlohmann::json analysis_to_json(const ReportAnalysis& analysis) {
  nlohmann::json json = nlohmann::json::object();
  json["overall_assessment"] = analysis.overall_assessment;
  json["strengths"] = analysis.strengths;
  json["weaknesses"] = analysis.weaknesses;
  nlohmann::json style = nlohmann::json::object();
  style["pace"] = analysis.learning_style.pace;
  style["difficulty_preference"] = analysis.learning_style.difficulty_preference;
  json["learning_style"] = std::move(style);
  json["improvement_suggestions"] = analysis.improvement_suggestions;
  return json;
}

ReportAnalysis analysis_from_json(const nlohmann::json& json) {
  ReportAnalysis analysis;
  assign_if_present(json, "overall_assessment", [&](const nlohmann::json& v) {
    analysis.overall_assessment = json_to_string(v, "overall_assessment");
  });
  assign_if_present(json, "strengths", [&](const nlohmann::json& v) {
    analysis.strengths = json_to_string_vector(v, "strengths");
  });
  assign_if_present(json, "weaknesses", [&](const nlohmann::json& v) {
    analysis.weaknesses = json_to_string_vector(v, "weaknesses");
  });
  assign_if_present(json, "learning_style", [&](const nlohmann::json& style) {
    assign_if_present(style, "pace", [&](const nlohmann::json& v) {
      analysis.learning_style.pace = json_to_string(v, "pace");
    });
    assign_if_present(style, "difficulty_preference", [&](const nlohmann::json& v) {
      analysis.learning_style.difficulty_preference = json_to_string(v, "difficulty_preference");
    });
  });
  assign_if_present(json, "improvement_suggestions", [&](const nlohmann::json& v) {
    analysis.improvement_suggestions = json_to_string_vector(v, "improvement_suggestions");
  });
  return analysis;
}

nlohmann::json recommendation_to_json(const Recommendation& rec) {
  nlohmann::json json = nlohmann::json::object();
  json["type"] = rec.type;
  json["title"] = rec.title;
  json["description"] = rec.description;
  json["estimated_hours"] = optional_to_json(rec.estimated_hours);
  json["priority"] = rec.priority;
  if (rec.strategy.has_value()) {
    json["strategy"] = to_string(rec.strategy.value());
  } else {
    json["strategy"] = nullptr;
  }
  return json;
}

Recommendation recommendation_from_json(const nlohmann::json& json) {
  Recommendation rec;
  rec.type = json_to_string(require_field(json, "type"), "type");
  rec.title = json_to_string(require_field(json, "title"), "title");
  rec.description = json_to_string(require_field(json, "description"), "description");
  assign_if_present(json, "estimated_hours", [&](const nlohmann::json& v) {
    rec.estimated_hours = json_to_double(v, "estimated_hours");
  });
  rec.priority = json_to_string(require_field(json, "priority"), "priority");
  assign_if_present(json, "strategy", [&](const nlohmann::json& v) {
    rec.strategy = practice_strategy_from_string(json_to_string(v, "strategy"));
  });
  return rec;
}

template <typename T, typename Convert>
nlohmann::json array_to_json(const std::vector<T>& values, Convert&& convert) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& value : values) {
    out.push_back(convert(value));
  }
  return out;
}

template <typename T, typename Convert>
std::vector<T> array_from_json(const nlohmann::json& value, std::string_view key,
                               Convert&& convert) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array for field '" + std::string(key) + "'");
  }
  std::vector<T> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(convert(entry));
  }
  return out;
}

} // namespace

nlohmann::json to_json(const DifficultyRange& range) {
  nlohmann::json json = nlohmann::json::object();
  json["min"] = range.min;
  json["max"] = range.max;
  return json;
}

DifficultyRange difficulty_range_from_json(const nlohmann::json& json_range) {
  DifficultyRange range;
  assign_if_present(json_range, "min",
                    [&](const nlohmann::json& v) { range.min = json_to_int(v, "difficulty_range.min"); });
  assign_if_present(json_range, "max",
                    [&](const nlohmann::json& v) { range.max = json_to_int(v, "difficulty_range.max"); });
  return range;
}

nlohmann::json to_json(const ReportConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["name"] = config.name;
  json["description"] = config.description;
  json["diagnosis_type"] = to_string(config.type);
  json["target_level"] = to_string(config.target_level);
  json["total_questions_planned"] = config.total_questions_planned;
  json["time_limit_minutes"] = config.time_limit_minutes;
  json["difficulty_range"] = to_json(config.difficulty_range);
  json["adaptive_enabled"] = config.adaptive_enabled;
  json["knowledge_point_ids"] = config.knowledge_point_ids;
  return json;
}

ReportConfig report_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw ConfigurationError("Report config must be a JSON object");
  }
  try {
    ReportConfig config;
    assign_if_present(json_config, "name",
                      [&](const nlohmann::json& v) { config.name = json_to_string(v, "name"); });
    assign_if_present(json_config, "description", [&](const nlohmann::json& v) {
      config.description = json_to_string(v, "description");
    });
    assign_if_present(json_config, "diagnosis_type", [&](const nlohmann::json& v) {
      config.type = diagnosis_type_from_string(json_to_string(v, "diagnosis_type"));
    });
    assign_if_present(json_config, "target_level", [&](const nlohmann::json& v) {
      config.target_level = diagnosis_level_from_string(json_to_string(v, "target_level"));
    });
    assign_if_present(json_config, "total_questions_planned", [&](const nlohmann::json& v) {
      config.total_questions_planned = json_to_int(v, "total_questions_planned");
    });
    assign_if_present(json_config, "time_limit_minutes", [&](const nlohmann::json& v) {
      config.time_limit_minutes = json_to_int(v, "time_limit_minutes");
    });
    assign_if_present(json_config, "difficulty_range", [&](const nlohmann::json& v) {
      config.difficulty_range = difficulty_range_from_json(v);
    });
    assign_if_present(json_config, "adaptive_enabled", [&](const nlohmann::json& v) {
      config.adaptive_enabled = json_to_bool(v, "adaptive_enabled");
    });
    assign_if_present(json_config, "knowledge_point_ids", [&](const nlohmann::json& v) {
      config.knowledge_point_ids = json_to_string_vector(v, "knowledge_point_ids");
    });
    return config;
  } catch (const std::invalid_argument& ex) {
    throw ConfigurationError(ex.what());
  }
}

nlohmann::json to_json(const SessionConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["name"] = config.name;
  json["level"] = to_string(config.level);
  json["min_questions"] = optional_to_json(config.min_questions);
  json["max_questions"] = optional_to_json(config.max_questions);
  json["target_precision"] = optional_to_json(config.target_precision);
  return json;
}

SessionConfig session_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw ConfigurationError("Session config must be a JSON object");
  }
  try {
    SessionConfig config;
    assign_if_present(json_config, "name",
                      [&](const nlohmann::json& v) { config.name = json_to_string(v, "name"); });
    assign_if_present(json_config, "level", [&](const nlohmann::json& v) {
      config.level = diagnosis_level_from_string(json_to_string(v, "level"));
    });
    assign_if_present(json_config, "min_questions", [&](const nlohmann::json& v) {
      config.min_questions = json_to_int(v, "min_questions");
    });
    assign_if_present(json_config, "max_questions", [&](const nlohmann::json& v) {
      config.max_questions = json_to_int(v, "max_questions");
    });
    assign_if_present(json_config, "target_precision", [&](const nlohmann::json& v) {
      config.target_precision = json_to_double(v, "target_precision");
    });
    return config;
  } catch (const std::invalid_argument& ex) {
    throw ConfigurationError(ex.what());
  }
}

nlohmann::json to_json(const QuestionItem& item) {
  nlohmann::json json = nlohmann::json::object();
  json["question_id"] = item.question_id;
  json["knowledge_point_id"] = item.knowledge_point_id;
  json["difficulty"] = item.difficulty;
  json["content"] = item.content;
  json["question_type"] = item.question_type;
  return json;
}

QuestionItem question_item_from_json(const nlohmann::json& json_item) {
  QuestionItem item;
  item.question_id = json_to_string(require_field(json_item, "question_id"), "question_id");
  item.knowledge_point_id =
      json_to_string(require_field(json_item, "knowledge_point_id"), "knowledge_point_id");
  item.difficulty = json_to_int(require_field(json_item, "difficulty"), "difficulty");
  assign_if_present(json_item, "content",
                    [&](const nlohmann::json& v) { item.content = json_to_string(v, "content"); });
  assign_if_present(json_item, "question_type", [&](const nlohmann::json& v) {
    item.question_type = json_to_string(v, "question_type");
  });
  return item;
}

nlohmann::json to_json(const DiagnosisSession& session) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = session.id;
  json["report_id"] = session.report_id;
  json["name"] = session.name;
  json["level"] = to_string(session.level);
  json["status"] = to_string(session.status);
  json["limits"] = limits_to_json(session.limits);
  json["difficulty_band"] = to_json(session.difficulty_band);
  json["current_ability_estimate"] = session.current_ability_estimate;
  json["ability_se"] = session.ability_se;
  json["questions_answered"] = session.questions_answered;
  json["correct_answers"] = session.correct_answers;
  json["current_question_index"] = session.current_question_index;
  json["total_time_spent"] = session.total_time_spent;
  json["accuracy_rate"] = session.accuracy_rate;
  json["created_at_ms"] = session.created_at_ms;
  json["start_time_ms"] = optional_to_json(session.start_time_ms);
  json["end_time_ms"] = optional_to_json(session.end_time_ms);
  if (session.stop_reason.has_value()) {
    json["stop_reason"] = to_string(session.stop_reason.value());
  } else {
    json["stop_reason"] = nullptr;
  }
  if (session.active_item.has_value()) {
    json["active_item"] = to_json(session.active_item.value());
  } else {
    json["active_item"] = nullptr;
  }
  json["ability_progression"] = array_to_json(session.ability_progression, progression_entry_to_json);
  json["selection_history"] = array_to_json(session.selection_history, selection_entry_to_json);
  json["version"] = session.version;
  return json;
}

DiagnosisSession diagnosis_session_from_json(const nlohmann::json& json_session) {
  DiagnosisSession session;
  session.id = json_to_string(require_field(json_session, "id"), "id");
  session.report_id = json_to_string(require_field(json_session, "report_id"), "report_id");
  assign_if_present(json_session, "name",
                    [&](const nlohmann::json& v) { session.name = json_to_string(v, "name"); });
  session.level =
      diagnosis_level_from_string(json_to_string(require_field(json_session, "level"), "level"));
  session.status =
      diagnosis_status_from_string(json_to_string(require_field(json_session, "status"), "status"));
  assign_if_present(json_session, "limits",
                    [&](const nlohmann::json& v) { session.limits = limits_from_json(v); });
  assign_if_present(json_session, "difficulty_band", [&](const nlohmann::json& v) {
    session.difficulty_band = difficulty_range_from_json(v);
  });
  session.current_ability_estimate = json_to_double(
      require_field(json_session, "current_ability_estimate"), "current_ability_estimate");
  session.ability_se = json_to_double(require_field(json_session, "ability_se"), "ability_se");
  session.questions_answered =
      json_to_int(require_field(json_session, "questions_answered"), "questions_answered");
  session.correct_answers =
      json_to_int(require_field(json_session, "correct_answers"), "correct_answers");
  session.current_question_index =
      json_to_int(require_field(json_session, "current_question_index"), "current_question_index");
  assign_if_present(json_session, "total_time_spent", [&](const nlohmann::json& v) {
    session.total_time_spent = json_to_int(v, "total_time_spent");
  });
  assign_if_present(json_session, "accuracy_rate", [&](const nlohmann::json& v) {
    session.accuracy_rate = json_to_double(v, "accuracy_rate");
  });
  assign_if_present(json_session, "created_at_ms", [&](const nlohmann::json& v) {
    session.created_at_ms = json_to_int64(v, "created_at_ms");
  });
  assign_if_present(json_session, "start_time_ms", [&](const nlohmann::json& v) {
    session.start_time_ms = json_to_int64(v, "start_time_ms");
  });
  assign_if_present(json_session, "end_time_ms", [&](const nlohmann::json& v) {
    session.end_time_ms = json_to_int64(v, "end_time_ms");
  });
  assign_if_present(json_session, "stop_reason", [&](const nlohmann::json& v) {
    session.stop_reason = stop_reason_from_string(json_to_string(v, "stop_reason"));
  });
  assign_if_present(json_session, "active_item", [&](const nlohmann::json& v) {
    session.active_item = question_item_from_json(v);
  });
  assign_if_present(json_session, "ability_progression", [&](const nlohmann::json& v) {
    session.ability_progression =
        array_from_json<AbilityProgressionEntry>(v, "ability_progression", progression_entry_from_json);
  });
  assign_if_present(json_session, "selection_history", [&](const nlohmann::json& v) {
    session.selection_history =
        array_from_json<SelectionLogEntry>(v, "selection_history", selection_entry_from_json);
  });
  session.version = json_to_uint64(require_field(json_session, "version"), "version");
  return session;
}

nlohmann::json to_json(const QuestionResponse& response) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = response.id;
  json["session_id"] = response.session_id;
  json["sequence"] = response.sequence;
  json["question_id"] = response.question_id;
  json["knowledge_point_id"] = response.knowledge_point_id;
  json["question_content"] = response.question_content;
  json["question_type"] = response.question_type;
  json["difficulty"] = response.difficulty;
  json["user_answer"] = response.user_answer;
  json["correct_answer"] = response.correct_answer;
  json["correct"] = response.correct;
  json["time_spent"] = response.time_spent;
  json["confidence"] = optional_to_json(response.confidence);
  json["error_type"] = optional_to_json(response.error_type);
  json["timestamp_ms"] = response.timestamp_ms;
  return json;
}

QuestionResponse question_response_from_json(const nlohmann::json& json_response) {
  QuestionResponse response;
  response.id = json_to_string(require_field(json_response, "id"), "id");
  response.session_id = json_to_string(require_field(json_response, "session_id"), "session_id");
  response.sequence = json_to_int(require_field(json_response, "sequence"), "sequence");
  response.question_id =
      json_to_string(require_field(json_response, "question_id"), "question_id");
  response.knowledge_point_id =
      json_to_string(require_field(json_response, "knowledge_point_id"), "knowledge_point_id");
  assign_if_present(json_response, "question_content", [&](const nlohmann::json& v) {
    response.question_content = json_to_string(v, "question_content");
  });
  assign_if_present(json_response, "question_type", [&](const nlohmann::json& v) {
    response.question_type = json_to_string(v, "question_type");
  });
  response.difficulty = json_to_int(require_field(json_response, "difficulty"), "difficulty");
  assign_if_present(json_response, "user_answer", [&](const nlohmann::json& v) {
    response.user_answer = json_to_string(v, "user_answer");
  });
  assign_if_present(json_response, "correct_answer", [&](const nlohmann::json& v) {
    response.correct_answer = json_to_string(v, "correct_answer");
  });
  response.correct = json_to_bool(require_field(json_response, "correct"), "correct");
  assign_if_present(json_response, "time_spent", [&](const nlohmann::json& v) {
    response.time_spent = json_to_int(v, "time_spent");
  });
  assign_if_present(json_response, "confidence", [&](const nlohmann::json& v) {
    response.confidence = json_to_int(v, "confidence");
  });
  assign_if_present(json_response, "error_type", [&](const nlohmann::json& v) {
    response.error_type = json_to_string(v, "error_type");
  });
  assign_if_present(json_response, "timestamp_ms", [&](const nlohmann::json& v) {
    response.timestamp_ms = json_to_int64(v, "timestamp_ms");
  });
  return response;
}

AnswerSubmission answer_submission_from_json(const nlohmann::json& json_submission) {
  if (!json_submission.is_object()) {
    throw InvalidResponse("Answer payload must be a JSON object");
  }
  try {
    AnswerSubmission submission;
    auto read_string = [&](const char* key, std::string& target) {
      assign_if_present(json_submission, key,
                        [&](const nlohmann::json& v) { target = json_to_string(v, key); });
    };
    read_string("question_id", submission.question_id);
    read_string("knowledge_point_id", submission.knowledge_point_id);
    read_string("question_content", submission.question_content);
    read_string("question_type", submission.question_type);
    read_string("user_answer", submission.user_answer);
    read_string("correct_answer", submission.correct_answer);
    assign_if_present(json_submission, "difficulty", [&](const nlohmann::json& v) {
      submission.difficulty = json_to_int(v, "difficulty");
    });
    submission.correct = json_to_bool(require_field(json_submission, "correct"), "correct");
    assign_if_present(json_submission, "time_spent", [&](const nlohmann::json& v) {
      submission.time_spent = json_to_int(v, "time_spent");
    });
    assign_if_present(json_submission, "confidence", [&](const nlohmann::json& v) {
      submission.confidence = json_to_int(v, "confidence");
    });
    assign_if_present(json_submission, "error_type", [&](const nlohmann::json& v) {
      submission.error_type = json_to_string(v, "error_type");
    });
    return submission;
  } catch (const std::invalid_argument& ex) {
    throw InvalidResponse(ex.what());
  }
}

nlohmann::json to_json(const DiagnosisReport& report) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = report.id;
  json["user_id"] = report.user_id;
  json["subject_id"] = report.subject_id;
  json["config"] = to_json(report.config);
  json["status"] = to_string(report.status);
  json["created_at_ms"] = report.created_at_ms;
  json["completed_at_ms"] = optional_to_json(report.completed_at_ms);
  json["overall_score"] = report.overall_score;
  json["max_score"] = report.max_score;
  json["total_questions"] = report.total_questions;
  json["correct_questions"] = report.correct_questions;
  json["accuracy_rate"] = report.accuracy_rate;
  json["total_time"] = report.total_time;
  json["avg_time_per_question"] = report.avg_time_per_question;
  json["ability_estimate"] = report.ability_estimate;
  json["ability_se"] = report.ability_se;
  nlohmann::json interval = nlohmann::json::object();
  interval["lower"] = report.confidence_interval.lower;
  interval["upper"] = report.confidence_interval.upper;
  interval["confidence_level"] = report.confidence_interval.level;
  json["confidence_interval"] = std::move(interval);
  nlohmann::json mastery = nlohmann::json::object();
  for (const auto& [id, entry] : report.mastery_levels) {
    mastery[id] = mastery_entry_to_json(entry);
  }
  json["mastery_levels"] = std::move(mastery);
  json["heatmap_data"] = heatmap_to_json(report.heatmap_data);
  json["weakness_points"] = array_to_json(report.weakness_points, ranked_point_to_json);
  json["strength_points"] = array_to_json(report.strength_points, ranked_point_to_json);
  json["learning_path"] = array_to_json(report.learning_path, path_step_to_json);
  json["weakness_records"] = array_to_json(report.weakness_records, weakness_record_to_json);
  json["analysis"] = analysis_to_json(report.analysis);
  json["recommendations"] = array_to_json(report.recommendations, recommendation_to_json);
  json["version"] = report.version;
  return json;
}

DiagnosisReport diagnosis_report_from_json(const nlohmann::json& json_report) {
  DiagnosisReport report;
  report.id = json_to_string(require_field(json_report, "id"), "id");
  report.user_id = json_to_string(require_field(json_report, "user_id"), "user_id");
  report.subject_id = json_to_string(require_field(json_report, "subject_id"), "subject_id");
  report.config = report_config_from_json(require_field(json_report, "config"));
  report.status =
      diagnosis_status_from_string(json_to_string(require_field(json_report, "status"), "status"));
  assign_if_present(json_report, "created_at_ms", [&](const nlohmann::json& v) {
    report.created_at_ms = json_to_int64(v, "created_at_ms");
  });
  assign_if_present(json_report, "completed_at_ms", [&](const nlohmann::json& v) {
    report.completed_at_ms = json_to_int64(v, "completed_at_ms");
  });
  auto read_int = [&](const char* key, int& target) {
    assign_if_present(json_report, key, [&](const nlohmann::json& v) { target = json_to_int(v, key); });
  };
  auto read_double = [&](const char* key, double& target) {
    assign_if_present(json_report, key,
                      [&](const nlohmann::json& v) { target = json_to_double(v, key); });
  };
  read_int("overall_score", report.overall_score);
  read_int("max_score", report.max_score);
  read_int("total_questions", report.total_questions);
  read_int("correct_questions", report.correct_questions);
  read_double("accuracy_rate", report.accuracy_rate);
  read_int("total_time", report.total_time);
  read_double("avg_time_per_question", report.avg_time_per_question);
  read_double("ability_estimate", report.ability_estimate);
  read_double("ability_se", report.ability_se);
  assign_if_present(json_report, "confidence_interval", [&](const nlohmann::json& v) {
    report.confidence_interval.lower = json_to_double(require_field(v, "lower"), "lower");
    report.confidence_interval.upper = json_to_double(require_field(v, "upper"), "upper");
    assign_if_present(v, "confidence_level", [&](const nlohmann::json& level) {
      report.confidence_interval.level = json_to_double(level, "confidence_level");
    });
  });
  assign_if_present(json_report, "mastery_levels", [&](const nlohmann::json& v) {
    if (!v.is_object()) {
      throw std::invalid_argument("Expected object for field 'mastery_levels'");
    }
    for (const auto& [id, entry] : v.items()) {
      report.mastery_levels[id] = mastery_entry_from_json(entry);
    }
  });
  assign_if_present(json_report, "heatmap_data",
                    [&](const nlohmann::json& v) { report.heatmap_data = heatmap_from_json(v); });
  assign_if_present(json_report, "weakness_points", [&](const nlohmann::json& v) {
    report.weakness_points = array_from_json<RankedPoint>(v, "weakness_points", ranked_point_from_json);
  });
  assign_if_present(json_report, "strength_points", [&](const nlohmann::json& v) {
    report.strength_points = array_from_json<RankedPoint>(v, "strength_points", ranked_point_from_json);
  });
  assign_if_present(json_report, "learning_path", [&](const nlohmann::json& v) {
    report.learning_path = array_from_json<LearningPathStep>(v, "learning_path", path_step_from_json);
  });
  assign_if_present(json_report, "weakness_records", [&](const nlohmann::json& v) {
    report.weakness_records =
        array_from_json<WeaknessPoint>(v, "weakness_records", weakness_record_from_json);
  });
  assign_if_present(json_report, "analysis",
                    [&](const nlohmann::json& v) { report.analysis = analysis_from_json(v); });
  assign_if_present(json_report, "recommendations", [&](const nlohmann::json& v) {
    report.recommendations =
        array_from_json<Recommendation>(v, "recommendations", recommendation_from_json);
  });
  report.version = json_to_uint64(require_field(json_report, "version"), "version");
  return report;
}

nlohmann::json to_json(const DiagnosisStatistics& statistics) {
  nlohmann::json json = nlohmann::json::object();
  json["total_diagnoses"] = statistics.total_diagnoses;
  json["completed_diagnoses"] = statistics.completed_diagnoses;
  json["average_accuracy"] = statistics.average_accuracy;
  nlohmann::json trend = nlohmann::json::array();
  for (const auto& entry : statistics.improvement_trend) {
    nlohmann::json item = nlohmann::json::object();
    item["report_id"] = entry.report_id;
    item["completed_at_ms"] = entry.completed_at_ms;
    item["accuracy_rate"] = entry.accuracy_rate;
    item["ability_estimate"] = entry.ability_estimate;
    trend.push_back(std::move(item));
  }
  json["improvement_trend"] = std::move(trend);
  json["latest_ability_estimate"] = optional_to_json(statistics.latest_ability_estimate);
  return json;
}

nlohmann::json to_json(const analysis::ResponsePattern& pattern) {
  nlohmann::json json = nlohmann::json::object();
  json["session_id"] = pattern.session_id;
  json["total_questions"] = pattern.total_questions;
  json["correct_count"] = pattern.correct_count;
  json["accuracy_rate"] = pattern.accuracy_rate;
  json["average_time"] = pattern.average_time;
  json["ability_trajectory"] = pattern.ability_trajectory;
  nlohmann::json steps = nlohmann::json::array();
  for (const auto& step : pattern.difficulty_progression) {
    nlohmann::json item = nlohmann::json::object();
    item["question_index"] = step.question_index;
    item["difficulty"] = step.difficulty;
    item["correct"] = step.correct;
    item["time_spent"] = step.time_spent;
    steps.push_back(std::move(item));
  }
  json["difficulty_progression"] = std::move(steps);
  json["consistency_score"] = pattern.consistency_score;
  json["ability_trend"] = analysis::to_string(pattern.ability_trend);
  json["learning_trend"] = analysis::to_string(pattern.learning_trend);
  json["learning_efficiency"] = pattern.learning_efficiency;
  return json;
}

nlohmann::json to_json(const EngineOptions& options) {
  nlohmann::json json = nlohmann::json::object();
  json["default_min_questions"] = options.default_min_questions;
  json["default_max_questions"] = options.default_max_questions;
  json["default_target_precision"] = options.default_target_precision;
  json["priority_policy"] = to_string(options.priority_policy);
  json["default_priority"] = options.default_priority;
  json["id_seed"] = options.id_seed;
  return json;
}

EngineOptions engine_options_from_json(const nlohmann::json& json_options) {
  if (!json_options.is_object()) {
    throw ConfigurationError("Engine options must be a JSON object");
  }
  try {
    EngineOptions options;
    assign_if_present(json_options, "default_min_questions", [&](const nlohmann::json& v) {
      options.default_min_questions = json_to_int(v, "default_min_questions");
    });
    assign_if_present(json_options, "default_max_questions", [&](const nlohmann::json& v) {
      options.default_max_questions = json_to_int(v, "default_max_questions");
    });
    assign_if_present(json_options, "default_target_precision", [&](const nlohmann::json& v) {
      options.default_target_precision = json_to_double(v, "default_target_precision");
    });
    assign_if_present(json_options, "priority_policy", [&](const nlohmann::json& v) {
      options.priority_policy = priority_policy_from_string(json_to_string(v, "priority_policy"));
    });
    assign_if_present(json_options, "default_priority", [&](const nlohmann::json& v) {
      options.default_priority = json_to_int(v, "default_priority");
    });
    assign_if_present(json_options, "id_seed", [&](const nlohmann::json& v) {
      options.id_seed = json_to_uint64(v, "id_seed");
    });
    return options;
  } catch (const std::invalid_argument& ex) {
    throw ConfigurationError(ex.what());
  }
}

nlohmann::json to_json(const SubmitOutcome& outcome) {
  nlohmann::json json = nlohmann::json::object();
  json["recorded"] = outcome.recorded;
  json["should_continue"] = outcome.should_continue;
  json["current_ability"] = outcome.current_ability;
  json["current_se"] = outcome.current_se;
  json["questions_remaining"] = outcome.questions_remaining;
  json["response_id"] = outcome.response_id;
  return json;
}

nlohmann::json to_json(const DiagnosisEngine::Next& next) {
  nlohmann::json json = nlohmann::json::object();
  if (const auto* item = std::get_if<NextItem>(&next)) {
    json["type"] = "item";
    json["item"] = to_json(item->item);
    json["suggested_difficulty"] = item->suggested_difficulty;
    json["question_number"] = item->question_number;
    json["reason"] = item->reason;
    return json;
  }
  const auto& finished = std::get<SessionFinished>(next);
  json["type"] = "session_finished";
  json["reason"] = to_string(finished.reason);
  json["session"] = to_json(finished.session);
  return json;
}

} // namespace dx::bridge
