#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dx {

// Milliseconds since the Unix epoch.
using Clock = std::function<std::int64_t()>;

inline std::int64_t system_clock_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

enum class DiagnosisStatus {
  Pending,
  InProgress,
  Completed,
  Cancelled
};

inline std::string to_string(DiagnosisStatus status) {
  switch (status) {
    case DiagnosisStatus::Pending: return "pending";
    case DiagnosisStatus::InProgress: return "in_progress";
    case DiagnosisStatus::Completed: return "completed";
    case DiagnosisStatus::Cancelled: return "cancelled";
  }
  return "pending";
}

inline DiagnosisStatus diagnosis_status_from_string(const std::string& value) {
  if (value == "pending") {
    return DiagnosisStatus::Pending;
  }
  if (value == "in_progress") {
    return DiagnosisStatus::InProgress;
  }
  if (value == "completed") {
    return DiagnosisStatus::Completed;
  }
  if (value == "cancelled") {
    return DiagnosisStatus::Cancelled;
  }
  throw std::invalid_argument("Unknown diagnosis status: " + value);
}

enum class DiagnosisLevel {
  Memory,
  Application,
  Transfer
};

inline std::string to_string(DiagnosisLevel level) {
  switch (level) {
    case DiagnosisLevel::Memory: return "memory";
    case DiagnosisLevel::Application: return "application";
    case DiagnosisLevel::Transfer: return "transfer";
  }
  return "memory";
}

inline DiagnosisLevel diagnosis_level_from_string(const std::string& value) {
  if (value == "memory") {
    return DiagnosisLevel::Memory;
  }
  if (value == "application") {
    return DiagnosisLevel::Application;
  }
  if (value == "transfer") {
    return DiagnosisLevel::Transfer;
  }
  throw std::invalid_argument("Unknown diagnosis level: " + value);
}

enum class DiagnosisType {
  Basic,
  Comprehensive,
  Adaptive,
  Targeted
};

inline std::string to_string(DiagnosisType type) {
  switch (type) {
    case DiagnosisType::Basic: return "basic";
    case DiagnosisType::Comprehensive: return "comprehensive";
    case DiagnosisType::Adaptive: return "adaptive";
    case DiagnosisType::Targeted: return "targeted";
  }
  return "comprehensive";
}

inline DiagnosisType diagnosis_type_from_string(const std::string& value) {
  if (value == "basic") {
    return DiagnosisType::Basic;
  }
  if (value == "comprehensive") {
    return DiagnosisType::Comprehensive;
  }
  if (value == "adaptive") {
    return DiagnosisType::Adaptive;
  }
  if (value == "targeted") {
    return DiagnosisType::Targeted;
  }
  throw std::invalid_argument("Unknown diagnosis type: " + value);
}

enum class StopReason {
  MaxQuestions,
  PrecisionReached,
  PoolExhausted,
  Ended,
  Cancelled
};

inline std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::MaxQuestions: return "max_questions";
    case StopReason::PrecisionReached: return "precision_reached";
    case StopReason::PoolExhausted: return "pool_exhausted";
    case StopReason::Ended: return "ended";
    case StopReason::Cancelled: return "cancelled";
  }
  return "ended";
}

inline StopReason stop_reason_from_string(const std::string& value) {
  if (value == "max_questions") {
    return StopReason::MaxQuestions;
  }
  if (value == "precision_reached") {
    return StopReason::PrecisionReached;
  }
  if (value == "pool_exhausted") {
    return StopReason::PoolExhausted;
  }
  if (value == "ended") {
    return StopReason::Ended;
  }
  if (value == "cancelled") {
    return StopReason::Cancelled;
  }
  throw std::invalid_argument("Unknown stop reason: " + value);
}

struct DifficultyRange {
  int min = 1;
  int max = 5;
};

struct ConfidenceInterval {
  double lower = 0.0;
  double upper = 0.0;
  double level = 0.95;
};

struct ReportConfig {
  std::string name;
  std::string description;
  DiagnosisType type = DiagnosisType::Comprehensive;
  DiagnosisLevel target_level = DiagnosisLevel::Transfer;
  int total_questions_planned = 30;
  int time_limit_minutes = 60;
  DifficultyRange difficulty_range;
  bool adaptive_enabled = true;
  // Empty means every knowledge point of the subject.
  std::vector<std::string> knowledge_point_ids;

  void validate() const;
};

// Unset limits fall back to the engine defaults.
struct SessionConfig {
  std::string name;
  DiagnosisLevel level = DiagnosisLevel::Memory;
  std::optional<int> min_questions;
  std::optional<int> max_questions;
  std::optional<double> target_precision;
};

struct SessionLimits {
  int min_questions = 10;
  int max_questions = 30;
  double target_precision = 0.3;

  void validate() const;
};

struct QuestionItem {
  std::string question_id;
  std::string knowledge_point_id;
  int difficulty = 3;
  std::string content;
  std::string question_type;
};

struct AbilityProgressionEntry {
  int question_index = 0;
  double previous_estimate = 0.0;
  bool correct = false;
  int difficulty = 3;
  std::int64_t timestamp_ms = 0;
};

struct SelectionLogEntry {
  int question_index = 0;
  int suggested_difficulty = 3;
  int actual_difficulty = 3;
  std::string question_id;
  std::string knowledge_point_id;
  std::string reason;
  std::int64_t timestamp_ms = 0;
};

struct DiagnosisSession {
  std::string id;
  std::string report_id;
  std::string name;
  DiagnosisLevel level = DiagnosisLevel::Memory;
  DiagnosisStatus status = DiagnosisStatus::Pending;
  SessionLimits limits;
  DifficultyRange difficulty_band;

  double current_ability_estimate = 0.0;
  double ability_se = 1.0;
  int questions_answered = 0;
  int correct_answers = 0;
  int current_question_index = 0;
  int total_time_spent = 0;
  double accuracy_rate = 0.0;

  std::int64_t created_at_ms = 0;
  std::optional<std::int64_t> start_time_ms;
  std::optional<std::int64_t> end_time_ms;
  std::optional<StopReason> stop_reason;

  // Item served by next_item and not yet answered.
  std::optional<QuestionItem> active_item;
  std::vector<AbilityProgressionEntry> ability_progression;
  std::vector<SelectionLogEntry> selection_history;

  std::uint64_t version = 0;
};

struct QuestionResponse {
  std::string id;
  std::string session_id;
  int sequence = 0;
  std::string question_id;
  std::string knowledge_point_id;
  std::string question_content;
  std::string question_type;
  int difficulty = 3;
  std::string user_answer;
  std::string correct_answer;
  bool correct = false;
  int time_spent = 0;
  std::optional<int> confidence;
  std::optional<std::string> error_type;
  std::int64_t timestamp_ms = 0;
};

// Answer payload as submitted by the service layer. Fields left empty are
// taken from the item currently served to the session.
struct AnswerSubmission {
  std::string question_id;
  std::string knowledge_point_id;
  std::string question_content;
  std::string question_type;
  std::optional<int> difficulty;
  std::string user_answer;
  std::string correct_answer;
  bool correct = false;
  int time_spent = 0;
  std::optional<int> confidence;
  std::optional<std::string> error_type;
};

} // namespace dx
