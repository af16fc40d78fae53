#pragma once

#include "types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dx {

enum class PracticeStrategy {
  FoundationBuilding,
  SkillDevelopment,
  MasteryRefinement
};

inline std::string to_string(PracticeStrategy strategy) {
  switch (strategy) {
    case PracticeStrategy::FoundationBuilding: return "foundation_building";
    case PracticeStrategy::SkillDevelopment: return "skill_development";
    case PracticeStrategy::MasteryRefinement: return "mastery_refinement";
  }
  return "foundation_building";
}

inline PracticeStrategy practice_strategy_from_string(const std::string& value) {
  if (value == "foundation_building") {
    return PracticeStrategy::FoundationBuilding;
  }
  if (value == "skill_development") {
    return PracticeStrategy::SkillDevelopment;
  }
  if (value == "mastery_refinement") {
    return PracticeStrategy::MasteryRefinement;
  }
  throw std::invalid_argument("Unknown practice strategy: " + value);
}

enum class PriorityPolicy {
  Fixed,
  MasteryBanded
};

inline std::string to_string(PriorityPolicy policy) {
  switch (policy) {
    case PriorityPolicy::Fixed: return "fixed";
    case PriorityPolicy::MasteryBanded: return "mastery_banded";
  }
  return "fixed";
}

inline PriorityPolicy priority_policy_from_string(const std::string& value) {
  if (value == "fixed") {
    return PriorityPolicy::Fixed;
  }
  if (value == "mastery_banded") {
    return PriorityPolicy::MasteryBanded;
  }
  throw std::invalid_argument("Unknown priority policy: " + value);
}

struct MasteryEntry {
  double score = 0.0;
  double accuracy = 0.0;
  int total = 0;
  int correct = 0;
  double average_difficulty = 3.0;
  int total_time = 0;
  double average_time = 0.0;
  double error_rate = 0.0;
  std::map<std::string, int> error_types;
  int priority = 3;
};

// Parallel arrays, one slot per mastery entry.
struct HeatmapData {
  std::vector<std::string> knowledge_point_ids;
  std::vector<std::string> knowledge_points;
  std::vector<double> mastery_scores;
  std::vector<double> difficulty_levels;
  std::vector<double> time_spent;
  std::vector<double> error_rates;
};

struct RankedPoint {
  std::string knowledge_point_id;
  std::string knowledge_point_name;
  double mastery_score = 0.0;
  int priority = 3;
};

struct LearningPathStep {
  int order = 0;
  std::string knowledge_point_id;
  std::string knowledge_point_name;
  double current_mastery = 0.0;
  double target_mastery = 80.0;
  double estimated_hours = 0.0;
  PracticeStrategy practice_strategy = PracticeStrategy::FoundationBuilding;
  std::vector<std::string> prerequisites;
};

struct WeaknessPoint {
  std::string knowledge_point_id;
  int weakness_level = 1;
  double accuracy_rate = 0.0;
  double average_time = 0.0;
  std::map<std::string, int> error_types;
  int priority = 3;
  double estimated_improvement_hours = 0.0;
};

struct LearningStyle {
  std::string pace = "moderate";
  std::string difficulty_preference = "medium";
};

struct ReportAnalysis {
  std::string overall_assessment;
  std::vector<std::string> strengths;
  std::vector<std::string> weaknesses;
  LearningStyle learning_style;
  std::vector<std::string> improvement_suggestions;
};

struct Recommendation {
  std::string type;
  std::string title;
  std::string description;
  std::optional<double> estimated_hours;
  std::string priority;
  std::optional<PracticeStrategy> strategy;
};

struct DiagnosisReport {
  std::string id;
  std::string user_id;
  std::string subject_id;
  ReportConfig config;
  DiagnosisStatus status = DiagnosisStatus::Pending;
  std::int64_t created_at_ms = 0;
  std::optional<std::int64_t> completed_at_ms;

  int overall_score = 0;
  int max_score = 0;
  int total_questions = 0;
  int correct_questions = 0;
  double accuracy_rate = 0.0;
  int total_time = 0;
  double avg_time_per_question = 0.0;
  double ability_estimate = 0.0;
  double ability_se = 1.0;
  ConfidenceInterval confidence_interval;

  std::map<std::string, MasteryEntry> mastery_levels;
  HeatmapData heatmap_data;
  std::vector<RankedPoint> weakness_points;
  std::vector<RankedPoint> strength_points;
  std::vector<LearningPathStep> learning_path;
  std::vector<WeaknessPoint> weakness_records;
  ReportAnalysis analysis;
  std::vector<Recommendation> recommendations;

  std::uint64_t version = 0;
};

struct StatisticsTrendEntry {
  std::string report_id;
  std::int64_t completed_at_ms = 0;
  double accuracy_rate = 0.0;
  double ability_estimate = 0.0;
};

struct DiagnosisStatistics {
  int total_diagnoses = 0;
  int completed_diagnoses = 0;
  double average_accuracy = 0.0;
  std::vector<StatisticsTrendEntry> improvement_trend;
  std::optional<double> latest_ability_estimate;
};

} // namespace dx
