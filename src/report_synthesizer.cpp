#include "dx/report_synthesizer.hpp"

#include "../estimation/ability.hpp"
#include "debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace dx {
namespace {

double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::nearbyint(value * scale) / scale;
}

double priority_multiplier(int priority) {
  switch (priority) {
    case 1: return 1.5;
    case 2: return 1.3;
    case 3: return 1.0;
    case 4: return 0.8;
    case 5: return 0.6;
    default: return 1.0;
  }
}

struct ErrorCount {
  std::string type;
  int count = 0;
};

std::vector<ErrorCount> recurring_errors(const std::map<std::string, MasteryEntry>& mastery) {
  std::map<std::string, int> totals;
  for (const auto& [id, entry] : mastery) {
    for (const auto& [type, count] : entry.error_types) {
      totals[type] += count;
    }
  }
  std::vector<ErrorCount> sorted;
  for (const auto& [type, count] : totals) {
    sorted.push_back({type, count});
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ErrorCount& a, const ErrorCount& b) { return a.count > b.count; });
  if (sorted.size() > 3) {
    sorted.resize(3);
  }
  return sorted;
}

std::string overall_assessment(double accuracy_percent, double ability) {
  if (accuracy_percent >= 80.0 && ability > 1.0) {
    return "excellent";
  }
  if (accuracy_percent >= 60.0 && ability > 0.0) {
    return "good";
  }
  if (accuracy_percent >= 40.0) {
    return "fair";
  }
  return "needs_improvement";
}

} // namespace

double estimate_improvement_hours(double mastery, int priority) {
  const double base = (kTargetMastery - mastery) * 0.1;
  return round_to(base * priority_multiplier(priority), 1);
}

PracticeStrategy practice_strategy_for(double mastery) {
  if (mastery < 30.0) {
    return PracticeStrategy::FoundationBuilding;
  }
  if (mastery < 60.0) {
    return PracticeStrategy::SkillDevelopment;
  }
  return PracticeStrategy::MasteryRefinement;
}

int weakness_level_for(double mastery) {
  const int level = static_cast<int>(std::ceil((kWeaknessThreshold - mastery) / 12.0));
  return std::clamp(level, 1, 5);
}

int mastery_banded_priority(double mastery, double average_difficulty) {
  if (mastery < 40.0) {
    return 1;
  }
  if (mastery < 60.0) {
    return 2;
  }
  if (mastery < 80.0) {
    return 3;
  }
  return average_difficulty < 4.0 ? 4 : 5;
}

ReportSynthesizer::ReportSynthesizer(const KnowledgeDirectory* directory, SynthesisOptions options)
    : directory_(directory), options_(options) {}

int ReportSynthesizer::improvement_priority(double mastery, double average_difficulty) const {
  if (options_.priority_policy == PriorityPolicy::MasteryBanded) {
    return mastery_banded_priority(mastery, average_difficulty);
  }
  return options_.default_priority;
}

std::string ReportSynthesizer::knowledge_point_name(const std::string& knowledge_point_id) const {
  if (directory_ != nullptr) {
    if (auto info = directory_->describe(knowledge_point_id)) {
      if (!info->name.empty()) {
        return info->name;
      }
    }
  }
  return knowledge_point_id;
}

std::vector<std::string> ReportSynthesizer::prerequisites(
    const std::string& knowledge_point_id) const {
  if (directory_ != nullptr) {
    if (auto info = directory_->describe(knowledge_point_id)) {
      return info->prerequisites;
    }
  }
  return {};
}

std::map<std::string, MasteryEntry> ReportSynthesizer::mastery_levels(
    const std::vector<QuestionResponse>& responses) const {
  struct Tally {
    int total = 0;
    int correct = 0;
    int difficulty_sum = 0;
    int time = 0;
    std::map<std::string, int> errors;
  };
  std::map<std::string, Tally> tallies;
  for (const auto& response : responses) {
    if (response.knowledge_point_id.empty()) {
      continue;
    }
    auto& tally = tallies[response.knowledge_point_id];
    tally.total += 1;
    if (response.correct) {
      tally.correct += 1;
    }
    tally.difficulty_sum += response.difficulty;
    tally.time += response.time_spent;
    if (response.error_type.has_value() && !response.error_type->empty()) {
      tally.errors[*response.error_type] += 1;
    }
  }

  std::map<std::string, MasteryEntry> mastery;
  for (auto& [id, tally] : tallies) {
    MasteryEntry entry;
    const double total = static_cast<double>(tally.total);
    entry.total = tally.total;
    entry.correct = tally.correct;
    entry.accuracy = static_cast<double>(tally.correct) / total;
    entry.score = std::clamp(entry.accuracy * 100.0, 0.0, 100.0);
    entry.average_difficulty = static_cast<double>(tally.difficulty_sum) / total;
    entry.total_time = tally.time;
    entry.average_time = static_cast<double>(tally.time) / total;
    entry.error_rate = 1.0 - entry.accuracy;
    entry.error_types = std::move(tally.errors);
    entry.priority = improvement_priority(entry.score, entry.average_difficulty);
    mastery.emplace(id, std::move(entry));
  }
  return mastery;
}

HeatmapData ReportSynthesizer::heatmap(const std::map<std::string, MasteryEntry>& mastery) const {
  HeatmapData data;
  for (const auto& [id, entry] : mastery) {
    data.knowledge_point_ids.push_back(id);
    data.knowledge_points.push_back(knowledge_point_name(id));
    data.mastery_scores.push_back(entry.score);
    data.difficulty_levels.push_back(entry.average_difficulty);
    data.time_spent.push_back(entry.average_time);
    data.error_rates.push_back(entry.error_rate);
  }
  return data;
}

std::vector<RankedPoint> ReportSynthesizer::rank_weaknesses(
    const std::map<std::string, MasteryEntry>& mastery) const {
  std::vector<RankedPoint> ranked;
  for (const auto& [id, entry] : mastery) {
    if (entry.score < kWeaknessThreshold) {
      ranked.push_back({id, knowledge_point_name(id), entry.score, entry.priority});
    }
  }
  std::sort(ranked.begin(), ranked.end(), [](const RankedPoint& a, const RankedPoint& b) {
    if (a.priority != b.priority) {
      return a.priority < b.priority;
    }
    if (a.mastery_score != b.mastery_score) {
      return a.mastery_score < b.mastery_score;
    }
    return a.knowledge_point_id < b.knowledge_point_id;
  });
  if (ranked.size() > kRankedPointLimit) {
    ranked.resize(kRankedPointLimit);
  }
  return ranked;
}

std::vector<RankedPoint> ReportSynthesizer::rank_strengths(
    const std::map<std::string, MasteryEntry>& mastery) const {
  std::vector<RankedPoint> ranked;
  for (const auto& [id, entry] : mastery) {
    if (entry.score >= kStrengthThreshold) {
      ranked.push_back({id, knowledge_point_name(id), entry.score, entry.priority});
    }
  }
  std::sort(ranked.begin(), ranked.end(), [](const RankedPoint& a, const RankedPoint& b) {
    if (a.mastery_score != b.mastery_score) {
      return a.mastery_score > b.mastery_score;
    }
    return a.knowledge_point_id < b.knowledge_point_id;
  });
  if (ranked.size() > kRankedPointLimit) {
    ranked.resize(kRankedPointLimit);
  }
  return ranked;
}

std::vector<LearningPathStep> ReportSynthesizer::learning_path(
    const std::vector<RankedPoint>& weaknesses) const {
  std::vector<LearningPathStep> path;
  int order = 0;
  for (const auto& point : weaknesses) {
    LearningPathStep step;
    step.order = ++order;
    step.knowledge_point_id = point.knowledge_point_id;
    step.knowledge_point_name = point.knowledge_point_name;
    step.current_mastery = point.mastery_score;
    step.target_mastery = kTargetMastery;
    step.estimated_hours = estimate_improvement_hours(point.mastery_score, point.priority);
    step.practice_strategy = practice_strategy_for(point.mastery_score);
    step.prerequisites = prerequisites(point.knowledge_point_id);
    path.push_back(std::move(step));
  }
  return path;
}

std::vector<WeaknessPoint> ReportSynthesizer::weakness_records(
    const std::vector<RankedPoint>& weaknesses,
    const std::map<std::string, MasteryEntry>& mastery) const {
  std::vector<WeaknessPoint> records;
  for (const auto& point : weaknesses) {
    const auto it = mastery.find(point.knowledge_point_id);
    if (it == mastery.end()) {
      continue;
    }
    const auto& entry = it->second;
    WeaknessPoint record;
    record.knowledge_point_id = point.knowledge_point_id;
    record.weakness_level = weakness_level_for(entry.score);
    record.accuracy_rate = entry.accuracy;
    record.average_time = entry.average_time;
    record.error_types = entry.error_types;
    record.priority = entry.priority;
    record.estimated_improvement_hours = estimate_improvement_hours(entry.score, entry.priority);
    records.push_back(std::move(record));
  }
  return records;
}

ReportAnalysis ReportSynthesizer::analyze(const DiagnosisReport& report) const {
  ReportAnalysis analysis;
  analysis.overall_assessment = overall_assessment(report.accuracy_rate, report.ability_estimate);
  const double avg_time = report.avg_time_per_question;
  const auto& mastery = report.mastery_levels;

  int strong = 0;
  int weak = 0;
  int very_weak = 0;
  bool hard_items_strong = false;
  double difficulty_sum = 0.0;
  for (const auto& [id, entry] : mastery) {
    if (entry.score >= kStrengthThreshold) {
      ++strong;
    }
    if (entry.score < kWeaknessThreshold) {
      ++weak;
    }
    if (entry.score < 50.0) {
      ++very_weak;
    }
    if (entry.average_difficulty >= 4.0 && entry.accuracy > 0.7) {
      hard_items_strong = true;
    }
    difficulty_sum += entry.average_difficulty;
  }

  if (strong > 0) {
    analysis.strengths.push_back("Strong performance on " + std::to_string(strong) +
                                 " knowledge point(s)");
  }
  if (hard_items_strong) {
    analysis.strengths.push_back("Performs well on high-difficulty items");
  }
  if (avg_time > 0.0 && avg_time < 90.0) {
    analysis.strengths.push_back("Answers quickly");
  }

  if (weak > 0) {
    analysis.weaknesses.push_back(std::to_string(weak) + " knowledge point(s) need reinforcement");
  }
  for (const auto& error : recurring_errors(mastery)) {
    if (error.count >= 2) {
      analysis.weaknesses.push_back("Recurring error type: " + error.type);
    }
  }
  if (avg_time > 180.0) {
    analysis.weaknesses.push_back("Answers slowly");
  }

  if (avg_time > 0.0) {
    if (avg_time < 60.0) {
      analysis.learning_style.pace = "fast";
    } else if (avg_time > 150.0) {
      analysis.learning_style.pace = "slow";
    }
  }
  if (!mastery.empty()) {
    const double avg_difficulty = difficulty_sum / static_cast<double>(mastery.size());
    if (avg_difficulty > 3.5) {
      analysis.learning_style.difficulty_preference = "high";
    } else if (avg_difficulty < 2.5) {
      analysis.learning_style.difficulty_preference = "low";
    }
  }

  if (report.total_questions > 0 && report.accuracy_rate < 60.0) {
    analysis.improvement_suggestions.push_back("Consolidate the foundational material");
  }
  if (avg_time > 150.0) {
    analysis.improvement_suggestions.push_back("Practice under time limits to improve speed");
  }
  if (very_weak > 0) {
    analysis.improvement_suggestions.push_back("Focus on the " + std::to_string(very_weak) +
                                               " weakest knowledge point(s)");
  }
  analysis.improvement_suggestions.push_back("Follow a personalized, step-by-step study plan");
  return analysis;
}

std::vector<Recommendation> ReportSynthesizer::recommendations(const DiagnosisReport& report) const {
  std::vector<Recommendation> out;
  const std::size_t steps = std::min(kRecommendedSteps, report.learning_path.size());
  for (std::size_t i = 0; i < steps; ++i) {
    const auto& step = report.learning_path[i];
    std::ostringstream description;
    description << std::fixed << std::setprecision(1) << "Current mastery "
                << step.current_mastery << "%, target " << step.target_mastery << "%";
    Recommendation rec;
    rec.type = "knowledge_improvement";
    rec.title = "Strengthen " + step.knowledge_point_name;
    rec.description = description.str();
    rec.estimated_hours = step.estimated_hours;
    rec.priority = step.current_mastery < 40.0 ? "high" : "medium";
    rec.strategy = step.practice_strategy;
    out.push_back(std::move(rec));
  }
  if (report.analysis.learning_style.pace == "slow") {
    Recommendation rec;
    rec.type = "study_method";
    rec.title = "Improve study efficiency";
    rec.description = "Practice in fixed, timed intervals";
    rec.priority = "medium";
    out.push_back(std::move(rec));
  }
  return out;
}

DiagnosisReport ReportSynthesizer::synthesize(const DiagnosisReport& report,
                                              const std::vector<QuestionResponse>& responses,
                                              std::int64_t completed_at_ms) const {
  DiagnosisReport result = report;

  int correct = 0;
  int total_time = 0;
  for (const auto& response : responses) {
    if (response.correct) {
      ++correct;
    }
    total_time += response.time_spent;
  }
  const int total = static_cast<int>(responses.size());
  result.total_questions = total;
  result.correct_questions = correct;
  result.overall_score = correct;
  result.max_score = total;
  result.total_time = total_time;
  result.avg_time_per_question = static_cast<double>(total_time) / std::max(1, total);
  result.accuracy_rate =
      total == 0 ? 0.0 : round_to(static_cast<double>(correct) / total * 100.0, 2);

  const auto estimate = estimation::estimate_batch(responses);
  result.ability_estimate = estimate.ability;
  result.ability_se = estimate.standard_error;
  result.confidence_interval = estimate.interval;

  result.mastery_levels = mastery_levels(responses);
  result.heatmap_data = heatmap(result.mastery_levels);
  result.weakness_points = rank_weaknesses(result.mastery_levels);
  result.strength_points = rank_strengths(result.mastery_levels);
  result.learning_path = learning_path(result.weakness_points);
  result.weakness_records = weakness_records(result.weakness_points, result.mastery_levels);
  result.analysis = analyze(result);
  result.recommendations = recommendations(result);

  result.status = DiagnosisStatus::Completed;
  result.completed_at_ms = completed_at_ms;

  std::ostringstream oss;
  oss << "report " << result.id << " synthesized from " << total << " responses, ability "
      << result.ability_estimate << ", " << result.weakness_points.size() << " weak point(s)";
  detail::debug_log("report", oss.str());
  return result;
}

} // namespace dx
