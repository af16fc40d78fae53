#pragma once

#include "question_bank.hpp"
#include "report.hpp"
#include "types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dx {

constexpr double kWeaknessThreshold = 60.0;
constexpr double kStrengthThreshold = 80.0;
constexpr double kTargetMastery = 80.0;
constexpr std::size_t kRankedPointLimit = 5;
constexpr std::size_t kRecommendedSteps = 3;

struct SynthesisOptions {
  PriorityPolicy priority_policy = PriorityPolicy::Fixed;
  int default_priority = 3;
};

// (kTargetMastery - mastery) * 0.1 hours scaled by priority, rounded to 0.1.
double estimate_improvement_hours(double mastery, int priority);

PracticeStrategy practice_strategy_for(double mastery);

// 1 just below the weakness threshold, 5 at zero mastery.
int weakness_level_for(double mastery);

int mastery_banded_priority(double mastery, double average_difficulty);

// Turns the response history of a report into its final form. Holds no state
// between calls; the same input yields the same report apart from
// completed_at_ms.
class ReportSynthesizer {
public:
  explicit ReportSynthesizer(const KnowledgeDirectory* directory, SynthesisOptions options = {});

  DiagnosisReport synthesize(const DiagnosisReport& report,
                             const std::vector<QuestionResponse>& responses,
                             std::int64_t completed_at_ms) const;

  int improvement_priority(double mastery, double average_difficulty) const;

  std::map<std::string, MasteryEntry> mastery_levels(
      const std::vector<QuestionResponse>& responses) const;

  HeatmapData heatmap(const std::map<std::string, MasteryEntry>& mastery) const;

  std::vector<RankedPoint> rank_weaknesses(const std::map<std::string, MasteryEntry>& mastery) const;

  std::vector<RankedPoint> rank_strengths(const std::map<std::string, MasteryEntry>& mastery) const;

  std::vector<LearningPathStep> learning_path(const std::vector<RankedPoint>& weaknesses) const;

  std::vector<WeaknessPoint> weakness_records(const std::vector<RankedPoint>& weaknesses,
                                              const std::map<std::string, MasteryEntry>& mastery) const;

  // Rule-based notes over the aggregate fields and mastery map of `report`.
  ReportAnalysis analyze(const DiagnosisReport& report) const;

  std::vector<Recommendation> recommendations(const DiagnosisReport& report) const;

private:
  std::string knowledge_point_name(const std::string& knowledge_point_id) const;
  std::vector<std::string> prerequisites(const std::string& knowledge_point_id) const;

  const KnowledgeDirectory* directory_;
  SynthesisOptions options_;
};

} // namespace dx
