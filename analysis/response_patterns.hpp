#pragma once

#include "dx/types.hpp"

#include <string>
#include <vector>

namespace dx::analysis {

constexpr std::size_t kConsistencyWindow = 5;
constexpr std::size_t kAccuracyWindow = 5;
// Per-question slope below which the ability trajectory counts as flat.
constexpr double kTrendSlopeEpsilon = 0.01;
constexpr double kAccuracyTrendMargin = 0.1;

enum class Trend {
  Improving,
  Declining,
  Stable
};

inline std::string to_string(Trend trend) {
  switch (trend) {
    case Trend::Improving: return "improving";
    case Trend::Declining: return "declining";
    case Trend::Stable: return "stable";
  }
  return "stable";
}

struct DifficultyStep {
  int question_index = 0; // 1-based
  int difficulty = 3;
  bool correct = false;
  int time_spent = 0;
};

struct ResponsePattern {
  std::string session_id;
  int total_questions = 0;
  int correct_count = 0;
  double accuracy_rate = 0.0;
  double average_time = 0.0;
  // Prior estimates from the progression followed by the current estimate.
  std::vector<double> ability_trajectory;
  std::vector<DifficultyStep> difficulty_progression;
  double consistency_score = 0.0;
  Trend ability_trend = Trend::Stable;
  // First kAccuracyWindow answers against the last kAccuracyWindow.
  Trend learning_trend = Trend::Stable;
  double learning_efficiency = 0.0;
};

// Pure view over a session and its responses; neither is modified.
ResponsePattern analyze(const DiagnosisSession& session,
                        const std::vector<QuestionResponse>& responses);

double consistency_score(const std::vector<double>& trajectory);

double trajectory_slope(const std::vector<double>& trajectory);

} // namespace dx::analysis
