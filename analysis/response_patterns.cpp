#include "response_patterns.hpp"

#include <algorithm>
#include <cmath>

namespace dx::analysis {
namespace {

double window_accuracy(const std::vector<QuestionResponse>& responses, std::size_t begin,
                       std::size_t count) {
  int correct = 0;
  for (std::size_t i = begin; i < begin + count; ++i) {
    if (responses[i].correct) {
      ++correct;
    }
  }
  return static_cast<double>(correct) / static_cast<double>(count);
}

Trend accuracy_trend(const std::vector<QuestionResponse>& responses) {
  if (responses.size() < kAccuracyWindow) {
    return Trend::Stable;
  }
  const double early = window_accuracy(responses, 0, kAccuracyWindow);
  const double recent =
      window_accuracy(responses, responses.size() - kAccuracyWindow, kAccuracyWindow);
  if (recent > early + kAccuracyTrendMargin) {
    return Trend::Improving;
  }
  if (recent < early - kAccuracyTrendMargin) {
    return Trend::Declining;
  }
  return Trend::Stable;
}

} // namespace

double consistency_score(const std::vector<double>& trajectory) {
  if (trajectory.empty()) {
    return 0.0;
  }
  const std::size_t count = std::min(kConsistencyWindow, trajectory.size());
  const auto first = trajectory.end() - static_cast<std::ptrdiff_t>(count);
  double mean = 0.0;
  for (auto it = first; it != trajectory.end(); ++it) {
    mean += *it;
  }
  mean /= static_cast<double>(count);
  double variance = 0.0;
  for (auto it = first; it != trajectory.end(); ++it) {
    variance += (*it - mean) * (*it - mean);
  }
  variance /= static_cast<double>(count);
  return 1.0 / (1.0 + variance);
}

double trajectory_slope(const std::vector<double>& trajectory) {
  const std::size_t n = trajectory.size();
  if (n < 2) {
    return 0.0;
  }
  const double mean_x = static_cast<double>(n - 1) / 2.0;
  double mean_y = 0.0;
  for (double y : trajectory) {
    mean_y += y;
  }
  mean_y /= static_cast<double>(n);
  double num = 0.0;
  double den = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double dx = static_cast<double>(i) - mean_x;
    num += dx * (trajectory[i] - mean_y);
    den += dx * dx;
  }
  return den > 0.0 ? num / den : 0.0;
}

ResponsePattern analyze(const DiagnosisSession& session,
                        const std::vector<QuestionResponse>& responses) {
  ResponsePattern pattern;
  pattern.session_id = session.id;
  if (responses.empty()) {
    return pattern;
  }

  pattern.total_questions = static_cast<int>(responses.size());
  int total_time = 0;
  int index = 0;
  for (const auto& response : responses) {
    if (response.correct) {
      ++pattern.correct_count;
    }
    total_time += response.time_spent;
    DifficultyStep step;
    step.question_index = ++index;
    step.difficulty = response.difficulty;
    step.correct = response.correct;
    step.time_spent = response.time_spent;
    pattern.difficulty_progression.push_back(step);
  }
  pattern.accuracy_rate =
      static_cast<double>(pattern.correct_count) / static_cast<double>(pattern.total_questions);
  pattern.average_time =
      static_cast<double>(total_time) / static_cast<double>(pattern.total_questions);

  for (const auto& entry : session.ability_progression) {
    pattern.ability_trajectory.push_back(entry.previous_estimate);
  }
  pattern.ability_trajectory.push_back(session.current_ability_estimate);

  pattern.consistency_score = consistency_score(pattern.ability_trajectory);
  const double slope = trajectory_slope(pattern.ability_trajectory);
  if (slope > kTrendSlopeEpsilon) {
    pattern.ability_trend = Trend::Improving;
  } else if (slope < -kTrendSlopeEpsilon) {
    pattern.ability_trend = Trend::Declining;
  }
  pattern.learning_trend = accuracy_trend(responses);
  pattern.learning_efficiency = pattern.accuracy_rate * 60.0 / std::max(1.0, pattern.average_time);
  return pattern;
}

} // namespace dx::analysis
