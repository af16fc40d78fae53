#include "ability.hpp"

#include <algorithm>
#include <cmath>

namespace dx::estimation {

double incremental_update(double current, bool correct) {
  const double step = correct ? kIncrementStep : -kIncrementStep;
  return clamp_ability(current + step);
}

double standard_error(std::size_t response_count) {
  const double n = static_cast<double>(std::max<std::size_t>(1, response_count));
  return 1.0 / std::sqrt(n);
}

ConfidenceInterval confidence_interval(double ability, double standard_error) {
  ConfidenceInterval interval;
  interval.lower = clamp_ability(ability - kConfidenceZ * standard_error);
  interval.upper = clamp_ability(ability + kConfidenceZ * standard_error);
  interval.level = kConfidenceLevel;
  return interval;
}

BatchEstimate estimate_batch(const std::vector<ScoredResponse>& responses) {
  double weighted_score = 0.0;
  double total_weight = 0.0;
  for (const auto& response : responses) {
    const double difficulty = static_cast<double>(response.difficulty);
    const double weight = difficulty;
    if (response.correct) {
      weighted_score += weight * difficulty;
    }
    total_weight += weight;
  }

  BatchEstimate estimate;
  estimate.response_count = responses.size();
  if (total_weight > 0.0) {
    const double raw = (weighted_score / total_weight - 2.5) * 1.2;
    estimate.ability = clamp_ability(raw);
  } else {
    estimate.ability = 0.0;
  }
  estimate.standard_error = standard_error(responses.size());
  estimate.interval = confidence_interval(estimate.ability, estimate.standard_error);
  return estimate;
}

BatchEstimate estimate_batch(const std::vector<QuestionResponse>& responses) {
  std::vector<ScoredResponse> scored;
  scored.reserve(responses.size());
  for (const auto& response : responses) {
    scored.push_back({response.difficulty, response.correct});
  }
  return estimate_batch(scored);
}

} // namespace dx::estimation
