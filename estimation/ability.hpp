#pragma once

#include "dx/types.hpp"

#include <cstddef>
#include <vector>

namespace dx::estimation {

constexpr double kAbilityMin = -3.0;
constexpr double kAbilityMax = 3.0;
constexpr double kIncrementStep = 0.1;
constexpr double kConfidenceZ = 1.96;
constexpr double kConfidenceLevel = 0.95;

inline double clamp_ability(double value) {
  if (value < kAbilityMin) {
    return kAbilityMin;
  }
  if (value > kAbilityMax) {
    return kAbilityMax;
  }
  return value;
}

struct ScoredResponse {
  int difficulty = 3;
  bool correct = false;
};

struct BatchEstimate {
  double ability = 0.0;
  double standard_error = 1.0;
  ConfidenceInterval interval;
  std::size_t response_count = 0;
};

// Online update applied after every answer: one fixed step toward the
// observed outcome.
double incremental_update(double current, bool correct);

// 1 / sqrt(max(1, count)).
double standard_error(std::size_t response_count);

ConfidenceInterval confidence_interval(double ability, double standard_error);

// Difficulty-weighted estimate over a whole response set. An empty set yields
// ability 0 with SE 1.
BatchEstimate estimate_batch(const std::vector<ScoredResponse>& responses);

BatchEstimate estimate_batch(const std::vector<QuestionResponse>& responses);

} // namespace dx::estimation
