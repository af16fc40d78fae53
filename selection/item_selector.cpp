#include "item_selector.hpp"

#include "../src/debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <set>
#include <sstream>

namespace dx::selection {
namespace {

int clamp_to_band(int value, const DifficultyRange& band) {
  return std::max(band.min, std::min(band.max, value));
}

} // namespace

int suggested_difficulty(double ability) {
  const double raw = 3.0 + ability * 0.5;
  const double clamped = std::clamp(raw, static_cast<double>(kMinDifficulty),
                                    static_cast<double>(kMaxDifficulty));
  return static_cast<int>(std::nearbyint(clamped));
}

DifficultyRange level_band(DiagnosisLevel level) {
  switch (level) {
    case DiagnosisLevel::Memory: return {1, 2};
    case DiagnosisLevel::Application: return {2, 4};
    case DiagnosisLevel::Transfer: return {3, 5};
  }
  return {kMinDifficulty, kMaxDifficulty};
}

std::optional<DifficultyRange> allowed_band(const DifficultyRange& report_range,
                                            DiagnosisLevel level) {
  const auto band = level_band(level);
  DifficultyRange result;
  result.min = std::max(report_range.min, band.min);
  result.max = std::min(report_range.max, band.max);
  if (result.min > result.max) {
    return std::nullopt;
  }
  return result;
}

std::vector<int> difficulty_search_order(int target, const DifficultyRange& band) {
  std::vector<int> order;
  for (int d = band.min; d <= band.max; ++d) {
    order.push_back(d);
  }
  std::stable_sort(order.begin(), order.end(), [target](int a, int b) {
    const int da = std::abs(a - target);
    const int db = std::abs(b - target);
    if (da != db) {
      return da < db;
    }
    return a < b;
  });
  return order;
}

ItemSelector::ItemSelector(QuestionBank& bank) : bank_(bank) {}

int ItemSelector::target_difficulty(const SelectionRequest& request) const {
  if (!request.adaptive) {
    return (request.band.min + request.band.max) / 2;
  }
  return clamp_to_band(suggested_difficulty(request.ability), request.band);
}

Pick ItemSelector::select(const SelectionRequest& request) const {
  const int target = target_difficulty(request);
  const std::set<std::string> covered(request.covered_knowledge_points.begin(),
                                      request.covered_knowledge_points.end());

  std::optional<QuestionItem> first_repeat;
  for (int difficulty : difficulty_search_order(target, request.band)) {
    auto candidates = bank_.fetch_candidates(request.subject_id, request.knowledge_point_filter,
                                             difficulty, request.used_question_ids);
    for (auto& candidate : candidates) {
      if (std::find(request.used_question_ids.begin(), request.used_question_ids.end(),
                    candidate.question_id) != request.used_question_ids.end()) {
        continue;
      }
      if (covered.count(candidate.knowledge_point_id) == 0) {
        SelectedItem selected;
        selected.item = std::move(candidate);
        selected.target_difficulty = target;
        selected.repeat = false;
        return selected;
      }
      if (!first_repeat.has_value()) {
        first_repeat = std::move(candidate);
      }
    }
  }

  if (first_repeat.has_value()) {
    std::ostringstream oss;
    oss << "no uncovered knowledge point left, repeating " << first_repeat->knowledge_point_id;
    detail::debug_log("select", oss.str());
    SelectedItem selected;
    selected.item = std::move(first_repeat.value());
    selected.target_difficulty = target;
    selected.repeat = true;
    return selected;
  }

  std::ostringstream oss;
  oss << "item pool exhausted for subject " << request.subject_id << " (target " << target << ")";
  detail::debug_log("select", oss.str());
  return PoolExhausted{target};
}

} // namespace dx::selection
