#pragma once

#include "dx/question_bank.hpp"
#include "dx/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dx::selection {

constexpr int kMinDifficulty = 1;
constexpr int kMaxDifficulty = 5;

// round(clamp(3 + 0.5 * ability, 1, 5)), halves to even.
int suggested_difficulty(double ability);

// Difficulty band a diagnostic level draws from.
DifficultyRange level_band(DiagnosisLevel level);

// Intersection of the report range and the level band; nullopt when empty.
std::optional<DifficultyRange> allowed_band(const DifficultyRange& report_range,
                                            DiagnosisLevel level);

// Every difficulty of `band`, nearest to `target` first, ties to the easier
// side.
std::vector<int> difficulty_search_order(int target, const DifficultyRange& band);

struct SelectionRequest {
  std::string subject_id;
  double ability = 0.0;
  bool adaptive = true;
  DifficultyRange band;
  std::vector<std::string> knowledge_point_filter;
  std::vector<std::string> used_question_ids;
  std::vector<std::string> covered_knowledge_points;
};

struct SelectedItem {
  QuestionItem item;
  int target_difficulty = 3;
  bool repeat = false;

  const char* reason() const {
    return repeat ? "repeat_knowledge_point" : "uncovered_knowledge_point";
  }
};

struct PoolExhausted {
  int target_difficulty = 3;
};

using Pick = std::variant<SelectedItem, PoolExhausted>;

class ItemSelector {
public:
  explicit ItemSelector(QuestionBank& bank);

  int target_difficulty(const SelectionRequest& request) const;

  Pick select(const SelectionRequest& request) const;

private:
  QuestionBank& bank_;
};

} // namespace dx::selection
