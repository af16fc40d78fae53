#include "../selection/item_selector.hpp"
#include "dx/catalog_question_bank.hpp"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

dx::QuestionItem make_item(const std::string& id, const std::string& kp, int difficulty) {
  dx::QuestionItem item;
  item.question_id = id;
  item.knowledge_point_id = kp;
  item.difficulty = difficulty;
  item.content = "Question " + id;
  item.question_type = "single_choice";
  return item;
}

void test_difficulty_mapping(TestSuite& suite) {
  using dx::selection::suggested_difficulty;
  suite.require(suggested_difficulty(0.0) == 3, "ability 0 maps to difficulty 3");
  suite.require(suggested_difficulty(3.0) == 5, "ability 3 maps to difficulty 5");
  suite.require(suggested_difficulty(-3.0) == 1, "ability -3 maps to difficulty 1");
  suite.require(suggested_difficulty(1.0) == 4, "3.5 rounds half to even (4)");
  suite.require(suggested_difficulty(-1.0) == 2, "2.5 rounds half to even (2)");
  suite.require(suggested_difficulty(10.0) == 5, "out-of-range ability clamps to 5");
  for (double ability = -3.0; ability <= 3.0; ability += 0.1) {
    const int d = suggested_difficulty(ability);
    suite.require(d >= 1 && d <= 5, "suggested difficulty stays within [1, 5]");
  }
}

void test_bands(TestSuite& suite) {
  using namespace dx::selection;
  const auto memory = level_band(dx::DiagnosisLevel::Memory);
  suite.require(memory.min == 1 && memory.max == 2, "memory band is 1-2");
  const auto application = level_band(dx::DiagnosisLevel::Application);
  suite.require(application.min == 2 && application.max == 4, "application band is 2-4");
  const auto transfer = level_band(dx::DiagnosisLevel::Transfer);
  suite.require(transfer.min == 3 && transfer.max == 5, "transfer band is 3-5");

  const auto band = allowed_band({1, 3}, dx::DiagnosisLevel::Application);
  suite.require(band.has_value() && band->min == 2 && band->max == 3,
                "report range intersects the level band");
  suite.require(!allowed_band({4, 5}, dx::DiagnosisLevel::Memory).has_value(),
                "disjoint range and band give no band");

  const auto order = difficulty_search_order(3, {1, 5});
  const std::vector<int> expected = {3, 2, 4, 1, 5};
  suite.require(order == expected, "search order is nearest first, easier side on ties");
  const auto edge = difficulty_search_order(5, {3, 5});
  suite.require(edge == std::vector<int>({5, 4, 3}), "search order from the band edge");
}

void test_prefers_uncovered_knowledge_points(TestSuite& suite) {
  dx::CatalogQuestionBank bank;
  bank.add_question("math", make_item("q1", "kp-a", 3));
  bank.add_question("math", make_item("q2", "kp-a", 3));
  bank.add_question("math", make_item("q3", "kp-b", 3));

  dx::selection::ItemSelector selector(bank);
  dx::selection::SelectionRequest request;
  request.subject_id = "math";
  request.band = {1, 5};
  request.used_question_ids = {"q1"};
  request.covered_knowledge_points = {"kp-a"};

  const auto pick = selector.select(request);
  const auto* selected = std::get_if<dx::selection::SelectedItem>(&pick);
  suite.require(selected != nullptr, "an item is selected");
  if (selected) {
    suite.require(selected->item.question_id == "q3", "item of an uncovered knowledge point wins");
    suite.require(!selected->repeat, "fresh knowledge point is not a repeat");
    suite.require(std::string(selected->reason()) == "uncovered_knowledge_point",
                  "reason names the uncovered knowledge point");
    suite.require(selected->target_difficulty == 3, "target follows ability 0");
  }

  request.used_question_ids = {"q1", "q3"};
  request.covered_knowledge_points = {"kp-a", "kp-b"};
  const auto repeat_pick = selector.select(request);
  const auto* repeat = std::get_if<dx::selection::SelectedItem>(&repeat_pick);
  suite.require(repeat != nullptr, "a covered knowledge point is repeated when nothing else is left");
  if (repeat) {
    suite.require(repeat->item.question_id == "q2", "remaining unused item is repeated");
    suite.require(repeat->repeat, "repeat is flagged");
    suite.require(std::string(repeat->reason()) == "repeat_knowledge_point",
                  "reason names the repeated knowledge point");
  }
}

void test_uncovered_beats_nearest_difficulty(TestSuite& suite) {
  dx::CatalogQuestionBank bank;
  bank.add_question("math", make_item("near", "kp-a", 3));
  bank.add_question("math", make_item("far", "kp-b", 4));

  dx::selection::ItemSelector selector(bank);
  dx::selection::SelectionRequest request;
  request.subject_id = "math";
  request.band = {1, 5};
  request.covered_knowledge_points = {"kp-a"};

  const auto pick = selector.select(request);
  const auto* selected = std::get_if<dx::selection::SelectedItem>(&pick);
  suite.require(selected != nullptr && selected->item.question_id == "far",
                "uncovered knowledge point at a further difficulty beats a repeat at the target");
}

void test_pool_exhaustion_and_scope(TestSuite& suite) {
  dx::CatalogQuestionBank bank;
  bank.add_question("math", make_item("q1", "kp-a", 1));
  bank.add_question("math", make_item("q2", "kp-b", 4));

  dx::selection::ItemSelector selector(bank);
  dx::selection::SelectionRequest request;
  request.subject_id = "math";
  request.band = {1, 2};
  request.used_question_ids = {"q1"};

  const auto pick = selector.select(request);
  suite.require(std::holds_alternative<dx::selection::PoolExhausted>(pick),
                "no unused item inside the band exhausts the pool");

  request.band = {1, 5};
  request.used_question_ids.clear();
  request.knowledge_point_filter = {"kp-b"};
  const auto scoped = selector.select(request);
  const auto* selected = std::get_if<dx::selection::SelectedItem>(&scoped);
  suite.require(selected != nullptr && selected->item.question_id == "q2",
                "knowledge point filter restricts the candidates");

  request.subject_id = "physics";
  suite.require(std::holds_alternative<dx::selection::PoolExhausted>(selector.select(request)),
                "unknown subject exhausts the pool");
}

void test_target_difficulty(TestSuite& suite) {
  dx::CatalogQuestionBank bank;
  dx::selection::ItemSelector selector(bank);
  dx::selection::SelectionRequest request;
  request.band = {1, 2};
  request.ability = 3.0;
  suite.require(selector.target_difficulty(request) == 2, "adaptive target clamps into the band");

  request.adaptive = false;
  request.band = {2, 4};
  suite.require(selector.target_difficulty(request) == 3, "non-adaptive target is the band midpoint");
}

} // namespace

int main() {
  TestSuite suite;
  test_difficulty_mapping(suite);
  test_bands(suite);
  test_prefers_uncovered_knowledge_points(suite);
  test_uncovered_beats_nearest_difficulty(suite);
  test_pool_exhaustion_and_scope(suite);
  test_target_difficulty(suite);

  if (!suite.ok) {
    std::cerr << "Item selector tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Item selector tests passed" << std::endl;
  return 0;
}
