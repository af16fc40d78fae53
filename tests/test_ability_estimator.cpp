#include "../estimation/ability.hpp"

#include <cmath>
#include <iostream>
#include <string>
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

bool near(double a, double b, double tolerance = 1e-9) {
  return std::fabs(a - b) <= tolerance;
}

void test_incremental_update(TestSuite& suite) {
  using namespace dx::estimation;
  suite.require(near(incremental_update(0.0, true), 0.1), "correct answer adds one step");
  suite.require(near(incremental_update(0.0, false), -0.1), "wrong answer removes one step");
  suite.require(near(incremental_update(2.95, true), 3.0), "update clamps at the upper bound");
  suite.require(near(incremental_update(-3.0, false), -3.0), "update clamps at the lower bound");

  double ability = 0.0;
  for (int i = 0; i < 100; ++i) {
    ability = incremental_update(ability, i % 3 != 0);
    suite.require(ability >= kAbilityMin && ability <= kAbilityMax,
                  "ability stays within [-3, 3] over a long run");
  }
}

void test_standard_error(TestSuite& suite) {
  using namespace dx::estimation;
  suite.require(near(standard_error(0), 1.0), "no responses gives SE 1");
  suite.require(near(standard_error(1), 1.0), "one response gives SE 1");
  suite.require(near(standard_error(4), 0.5), "four responses give SE 0.5");
  for (std::size_t n = 0; n < 50; ++n) {
    suite.require(standard_error(n) > 0.0, "SE is positive");
    suite.require(standard_error(n + 1) <= standard_error(n), "SE does not grow with more responses");
  }
}

void test_batch_all_correct_hardest(TestSuite& suite) {
  using namespace dx::estimation;
  std::vector<ScoredResponse> responses(10, ScoredResponse{5, true});
  const auto estimate = estimate_batch(responses);
  suite.require(near(estimate.ability, 3.0), "ten correct difficulty-5 answers give ability 3.0");
  suite.require(near(estimate.standard_error, 0.316, 1e-3), "SE after ten answers is about 0.316");
  suite.require(near(estimate.interval.lower, 2.38, 1e-2), "CI lower bound is about 2.38");
  suite.require(near(estimate.interval.upper, 3.0), "CI upper bound clamps at 3.0");
  suite.require(near(estimate.interval.level, 0.95), "CI level is 0.95");
  suite.require(estimate.response_count == 10, "response count is reported");
}

void test_batch_edge_cases(TestSuite& suite) {
  using namespace dx::estimation;
  const auto empty = estimate_batch(std::vector<ScoredResponse>{});
  suite.require(near(empty.ability, 0.0), "empty response set gives ability 0");
  suite.require(near(empty.standard_error, 1.0), "empty response set gives SE 1");

  std::vector<ScoredResponse> all_wrong(6, ScoredResponse{1, false});
  const auto wrong = estimate_batch(all_wrong);
  suite.require(near(wrong.ability, -3.0), "all wrong answers clamp to -3");

  std::vector<ScoredResponse> mixed = {{1, true}, {2, true}, {3, false}, {4, true}, {5, false}};
  const auto mixed_estimate = estimate_batch(mixed);
  // (1 + 4 + 16) / 15 = 1.4 -> (1.4 - 2.5) * 1.2 = -1.32
  suite.require(near(mixed_estimate.ability, -1.32), "mixed responses are weighted by difficulty");
  suite.require(mixed_estimate.interval.lower <= mixed_estimate.ability &&
                    mixed_estimate.ability <= mixed_estimate.interval.upper,
                "interval contains the estimate");

  std::vector<dx::QuestionResponse> records(2);
  records[0].difficulty = 3;
  records[0].correct = true;
  records[1].difficulty = 3;
  records[1].correct = true;
  const auto from_records = estimate_batch(records);
  suite.require(near(from_records.ability, 0.6), "estimate over stored responses uses difficulty");
}

} // namespace

int main() {
  TestSuite suite;
  test_incremental_update(suite);
  test_standard_error(suite);
  test_batch_all_correct_hardest(suite);
  test_batch_edge_cases(suite);

  if (!suite.ok) {
    std::cerr << "Ability estimator tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Ability estimator tests passed" << std::endl;
  return 0;
}
