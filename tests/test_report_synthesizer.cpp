#include "dx/catalog_question_bank.hpp"
#include "dx/report_synthesizer.hpp"
#include "../analysis/response_patterns.hpp"

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

dx::QuestionResponse make_response(const std::string& kp, bool correct, int difficulty = 3,
                                   int time_spent = 60) {
  static int counter = 0;
  dx::QuestionResponse response;
  response.id = "resp-" + std::to_string(++counter);
  response.session_id = "sess-1";
  response.sequence = counter;
  response.question_id = "q-" + std::to_string(counter);
  response.knowledge_point_id = kp;
  response.difficulty = difficulty;
  response.correct = correct;
  response.time_spent = time_spent;
  return response;
}

dx::DiagnosisReport base_report() {
  dx::DiagnosisReport report;
  report.id = "rpt-1";
  report.user_id = "user-1";
  report.subject_id = "math";
  report.status = dx::DiagnosisStatus::InProgress;
  report.version = 2;
  return report;
}

void test_one_of_four_scenario(TestSuite& suite) {
  dx::CatalogQuestionBank directory;
  directory.add_knowledge_point({"kp-frac", "Fractions", {"kp-div"}});

  std::vector<dx::QuestionResponse> responses = {
      make_response("kp-frac", true), make_response("kp-frac", false),
      make_response("kp-frac", false), make_response("kp-frac", false)};
  responses[1].error_type = "calculation";
  responses[2].error_type = "calculation";

  dx::ReportSynthesizer synthesizer(&directory);
  const auto report = synthesizer.synthesize(base_report(), responses, 5'000);

  suite.require(report.status == dx::DiagnosisStatus::Completed, "synthesized report is completed");
  suite.require(report.completed_at_ms == 5'000, "completion time is stamped");
  suite.require(report.total_questions == 4 && report.correct_questions == 1,
                "aggregate counts");
  suite.require(near(report.accuracy_rate, 25.0), "accuracy is a percentage");
  suite.require(report.overall_score == 1 && report.max_score == 4, "score is the correct count");
  suite.require(report.total_time == 240 && near(report.avg_time_per_question, 60.0),
                "time aggregates");

  const auto it = report.mastery_levels.find("kp-frac");
  suite.require(it != report.mastery_levels.end(), "mastery entry per knowledge point");
  if (it != report.mastery_levels.end()) {
    suite.require(near(it->second.score, 25.0), "1 of 4 correct gives mastery 25");
    suite.require(near(it->second.error_rate, 0.75), "error rate is 1 - accuracy");
    suite.require(it->second.error_types.at("calculation") == 2, "error types are counted");
    suite.require(it->second.priority == 3, "fixed priority policy uses 3");
  }

  suite.require(report.weakness_points.size() == 1 &&
                    report.weakness_points[0].knowledge_point_id == "kp-frac",
                "mastery below 60 is a weakness");
  suite.require(report.weakness_points[0].knowledge_point_name == "Fractions",
                "weakness carries the directory name");
  suite.require(report.strength_points.empty(), "no strengths");

  suite.require(report.learning_path.size() == 1, "one learning path step per weakness");
  if (!report.learning_path.empty()) {
    const auto& step = report.learning_path[0];
    suite.require(step.order == 1, "steps are numbered from 1");
    suite.require(step.practice_strategy == dx::PracticeStrategy::FoundationBuilding,
                  "mastery 25 is foundation building");
    suite.require(near(step.target_mastery, 80.0), "target mastery is 80");
    suite.require(near(step.estimated_hours, 5.5), "(80 - 25) * 0.1 hours at priority 3");
    suite.require(step.prerequisites.size() == 1 && step.prerequisites[0] == "kp-div",
                  "prerequisites come from the directory");
  }

  suite.require(report.weakness_records.size() == 1, "weakness record per weak point");
  if (!report.weakness_records.empty()) {
    suite.require(report.weakness_records[0].weakness_level == 3,
                  "ceil((60 - 25) / 12) = 3");
  }

  suite.require(report.heatmap_data.knowledge_points.size() == 1 &&
                    report.heatmap_data.knowledge_points[0] == "Fractions",
                "heatmap lists the knowledge point by name");
  suite.require(report.analysis.overall_assessment == "needs_improvement",
                "25% accuracy needs improvement");
  suite.require(!report.recommendations.empty() &&
                    report.recommendations[0].type == "knowledge_improvement" &&
                    report.recommendations[0].priority == "high",
                "low mastery gives a high-priority recommendation");
  suite.require(report.version == 2, "synthesis leaves versioning to the caller");
}

void test_idempotence(TestSuite& suite) {
  std::vector<dx::QuestionResponse> responses = {
      make_response("kp-a", true, 4, 30), make_response("kp-a", true, 5, 45),
      make_response("kp-b", false, 2, 200), make_response("kp-c", true, 3, 80),
      make_response("kp-c", false, 3, 70)};
  dx::ReportSynthesizer synthesizer(nullptr);
  const auto first = synthesizer.synthesize(base_report(), responses, 100);
  const auto second = synthesizer.synthesize(base_report(), responses, 100);

  suite.require(first.accuracy_rate == second.accuracy_rate, "accuracy is deterministic");
  suite.require(first.ability_estimate == second.ability_estimate, "ability is deterministic");
  suite.require(first.mastery_levels.size() == second.mastery_levels.size(),
                "mastery map is deterministic");
  suite.require(first.weakness_points.size() == second.weakness_points.size() &&
                    first.weakness_points[0].knowledge_point_id ==
                        second.weakness_points[0].knowledge_point_id,
                "weakness ranking is deterministic");
  suite.require(first.analysis.improvement_suggestions == second.analysis.improvement_suggestions,
                "analysis is deterministic");
  suite.require(first.recommendations.size() == second.recommendations.size(),
                "recommendations are deterministic");
  suite.require(first.heatmap_data.knowledge_points[0] == "kp-a",
                "ids stand in for names without a directory");

  for (const auto& [id, entry] : first.mastery_levels) {
    suite.require(entry.score >= 0.0 && entry.score <= 100.0, "mastery within [0, 100]");
  }
  suite.require(first.ability_estimate >= -3.0 && first.ability_estimate <= 3.0,
                "ability within [-3, 3]");
  suite.require(first.ability_se >= 0.0, "SE is not negative");
  suite.require(near(first.accuracy_rate, 60.0), "3 of 5 correct is 60%");
}

void test_ranking(TestSuite& suite) {
  std::vector<dx::QuestionResponse> responses;
  // kp-0 .. kp-6: mastery 0, 0, 0, 50, 50, 50, 50 plus a strong kp-s.
  for (int i = 0; i < 3; ++i) {
    responses.push_back(make_response("kp-" + std::to_string(i), false));
  }
  for (int i = 3; i < 7; ++i) {
    responses.push_back(make_response("kp-" + std::to_string(i), true));
    responses.push_back(make_response("kp-" + std::to_string(i), false));
  }
  responses.push_back(make_response("kp-s", true, 4));

  dx::ReportSynthesizer synthesizer(nullptr);
  const auto mastery = synthesizer.mastery_levels(responses);
  const auto weaknesses = synthesizer.rank_weaknesses(mastery);
  suite.require(weaknesses.size() == dx::kRankedPointLimit, "weaknesses are capped at five");
  suite.require(weaknesses[0].knowledge_point_id == "kp-0" &&
                    weaknesses[1].knowledge_point_id == "kp-1" &&
                    weaknesses[2].knowledge_point_id == "kp-2",
                "lowest mastery first, ids break ties");
  suite.require(near(weaknesses[3].mastery_score, 50.0), "then the 50% points");

  const auto strengths = synthesizer.rank_strengths(mastery);
  suite.require(strengths.size() == 1 && strengths[0].knowledge_point_id == "kp-s",
                "mastery >= 80 is a strength");

  dx::ReportSynthesizer banded(nullptr, {dx::PriorityPolicy::MasteryBanded, 3});
  const auto banded_mastery = banded.mastery_levels(responses);
  suite.require(banded_mastery.at("kp-0").priority == 1, "banded priority 1 below 40");
  suite.require(banded_mastery.at("kp-3").priority == 2, "banded priority 2 below 60");
  suite.require(banded_mastery.at("kp-s").priority == 5, "banded priority 5 for hard strong items");
}

void test_helpers(TestSuite& suite) {
  suite.require(near(dx::estimate_improvement_hours(25.0, 3), 5.5), "hours at priority 3");
  suite.require(near(dx::estimate_improvement_hours(20.0, 1), 9.0), "hours scaled by 1.5");
  suite.require(near(dx::estimate_improvement_hours(50.0, 5), 1.8), "hours scaled by 0.6");

  suite.require(dx::practice_strategy_for(10.0) == dx::PracticeStrategy::FoundationBuilding,
                "below 30 is foundation building");
  suite.require(dx::practice_strategy_for(45.0) == dx::PracticeStrategy::SkillDevelopment,
                "below 60 is skill development");
  suite.require(dx::practice_strategy_for(70.0) == dx::PracticeStrategy::MasteryRefinement,
                "otherwise mastery refinement");

  suite.require(dx::weakness_level_for(59.0) == 1, "just below the threshold is level 1");
  suite.require(dx::weakness_level_for(0.0) == 5, "zero mastery is level 5");

  suite.require(dx::mastery_banded_priority(85.0, 3.0) == 4, "strong on easy items is priority 4");
}

void test_analysis_rules(TestSuite& suite) {
  dx::ReportSynthesizer synthesizer(nullptr);
  std::vector<dx::QuestionResponse> responses;
  for (int i = 0; i < 5; ++i) {
    responses.push_back(make_response("kp-slow", i < 4, 5, 200));
  }
  const auto report = synthesizer.synthesize(base_report(), responses, 1);
  suite.require(report.analysis.learning_style.pace == "slow", "average time above 150 is slow");
  suite.require(report.analysis.learning_style.difficulty_preference == "high",
                "average difficulty above 3.5 prefers high");
  suite.require(report.analysis.overall_assessment == "excellent",
                "80% accuracy with ability above 1 is excellent");
  bool has_study_method = false;
  for (const auto& rec : report.recommendations) {
    if (rec.type == "study_method") {
      has_study_method = true;
    }
  }
  suite.require(has_study_method, "slow pace adds a study method recommendation");
  bool slow_note = false;
  for (const auto& note : report.analysis.weaknesses) {
    if (note == "Answers slowly") {
      slow_note = true;
    }
  }
  suite.require(slow_note, "average time above 180 is a weakness note");

  const auto empty = synthesizer.synthesize(base_report(), {}, 1);
  suite.require(empty.total_questions == 0 && near(empty.accuracy_rate, 0.0),
                "no responses give zero aggregates");
  suite.require(near(empty.ability_estimate, 0.0) && near(empty.ability_se, 1.0),
                "no responses give the zero-ability estimate");
  suite.require(empty.mastery_levels.empty() && empty.learning_path.empty(),
                "no responses give no mastery");
}

void test_response_patterns(TestSuite& suite) {
  dx::DiagnosisSession session;
  session.id = "sess-pattern";
  std::vector<dx::QuestionResponse> responses;
  double estimate = 0.0;
  for (int i = 0; i < 10; ++i) {
    const bool correct = i >= 3;
    dx::AbilityProgressionEntry entry;
    entry.question_index = i;
    entry.previous_estimate = estimate;
    entry.correct = correct;
    session.ability_progression.push_back(entry);
    estimate += correct ? 0.1 : -0.1;
    responses.push_back(make_response("kp-a", correct, 3, 30));
  }
  session.current_ability_estimate = estimate;

  const auto pattern = dx::analysis::analyze(session, responses);
  suite.require(pattern.total_questions == 10 && pattern.correct_count == 7, "pattern counts");
  suite.require(pattern.ability_trajectory.size() == 11, "trajectory holds priors and current");
  suite.require(pattern.ability_trend == dx::analysis::Trend::Improving, "rising ability improves");
  suite.require(pattern.learning_trend == dx::analysis::Trend::Improving,
                "later answers are more accurate");
  suite.require(pattern.consistency_score > 0.0 && pattern.consistency_score <= 1.0,
                "consistency within (0, 1]");
  suite.require(near(pattern.learning_efficiency, 0.7 * 60.0 / 30.0), "efficiency per minute");
  suite.require(pattern.difficulty_progression.front().question_index == 1,
                "progression is 1-based");

  const auto empty = dx::analysis::analyze(session, {});
  suite.require(empty.total_questions == 0 && empty.ability_trajectory.empty(),
                "no responses give an empty pattern");
  suite.require(near(dx::analysis::consistency_score({1.0, 1.0, 1.0}), 1.0),
                "flat trajectory is fully consistent");
  suite.require(near(dx::analysis::trajectory_slope({0.0, 0.1, 0.2}), 0.1), "least-squares slope");
}

} // namespace

int main() {
  TestSuite suite;
  test_one_of_four_scenario(suite);
  test_idempotence(suite);
  test_ranking(suite);
  test_helpers(suite);
  test_analysis_rules(suite);
  test_response_patterns(suite);

  if (!suite.ok) {
    std::cerr << "Report synthesizer tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Report synthesizer tests passed" << std::endl;
  return 0;
}
