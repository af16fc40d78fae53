#include "dx/errors.hpp"
#include "dx/session_machine.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

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

dx::Clock fixed_clock() {
  auto now = std::make_shared<std::int64_t>(1'000);
  return [now]() { return (*now)++; };
}

dx::DiagnosisSession fresh_session() {
  dx::DiagnosisSession session;
  session.id = "sess-test";
  session.report_id = "rpt-test";
  session.limits = {10, 30, 0.3};
  session.difficulty_band = {1, 5};
  session.version = 1;
  return session;
}

template <typename Exception, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void test_start_and_counters(TestSuite& suite) {
  auto session = fresh_session();
  dx::SessionMachine machine(session, fixed_clock());
  machine.start();
  suite.require(session.status == dx::DiagnosisStatus::InProgress, "start moves to in_progress");
  suite.require(session.start_time_ms.has_value(), "start records the start time");
  suite.require(throws<dx::InvalidStateTransition>([&] { machine.start(); }),
                "starting twice is rejected");

  machine.record_answer(true, 3, 40);
  machine.record_answer(false, 4, 20);
  suite.require(session.questions_answered == 2, "answers are counted");
  suite.require(session.correct_answers == 1, "correct answers are counted");
  suite.require(session.current_question_index == 2, "question index advances");
  suite.require(session.total_time_spent == 60, "time is accumulated");
  suite.require(std::fabs(session.current_ability_estimate) < 1e-9,
                "one right and one wrong cancel out");
  suite.require(std::fabs(session.ability_se - 1.0 / std::sqrt(2.0)) < 1e-9,
                "SE follows the answer count");
  suite.require(session.ability_progression.size() == 2, "progression grows per answer");
  suite.require(std::fabs(session.ability_progression[1].previous_estimate - 0.1) < 1e-9,
                "progression keeps the prior estimate");
  suite.require(session.correct_answers <= session.questions_answered,
                "correct never exceeds answered");

  suite.require(throws<dx::InvalidResponse>([&] { machine.record_answer(true, 6); }),
                "difficulty outside [1, 5] is rejected");
  suite.require(session.questions_answered == 2, "rejected answer leaves counters unchanged");
}

void test_stopping_rule(TestSuite& suite) {
  auto session = fresh_session();
  dx::SessionMachine machine(session, fixed_clock());
  machine.start();
  for (int i = 0; i < 9; ++i) {
    machine.record_answer(true, 3);
    suite.require(machine.should_continue(), "continues below min_questions");
  }
  machine.record_answer(true, 3);
  // Last five priors 0.5..0.9 against 1.0: (0.25+0.16+0.09+0.04+0.01)/5 = 0.11.
  const auto variance = dx::SessionMachine::precision_variance(session);
  suite.require(variance.has_value() && std::fabs(*variance - 0.11) < 1e-9,
                "precision variance over the last five estimates");
  suite.require(!machine.should_continue(), "stops once precision is reached after min_questions");
  suite.require(dx::SessionMachine::stop_reason_for(session) == dx::StopReason::PrecisionReached,
                "stop reason is precision_reached");

  auto loose = fresh_session();
  loose.limits.target_precision = 0.001;
  dx::SessionMachine loose_machine(loose, fixed_clock());
  loose_machine.start();
  for (int i = 0; i < 29; ++i) {
    loose_machine.record_answer(i % 2 == 0, 3);
    suite.require(loose_machine.should_continue(), "continues below max_questions");
  }
  loose_machine.record_answer(true, 3);
  suite.require(!loose_machine.should_continue(), "stops at max_questions");
  suite.require(dx::SessionMachine::stop_reason_for(loose) == dx::StopReason::MaxQuestions,
                "stop reason is max_questions");
  suite.require(throws<dx::InvalidStateTransition>([&] { loose_machine.record_answer(true, 3); }),
                "answers beyond max_questions are rejected");
  suite.require(loose.questions_answered == 30, "answered count never exceeds max");
}

void test_record_answer_after_end(TestSuite& suite) {
  auto session = fresh_session();
  dx::SessionMachine machine(session, fixed_clock());
  machine.start();
  machine.record_answer(true, 2);
  machine.record_answer(true, 2);
  machine.record_answer(false, 2);
  machine.end();
  suite.require(session.status == dx::DiagnosisStatus::Completed, "end completes the session");
  suite.require(session.stop_reason == dx::StopReason::Ended, "manual end records its reason");
  suite.require(std::fabs(session.accuracy_rate - 2.0 / 3.0) < 1e-9,
                "accuracy is computed at end");

  const int answered = session.questions_answered;
  const int correct = session.correct_answers;
  const double ability = session.current_ability_estimate;
  suite.require(throws<dx::InvalidStateTransition>([&] { machine.record_answer(true, 3); }),
                "record_answer on a completed session is rejected");
  suite.require(session.questions_answered == answered && session.correct_answers == correct &&
                    session.current_ability_estimate == ability,
                "rejected transition leaves the record unchanged");
  suite.require(throws<dx::InvalidStateTransition>([&] { machine.end(); }),
                "ending twice is rejected");
  suite.require(throws<dx::InvalidStateTransition>([&] { machine.cancel(); }),
                "a completed session cannot be cancelled");
}

void test_cancel(TestSuite& suite) {
  auto pending = fresh_session();
  dx::SessionMachine pending_machine(pending, fixed_clock());
  pending_machine.cancel();
  suite.require(pending.status == dx::DiagnosisStatus::Cancelled, "pending session can be cancelled");
  suite.require(throws<dx::InvalidStateTransition>([&] { pending_machine.start(); }),
                "cancelled session cannot start");

  auto running = fresh_session();
  dx::SessionMachine running_machine(running, fixed_clock());
  running_machine.start();
  running_machine.cancel();
  suite.require(running.status == dx::DiagnosisStatus::Cancelled,
                "in-progress session can be cancelled");
  suite.require(running.stop_reason == dx::StopReason::Cancelled, "cancel records its reason");
}

void test_serve(TestSuite& suite) {
  auto session = fresh_session();
  dx::SessionMachine machine(session, fixed_clock());
  dx::QuestionItem item;
  item.question_id = "q1";
  item.knowledge_point_id = "kp-a";
  item.difficulty = 4;

  suite.require(throws<dx::InvalidStateTransition>([&] { machine.serve(item, 3, "x"); }),
                "serving a pending session is rejected");
  machine.start();
  machine.serve(item, 3, "uncovered_knowledge_point");
  suite.require(session.active_item.has_value() && session.active_item->question_id == "q1",
                "served item is outstanding");
  suite.require(session.selection_history.size() == 1, "selection is logged");
  suite.require(session.selection_history[0].suggested_difficulty == 3 &&
                    session.selection_history[0].actual_difficulty == 4,
                "log keeps suggested and actual difficulty");
  suite.require(throws<dx::InvalidStateTransition>([&] { machine.serve(item, 3, "x"); }),
                "a second item is not served while one is outstanding");
  suite.require(session.selection_history.size() == 1, "rejected serve does not log");

  machine.record_answer(true, 4);
  suite.require(!session.active_item.has_value(), "answer clears the outstanding item");
}

} // namespace

int main() {
  TestSuite suite;
  test_start_and_counters(suite);
  test_stopping_rule(suite);
  test_record_answer_after_end(suite);
  test_cancel(suite);
  test_serve(suite);

  if (!suite.ok) {
    std::cerr << "Session machine tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Session machine tests passed" << std::endl;
  return 0;
}
