#include "dx/session_machine.hpp"

#include "dx/errors.hpp"
#include "../estimation/ability.hpp"
#include "debug_log.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace dx {
namespace {

std::string describe(const DiagnosisSession& session) {
  std::ostringstream oss;
  oss << "session " << session.id << " (" << to_string(session.status) << ")";
  return oss.str();
}

} // namespace

SessionMachine::SessionMachine(DiagnosisSession& session, Clock clock)
    : session_(session), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = system_clock_ms;
  }
}

void SessionMachine::require_status(DiagnosisStatus expected, const char* transition) const {
  if (session_.status != expected) {
    throw InvalidStateTransition(std::string(transition) + " requires " + to_string(expected) +
                                 ", " + describe(session_));
  }
}

void SessionMachine::start() {
  require_status(DiagnosisStatus::Pending, "start");
  session_.status = DiagnosisStatus::InProgress;
  session_.start_time_ms = clock_();
  detail::debug_log("session", describe(session_) + " started");
}

void SessionMachine::serve(const QuestionItem& item, int suggested_difficulty,
                           const std::string& reason) {
  require_status(DiagnosisStatus::InProgress, "serve");
  if (session_.active_item.has_value()) {
    throw InvalidStateTransition("serve: item " + session_.active_item->question_id +
                                 " is still unanswered in " + describe(session_));
  }
  if (session_.questions_answered >= session_.limits.max_questions) {
    throw InvalidStateTransition("serve: max_questions reached in " + describe(session_));
  }

  SelectionLogEntry entry;
  entry.question_index = session_.current_question_index;
  entry.suggested_difficulty = suggested_difficulty;
  entry.actual_difficulty = item.difficulty;
  entry.question_id = item.question_id;
  entry.knowledge_point_id = item.knowledge_point_id;
  entry.reason = reason;
  entry.timestamp_ms = clock_();

  session_.selection_history.push_back(std::move(entry));
  session_.active_item = item;
}

void SessionMachine::record_answer(bool correct, int difficulty, int time_spent) {
  require_status(DiagnosisStatus::InProgress, "record_answer");
  if (session_.questions_answered >= session_.limits.max_questions) {
    throw InvalidStateTransition("record_answer: max_questions reached in " + describe(session_));
  }
  if (difficulty < 1 || difficulty > 5) {
    throw InvalidResponse("difficulty must be within [1, 5], got " + std::to_string(difficulty));
  }
  if (time_spent < 0) {
    throw InvalidResponse("time_spent must not be negative");
  }

  AbilityProgressionEntry entry;
  entry.question_index = session_.current_question_index;
  entry.previous_estimate = session_.current_ability_estimate;
  entry.correct = correct;
  entry.difficulty = difficulty;
  entry.timestamp_ms = clock_();
  session_.ability_progression.push_back(entry);

  session_.current_ability_estimate =
      estimation::incremental_update(session_.current_ability_estimate, correct);
  session_.questions_answered += 1;
  if (correct) {
    session_.correct_answers += 1;
  }
  session_.current_question_index += 1;
  session_.total_time_spent += time_spent;
  session_.ability_se =
      estimation::standard_error(static_cast<std::size_t>(session_.questions_answered));
  session_.active_item.reset();
}

bool SessionMachine::should_continue() const {
  return should_continue(session_);
}

void SessionMachine::end(StopReason reason) {
  require_status(DiagnosisStatus::InProgress, "end");
  session_.status = DiagnosisStatus::Completed;
  session_.end_time_ms = clock_();
  session_.stop_reason = reason;
  session_.active_item.reset();
  session_.accuracy_rate = static_cast<double>(session_.correct_answers) /
                           static_cast<double>(std::max(1, session_.questions_answered));
  detail::debug_log("session", describe(session_) + " stopped: " + to_string(reason));
}

void SessionMachine::cancel() {
  if (session_.status != DiagnosisStatus::Pending &&
      session_.status != DiagnosisStatus::InProgress) {
    throw InvalidStateTransition("cancel requires pending or in_progress, " + describe(session_));
  }
  session_.status = DiagnosisStatus::Cancelled;
  session_.end_time_ms = clock_();
  session_.stop_reason = StopReason::Cancelled;
  session_.active_item.reset();
  detail::debug_log("session", describe(session_) + " cancelled");
}

bool SessionMachine::should_continue(const DiagnosisSession& session) {
  if (session.questions_answered >= session.limits.max_questions) {
    return false;
  }
  if (session.questions_answered < session.limits.min_questions) {
    return true;
  }
  const auto variance = precision_variance(session);
  if (!variance.has_value()) {
    return true;
  }
  return !(variance.value() < session.limits.target_precision);
}

std::optional<double> SessionMachine::precision_variance(const DiagnosisSession& session) {
  const auto& progression = session.ability_progression;
  if (progression.size() < kPrecisionWindow) {
    return std::nullopt;
  }
  double sum = 0.0;
  for (auto it = progression.end() - static_cast<std::ptrdiff_t>(kPrecisionWindow);
       it != progression.end(); ++it) {
    const double delta = it->previous_estimate - session.current_ability_estimate;
    sum += delta * delta;
  }
  return sum / static_cast<double>(kPrecisionWindow);
}

StopReason SessionMachine::stop_reason_for(const DiagnosisSession& session) {
  if (session.questions_answered >= session.limits.max_questions) {
    return StopReason::MaxQuestions;
  }
  return StopReason::PrecisionReached;
}

} // namespace dx
