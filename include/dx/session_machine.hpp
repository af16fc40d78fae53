#pragma once

#include "types.hpp"

#include <optional>
#include <string>

namespace dx {

// Lifecycle of one diagnostic session. Operates in place on a session record;
// every mutation of the record goes through these transitions. A transition
// that throws leaves the record unchanged.
class SessionMachine {
public:
  static constexpr std::size_t kPrecisionWindow = 5;

  SessionMachine(DiagnosisSession& session, Clock clock);

  // pending -> in_progress
  void start();

  // Attaches the item handed out by next_item. Only in in_progress with no
  // unanswered item outstanding.
  void serve(const QuestionItem& item, int suggested_difficulty, const std::string& reason);

  // Incremental ability update for one answer. Only in in_progress and while
  // questions_answered < max_questions.
  void record_answer(bool correct, int difficulty, int time_spent = 0);

  bool should_continue() const;

  // in_progress -> completed
  void end(StopReason reason = StopReason::Ended);

  // pending | in_progress -> cancelled
  void cancel();

  const DiagnosisSession& session() const { return session_; }

  static bool should_continue(const DiagnosisSession& session);

  // Mean squared deviation of the last kPrecisionWindow prior estimates from
  // the current estimate; nullopt while the window is not yet full.
  static std::optional<double> precision_variance(const DiagnosisSession& session);

  // Why a session that should not continue stops.
  static StopReason stop_reason_for(const DiagnosisSession& session);

private:
  void require_status(DiagnosisStatus expected, const char* transition) const;

  DiagnosisSession& session_;
  Clock clock_;
};

} // namespace dx
