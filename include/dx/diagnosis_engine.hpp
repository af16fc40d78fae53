#pragma once

#include "question_bank.hpp"
#include "report.hpp"
#include "store.hpp"
#include "types.hpp"
#include "../../analysis/response_patterns.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace dx {

struct EngineOptions {
  int default_min_questions = 10;
  int default_max_questions = 30;
  double default_target_precision = 0.3;
  PriorityPolicy priority_policy = PriorityPolicy::Fixed;
  int default_priority = 3;
  // 0 seeds the id generator from the clock.
  std::uint64_t id_seed = 0;

  void validate() const;

  // Session limits with unset fields taken from the defaults; validated.
  SessionLimits resolve_limits(const SessionConfig& config) const;
};

// Reads a JSON object of EngineOptions fields. Unknown keys are ignored.
EngineOptions load_engine_options(const std::string& path);

struct NextItem {
  QuestionItem item;
  int suggested_difficulty = 3;
  int question_number = 1; // 1-based
  std::string reason;
};

struct SessionFinished {
  DiagnosisSession session;
  StopReason reason = StopReason::Ended;
};

struct SubmitOutcome {
  bool recorded = false;
  bool should_continue = false;
  double current_ability = 0.0;
  double current_se = 1.0;
  int questions_remaining = 0;
  std::string response_id;
};

struct EngineDependencies {
  std::shared_ptr<QuestionBank> bank;
  // Optional; knowledge point ids stand in for names when absent.
  std::shared_ptr<KnowledgeDirectory> directory;
  std::shared_ptr<DiagnosisStore> store;
  Clock clock;
};

class DiagnosisEngine {
public:
  virtual ~DiagnosisEngine() = default;

  virtual DiagnosisReport create_report(const std::string& user_id,
                                        const std::string& subject_id,
                                        const ReportConfig& config) = 0;

  // Creates a session of the report and starts it. The report moves to
  // in_progress with its first session.
  virtual DiagnosisSession start_session(const std::string& report_id,
                                         const SessionConfig& config) = 0;

  using Next = std::variant<NextItem, SessionFinished>;

  // Serves the next item, or stops the session when the stopping rule fires
  // or the item pool is exhausted. Repeats the outstanding item until it is
  // answered.
  virtual Next next_item(const std::string& session_id) = 0;

  virtual SubmitOutcome submit_answer(const std::string& session_id,
                                      const AnswerSubmission& submission) = 0;

  virtual DiagnosisSession end_session(const std::string& session_id) = 0;

  virtual DiagnosisSession cancel_session(const std::string& session_id) = 0;

  virtual DiagnosisReport complete_report(const std::string& report_id) = 0;

  virtual DiagnosisReport get_report(const std::string& report_id) = 0;

  virtual DiagnosisSession get_session(const std::string& session_id) = 0;

  virtual void delete_report(const std::string& report_id) = 0;

  virtual analysis::ResponsePattern analyze_session(const std::string& session_id) = 0;

  virtual DiagnosisStatistics diagnosis_statistics(const std::string& user_id,
                                                   const std::optional<std::string>& subject_id) = 0;

  virtual nlohmann::json debug_state(const std::string& session_id) = 0;

  virtual const EngineOptions& options() const = 0;
};

std::unique_ptr<DiagnosisEngine> make_engine(EngineDependencies dependencies,
                                             EngineOptions options = {});

} // namespace dx
