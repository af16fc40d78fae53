#include "dx/diagnosis_engine.hpp"

#include "dx/errors.hpp"
#include "dx/report_synthesizer.hpp"
#include "dx/session_machine.hpp"
#include "../selection/item_selector.hpp"
#include "debug_log.hpp"
#include "id_generator.hpp"
#include "json_bridge.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace dx {
namespace {

constexpr std::size_t kTrendLength = 10;

std::vector<std::string> unique_in_order(const std::vector<std::string>& values) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& value : values) {
    if (seen.insert(value).second) {
      out.push_back(value);
    }
  }
  return out;
}

void validate_submission(const AnswerSubmission& submission, const DiagnosisSession& session) {
  if (session.active_item.has_value()) {
    if (!submission.question_id.empty() &&
        submission.question_id != session.active_item->question_id) {
      throw InvalidResponse("Answer for " + submission.question_id + " but " +
                            session.active_item->question_id + " is being served");
    }
    if (submission.difficulty.has_value() &&
        submission.difficulty.value() != session.active_item->difficulty) {
      throw InvalidResponse("difficulty " + std::to_string(submission.difficulty.value()) +
                            " does not match served item " + session.active_item->question_id +
                            " (difficulty " + std::to_string(session.active_item->difficulty) +
                            ")");
    }
  } else {
    if (submission.question_id.empty()) {
      throw InvalidResponse("question_id is required when no item is being served");
    }
    if (submission.knowledge_point_id.empty()) {
      throw InvalidResponse("knowledge_point_id is required when no item is being served");
    }
    if (!submission.difficulty.has_value()) {
      throw InvalidResponse("difficulty is required when no item is being served");
    }
  }
  if (submission.difficulty.has_value() &&
      (submission.difficulty.value() < 1 || submission.difficulty.value() > 5)) {
    throw InvalidResponse("difficulty must be within [1, 5], got " +
                          std::to_string(submission.difficulty.value()));
  }
  if (submission.time_spent < 0) {
    throw InvalidResponse("time_spent must not be negative");
  }
  if (submission.confidence.has_value() &&
      (submission.confidence.value() < 1 || submission.confidence.value() > 5)) {
    throw InvalidResponse("confidence must be within [1, 5]");
  }
}

QuestionResponse build_response(const AnswerSubmission& submission,
                                const DiagnosisSession& session) {
  QuestionResponse response;
  response.session_id = session.id;
  response.question_id = submission.question_id;
  response.knowledge_point_id = submission.knowledge_point_id;
  response.question_content = submission.question_content;
  response.question_type = submission.question_type;
  if (session.active_item.has_value()) {
    const auto& item = session.active_item.value();
    response.question_id = item.question_id;
    if (response.knowledge_point_id.empty()) {
      response.knowledge_point_id = item.knowledge_point_id;
    }
    if (response.question_content.empty()) {
      response.question_content = item.content;
    }
    if (response.question_type.empty()) {
      response.question_type = item.question_type;
    }
    response.difficulty = item.difficulty;
  } else {
    response.difficulty = submission.difficulty.value_or(3);
  }
  response.user_answer = submission.user_answer;
  response.correct_answer = submission.correct_answer;
  response.correct = submission.correct;
  response.time_spent = submission.time_spent;
  response.confidence = submission.confidence;
  response.error_type = submission.error_type;
  return response;
}

std::string default_session_name(DiagnosisLevel level) {
  return to_string(level) + " diagnosis";
}

class DiagnosisEngineImpl : public DiagnosisEngine {
public:
  DiagnosisEngineImpl(EngineDependencies dependencies, EngineOptions options)
      : deps_(std::move(dependencies)),
        options_(options),
        selector_(*deps_.bank),
        synthesizer_(deps_.directory.get(),
                     SynthesisOptions{options.priority_policy, options.default_priority}),
        ids_(options.id_seed != 0 ? options.id_seed
                                  : static_cast<std::uint64_t>(deps_.clock())) {}

  DiagnosisReport create_report(const std::string& user_id, const std::string& subject_id,
                                const ReportConfig& config) override {
    if (user_id.empty() || subject_id.empty()) {
      throw ConfigurationError("create_report needs a user_id and a subject_id");
    }
    config.validate();

    DiagnosisReport report;
    report.id = generate_id("rpt");
    report.user_id = user_id;
    report.subject_id = subject_id;
    report.config = config;
    report.config.knowledge_point_ids = unique_in_order(config.knowledge_point_ids);
    report.status = DiagnosisStatus::Pending;
    report.created_at_ms = deps_.clock();
    report.version = 1;
    deps_.store->save_report(report);
    detail::debug_log("report", "created " + report.id + " for " + user_id + "/" + subject_id);
    return report;
  }

  DiagnosisSession start_session(const std::string& report_id,
                                 const SessionConfig& config) override {
    auto lock = lock_for("report:" + report_id);
    std::scoped_lock guard(*lock);

    auto report = deps_.store->load_report(report_id);
    if (report.status == DiagnosisStatus::Completed ||
        report.status == DiagnosisStatus::Cancelled) {
      throw InvalidStateTransition("report " + report_id + " is " + to_string(report.status) +
                                   " and accepts no new sessions");
    }

    const auto limits = options_.resolve_limits(config);
    const auto band = selection::allowed_band(report.config.difficulty_range, config.level);
    if (!band.has_value()) {
      throw ConfigurationError("difficulty range of report " + report_id +
                               " does not intersect the " + to_string(config.level) + " band");
    }

    DiagnosisSession session;
    session.id = generate_id("sess");
    session.report_id = report_id;
    session.name = config.name.empty() ? default_session_name(config.level) : config.name;
    session.level = config.level;
    session.limits = limits;
    session.difficulty_band = band.value();
    session.created_at_ms = deps_.clock();
    session.version = 1;
    SessionMachine(session, deps_.clock).start();

    deps_.store->create_session(session);
    if (report.status == DiagnosisStatus::Pending) {
      report.status = DiagnosisStatus::InProgress;
      report.version += 1;
      deps_.store->save_report(report);
    }
    return session;
  }

  Next next_item(const std::string& session_id) override {
    auto lock = lock_for("session:" + session_id);
    std::scoped_lock guard(*lock);

    auto session = deps_.store->load_session(session_id);
    switch (session.status) {
      case DiagnosisStatus::Pending:
        throw InvalidStateTransition("session " + session_id + " has not been started");
      case DiagnosisStatus::Completed:
      case DiagnosisStatus::Cancelled:
        return finished(session);
      case DiagnosisStatus::InProgress:
        break;
    }

    if (session.active_item.has_value()) {
      NextItem next;
      next.item = session.active_item.value();
      next.question_number = session.questions_answered + 1;
      if (!session.selection_history.empty()) {
        next.suggested_difficulty = session.selection_history.back().suggested_difficulty;
        next.reason = session.selection_history.back().reason;
      }
      return next;
    }

    if (!SessionMachine::should_continue(session)) {
      return stop(session, SessionMachine::stop_reason_for(session));
    }

    const auto report = deps_.store->load_report(session.report_id);
    selection::SelectionRequest request;
    request.subject_id = report.subject_id;
    request.ability = session.current_ability_estimate;
    request.adaptive = report.config.adaptive_enabled;
    request.band = session.difficulty_band;
    request.knowledge_point_filter = report.config.knowledge_point_ids;
    for (const auto& entry : session.selection_history) {
      request.used_question_ids.push_back(entry.question_id);
      request.covered_knowledge_points.push_back(entry.knowledge_point_id);
    }
    for (const auto& response : deps_.store->load_session_responses(session_id)) {
      request.used_question_ids.push_back(response.question_id);
      request.covered_knowledge_points.push_back(response.knowledge_point_id);
    }
    request.used_question_ids = unique_in_order(request.used_question_ids);
    request.covered_knowledge_points = unique_in_order(request.covered_knowledge_points);

    const auto pick = selector_.select(request);
    if (std::holds_alternative<selection::PoolExhausted>(pick)) {
      return stop(session, StopReason::PoolExhausted);
    }

    const auto& selected = std::get<selection::SelectedItem>(pick);
    SessionMachine(session, deps_.clock)
        .serve(selected.item, selected.target_difficulty, selected.reason());
    session.version += 1;
    deps_.store->save_session(session);

    std::ostringstream oss;
    oss << "session " << session_id << " serves " << selected.item.question_id << " (difficulty "
        << selected.item.difficulty << ", target " << selected.target_difficulty << ", "
        << selected.reason() << ")";
    detail::debug_log("select", oss.str());

    NextItem next;
    next.item = selected.item;
    next.suggested_difficulty = selected.target_difficulty;
    next.question_number = session.questions_answered + 1;
    next.reason = selected.reason();
    return next;
  }

  SubmitOutcome submit_answer(const std::string& session_id,
                              const AnswerSubmission& submission) override {
    auto lock = lock_for("session:" + session_id);
    std::scoped_lock guard(*lock);

    auto session = deps_.store->load_session(session_id);
    validate_submission(submission, session);
    auto response = build_response(submission, session);

    SessionMachine machine(session, deps_.clock);
    machine.record_answer(response.correct, response.difficulty, response.time_spent);
    session.version += 1;

    response.id = generate_id("resp");
    response.sequence = session.questions_answered;
    response.timestamp_ms = deps_.clock();
    deps_.store->append_response(session, response);

    SubmitOutcome outcome;
    outcome.recorded = true;
    outcome.should_continue = machine.should_continue();
    outcome.current_ability = session.current_ability_estimate;
    outcome.current_se = session.ability_se;
    outcome.questions_remaining =
        std::max(0, session.limits.max_questions - session.questions_answered);
    outcome.response_id = response.id;
    return outcome;
  }

  DiagnosisSession end_session(const std::string& session_id) override {
    auto lock = lock_for("session:" + session_id);
    std::scoped_lock guard(*lock);

    auto session = deps_.store->load_session(session_id);
    SessionMachine(session, deps_.clock).end(StopReason::Ended);
    session.version += 1;
    deps_.store->save_session(session);
    return session;
  }

  DiagnosisSession cancel_session(const std::string& session_id) override {
    auto lock = lock_for("session:" + session_id);
    std::scoped_lock guard(*lock);

    auto session = deps_.store->load_session(session_id);
    SessionMachine(session, deps_.clock).cancel();
    session.version += 1;
    deps_.store->save_session(session);
    return session;
  }

  DiagnosisReport complete_report(const std::string& report_id) override {
    auto lock = lock_for("report:" + report_id);
    std::scoped_lock guard(*lock);

    const auto report = deps_.store->load_report(report_id);
    if (report.status == DiagnosisStatus::Completed) {
      throw InvalidStateTransition("report " + report_id + " is already completed");
    }

    std::vector<QuestionResponse> responses;
    for (const auto& session : deps_.store->load_sessions(report_id)) {
      if (session.status == DiagnosisStatus::Pending ||
          session.status == DiagnosisStatus::InProgress) {
        throw InvalidStateTransition("report " + report_id + " still has session " + session.id +
                                     " " + to_string(session.status));
      }
      if (session.status == DiagnosisStatus::Cancelled) {
        continue;
      }
      auto session_responses = deps_.store->load_session_responses(session.id);
      responses.insert(responses.end(), session_responses.begin(), session_responses.end());
    }

    auto completed = synthesizer_.synthesize(report, responses, deps_.clock());
    completed.version = report.version + 1;
    deps_.store->save_report(completed);
    detail::debug_log("report", "completed " + report_id);
    return completed;
  }

  DiagnosisReport get_report(const std::string& report_id) override {
    return deps_.store->load_report(report_id);
  }

  DiagnosisSession get_session(const std::string& session_id) override {
    return deps_.store->load_session(session_id);
  }

  void delete_report(const std::string& report_id) override {
    auto lock = lock_for("report:" + report_id);
    std::scoped_lock guard(*lock);
    deps_.store->delete_report(report_id);
  }

  analysis::ResponsePattern analyze_session(const std::string& session_id) override {
    auto lock = lock_for("session:" + session_id);
    std::scoped_lock guard(*lock);
    const auto session = deps_.store->load_session(session_id);
    return analysis::analyze(session, deps_.store->load_session_responses(session_id));
  }

  DiagnosisStatistics diagnosis_statistics(const std::string& user_id,
                                           const std::optional<std::string>& subject_id) override {
    const auto reports = deps_.store->list_reports(user_id, subject_id);
    DiagnosisStatistics statistics;
    statistics.total_diagnoses = static_cast<int>(reports.size());

    std::vector<const DiagnosisReport*> completed;
    for (const auto& report : reports) {
      if (report.status == DiagnosisStatus::Completed) {
        completed.push_back(&report);
      }
    }
    statistics.completed_diagnoses = static_cast<int>(completed.size());
    if (completed.empty()) {
      return statistics;
    }

    std::stable_sort(completed.begin(), completed.end(),
                     [](const DiagnosisReport* a, const DiagnosisReport* b) {
                       return a->completed_at_ms.value_or(0) < b->completed_at_ms.value_or(0);
                     });
    double accuracy_sum = 0.0;
    for (const auto* report : completed) {
      accuracy_sum += report->accuracy_rate;
    }
    statistics.average_accuracy =
        std::nearbyint(accuracy_sum / static_cast<double>(completed.size()) * 100.0) / 100.0;

    const std::size_t first = completed.size() > kTrendLength ? completed.size() - kTrendLength : 0;
    for (std::size_t i = first; i < completed.size(); ++i) {
      const auto* report = completed[i];
      statistics.improvement_trend.push_back({report->id, report->completed_at_ms.value_or(0),
                                              report->accuracy_rate, report->ability_estimate});
    }
    statistics.latest_ability_estimate = completed.back()->ability_estimate;
    return statistics;
  }

  nlohmann::json debug_state(const std::string& session_id) override {
    auto lock = lock_for("session:" + session_id);
    std::scoped_lock guard(*lock);
    const auto session = deps_.store->load_session(session_id);

    nlohmann::json info = nlohmann::json::object();
    info["session_id"] = session_id;
    info["report_id"] = session.report_id;
    info["status"] = to_string(session.status);
    info["level"] = to_string(session.level);
    info["difficulty_band"] = bridge::to_json(session.difficulty_band);
    info["questions_answered"] = session.questions_answered;
    info["max_questions"] = session.limits.max_questions;
    info["min_questions"] = session.limits.min_questions;
    info["target_precision"] = session.limits.target_precision;
    info["current_ability_estimate"] = session.current_ability_estimate;
    info["ability_se"] = session.ability_se;
    info["suggested_difficulty"] = selection::suggested_difficulty(session.current_ability_estimate);
    if (const auto variance = SessionMachine::precision_variance(session)) {
      info["precision_variance"] = variance.value();
    } else {
      info["precision_variance"] = nullptr;
    }
    info["should_continue"] = session.status == DiagnosisStatus::InProgress &&
                              SessionMachine::should_continue(session);
    if (session.active_item.has_value()) {
      info["active_item"] = bridge::to_json(session.active_item.value());
    } else {
      info["active_item"] = nullptr;
    }
    info["served_count"] = static_cast<int>(session.selection_history.size());
    info["version"] = session.version;
    info["tracked_locks"] = static_cast<int>(tracked_locks());
    return info;
  }

  const EngineOptions& options() const override { return options_; }

private:
  Next finished(const DiagnosisSession& session) const {
    SessionFinished done;
    done.session = session;
    done.reason = session.stop_reason.value_or(session.status == DiagnosisStatus::Cancelled
                                                   ? StopReason::Cancelled
                                                   : StopReason::Ended);
    return done;
  }

  Next stop(DiagnosisSession& session, StopReason reason) {
    SessionMachine(session, deps_.clock).end(reason);
    session.version += 1;
    deps_.store->save_session(session);
    return finished(session);
  }

  // Entries live only while a caller holds the returned mutex.
  std::shared_ptr<std::mutex> lock_for(const std::string& key) {
    std::scoped_lock guard(registry_mutex_);
    for (auto it = locks_.begin(); it != locks_.end();) {
      if (it->second.expired() && it->first != key) {
        it = locks_.erase(it);
      } else {
        ++it;
      }
    }
    auto& slot = locks_[key];
    auto lock = slot.lock();
    if (!lock) {
      lock = std::make_shared<std::mutex>();
      slot = lock;
    }
    return lock;
  }

  std::size_t tracked_locks() {
    std::scoped_lock guard(registry_mutex_);
    return locks_.size();
  }

  std::string generate_id(const char* prefix) {
    std::scoped_lock guard(id_mutex_);
    return ids_.next(prefix);
  }

  EngineDependencies deps_;
  EngineOptions options_;
  selection::ItemSelector selector_;
  ReportSynthesizer synthesizer_;

  std::mutex registry_mutex_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;

  std::mutex id_mutex_;
  detail::IdGenerator ids_;
};

} // namespace

std::unique_ptr<DiagnosisEngine> make_engine(EngineDependencies dependencies,
                                             EngineOptions options) {
  options.validate();
  if (!dependencies.bank) {
    throw ConfigurationError("make_engine requires a question bank");
  }
  if (!dependencies.store) {
    throw ConfigurationError("make_engine requires a store");
  }
  if (!dependencies.clock) {
    dependencies.clock = system_clock_ms;
  }
  if (!dependencies.directory) {
    dependencies.directory = std::dynamic_pointer_cast<KnowledgeDirectory>(dependencies.bank);
  }
  return std::make_unique<DiagnosisEngineImpl>(std::move(dependencies), options);
}

} // namespace dx
