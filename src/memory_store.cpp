#include "dx/memory_store.hpp"

#include "dx/errors.hpp"
#include "store_versioning.hpp"

#include <algorithm>

namespace dx {

void MemoryStore::save_report(const DiagnosisReport& report) {
  std::scoped_lock guard(mutex_);
  auto it = reports_.find(report.id);
  if (it == reports_.end()) {
    detail::check_write_version("report", report.id, std::nullopt, report.version);
    reports_.emplace(report.id, report);
    report_order_.push_back(report.id);
    return;
  }
  detail::check_write_version("report", report.id, it->second.version, report.version);
  it->second = report;
}

DiagnosisReport MemoryStore::load_report(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  auto it = reports_.find(report_id);
  if (it == reports_.end()) {
    throw NotFound("Unknown report id: " + report_id);
  }
  return it->second;
}

std::vector<DiagnosisReport> MemoryStore::list_reports(
    const std::string& user_id, const std::optional<std::string>& subject_id) {
  std::scoped_lock guard(mutex_);
  std::vector<DiagnosisReport> out;
  for (const auto& id : report_order_) {
    const auto& report = reports_.at(id);
    if (report.user_id != user_id) {
      continue;
    }
    if (subject_id.has_value() && report.subject_id != subject_id.value()) {
      continue;
    }
    out.push_back(report);
  }
  return out;
}

void MemoryStore::delete_report(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  if (reports_.erase(report_id) == 0) {
    throw NotFound("Unknown report id: " + report_id);
  }
  report_order_.erase(std::remove(report_order_.begin(), report_order_.end(), report_id),
                      report_order_.end());
  auto owned = sessions_by_report_.find(report_id);
  if (owned != sessions_by_report_.end()) {
    for (const auto& session_id : owned->second) {
      sessions_.erase(session_id);
      responses_.erase(session_id);
    }
    sessions_by_report_.erase(owned);
  }
}

void MemoryStore::create_session(const DiagnosisSession& session) {
  std::scoped_lock guard(mutex_);
  if (reports_.count(session.report_id) == 0) {
    throw NotFound("Unknown report id: " + session.report_id);
  }
  if (sessions_.count(session.id) != 0) {
    throw PersistenceFailure("session " + session.id + " already exists");
  }
  detail::check_write_version("session", session.id, std::nullopt, session.version);
  sessions_.emplace(session.id, session);
  sessions_by_report_[session.report_id].push_back(session.id);
}

DiagnosisSession MemoryStore::load_session(const std::string& session_id) {
  std::scoped_lock guard(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw NotFound("Unknown session id: " + session_id);
  }
  return it->second;
}

void MemoryStore::check_session_write(const DiagnosisSession& session) const {
  auto it = sessions_.find(session.id);
  if (it == sessions_.end()) {
    throw NotFound("Unknown session id: " + session.id);
  }
  detail::check_write_version("session", session.id, it->second.version, session.version);
}

void MemoryStore::save_session(const DiagnosisSession& session) {
  std::scoped_lock guard(mutex_);
  check_session_write(session);
  sessions_[session.id] = session;
}

std::vector<DiagnosisSession> MemoryStore::load_sessions(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  std::vector<DiagnosisSession> out;
  auto owned = sessions_by_report_.find(report_id);
  if (owned == sessions_by_report_.end()) {
    return out;
  }
  for (const auto& session_id : owned->second) {
    out.push_back(sessions_.at(session_id));
  }
  return out;
}

void MemoryStore::append_response(const DiagnosisSession& session,
                                  const QuestionResponse& response) {
  std::scoped_lock guard(mutex_);
  check_session_write(session);
  if (response.session_id != session.id) {
    throw PersistenceFailure("response " + response.id + " does not belong to session " +
                             session.id);
  }
  // Both containers are updated only after every check passed.
  responses_[session.id].push_back(response);
  sessions_[session.id] = session;
}

std::vector<QuestionResponse> MemoryStore::load_session_responses(const std::string& session_id) {
  std::scoped_lock guard(mutex_);
  if (sessions_.count(session_id) == 0) {
    throw NotFound("Unknown session id: " + session_id);
  }
  auto it = responses_.find(session_id);
  if (it == responses_.end()) {
    return {};
  }
  return it->second;
}

std::vector<QuestionResponse> MemoryStore::load_report_responses(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  if (reports_.count(report_id) == 0) {
    throw NotFound("Unknown report id: " + report_id);
  }
  std::vector<QuestionResponse> out;
  auto owned = sessions_by_report_.find(report_id);
  if (owned == sessions_by_report_.end()) {
    return out;
  }
  for (const auto& session_id : owned->second) {
    auto it = responses_.find(session_id);
    if (it != responses_.end()) {
      out.insert(out.end(), it->second.begin(), it->second.end());
    }
  }
  return out;
}

} // namespace dx
