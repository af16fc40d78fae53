#pragma once

#include "report.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dx {

// Persistence for reports, sessions and responses. Every write is atomic.
// A new record is written with version 1; a write of an existing record must
// carry version == stored version + 1. Anything else raises
// PersistenceFailure. Unknown ids raise NotFound.
class DiagnosisStore {
public:
  virtual ~DiagnosisStore() = default;

  // Creates the report or updates the stored one.
  virtual void save_report(const DiagnosisReport& report) = 0;

  virtual DiagnosisReport load_report(const std::string& report_id) = 0;

  // Oldest first.
  virtual std::vector<DiagnosisReport> list_reports(const std::string& user_id,
                                                    const std::optional<std::string>& subject_id) = 0;

  // Removes the report with its sessions and their responses.
  virtual void delete_report(const std::string& report_id) = 0;

  virtual void create_session(const DiagnosisSession& session) = 0;

  virtual DiagnosisSession load_session(const std::string& session_id) = 0;

  virtual void save_session(const DiagnosisSession& session) = 0;

  // Ordered by creation time.
  virtual std::vector<DiagnosisSession> load_sessions(const std::string& report_id) = 0;

  // Stores the response together with the session it updated, or neither.
  virtual void append_response(const DiagnosisSession& session,
                               const QuestionResponse& response) = 0;

  // Ordered by sequence.
  virtual std::vector<QuestionResponse> load_session_responses(const std::string& session_id) = 0;

  // Responses of every session of the report, session by session.
  virtual std::vector<QuestionResponse> load_report_responses(const std::string& report_id) = 0;
};

} // namespace dx
