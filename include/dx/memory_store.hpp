#pragma once

#include "store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dx {

class MemoryStore : public DiagnosisStore {
public:
  void save_report(const DiagnosisReport& report) override;
  DiagnosisReport load_report(const std::string& report_id) override;
  std::vector<DiagnosisReport> list_reports(const std::string& user_id,
                                            const std::optional<std::string>& subject_id) override;
  void delete_report(const std::string& report_id) override;

  void create_session(const DiagnosisSession& session) override;
  DiagnosisSession load_session(const std::string& session_id) override;
  void save_session(const DiagnosisSession& session) override;
  std::vector<DiagnosisSession> load_sessions(const std::string& report_id) override;

  void append_response(const DiagnosisSession& session, const QuestionResponse& response) override;
  std::vector<QuestionResponse> load_session_responses(const std::string& session_id) override;
  std::vector<QuestionResponse> load_report_responses(const std::string& report_id) override;

private:
  void check_session_write(const DiagnosisSession& session) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, DiagnosisReport> reports_;
  std::vector<std::string> report_order_;
  std::unordered_map<std::string, DiagnosisSession> sessions_;
  std::unordered_map<std::string, std::vector<std::string>> sessions_by_report_;
  std::unordered_map<std::string, std::vector<QuestionResponse>> responses_;
};

} // namespace dx
