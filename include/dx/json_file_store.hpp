#pragma once

#include "store.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace dx {

// One JSON document per record under `root`:
//   reports/<report_id>.json
//   sessions/<session_id>.json   (session record plus its responses)
// Documents are written to a temporary file and renamed into place, so a
// session and the response appended with it land in a single write.
class JsonFileStore : public DiagnosisStore {
public:
  explicit JsonFileStore(std::filesystem::path root);

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

  const std::filesystem::path& root() const { return root_; }

private:
  struct SessionDocument {
    DiagnosisSession session;
    std::vector<QuestionResponse> responses;
  };

  std::filesystem::path report_path(const std::string& report_id) const;
  std::filesystem::path session_path(const std::string& session_id) const;

  SessionDocument read_session_document(const std::string& session_id) const;
  void write_session_document(const SessionDocument& document) const;
  std::vector<SessionDocument> read_report_sessions(const std::string& report_id) const;

  std::filesystem::path root_;
  mutable std::mutex mutex_;
};

} // namespace dx
