#include "dx/json_file_store.hpp"

#include "dx/errors.hpp"
#include "json_bridge.hpp"
#include "store_versioning.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace dx {
namespace {

void check_id(const std::string& id, const char* kind) {
  if (id.empty() || id.find_first_of("/\\") != std::string::npos || id == "." || id == "..") {
    throw NotFound(std::string("Invalid ") + kind + " id: '" + id + "'");
  }
}

nlohmann::json read_document(const fs::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw PersistenceFailure("Unable to open " + path.string());
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& ex) {
    throw PersistenceFailure("Corrupt document " + path.string() + ": " + ex.what());
  }
}

void write_document(const fs::path& path, const nlohmann::json& document) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw PersistenceFailure("Unable to write " + tmp.string());
    }
    out << document.dump(2);
    out.flush();
    if (!out) {
      throw PersistenceFailure("Short write to " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw PersistenceFailure("Unable to replace " + path.string());
  }
}

DiagnosisReport read_report(const fs::path& path) {
  const auto json = read_document(path);
  try {
    return bridge::diagnosis_report_from_json(json);
  } catch (const std::invalid_argument& ex) {
    throw PersistenceFailure("Corrupt report document " + path.string() + ": " + ex.what());
  } catch (const ConfigurationError& ex) {
    throw PersistenceFailure("Corrupt report document " + path.string() + ": " + ex.what());
  }
}

std::vector<fs::path> json_files(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return out;
  }
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      out.push_back(entry.path());
    }
  }
  if (ec) {
    throw PersistenceFailure("Unable to list " + dir.string() + ": " + ec.message());
  }
  return out;
}

} // namespace

JsonFileStore::JsonFileStore(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_ / "reports", ec);
  if (!ec) {
    fs::create_directories(root_ / "sessions", ec);
  }
  if (ec) {
    throw PersistenceFailure("Unable to prepare storage root " + root_.string() + ": " +
                             ec.message());
  }
}

fs::path JsonFileStore::report_path(const std::string& report_id) const {
  check_id(report_id, "report");
  return root_ / "reports" / (report_id + ".json");
}

fs::path JsonFileStore::session_path(const std::string& session_id) const {
  check_id(session_id, "session");
  return root_ / "sessions" / (session_id + ".json");
}

void JsonFileStore::save_report(const DiagnosisReport& report) {
  std::scoped_lock guard(mutex_);
  const auto path = report_path(report.id);
  std::optional<std::uint64_t> stored;
  if (fs::exists(path)) {
    stored = read_report(path).version;
  }
  detail::check_write_version("report", report.id, stored, report.version);
  write_document(path, bridge::to_json(report));
}

DiagnosisReport JsonFileStore::load_report(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  const auto path = report_path(report_id);
  if (!fs::exists(path)) {
    throw NotFound("Unknown report id: " + report_id);
  }
  return read_report(path);
}

std::vector<DiagnosisReport> JsonFileStore::list_reports(
    const std::string& user_id, const std::optional<std::string>& subject_id) {
  std::scoped_lock guard(mutex_);
  std::vector<DiagnosisReport> out;
  for (const auto& path : json_files(root_ / "reports")) {
    auto report = read_report(path);
    if (report.user_id != user_id) {
      continue;
    }
    if (subject_id.has_value() && report.subject_id != subject_id.value()) {
      continue;
    }
    out.push_back(std::move(report));
  }
  std::sort(out.begin(), out.end(), [](const DiagnosisReport& a, const DiagnosisReport& b) {
    if (a.created_at_ms != b.created_at_ms) {
      return a.created_at_ms < b.created_at_ms;
    }
    return a.id < b.id;
  });
  return out;
}

void JsonFileStore::delete_report(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  const auto path = report_path(report_id);
  if (!fs::exists(path)) {
    throw NotFound("Unknown report id: " + report_id);
  }
  std::error_code ec;
  for (const auto& document : read_report_sessions(report_id)) {
    fs::remove(session_path(document.session.id), ec);
    if (ec) {
      throw PersistenceFailure("Unable to delete session " + document.session.id);
    }
  }
  fs::remove(path, ec);
  if (ec) {
    throw PersistenceFailure("Unable to delete report " + report_id);
  }
}

JsonFileStore::SessionDocument JsonFileStore::read_session_document(
    const std::string& session_id) const {
  const auto path = session_path(session_id);
  if (!fs::exists(path)) {
    throw NotFound("Unknown session id: " + session_id);
  }
  const auto json = read_document(path);
  try {
    SessionDocument document;
    document.session = bridge::diagnosis_session_from_json(json.at("session"));
    for (const auto& entry : json.at("responses")) {
      document.responses.push_back(bridge::question_response_from_json(entry));
    }
    return document;
  } catch (const nlohmann::json::exception& ex) {
    throw PersistenceFailure("Corrupt session document " + path.string() + ": " + ex.what());
  } catch (const std::invalid_argument& ex) {
    throw PersistenceFailure("Corrupt session document " + path.string() + ": " + ex.what());
  }
}

void JsonFileStore::write_session_document(const SessionDocument& document) const {
  nlohmann::json json = nlohmann::json::object();
  json["session"] = bridge::to_json(document.session);
  nlohmann::json responses = nlohmann::json::array();
  for (const auto& response : document.responses) {
    responses.push_back(bridge::to_json(response));
  }
  json["responses"] = std::move(responses);
  write_document(session_path(document.session.id), json);
}

std::vector<JsonFileStore::SessionDocument> JsonFileStore::read_report_sessions(
    const std::string& report_id) const {
  std::vector<SessionDocument> out;
  for (const auto& path : json_files(root_ / "sessions")) {
    auto document = read_session_document(path.stem().string());
    if (document.session.report_id == report_id) {
      out.push_back(std::move(document));
    }
  }
  std::sort(out.begin(), out.end(), [](const SessionDocument& a, const SessionDocument& b) {
    if (a.session.created_at_ms != b.session.created_at_ms) {
      return a.session.created_at_ms < b.session.created_at_ms;
    }
    return a.session.id < b.session.id;
  });
  return out;
}

void JsonFileStore::create_session(const DiagnosisSession& session) {
  std::scoped_lock guard(mutex_);
  if (!fs::exists(report_path(session.report_id))) {
    throw NotFound("Unknown report id: " + session.report_id);
  }
  if (fs::exists(session_path(session.id))) {
    throw PersistenceFailure("session " + session.id + " already exists");
  }
  detail::check_write_version("session", session.id, std::nullopt, session.version);
  write_session_document({session, {}});
}

DiagnosisSession JsonFileStore::load_session(const std::string& session_id) {
  std::scoped_lock guard(mutex_);
  return read_session_document(session_id).session;
}

void JsonFileStore::save_session(const DiagnosisSession& session) {
  std::scoped_lock guard(mutex_);
  auto document = read_session_document(session.id);
  detail::check_write_version("session", session.id, document.session.version, session.version);
  document.session = session;
  write_session_document(document);
}

std::vector<DiagnosisSession> JsonFileStore::load_sessions(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  std::vector<DiagnosisSession> out;
  for (auto& document : read_report_sessions(report_id)) {
    out.push_back(std::move(document.session));
  }
  return out;
}

void JsonFileStore::append_response(const DiagnosisSession& session,
                                    const QuestionResponse& response) {
  std::scoped_lock guard(mutex_);
  auto document = read_session_document(session.id);
  detail::check_write_version("session", session.id, document.session.version, session.version);
  if (response.session_id != session.id) {
    throw PersistenceFailure("response " + response.id + " does not belong to session " +
                             session.id);
  }
  document.session = session;
  document.responses.push_back(response);
  write_session_document(document);
}

std::vector<QuestionResponse> JsonFileStore::load_session_responses(const std::string& session_id) {
  std::scoped_lock guard(mutex_);
  return read_session_document(session_id).responses;
}

std::vector<QuestionResponse> JsonFileStore::load_report_responses(const std::string& report_id) {
  std::scoped_lock guard(mutex_);
  if (!fs::exists(report_path(report_id))) {
    throw NotFound("Unknown report id: " + report_id);
  }
  std::vector<QuestionResponse> out;
  for (auto& document : read_report_sessions(report_id)) {
    out.insert(out.end(), std::make_move_iterator(document.responses.begin()),
               std::make_move_iterator(document.responses.end()));
  }
  return out;
}

} // namespace dx
