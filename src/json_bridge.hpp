#pragma once

#include "dx/diagnosis_engine.hpp"

#include <nlohmann/json.hpp>

namespace dx::bridge {

nlohmann::json to_json(const DifficultyRange& range);
DifficultyRange difficulty_range_from_json(const nlohmann::json& json_range);

nlohmann::json to_json(const ReportConfig& config);
ReportConfig report_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const SessionConfig& config);
SessionConfig session_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const QuestionItem& item);
QuestionItem question_item_from_json(const nlohmann::json& json_item);

nlohmann::json to_json(const DiagnosisSession& session);
DiagnosisSession diagnosis_session_from_json(const nlohmann::json& json_session);

nlohmann::json to_json(const QuestionResponse& response);
QuestionResponse question_response_from_json(const nlohmann::json& json_response);

// Type errors surface as InvalidResponse.
AnswerSubmission answer_submission_from_json(const nlohmann::json& json_submission);

nlohmann::json to_json(const DiagnosisReport& report);
DiagnosisReport diagnosis_report_from_json(const nlohmann::json& json_report);

nlohmann::json to_json(const DiagnosisStatistics& statistics);

nlohmann::json to_json(const analysis::ResponsePattern& pattern);

nlohmann::json to_json(const EngineOptions& options);
// Type errors surface as ConfigurationError. Unknown keys are ignored.
EngineOptions engine_options_from_json(const nlohmann::json& json_options);

nlohmann::json to_json(const SubmitOutcome& outcome);

nlohmann::json to_json(const DiagnosisEngine::Next& next);

} // namespace dx::bridge
