#pragma once

#include "cat/adaptive_session.hpp"
#include "cat/item_bank.hpp"
#include "cat/session_engine.hpp"
#include "cat/session_report.hpp"

#include <nlohmann/json.hpp>

namespace cat::bridge {

nlohmann::json to_json(const ItemParameter& parameter);
ItemParameter item_parameter_from_json(const nlohmann::json& json_parameter);

nlohmann::json to_json(const ItemTemplate& item);
ItemTemplate item_template_from_json(const nlohmann::json& json_item);

// Accepts {"items": [...]} or a bare array of items.
ItemBank item_bank_from_json(const nlohmann::json& json_bank);

nlohmann::json to_json(const LearnerProfile& learner);
LearnerProfile learner_profile_from_json(const nlohmann::json& json_learner);

nlohmann::json to_json(const AbilityEstimate& estimate);
AbilityEstimate ability_estimate_from_json(const nlohmann::json& json_estimate);

nlohmann::json to_json(const ItemResponse& response);
ItemResponse item_response_from_json(const nlohmann::json& json_response);

nlohmann::json to_json(const TerminationCriteria& criteria);
TerminationCriteria termination_criteria_from_json(const nlohmann::json& json_criteria);

nlohmann::json to_json(const irt::EstimatorConfig& config);
irt::EstimatorConfig estimator_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const SessionConfig& config);
SessionConfig session_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const SessionSnapshot& snapshot);
SessionSnapshot session_snapshot_from_json(const nlohmann::json& json_snapshot);

nlohmann::json to_json(const SessionReport& report);
SessionReport session_report_from_json(const nlohmann::json& json_report);

// {"learner": {...}, "topic": "...", "criteria": {...}}; topic and criteria optional.
SessionRequest session_request_from_json(const nlohmann::json& json_request);

ResponseSubmission response_submission_from_json(const nlohmann::json& json_submission);

// {"type": "item", "item": {...}} or {"type": "report", "report": {...}}.
nlohmann::json to_json(const SessionEngine::Next& next);

} // namespace cat::bridge
