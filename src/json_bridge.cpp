#include "json_bridge.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cat::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key)) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj.at(key);
}

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v <= static_cast<std::uint64_t>(kMax)) {
      return static_cast<int>(v);
    }
  } else if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v >= kMin && v <= kMax) {
      return static_cast<int>(v);
    }
  } else if (value.is_number_float()) {
    // Whole-valued floats such as 25.0 are accepted.
    const double v = value.get<double>();
    if (std::isfinite(v) && std::trunc(v) == v && v >= kMin && v <= kMax) {
      return static_cast<int>(v);
    }
    throw std::invalid_argument("Expected whole number for field '" + std::string(key) + "'");
  } else {
    throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
  }
  throw std::invalid_argument("Integer out of range for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw std::invalid_argument("Integer out of range for field '" + std::string(key) + "'");
    }
    return static_cast<std::int64_t>(v);
  }
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& element : value) {
    out.push_back(json_to_string(element, key));
  }
  return out;
}

nlohmann::json strings_to_json_array(const std::vector<std::string>& values) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& v : values) {
    arr.push_back(v);
  }
  return arr;
}

std::string trim(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(begin, end - begin);
}

// Item ids may be written as strings or integers in hand-authored banks.
std::string json_to_id(const nlohmann::json& value, std::string_view key) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  throw std::invalid_argument("Expected string id for field '" + std::string(key) + "'");
}

ItemChoice item_choice_from_json(const nlohmann::json& json_choice) {
  require_object(json_choice, "choice");
  ItemChoice choice;
  assign_if_present(json_choice, "id", [&](const nlohmann::json& value) {
    choice.id = json_to_id(value, "id");
  });
  choice.text = json_to_string(require_field(json_choice, "text"), "text");
  assign_if_present(json_choice, "is_correct", [&](const nlohmann::json& value) {
    choice.is_correct = json_to_bool(value, "is_correct");
  });
  return choice;
}

nlohmann::json to_json(const ItemChoice& choice) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = choice.id;
  json["text"] = choice.text;
  json["is_correct"] = choice.is_correct;
  return json;
}

} // namespace

nlohmann::json to_json(const ItemParameter& parameter) {
  nlohmann::json json = nlohmann::json::object();
  json["difficulty"] = parameter.difficulty;
  json["discrimination"] = parameter.discrimination;
  json["guessing"] = parameter.guessing;
  return json;
}

ItemParameter item_parameter_from_json(const nlohmann::json& json_parameter) {
  require_object(json_parameter, "parameter");
  ItemParameter parameter;
  parameter.difficulty =
      json_to_double(require_field(json_parameter, "difficulty"), "difficulty");
  assign_if_present(json_parameter, "discrimination", [&](const nlohmann::json& value) {
    parameter.discrimination = json_to_double(value, "discrimination");
  });
  assign_if_present(json_parameter, "guessing", [&](const nlohmann::json& value) {
    parameter.guessing = json_to_double(value, "guessing");
  });
  return parameter;
}

nlohmann::json to_json(const ItemTemplate& item) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = item.id;
  json["stem"] = item.stem;
  nlohmann::json choices = nlohmann::json::array();
  for (const auto& choice : item.choices) {
    choices.push_back(to_json(choice));
  }
  json["choices"] = std::move(choices);
  json["format"] = to_string(item.format);
  json["parameter"] = to_json(item.parameter);
  json["topic"] = item.topic;
  json["subtopic"] = item.subtopic;
  json["explanation"] = item.explanation;
  json["bloom_level"] = item.bloom_level;
  json["learning_objective"] = item.learning_objective;
  json["knowledge_unit_ids"] = strings_to_json_array(item.knowledge_unit_ids);
  return json;
}

ItemTemplate item_template_from_json(const nlohmann::json& json_item) {
  require_object(json_item, "item");
  ItemTemplate item;
  item.id = json_to_id(require_field(json_item, "id"), "id");
  item.stem = trim(json_to_string(require_field(json_item, "stem"), "stem"));
  item.parameter = item_parameter_from_json(require_field(json_item, "parameter"));
  assign_if_present(json_item, "choices", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'choices'");
    }
    for (const auto& element : value) {
      item.choices.push_back(item_choice_from_json(element));
    }
  });
  assign_if_present(json_item, "format", [&](const nlohmann::json& value) {
    item.format = item_format_from_string(json_to_string(value, "format"));
  });
  assign_if_present(json_item, "topic", [&](const nlohmann::json& value) {
    item.topic = trim(json_to_string(value, "topic"));
  });
  assign_if_present(json_item, "subtopic", [&](const nlohmann::json& value) {
    item.subtopic = trim(json_to_string(value, "subtopic"));
  });
  assign_if_present(json_item, "explanation", [&](const nlohmann::json& value) {
    item.explanation = trim(json_to_string(value, "explanation"));
  });
  assign_if_present(json_item, "bloom_level", [&](const nlohmann::json& value) {
    item.bloom_level = trim(json_to_string(value, "bloom_level"));
  });
  assign_if_present(json_item, "learning_objective", [&](const nlohmann::json& value) {
    item.learning_objective = trim(json_to_string(value, "learning_objective"));
  });
  assign_if_present(json_item, "knowledge_unit_ids", [&](const nlohmann::json& value) {
    item.knowledge_unit_ids = json_to_string_vector(value, "knowledge_unit_ids");
  });
  return item;
}

ItemBank item_bank_from_json(const nlohmann::json& json_bank) {
  const nlohmann::json* items = &json_bank;
  if (json_bank.is_object()) {
    items = &require_field(json_bank, "items");
  }
  if (!items->is_array()) {
    throw std::invalid_argument("Item bank must be an array of items");
  }
  ItemBank bank;
  for (const auto& element : *items) {
    bank.add(item_template_from_json(element));
  }
  return bank;
}

nlohmann::json to_json(const LearnerProfile& learner) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = learner.id;
  json["name"] = learner.name;
  json["objectives"] = strings_to_json_array(learner.objectives);
  return json;
}

LearnerProfile learner_profile_from_json(const nlohmann::json& json_learner) {
  require_object(json_learner, "learner");
  LearnerProfile learner;
  assign_if_present(json_learner, "id", [&](const nlohmann::json& value) {
    learner.id = json_to_id(value, "id");
  });
  learner.name = trim(json_to_string(require_field(json_learner, "name"), "name"));
  assign_if_present(json_learner, "objectives", [&](const nlohmann::json& value) {
    for (const auto& objective : json_to_string_vector(value, "objectives")) {
      auto trimmed = trim(objective);
      if (!trimmed.empty()) {
        learner.objectives.push_back(std::move(trimmed));
      }
    }
  });
  return learner;
}

nlohmann::json to_json(const AbilityEstimate& estimate) {
  nlohmann::json json = nlohmann::json::object();
  json["theta"] = estimate.theta;
  json["standard_error"] = estimate.standard_error;
  json["method"] = estimate.method;
  json["timestamp_ms"] = estimate.timestamp_ms;
  return json;
}

AbilityEstimate ability_estimate_from_json(const nlohmann::json& json_estimate) {
  require_object(json_estimate, "ability estimate");
  AbilityEstimate estimate;
  estimate.theta = json_to_double(require_field(json_estimate, "theta"), "theta");
  estimate.standard_error =
      json_to_double(require_field(json_estimate, "standard_error"), "standard_error");
  estimate.method = json_to_string(require_field(json_estimate, "method"), "method");
  assign_if_present(json_estimate, "timestamp_ms", [&](const nlohmann::json& value) {
    estimate.timestamp_ms = json_to_int64(value, "timestamp_ms");
  });
  return estimate;
}

nlohmann::json to_json(const ItemResponse& response) {
  nlohmann::json json = nlohmann::json::object();
  json["item_id"] = response.item_id;
  json["is_correct"] = response.is_correct;
  json["score"] = response.score;
  json["response_time_ms"] = response.response_time_ms;
  json["raw_response"] = response.raw_response;
  json["ability_after"] = to_json(response.ability_after);
  return json;
}

ItemResponse item_response_from_json(const nlohmann::json& json_response) {
  require_object(json_response, "response");
  ItemResponse response;
  response.item_id = json_to_id(require_field(json_response, "item_id"), "item_id");
  response.is_correct = json_to_bool(require_field(json_response, "is_correct"), "is_correct");
  response.score = json_to_double(require_field(json_response, "score"), "score");
  assign_if_present(json_response, "response_time_ms", [&](const nlohmann::json& value) {
    response.response_time_ms = json_to_int(value, "response_time_ms");
  });
  assign_if_present(json_response, "raw_response", [&](const nlohmann::json& value) {
    response.raw_response = json_to_string(value, "raw_response");
  });
  response.ability_after = ability_estimate_from_json(require_field(json_response, "ability_after"));
  return response;
}

nlohmann::json to_json(const TerminationCriteria& criteria) {
  nlohmann::json json = nlohmann::json::object();
  json["target_standard_error"] = criteria.target_standard_error;
  json["max_items"] = criteria.max_items;
  if (criteria.mastery_theta.has_value()) {
    json["mastery_theta"] = criteria.mastery_theta.value();
  } else {
    json["mastery_theta"] = nullptr;
  }
  json["max_stall_count"] = criteria.max_stall_count;
  return json;
}

TerminationCriteria termination_criteria_from_json(const nlohmann::json& json_criteria) {
  require_object(json_criteria, "termination criteria");
  TerminationCriteria criteria = TerminationCriteria::defaults();
  assign_if_present(json_criteria, "target_standard_error", [&](const nlohmann::json& value) {
    criteria.target_standard_error = json_to_double(value, "target_standard_error");
  });
  assign_if_present(json_criteria, "max_items", [&](const nlohmann::json& value) {
    criteria.max_items = json_to_int(value, "max_items");
  });
  if (json_criteria.contains("mastery_theta")) {
    const auto& value = json_criteria.at("mastery_theta");
    if (value.is_null()) {
      criteria.mastery_theta.reset();
    } else {
      criteria.mastery_theta = json_to_double(value, "mastery_theta");
    }
  }
  assign_if_present(json_criteria, "max_stall_count", [&](const nlohmann::json& value) {
    criteria.max_stall_count = json_to_int(value, "max_stall_count");
  });
  criteria.validate();
  return criteria;
}

nlohmann::json to_json(const irt::EstimatorConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["max_iterations"] = config.max_iterations;
  json["convergence_epsilon"] = config.convergence_epsilon;
  json["theta_min"] = config.theta_min;
  json["theta_max"] = config.theta_max;
  json["max_newton_step"] = config.max_newton_step;
  json["min_prior_sd"] = config.min_prior_sd;
  return json;
}

irt::EstimatorConfig estimator_config_from_json(const nlohmann::json& json_config) {
  require_object(json_config, "estimator config");
  irt::EstimatorConfig config;
  assign_if_present(json_config, "max_iterations", [&](const nlohmann::json& value) {
    config.max_iterations = json_to_int(value, "max_iterations");
  });
  assign_if_present(json_config, "convergence_epsilon", [&](const nlohmann::json& value) {
    config.convergence_epsilon = json_to_double(value, "convergence_epsilon");
  });
  assign_if_present(json_config, "theta_min", [&](const nlohmann::json& value) {
    config.theta_min = json_to_double(value, "theta_min");
  });
  assign_if_present(json_config, "theta_max", [&](const nlohmann::json& value) {
    config.theta_max = json_to_double(value, "theta_max");
  });
  assign_if_present(json_config, "max_newton_step", [&](const nlohmann::json& value) {
    config.max_newton_step = json_to_double(value, "max_newton_step");
  });
  assign_if_present(json_config, "min_prior_sd", [&](const nlohmann::json& value) {
    config.min_prior_sd = json_to_double(value, "min_prior_sd");
  });
  config.validate();
  return config;
}

nlohmann::json to_json(const SessionConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["estimator"] = to_json(config.estimator);
  json["prior_theta"] = config.prior_theta;
  json["prior_standard_error"] = config.prior_standard_error;
  json["stall_epsilon"] = config.stall_epsilon;
  json["mastery_min_items"] = config.mastery_min_items;
  return json;
}

SessionConfig session_config_from_json(const nlohmann::json& json_config) {
  require_object(json_config, "session config");
  SessionConfig config;
  assign_if_present(json_config, "estimator", [&](const nlohmann::json& value) {
    config.estimator = estimator_config_from_json(value);
  });
  assign_if_present(json_config, "prior_theta", [&](const nlohmann::json& value) {
    config.prior_theta = json_to_double(value, "prior_theta");
  });
  assign_if_present(json_config, "prior_standard_error", [&](const nlohmann::json& value) {
    config.prior_standard_error = json_to_double(value, "prior_standard_error");
  });
  assign_if_present(json_config, "stall_epsilon", [&](const nlohmann::json& value) {
    config.stall_epsilon = json_to_double(value, "stall_epsilon");
  });
  assign_if_present(json_config, "mastery_min_items", [&](const nlohmann::json& value) {
    config.mastery_min_items = json_to_int(value, "mastery_min_items");
  });
  config.validate();
  return config;
}

nlohmann::json to_json(const SessionSnapshot& snapshot) {
  nlohmann::json json = nlohmann::json::object();
  json["schema_version"] = snapshot.schema_version;
  json["session_id"] = snapshot.session_id;
  json["learner"] = to_json(snapshot.learner);
  json["criteria"] = to_json(snapshot.criteria);
  json["config"] = to_json(snapshot.config);
  json["state"] = to_string(snapshot.state);
  if (snapshot.completion_reason == CompletionReason::None) {
    json["completion_reason"] = nullptr;
  } else {
    json["completion_reason"] = to_string(snapshot.completion_reason);
  }
  json["item_pool_ids"] = strings_to_json_array(snapshot.item_pool_ids);
  json["administered_item_ids"] = strings_to_json_array(snapshot.administered_item_ids);
  nlohmann::json responses = nlohmann::json::array();
  for (const auto& response : snapshot.responses) {
    responses.push_back(to_json(response));
  }
  json["responses"] = std::move(responses);
  nlohmann::json history = nlohmann::json::array();
  for (const auto& estimate : snapshot.ability_history) {
    history.push_back(to_json(estimate));
  }
  json["ability_history"] = std::move(history);
  json["stall_count"] = snapshot.stall_count;
  json["is_complete"] = snapshot.is_complete;
  return json;
}

SessionSnapshot session_snapshot_from_json(const nlohmann::json& json_snapshot) {
  require_object(json_snapshot, "session snapshot");
  SessionSnapshot snapshot;
  snapshot.schema_version =
      json_to_int(require_field(json_snapshot, "schema_version"), "schema_version");
  snapshot.session_id =
      json_to_string(require_field(json_snapshot, "session_id"), "session_id");
  snapshot.state = session_state_from_string(
      json_to_string(require_field(json_snapshot, "state"), "state"));
  if (snapshot.state != SessionState::NotStarted) {
    snapshot.learner = learner_profile_from_json(require_field(json_snapshot, "learner"));
    snapshot.criteria =
        termination_criteria_from_json(require_field(json_snapshot, "criteria"));
  }
  assign_if_present(json_snapshot, "config", [&](const nlohmann::json& value) {
    snapshot.config = session_config_from_json(value);
  });
  assign_if_present(json_snapshot, "completion_reason", [&](const nlohmann::json& value) {
    snapshot.completion_reason =
        completion_reason_from_string(json_to_string(value, "completion_reason"));
  });
  assign_if_present(json_snapshot, "item_pool_ids", [&](const nlohmann::json& value) {
    snapshot.item_pool_ids = json_to_string_vector(value, "item_pool_ids");
  });
  assign_if_present(json_snapshot, "administered_item_ids", [&](const nlohmann::json& value) {
    snapshot.administered_item_ids = json_to_string_vector(value, "administered_item_ids");
  });
  assign_if_present(json_snapshot, "responses", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'responses'");
    }
    for (const auto& element : value) {
      snapshot.responses.push_back(item_response_from_json(element));
    }
  });
  assign_if_present(json_snapshot, "ability_history", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'ability_history'");
    }
    for (const auto& element : value) {
      snapshot.ability_history.push_back(ability_estimate_from_json(element));
    }
  });
  assign_if_present(json_snapshot, "stall_count", [&](const nlohmann::json& value) {
    snapshot.stall_count = json_to_int(value, "stall_count");
  });
  snapshot.is_complete =
      json_to_bool(require_field(json_snapshot, "is_complete"), "is_complete");
  return snapshot;
}

nlohmann::json to_json(const SessionReport& report) {
  nlohmann::json json = nlohmann::json::object();
  json["session_id"] = report.session_id;
  json["learner_name"] = report.learner_name;
  json["final_theta"] = report.final_theta;
  json["standard_error"] = report.standard_error;
  json["correct_count"] = report.correct_count;
  json["total_count"] = report.total_count;
  json["accuracy_percent"] = report.accuracy_percent();
  json["is_complete"] = report.is_complete;
  json["completion_reason"] = to_string(report.completion_reason);
  json["average_response_time_ms"] = report.average_response_time_ms;
  nlohmann::json topics = nlohmann::json::object();
  for (const auto& [topic, score] : report.topic_performance) {
    topics[topic] = score;
  }
  json["topic_performance"] = std::move(topics);
  return json;
}

SessionReport session_report_from_json(const nlohmann::json& json_report) {
  require_object(json_report, "session report");
  SessionReport report;
  report.session_id = json_to_string(require_field(json_report, "session_id"), "session_id");
  report.learner_name =
      json_to_string(require_field(json_report, "learner_name"), "learner_name");
  report.final_theta = json_to_double(require_field(json_report, "final_theta"), "final_theta");
  report.standard_error =
      json_to_double(require_field(json_report, "standard_error"), "standard_error");
  report.correct_count =
      json_to_int(require_field(json_report, "correct_count"), "correct_count");
  report.total_count = json_to_int(require_field(json_report, "total_count"), "total_count");
  report.is_complete = json_to_bool(require_field(json_report, "is_complete"), "is_complete");
  assign_if_present(json_report, "completion_reason", [&](const nlohmann::json& value) {
    report.completion_reason =
        completion_reason_from_string(json_to_string(value, "completion_reason"));
  });
  assign_if_present(json_report, "average_response_time_ms", [&](const nlohmann::json& value) {
    report.average_response_time_ms = json_to_double(value, "average_response_time_ms");
  });
  assign_if_present(json_report, "topic_performance", [&](const nlohmann::json& value) {
    require_object(value, "topic_performance");
    for (const auto& entry : value.items()) {
      report.topic_performance.emplace(entry.key(), json_to_double(entry.value(), entry.key()));
    }
  });
  return report;
}

SessionRequest session_request_from_json(const nlohmann::json& json_request) {
  require_object(json_request, "session request");
  SessionRequest request;
  request.learner = learner_profile_from_json(require_field(json_request, "learner"));
  assign_if_present(json_request, "topic", [&](const nlohmann::json& value) {
    request.topic = json_to_string(value, "topic");
  });
  assign_if_present(json_request, "criteria", [&](const nlohmann::json& value) {
    request.criteria = termination_criteria_from_json(value);
  });
  return request;
}

ResponseSubmission response_submission_from_json(const nlohmann::json& json_submission) {
  require_object(json_submission, "response submission");
  ResponseSubmission submission;
  submission.item_id = json_to_id(require_field(json_submission, "item_id"), "item_id");
  submission.is_correct =
      json_to_bool(require_field(json_submission, "is_correct"), "is_correct");
  assign_if_present(json_submission, "score", [&](const nlohmann::json& value) {
    submission.score = json_to_double(value, "score");
  });
  assign_if_present(json_submission, "response_time_ms", [&](const nlohmann::json& value) {
    submission.response_time_ms = json_to_int(value, "response_time_ms");
  });
  assign_if_present(json_submission, "raw_response", [&](const nlohmann::json& value) {
    submission.raw_response = json_to_string(value, "raw_response");
  });
  return submission;
}

nlohmann::json to_json(const SessionEngine::Next& next) {
  nlohmann::json payload = nlohmann::json::object();
  if (const auto* item = std::get_if<ItemPtr>(&next)) {
    payload["type"] = "item";
    payload["item"] = to_json(**item);
  } else {
    payload["type"] = "report";
    payload["report"] = to_json(std::get<SessionReport>(next));
  }
  return payload;
}

} // namespace cat::bridge
