#include "cat/adaptive_session.hpp"

#include "../irt/item_selector.hpp"
#include "../irt/termination.hpp"
#include "debug_log.hpp"

#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace cat {
namespace {

[[noreturn]] void invalid_snapshot(const std::string& message) {
  throw CatError(ErrorKind::InvalidSnapshot, "Invalid session snapshot: " + message);
}

SessionConfig checked_snapshot_config(const SessionConfig& config) {
  try {
    config.validate();
  } catch (const std::invalid_argument& ex) {
    invalid_snapshot(ex.what());
  }
  return config;
}

} // namespace

void SessionConfig::validate() const {
  estimator.validate();
  if (!std::isfinite(prior_theta)) {
    throw std::invalid_argument("prior_theta must be finite");
  }
  if (!std::isfinite(prior_standard_error) || prior_standard_error <= 0.0) {
    throw std::invalid_argument("prior_standard_error must be greater than 0");
  }
  if (!std::isfinite(stall_epsilon) || stall_epsilon < 0.0) {
    throw std::invalid_argument("stall_epsilon must be non-negative");
  }
  if (mastery_min_items < 0) {
    throw std::invalid_argument("mastery_min_items must be non-negative");
  }
}

AdaptiveSession::AdaptiveSession(std::string id, SessionConfig config)
    : id_(std::move(id)), config_(std::move(config)), estimator_(config_.estimator) {
  config_.validate();
}

AdaptiveSession::AdaptiveSession(const SessionSnapshot& snapshot, const ItemPool& pool)
    : id_(snapshot.session_id),
      config_(checked_snapshot_config(snapshot.config)),
      estimator_(config_.estimator) {
  if (snapshot.schema_version != kSnapshotSchemaVersion) {
    invalid_snapshot("unsupported schema_version " + std::to_string(snapshot.schema_version));
  }
  if (snapshot.session_id.empty()) {
    invalid_snapshot("session_id is required");
  }
  if (snapshot.is_complete != (snapshot.state == SessionState::Completed)) {
    invalid_snapshot("is_complete does not match state " + to_string(snapshot.state));
  }
  if ((snapshot.completion_reason != CompletionReason::None) != snapshot.is_complete) {
    invalid_snapshot("completion_reason does not match completion flag");
  }
  if (snapshot.stall_count < 0) {
    invalid_snapshot("stall_count must be non-negative");
  }

  if (snapshot.state == SessionState::NotStarted) {
    if (!snapshot.item_pool_ids.empty() || !snapshot.administered_item_ids.empty() ||
        !snapshot.responses.empty() || !snapshot.ability_history.empty()) {
      invalid_snapshot("a session that has not started cannot carry items or history");
    }
    return;
  }

  try {
    snapshot.learner.validate();
    snapshot.criteria.validate();
  } catch (const std::invalid_argument& ex) {
    invalid_snapshot(ex.what());
  }
  if (snapshot.item_pool_ids.empty()) {
    invalid_snapshot("item pool is empty");
  }

  std::unordered_map<std::string, ItemPtr> available;
  for (const auto& item : pool) {
    if (item) {
      available.emplace(item->id, item);
    }
  }
  ItemPool restored_pool;
  restored_pool.reserve(snapshot.item_pool_ids.size());
  std::unordered_set<std::string> pool_ids;
  for (const auto& item_id : snapshot.item_pool_ids) {
    if (!pool_ids.insert(item_id).second) {
      invalid_snapshot("duplicate pool item " + item_id);
    }
    auto it = available.find(item_id);
    if (it == available.end()) {
      invalid_snapshot("pool item " + item_id + " is not in the item bank");
    }
    restored_pool.push_back(it->second);
  }

  if (snapshot.responses.size() != snapshot.administered_item_ids.size()) {
    invalid_snapshot("responses and administered_item_ids differ in length");
  }
  if (snapshot.ability_history.size() != snapshot.responses.size() + 1) {
    invalid_snapshot("ability_history must hold one entry per response plus the prior");
  }
  std::unordered_set<std::string> administered;
  for (std::size_t i = 0; i < snapshot.administered_item_ids.size(); ++i) {
    const auto& item_id = snapshot.administered_item_ids[i];
    if (pool_ids.count(item_id) == 0) {
      invalid_snapshot("administered item " + item_id + " is not in the pool");
    }
    if (!administered.insert(item_id).second) {
      invalid_snapshot("item " + item_id + " administered twice");
    }
    if (snapshot.responses[i].item_id != item_id) {
      invalid_snapshot("response " + std::to_string(i) + " does not match administered item");
    }
    if (snapshot.responses[i].ability_after != snapshot.ability_history[i + 1]) {
      invalid_snapshot("response " + std::to_string(i) + " does not match ability history");
    }
  }

  learner_ = snapshot.learner;
  criteria_ = snapshot.criteria;
  item_pool_ = std::move(restored_pool);
  state_ = snapshot.state;
  completion_reason_ = snapshot.completion_reason;
  administered_item_ids_ = snapshot.administered_item_ids;
  administered_lookup_ = std::move(administered);
  responses_ = snapshot.responses;
  ability_history_ = snapshot.ability_history;
  stall_count_ = snapshot.stall_count;
  detail::debug_log("session", "restored " + id_ + " state=" + to_string(state_) +
                                   " responses=" + std::to_string(responses_.size()));
}

void AdaptiveSession::start(LearnerProfile learner, ItemPool item_pool,
                            std::optional<TerminationCriteria> criteria) {
  require_state(SessionState::NotStarted, "start");
  learner.validate();
  if (item_pool.empty()) {
    throw CatError(ErrorKind::ItemPoolEmpty, "No items available for the selected topic.");
  }
  std::unordered_set<std::string> ids;
  for (const auto& item : item_pool) {
    if (!item) {
      throw std::invalid_argument("Item pool contains an empty entry");
    }
    if (!ids.insert(item->id).second) {
      throw std::invalid_argument("Item pool contains duplicate id " + item->id);
    }
  }
  TerminationCriteria resolved = criteria.value_or(TerminationCriteria::defaults());
  resolved.validate();

  AbilityEstimate prior;
  prior.theta = config_.prior_theta;
  prior.standard_error = config_.prior_standard_error;
  prior.method = estimation_method::kPrior;
  prior.timestamp_ms = now_ms();

  learner_ = std::move(learner);
  item_pool_ = std::move(item_pool);
  criteria_ = resolved;
  ability_history_.assign(1, prior);
  state_ = SessionState::InProgress;
  detail::debug_log("session", id_ + " started with " + std::to_string(item_pool_.size()) +
                                   " items");
}

ItemPtr AdaptiveSession::advance_to_next_item() {
  require_state(SessionState::InProgress, "advance_to_next_item");
  auto next = irt::select_next(item_pool_, administered_lookup_, current_ability().theta);
  if (!next) {
    complete(CompletionReason::PoolExhausted);
  }
  return next;
}

const ItemResponse& AdaptiveSession::record_response(const std::string& item_id, bool is_correct,
                                                     double score, int response_time_ms,
                                                     std::string raw_response) {
  require_state(SessionState::InProgress, "record_response");
  if (!std::isfinite(score) || score < 0.0 || score > 1.0) {
    throw std::invalid_argument("score must be within [0, 1]");
  }
  if (response_time_ms < 0) {
    throw std::invalid_argument("response_time_ms must be non-negative");
  }

  const auto item = find_item(item_id);
  if (!item) {
    throw CatError(ErrorKind::UnknownOrDuplicateItem, "Unknown item id: " + item_id);
  }
  if (administered_lookup_.count(item_id) > 0) {
    throw CatError(ErrorKind::UnknownOrDuplicateItem, "Item already administered: " + item_id);
  }
  const auto offered = irt::select_next(item_pool_, administered_lookup_, current_ability().theta);
  if (!offered || offered->id != item_id) {
    throw CatError(ErrorKind::UnknownOrDuplicateItem,
                   "Item " + item_id + " is not the item currently offered");
  }

  const auto& previous = current_ability();
  const auto updated =
      estimator_.update(observations_with(*item, is_correct), ability_history_.front(),
                        previous.theta, now_ms());
  const int stall_count =
      std::abs(updated.theta - previous.theta) < config_.stall_epsilon ? stall_count_ + 1 : 0;
  const int administered_count = static_cast<int>(responses_.size()) + 1;
  const auto reason = irt::evaluate_termination(updated, administered_count, stall_count,
                                                criteria_, config_.mastery_min_items);

  ItemResponse response;
  response.item_id = item_id;
  response.is_correct = is_correct;
  response.score = score;
  response.response_time_ms = response_time_ms;
  response.raw_response = std::move(raw_response);
  response.ability_after = updated;

  administered_item_ids_.reserve(administered_item_ids_.size() + 1);
  responses_.reserve(responses_.size() + 1);
  ability_history_.reserve(ability_history_.size() + 1);
  administered_lookup_.insert(item_id);
  administered_item_ids_.push_back(item_id);
  responses_.push_back(std::move(response));
  ability_history_.push_back(updated);
  stall_count_ = stall_count;

  if (reason != CompletionReason::None) {
    complete(reason);
  }
  return responses_.back();
}

SessionSnapshot AdaptiveSession::snapshot() const {
  SessionSnapshot snapshot;
  snapshot.session_id = id_;
  snapshot.learner = learner_;
  snapshot.criteria = criteria_;
  snapshot.config = config_;
  snapshot.state = state_;
  snapshot.completion_reason = completion_reason_;
  snapshot.item_pool_ids.reserve(item_pool_.size());
  for (const auto& item : item_pool_) {
    snapshot.item_pool_ids.push_back(item->id);
  }
  snapshot.administered_item_ids = administered_item_ids_;
  snapshot.responses = responses_;
  snapshot.ability_history = ability_history_;
  snapshot.stall_count = stall_count_;
  snapshot.is_complete = is_complete();
  return snapshot;
}

const AbilityEstimate& AdaptiveSession::current_ability() const {
  if (ability_history_.empty()) {
    throw CatError(ErrorKind::InvalidSessionState, "Session " + id_ + " has not started");
  }
  return ability_history_.back();
}

ItemPtr AdaptiveSession::find_item(const std::string& item_id) const {
  for (const auto& item : item_pool_) {
    if (item->id == item_id) {
      return item;
    }
  }
  return nullptr;
}

void AdaptiveSession::require_state(SessionState expected, const char* operation) const {
  if (state_ != expected) {
    throw CatError(ErrorKind::InvalidSessionState,
                   std::string("Cannot ") + operation + " in state " + to_string(state_));
  }
}

void AdaptiveSession::complete(CompletionReason reason) {
  state_ = SessionState::Completed;
  completion_reason_ = reason;
  detail::debug_log("session", id_ + " completed reason=" + to_string(reason) +
                                   " responses=" + std::to_string(responses_.size()));
}

std::vector<irt::Observation> AdaptiveSession::observations_with(const ItemTemplate& item,
                                                                 bool is_correct) const {
  std::vector<irt::Observation> history;
  history.reserve(responses_.size() + 1);
  for (const auto& response : responses_) {
    const auto administered = find_item(response.item_id);
    if (!administered) {
      throw std::logic_error("Administered item missing from pool: " + response.item_id);
    }
    history.push_back({administered->parameter, response.is_correct});
  }
  history.push_back({item.parameter, is_correct});
  return history;
}

} // namespace cat
