#pragma once

#include "types.hpp"
#include "../../irt/ability_estimator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace cat {

inline constexpr int kSnapshotSchemaVersion = 1;

struct SessionConfig {
  irt::EstimatorConfig estimator;
  double prior_theta = -1.5;
  double prior_standard_error = 1.0;
  // |delta theta| below this counts as a stalled update.
  double stall_epsilon = 0.01;
  // Mastery-based stop is honoured only after this many responses.
  int mastery_min_items = 5;

  void validate() const;
};

// Plain serialisable form of an AdaptiveSession.
struct SessionSnapshot {
  int schema_version = kSnapshotSchemaVersion;
  std::string session_id;
  LearnerProfile learner;
  TerminationCriteria criteria;
  SessionConfig config;
  SessionState state = SessionState::NotStarted;
  CompletionReason completion_reason = CompletionReason::None;
  std::vector<std::string> item_pool_ids;
  std::vector<std::string> administered_item_ids;
  std::vector<ItemResponse> responses;
  std::vector<AbilityEstimate> ability_history;
  int stall_count = 0;
  bool is_complete = false;
};

// One learner's adaptive test: NotStarted -> InProgress -> Completed.
//
// Mutated only through start(), advance_to_next_item() and record_response().
// Each of them validates first and commits last, so a throwing call leaves
// the session exactly as it was.
class AdaptiveSession {
public:
  explicit AdaptiveSession(std::string id, SessionConfig config = {});

  // Rebuilds a session from a snapshot. `pool` must hold the items named by
  // snapshot.item_pool_ids, in any order. Throws CatError(InvalidSnapshot).
  AdaptiveSession(const SessionSnapshot& snapshot, const ItemPool& pool);

  // Throws CatError(ItemPoolEmpty) for an empty pool and
  // CatError(InvalidSessionState) unless NotStarted.
  void start(LearnerProfile learner, ItemPool item_pool,
             std::optional<TerminationCriteria> criteria = std::nullopt);

  // Returns the most informative remaining item without changing the session.
  // When none is left the session completes (PoolExhausted) and nullptr is
  // returned.
  ItemPtr advance_to_next_item();

  // Accepts only the item advance_to_next_item() currently offers.
  const ItemResponse& record_response(const std::string& item_id, bool is_correct, double score,
                                      int response_time_ms, std::string raw_response);

  SessionSnapshot snapshot() const;

  const std::string& id() const noexcept { return id_; }
  const LearnerProfile& learner() const noexcept { return learner_; }
  const TerminationCriteria& criteria() const noexcept { return criteria_; }
  const SessionConfig& config() const noexcept { return config_; }
  SessionState state() const noexcept { return state_; }
  bool is_complete() const noexcept { return state_ == SessionState::Completed; }
  CompletionReason completion_reason() const noexcept { return completion_reason_; }
  const ItemPool& item_pool() const noexcept { return item_pool_; }
  const std::vector<std::string>& administered_item_ids() const noexcept {
    return administered_item_ids_;
  }
  const std::vector<ItemResponse>& responses() const noexcept { return responses_; }
  const std::vector<AbilityEstimate>& ability_history() const noexcept { return ability_history_; }
  const AbilityEstimate& current_ability() const;
  int stall_count() const noexcept { return stall_count_; }
  std::size_t remaining_item_count() const noexcept {
    return item_pool_.size() - administered_item_ids_.size();
  }

  ItemPtr find_item(const std::string& item_id) const;

private:
  void require_state(SessionState expected, const char* operation) const;
  void complete(CompletionReason reason);
  std::vector<irt::Observation> observations_with(const ItemTemplate& item,
                                                  bool is_correct) const;

  std::string id_;
  SessionConfig config_;
  irt::AbilityEstimator estimator_;
  LearnerProfile learner_;
  TerminationCriteria criteria_;
  ItemPool item_pool_;
  SessionState state_ = SessionState::NotStarted;
  CompletionReason completion_reason_ = CompletionReason::None;
  std::vector<std::string> administered_item_ids_;
  std::unordered_set<std::string> administered_lookup_;
  std::vector<ItemResponse> responses_;
  std::vector<AbilityEstimate> ability_history_;
  int stall_count_ = 0;
};

} // namespace cat
