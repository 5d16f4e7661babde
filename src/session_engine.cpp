#include "cat/session_engine.hpp"

#include "../scoring/scoring.hpp"
#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace cat {
namespace {

struct SessionSlot {
  explicit SessionSlot(AdaptiveSession s) : session(std::move(s)) {}

  std::mutex mutex;
  AdaptiveSession session;
};

SessionEngine::Next next_for(AdaptiveSession& session) {
  if (session.is_complete()) {
    return build_report(session);
  }
  auto item = session.advance_to_next_item();
  if (!item) {
    return build_report(session);
  }
  return item;
}

class SessionEngineImpl : public SessionEngine {
public:
  SessionEngineImpl(std::shared_ptr<const ItemBank> bank, SessionConfig config)
      : bank_(std::move(bank)), config_(std::move(config)) {
    if (!bank_) {
      throw std::invalid_argument("SessionEngine requires an item bank");
    }
    config_.validate();
  }

  std::string create_session(const SessionRequest& request) override {
    ItemPool pool = request.topic.has_value() ? bank_->by_topic(*request.topic) : bank_->all();
    if (pool.empty()) {
      throw CatError(ErrorKind::ItemPoolEmpty,
                     "No items available for topic '" + request.topic.value_or("") + "'");
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    const std::string session_id = generate_session_id();
    AdaptiveSession session(session_id, config_);
    session.start(request.learner, std::move(pool), request.criteria);
    sessions_.emplace(session_id, std::make_shared<SessionSlot>(std::move(session)));
    detail::debug_log("engine", "created " + session_id + " for learner '" +
                                    request.learner.name + "'");
    return session_id;
  }

  Next next_item(const std::string& session_id) override {
    auto slot = get_slot(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return next_for(slot->session);
  }

  Next submit_response(const std::string& session_id,
                       const ResponseSubmission& submission) override {
    auto slot = get_slot(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto& session = slot->session;
    const double score =
        submission.score.value_or(scoring::dichotomous_score(submission.is_correct));
    const auto& response =
        session.record_response(submission.item_id, submission.is_correct, score,
                                submission.response_time_ms, submission.raw_response);
    detail::debug_log("engine", session_id + " item=" + response.item_id +
                                    " correct=" + (response.is_correct ? "1" : "0") +
                                    " theta=" + std::to_string(response.ability_after.theta) +
                                    " se=" +
                                    std::to_string(response.ability_after.standard_error));
    return next_for(session);
  }

  SessionReport report(const std::string& session_id) override {
    auto slot = get_slot(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return build_report(slot->session);
  }

  SessionReport end_session(const std::string& session_id) override {
    std::shared_ptr<SessionSlot> slot;
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      auto it = sessions_.find(session_id);
      if (it == sessions_.end()) {
        throw unknown_session(session_id);
      }
      slot = it->second;
      sessions_.erase(it);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    detail::debug_log("engine", "ended " + session_id);
    return build_report(slot->session);
  }

  nlohmann::json snapshot(const std::string& session_id) override {
    auto slot = get_slot(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return bridge::to_json(slot->session.snapshot());
  }

  std::string restore(const nlohmann::json& json_snapshot) override {
    SessionSnapshot parsed;
    try {
      parsed = bridge::session_snapshot_from_json(json_snapshot);
    } catch (const std::invalid_argument& ex) {
      throw CatError(ErrorKind::InvalidSnapshot,
                     std::string("Invalid session snapshot: ") + ex.what());
    } catch (const nlohmann::json::exception& ex) {
      throw CatError(ErrorKind::InvalidSnapshot,
                     std::string("Invalid session snapshot: ") + ex.what());
    }
    AdaptiveSession session(parsed, bank_->all());

    std::lock_guard<std::mutex> lock(registry_mutex_);
    const std::string session_id = session.id();
    if (sessions_.count(session_id) > 0) {
      throw CatError(ErrorKind::InvalidSnapshot, "Session " + session_id + " is already active");
    }
    sessions_.emplace(session_id, std::make_shared<SessionSlot>(std::move(session)));
    detail::debug_log("engine", "restored " + session_id);
    return session_id;
  }

  nlohmann::json debug_state(const std::string& session_id) override {
    auto slot = get_slot(session_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& session = slot->session;
    nlohmann::json state = nlohmann::json::object();
    state["session_id"] = session.id();
    state["state"] = to_string(session.state());
    state["completion_reason"] = to_string(session.completion_reason());
    state["learner_id"] = session.learner().id;
    state["pool_size"] = session.item_pool().size();
    state["administered"] = session.administered_item_ids().size();
    state["remaining"] = session.remaining_item_count();
    state["stall_count"] = session.stall_count();
    state["accuracy"] = scoring::aggregate_accuracy(session.responses());
    if (session.ability_history().empty()) {
      state["ability"] = nullptr;
    } else {
      state["ability"] = bridge::to_json(session.current_ability());
    }
    state["criteria"] = bridge::to_json(session.criteria());
    return state;
  }

  nlohmann::json capabilities() const override {
    nlohmann::json caps = nlohmann::json::object();
    caps["version"] = "v1";
    caps["model"] = "3PL";
    caps["snapshot_schema_version"] = kSnapshotSchemaVersion;
    nlohmann::json methods = nlohmann::json::array();
    methods.push_back(estimation_method::kPrior);
    methods.push_back(estimation_method::kMle);
    methods.push_back(estimation_method::kBayesModal);
    caps["estimation_methods"] = methods;
    nlohmann::json reasons = nlohmann::json::array();
    for (auto reason : {CompletionReason::MaxItems, CompletionReason::TargetStandardError,
                        CompletionReason::Mastery, CompletionReason::Stalled,
                        CompletionReason::PoolExhausted}) {
      reasons.push_back(to_string(reason));
    }
    caps["completion_reasons"] = reasons;
    caps["item_count"] = bank_->size();
    caps["default_criteria"] = bridge::to_json(TerminationCriteria::defaults());
    caps["config"] = bridge::to_json(config_);
    return caps;
  }

  std::vector<std::string> sessions_for_learner(const std::string& learner_id) const override {
    std::vector<std::pair<std::string, std::shared_ptr<SessionSlot>>> slots;
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      slots.assign(sessions_.begin(), sessions_.end());
    }
    std::vector<std::string> ids;
    for (const auto& [id, slot] : slots) {
      std::lock_guard<std::mutex> lock(slot->mutex);
      if (slot->session.learner().id == learner_id) {
        ids.push_back(id);
      }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
  }

  const ItemBank& item_bank() const override { return *bank_; }

private:
  static CatError unknown_session(const std::string& session_id) {
    return CatError(ErrorKind::UnknownSession, "Unknown session id: " + session_id);
  }

  std::shared_ptr<SessionSlot> get_slot(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      throw unknown_session(session_id);
    }
    return it->second;
  }

  // Caller holds registry_mutex_. Restored ids may occupy future counter values.
  std::string generate_session_id() {
    std::string id;
    do {
      std::ostringstream oss;
      oss << "sess-" << (++session_counter_);
      id = oss.str();
    } while (sessions_.count(id) > 0);
    return id;
  }

  std::shared_ptr<const ItemBank> bank_;
  SessionConfig config_;
  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionSlot>> sessions_;
  std::uint64_t session_counter_ = 0;
};

} // namespace

std::unique_ptr<SessionEngine> make_engine(std::shared_ptr<const ItemBank> bank,
                                           SessionConfig config) {
  return std::make_unique<SessionEngineImpl>(std::move(bank), std::move(config));
}

} // namespace cat
