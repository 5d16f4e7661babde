#pragma once

#include "adaptive_session.hpp"
#include "item_bank.hpp"
#include "session_report.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cat {

struct SessionRequest {
  LearnerProfile learner;
  // Restricts the pool to one topic of the bank; the whole bank otherwise.
  std::optional<std::string> topic;
  std::optional<TerminationCriteria> criteria;
};

struct ResponseSubmission {
  std::string item_id;
  bool is_correct = false;
  // Defaults to 1.0 / 0.0 from is_correct.
  std::optional<double> score;
  int response_time_ms = 0;
  std::string raw_response;
};

// Owns every live session for one item bank. Calls for the same session are
// serialised; distinct sessions may be driven from different threads.
class SessionEngine {
public:
  virtual ~SessionEngine() = default;

  virtual std::string create_session(const SessionRequest& request) = 0;

  using Next = std::variant<ItemPtr, SessionReport>;

  virtual Next next_item(const std::string& session_id) = 0;

  virtual Next submit_response(const std::string& session_id,
                               const ResponseSubmission& submission) = 0;

  virtual SessionReport report(const std::string& session_id) = 0;

  // Removes the session from the engine and returns its final report.
  virtual SessionReport end_session(const std::string& session_id) = 0;

  virtual nlohmann::json snapshot(const std::string& session_id) = 0;

  // Re-registers a session from snapshot(); the id is kept. Throws
  // CatError(InvalidSnapshot) for malformed input or an id already in use.
  virtual std::string restore(const nlohmann::json& snapshot) = 0;

  virtual nlohmann::json debug_state(const std::string& session_id) = 0;

  virtual nlohmann::json capabilities() const = 0;

  virtual std::vector<std::string> sessions_for_learner(const std::string& learner_id) const = 0;

  virtual const ItemBank& item_bank() const = 0;
};

std::unique_ptr<SessionEngine> make_engine(std::shared_ptr<const ItemBank> bank,
                                           SessionConfig config = {});

} // namespace cat
