#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cat {

struct ItemParameter {
  double difficulty = 0.0;
  double discrimination = 1.0;
  double guessing = 0.2;

  void validate() const;

  bool operator==(const ItemParameter& other) const {
    return difficulty == other.difficulty && discrimination == other.discrimination &&
           guessing == other.guessing;
  }
  bool operator!=(const ItemParameter& other) const { return !(*this == other); }
};

enum class ItemFormat {
  MultipleChoice,
  ShortAnswer,
  TrueFalse
};

inline std::string to_string(ItemFormat format) {
  switch (format) {
    case ItemFormat::MultipleChoice: return "multiple_choice";
    case ItemFormat::ShortAnswer: return "short_answer";
    case ItemFormat::TrueFalse: return "true_false";
  }
  return "multiple_choice";
}

inline ItemFormat item_format_from_string(const std::string& value) {
  if (value == "multiple_choice") {
    return ItemFormat::MultipleChoice;
  }
  if (value == "short_answer") {
    return ItemFormat::ShortAnswer;
  }
  if (value == "true_false") {
    return ItemFormat::TrueFalse;
  }
  throw std::invalid_argument("Unknown item format: " + value);
}

struct ItemChoice {
  std::string id;
  std::string text;
  bool is_correct = false;
};

// The engine only reads `id` and `parameter`; everything else is carried for
// the host application.
struct ItemTemplate {
  std::string id;
  std::string stem;
  std::vector<ItemChoice> choices;
  ItemFormat format = ItemFormat::MultipleChoice;
  ItemParameter parameter;
  std::string topic;
  std::string subtopic;
  std::string explanation;
  std::string bloom_level = "Apply";
  std::string learning_objective;
  std::vector<std::string> knowledge_unit_ids;

  void validate() const;
};

using ItemPtr = std::shared_ptr<const ItemTemplate>;
using ItemPool = std::vector<ItemPtr>;

struct LearnerProfile {
  std::string id;
  std::string name;
  std::vector<std::string> objectives;

  void validate() const;
};

namespace estimation_method {
inline constexpr const char* kPrior = "Prior";
inline constexpr const char* kMle = "MLE";
inline constexpr const char* kBayesModal = "Bayes-Modal";
} // namespace estimation_method

struct AbilityEstimate {
  double theta = 0.0;
  double standard_error = 1.0;
  std::string method = estimation_method::kPrior;
  std::int64_t timestamp_ms = 0;

  double information() const {
    if (standard_error <= 0.0) {
      return 0.0;
    }
    return 1.0 / (standard_error * standard_error);
  }

  bool operator==(const AbilityEstimate& other) const {
    return theta == other.theta && standard_error == other.standard_error &&
           method == other.method && timestamp_ms == other.timestamp_ms;
  }
  bool operator!=(const AbilityEstimate& other) const { return !(*this == other); }
};

struct ItemResponse {
  std::string item_id;
  bool is_correct = false;
  double score = 0.0;
  int response_time_ms = 0;
  std::string raw_response;
  AbilityEstimate ability_after;

  bool operator==(const ItemResponse& other) const {
    return item_id == other.item_id && is_correct == other.is_correct && score == other.score &&
           response_time_ms == other.response_time_ms && raw_response == other.raw_response &&
           ability_after == other.ability_after;
  }
  bool operator!=(const ItemResponse& other) const { return !(*this == other); }
};

struct TerminationCriteria {
  double target_standard_error = 0.3;
  int max_items = 25;
  std::optional<double> mastery_theta = 1.2;
  int max_stall_count = 3;

  static TerminationCriteria defaults() { return TerminationCriteria{}; }

  void validate() const;

  bool operator==(const TerminationCriteria& other) const {
    return target_standard_error == other.target_standard_error &&
           max_items == other.max_items && mastery_theta == other.mastery_theta &&
           max_stall_count == other.max_stall_count;
  }
  bool operator!=(const TerminationCriteria& other) const { return !(*this == other); }
};

enum class SessionState {
  NotStarted,
  InProgress,
  Completed
};

inline std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::NotStarted: return "not_started";
    case SessionState::InProgress: return "in_progress";
    case SessionState::Completed: return "completed";
  }
  return "not_started";
}

inline SessionState session_state_from_string(const std::string& value) {
  if (value == "not_started") {
    return SessionState::NotStarted;
  }
  if (value == "in_progress") {
    return SessionState::InProgress;
  }
  if (value == "completed") {
    return SessionState::Completed;
  }
  throw std::invalid_argument("Unknown session state: " + value);
}

enum class CompletionReason {
  None,
  MaxItems,
  TargetStandardError,
  Mastery,
  Stalled,
  PoolExhausted
};

inline std::string to_string(CompletionReason reason) {
  switch (reason) {
    case CompletionReason::None: return "none";
    case CompletionReason::MaxItems: return "max_items";
    case CompletionReason::TargetStandardError: return "target_standard_error";
    case CompletionReason::Mastery: return "mastery";
    case CompletionReason::Stalled: return "stalled";
    case CompletionReason::PoolExhausted: return "pool_exhausted";
  }
  return "none";
}

inline CompletionReason completion_reason_from_string(const std::string& value) {
  if (value == "none") {
    return CompletionReason::None;
  }
  if (value == "max_items") {
    return CompletionReason::MaxItems;
  }
  if (value == "target_standard_error") {
    return CompletionReason::TargetStandardError;
  }
  if (value == "mastery") {
    return CompletionReason::Mastery;
  }
  if (value == "stalled") {
    return CompletionReason::Stalled;
  }
  if (value == "pool_exhausted") {
    return CompletionReason::PoolExhausted;
  }
  throw std::invalid_argument("Unknown completion reason: " + value);
}

enum class ErrorKind {
  ItemPoolEmpty,
  InvalidSessionState,
  UnknownOrDuplicateItem,
  UnknownSession,
  InvalidSnapshot
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ItemPoolEmpty: return "ItemPoolEmpty";
    case ErrorKind::InvalidSessionState: return "InvalidSessionState";
    case ErrorKind::UnknownOrDuplicateItem: return "UnknownOrDuplicateItem";
    case ErrorKind::UnknownSession: return "UnknownSession";
    case ErrorKind::InvalidSnapshot: return "InvalidSnapshot";
  }
  return "InvalidSessionState";
}

class CatError : public std::runtime_error {
public:
  CatError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

inline std::int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace cat
