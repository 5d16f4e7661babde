#pragma once

#include "adaptive_session.hpp"
#include "types.hpp"

#include <map>
#include <string>

namespace cat {

struct SessionReport {
  std::string session_id;
  std::string learner_name;
  double final_theta = 0.0;
  double standard_error = 0.0;
  int correct_count = 0;
  int total_count = 0;
  bool is_complete = false;
  CompletionReason completion_reason = CompletionReason::None;
  double average_response_time_ms = 0.0;
  // Average score per item topic; items without a topic are keyed by id.
  std::map<std::string, double> topic_performance;

  double accuracy_percent() const {
    if (total_count <= 0) {
      return 0.0;
    }
    return static_cast<double>(correct_count) / static_cast<double>(total_count) * 100.0;
  }
};

SessionReport build_report(const AdaptiveSession& session);

} // namespace cat
