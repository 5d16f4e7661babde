#include "cat/session_report.hpp"

#include "../scoring/scoring.hpp"

namespace cat {

SessionReport build_report(const AdaptiveSession& session) {
  SessionReport report;
  report.session_id = session.id();
  report.learner_name = session.learner().name;
  report.is_complete = session.is_complete();
  report.completion_reason = session.completion_reason();

  const auto& responses = session.responses();
  report.correct_count = scoring::correct_count(responses);
  report.total_count = static_cast<int>(responses.size());
  report.average_response_time_ms = scoring::average_response_time(responses);
  report.topic_performance = scoring::topic_performance(responses, session.item_pool());

  if (!session.ability_history().empty()) {
    const auto& ability = session.current_ability();
    report.final_theta = ability.theta;
    report.standard_error = ability.standard_error;
  }
  return report;
}

} // namespace cat
