#include "termination.hpp"

namespace cat::irt {

CompletionReason evaluate_termination(const AbilityEstimate& ability, int items_administered,
                                      int stall_count, const TerminationCriteria& criteria,
                                      int mastery_min_items) {
  if (items_administered >= criteria.max_items) {
    return CompletionReason::MaxItems;
  }
  if (ability.standard_error <= criteria.target_standard_error) {
    return CompletionReason::TargetStandardError;
  }
  if (criteria.mastery_theta.has_value() && ability.theta >= criteria.mastery_theta.value() &&
      items_administered >= mastery_min_items) {
    return CompletionReason::Mastery;
  }
  if (stall_count >= criteria.max_stall_count) {
    return CompletionReason::Stalled;
  }
  return CompletionReason::None;
}

} // namespace cat::irt
