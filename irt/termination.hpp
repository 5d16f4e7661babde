#pragma once

#include "cat/types.hpp"

namespace cat::irt {

inline constexpr int kDefaultMasteryMinItems = 5;

// Evaluates the stop conditions in fixed priority order and returns the first
// one that holds, or CompletionReason::None to continue:
//   1) items_administered >= max_items
//   2) standard error <= target
//   3) theta >= mastery_theta, once at least mastery_min_items were answered
//   4) stall_count >= max_stall_count
CompletionReason evaluate_termination(const AbilityEstimate& ability, int items_administered,
                                      int stall_count, const TerminationCriteria& criteria,
                                      int mastery_min_items = kDefaultMasteryMinItems);

inline bool should_stop(const AbilityEstimate& ability, int items_administered, int stall_count,
                        const TerminationCriteria& criteria,
                        int mastery_min_items = kDefaultMasteryMinItems) {
  return evaluate_termination(ability, items_administered, stall_count, criteria,
                              mastery_min_items) != CompletionReason::None;
}

} // namespace cat::irt
