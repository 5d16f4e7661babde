#include "item_selector.hpp"

#include "probability_model.hpp"

namespace cat::irt {

ItemPtr select_next(const ItemPool& pool, const std::unordered_set<std::string>& administered_ids,
                    double theta) {
  ItemPtr best;
  double best_information = 0.0;
  for (const auto& item : pool) {
    if (!item || administered_ids.count(item->id) > 0) {
      continue;
    }
    const double information = fisher_information(item->parameter, theta);
    if (!best || information > best_information ||
        (information == best_information && item->id < best->id)) {
      best = item;
      best_information = information;
    }
  }
  return best;
}

} // namespace cat::irt
