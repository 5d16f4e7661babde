#pragma once

#include "cat/types.hpp"

#include <string>
#include <unordered_set>

namespace cat::irt {

// Maximum-information selection. Among items not yet administered, returns the
// one with the highest Fisher information at `theta`; equal information goes
// to the lexicographically lowest item id. Returns nullptr when every item has
// been administered.
ItemPtr select_next(const ItemPool& pool, const std::unordered_set<std::string>& administered_ids,
                    double theta);

} // namespace cat::irt
