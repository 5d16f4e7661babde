#pragma once

#include "types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cat {

// Fixed, validated collection of calibrated items. Insertion order is kept so
// pools handed to sessions are reproducible.
class ItemBank {
public:
  ItemBank() = default;
  explicit ItemBank(std::vector<ItemTemplate> items);

  // Validates the item and rejects duplicate ids (std::invalid_argument).
  void add(ItemTemplate item);

  const ItemPool& all() const noexcept { return items_; }

  // Case-insensitive match on the trimmed topic.
  ItemPool by_topic(std::string_view topic) const;

  ItemPtr find(const std::string& id) const;

  std::size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }

private:
  ItemPool items_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace cat
