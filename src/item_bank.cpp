#include "cat/item_bank.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>

namespace cat {
namespace {

std::string normalize_topic(std::string_view topic) {
  std::size_t begin = 0;
  std::size_t end = topic.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(topic[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(topic[end - 1]))) {
    --end;
  }
  std::string normalized;
  normalized.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(topic[i]))));
  }
  return normalized;
}

} // namespace

ItemBank::ItemBank(std::vector<ItemTemplate> items) {
  items_.reserve(items.size());
  for (auto& item : items) {
    add(std::move(item));
  }
}

void ItemBank::add(ItemTemplate item) {
  item.validate();
  if (index_.count(item.id) > 0) {
    throw std::invalid_argument("Duplicate item id in bank: " + item.id);
  }
  index_.emplace(item.id, items_.size());
  items_.push_back(std::make_shared<const ItemTemplate>(std::move(item)));
}

ItemPool ItemBank::by_topic(std::string_view topic) const {
  const auto wanted = normalize_topic(topic);
  ItemPool pool;
  std::copy_if(items_.begin(), items_.end(), std::back_inserter(pool),
               [&](const ItemPtr& item) { return normalize_topic(item->topic) == wanted; });
  return pool;
}

ItemPtr ItemBank::find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return items_[it->second];
}

} // namespace cat
