#include "scoring.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace cat::scoring {
namespace {

std::string group_key(const ItemTemplate* item, const std::string& item_id) {
  if (item == nullptr) {
    return item_id;
  }
  const auto& topic = item->topic;
  const bool blank = std::all_of(topic.begin(), topic.end(),
                                 [](unsigned char ch) { return std::isspace(ch) != 0; });
  return blank ? item_id : topic;
}

} // namespace

int correct_count(const std::vector<ItemResponse>& responses) {
  int correct = 0;
  for (const auto& r : responses) {
    if (r.is_correct) {
      ++correct;
    }
  }
  return correct;
}

double aggregate_accuracy(const std::vector<ItemResponse>& responses) {
  if (responses.empty()) {
    return 0.0;
  }
  return static_cast<double>(correct_count(responses)) / static_cast<double>(responses.size());
}

double average_response_time(const std::vector<ItemResponse>& responses) {
  if (responses.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto& r : responses) {
    total += static_cast<double>(r.response_time_ms);
  }
  return total / static_cast<double>(responses.size());
}

std::map<std::string, double> topic_performance(const std::vector<ItemResponse>& responses,
                                                const ItemPool& pool) {
  std::unordered_map<std::string, const ItemTemplate*> lookup;
  for (const auto& item : pool) {
    if (item) {
      lookup.emplace(item->id, item.get());
    }
  }

  std::map<std::string, std::pair<double, int>> sums;
  for (const auto& r : responses) {
    auto it = lookup.find(r.item_id);
    const auto key = group_key(it == lookup.end() ? nullptr : it->second, r.item_id);
    auto& entry = sums[key];
    entry.first += r.score;
    entry.second += 1;
  }

  std::map<std::string, double> averages;
  for (const auto& [key, entry] : sums) {
    averages.emplace(key, entry.first / static_cast<double>(entry.second));
  }
  return averages;
}

} // namespace cat::scoring
