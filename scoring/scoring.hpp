#pragma once

#include "cat/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace cat::scoring {

// Score recorded when the caller supplies only correctness.
inline double dichotomous_score(bool is_correct) {
  return is_correct ? 1.0 : 0.0;
}

int correct_count(const std::vector<ItemResponse>& responses);

double aggregate_accuracy(const std::vector<ItemResponse>& responses);

double average_response_time(const std::vector<ItemResponse>& responses);

// Groups responses by the topic of the administered item (falling back to the
// item id for blank topics) and averages their scores.
std::map<std::string, double> topic_performance(const std::vector<ItemResponse>& responses,
                                                const ItemPool& pool);

} // namespace cat::scoring
