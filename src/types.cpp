#include "cat/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace cat {
namespace {

bool is_blank(const std::string& value) {
  return std::all_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::isspace(ch) != 0; });
}

} // namespace

void ItemParameter::validate() const {
  if (!std::isfinite(difficulty)) {
    throw std::invalid_argument("difficulty must be finite");
  }
  if (!std::isfinite(discrimination) || discrimination <= 0.0) {
    throw std::invalid_argument("discrimination must be greater than 0");
  }
  if (!std::isfinite(guessing) || guessing < 0.0 || guessing >= 1.0) {
    throw std::invalid_argument("guessing must be within [0, 1)");
  }
}

void ItemTemplate::validate() const {
  if (id.empty()) {
    throw std::invalid_argument("item id is required");
  }
  if (is_blank(stem)) {
    throw std::invalid_argument("Stem is required for item " + id);
  }
  if (format == ItemFormat::MultipleChoice && choices.empty()) {
    throw std::invalid_argument("Multiple choice item " + id + " requires at least one choice");
  }
  parameter.validate();
}

void LearnerProfile::validate() const {
  if (is_blank(name)) {
    throw std::invalid_argument("Learner name is required");
  }
}

void TerminationCriteria::validate() const {
  if (!std::isfinite(target_standard_error) || target_standard_error < 0.0) {
    throw std::invalid_argument("target_standard_error must be non-negative");
  }
  if (max_items <= 0) {
    throw std::invalid_argument("max_items must be greater than 0");
  }
  if (mastery_theta.has_value() && !std::isfinite(mastery_theta.value())) {
    throw std::invalid_argument("mastery_theta must be finite when set");
  }
  if (max_stall_count <= 0) {
    throw std::invalid_argument("max_stall_count must be greater than 0");
  }
}

} // namespace cat
