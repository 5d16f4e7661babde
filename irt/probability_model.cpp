#include "probability_model.hpp"

#include <algorithm>
#include <cmath>

namespace cat::irt {

double probability_correct(const ItemParameter& parameter, double theta) {
  const double exponent =
      std::clamp(-kScalingConstant * parameter.discrimination * (theta - parameter.difficulty),
                 -kExponentLimit, kExponentLimit);
  const double logistic = 1.0 / (1.0 + std::exp(exponent));
  return parameter.guessing + (1.0 - parameter.guessing) * logistic;
}

double fisher_information(const ItemParameter& parameter, double theta) {
  const double span = 1.0 - parameter.guessing;
  if (span <= 0.0) {
    return 0.0;
  }
  const double p =
      std::clamp(probability_correct(parameter, theta), kProbabilityFloor, 1.0 - kProbabilityFloor);
  const double q = 1.0 - p;
  const double slope = kScalingConstant * parameter.discrimination;
  const double ratio = (p - parameter.guessing) / span;
  const double information = slope * slope * (q / p) * ratio * ratio;
  return std::max(0.0, information);
}

double max_information_theta(const ItemParameter& parameter) {
  const double c = std::max(0.0, parameter.guessing);
  const double shift = std::log((1.0 + std::sqrt(1.0 + 8.0 * c)) / 2.0);
  return parameter.difficulty + shift / (kScalingConstant * parameter.discrimination);
}

} // namespace cat::irt
