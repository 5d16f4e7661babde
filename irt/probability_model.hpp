#pragma once

#include "cat/types.hpp"

namespace cat::irt {

// Logistic scaling constant that makes the 3PL logistic curve track the
// normal ogive.
inline constexpr double kScalingConstant = 1.7;
// Bound on the exponent handed to std::exp.
inline constexpr double kExponentLimit = 35.0;
// Distance kept between p and {0, 1} before dividing by p or q.
inline constexpr double kProbabilityFloor = 1e-9;

// p(theta) = c + (1 - c) / (1 + exp(-D a (theta - b))), always within [c, 1).
double probability_correct(const ItemParameter& parameter, double theta);

// I(theta) = (D a)^2 (q / p) ((p - c) / (1 - c))^2. Zero when 1 - c <= 0.
double fisher_information(const ItemParameter& parameter, double theta);

// Location of the information maximum. Equals b for c = 0 and moves above b
// by ln((1 + sqrt(1 + 8c)) / 2) / (D a) as guessing grows.
double max_information_theta(const ItemParameter& parameter);

} // namespace cat::irt
