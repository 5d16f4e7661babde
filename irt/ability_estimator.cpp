#include "ability_estimator.hpp"

#include "probability_model.hpp"
#include "../src/debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cat::irt {
namespace {

constexpr double kMinTestInformation = 1e-12;

double clamped_probability(const ItemParameter& parameter, double theta) {
  return std::clamp(probability_correct(parameter, theta), kProbabilityFloor,
                    1.0 - kProbabilityFloor);
}

bool uniform_pattern(const std::vector<Observation>& history) {
  return std::all_of(history.begin(), history.end(), [&](const Observation& obs) {
    return obs.is_correct == history.front().is_correct;
  });
}

} // namespace

void EstimatorConfig::validate() const {
  if (max_iterations <= 0) {
    throw std::invalid_argument("max_iterations must be greater than 0");
  }
  if (!(convergence_epsilon > 0.0)) {
    throw std::invalid_argument("convergence_epsilon must be greater than 0");
  }
  if (!std::isfinite(theta_min) || !std::isfinite(theta_max) || theta_min >= theta_max) {
    throw std::invalid_argument("theta_min must be less than theta_max");
  }
  if (!(max_newton_step > 0.0)) {
    throw std::invalid_argument("max_newton_step must be greater than 0");
  }
  if (!(min_prior_sd > 0.0)) {
    throw std::invalid_argument("min_prior_sd must be greater than 0");
  }
}

double log_likelihood(const std::vector<Observation>& history, double theta) {
  double total = 0.0;
  for (const auto& obs : history) {
    const double p = clamped_probability(obs.parameter, theta);
    total += obs.is_correct ? std::log(p) : std::log(1.0 - p);
  }
  return total;
}

double test_information(const std::vector<Observation>& history, double theta) {
  double total = 0.0;
  for (const auto& obs : history) {
    total += fisher_information(obs.parameter, theta);
  }
  return total;
}

AbilityEstimator::AbilityEstimator() {
  config_.validate();
}

AbilityEstimator::AbilityEstimator(EstimatorConfig config) : config_(std::move(config)) {
  config_.validate();
}

AbilityEstimator::Derivatives AbilityEstimator::derivatives(
    const std::vector<Observation>& history, double theta) {
  Derivatives d;
  for (const auto& obs : history) {
    const double c = obs.parameter.guessing;
    const double span = 1.0 - c;
    if (span <= 0.0) {
      continue;
    }
    const double slope = kScalingConstant * obs.parameter.discrimination;
    const double p = clamped_probability(obs.parameter, theta);
    const double u = obs.is_correct ? 1.0 : 0.0;
    d.gradient += slope * (u - p) * (p - c) / (p * span);
    d.hessian += slope * slope * (p - c) * (1.0 - p) * (u * c - p * p) / (span * span * p * p);
  }
  return d;
}

std::variant<Converged, std::string> AbilityEstimator::maximum_likelihood(
    const std::vector<Observation>& history, double start) const {
  double theta = clamp_theta(start);
  for (int iteration = 1; iteration <= config_.max_iterations; ++iteration) {
    const auto d = derivatives(history, theta);
    if (!std::isfinite(d.gradient) || !std::isfinite(d.hessian)) {
      return std::string("non-finite derivatives at theta=") + std::to_string(theta);
    }
    double curvature = d.hessian;
    if (!(curvature < 0.0)) {
      // Fisher scoring: expected curvature is -I(theta), negative wherever items inform.
      curvature = -test_information(history, theta);
      if (!(curvature < 0.0)) {
        return std::string("no test information at theta=") + std::to_string(theta);
      }
    }
    const double step =
        std::clamp(-d.gradient / curvature, -config_.max_newton_step, config_.max_newton_step);
    const double next = theta + step;
    if (next < config_.theta_min || next > config_.theta_max) {
      return std::string("newton iterate left plausible range at theta=") + std::to_string(next);
    }
    if (std::abs(next - theta) < config_.convergence_epsilon) {
      Converged result;
      result.theta = next;
      result.iterations = iteration;
      return result;
    }
    theta = next;
  }
  return "no convergence within " + std::to_string(config_.max_iterations) + " iterations";
}

FallbackUsed AbilityEstimator::bayes_modal(const std::vector<Observation>& history,
                                           const AbilityEstimate& prior,
                                           std::string reason) const {
  const double mean = clamp_theta(prior.theta);
  const double sd = std::max(config_.min_prior_sd, prior.standard_error);
  const double precision = 1.0 / (sd * sd);

  double theta = mean;
  for (int iteration = 0; iteration < config_.max_iterations; ++iteration) {
    const auto d = derivatives(history, theta);
    const double gradient = d.gradient - (theta - mean) * precision;
    const double hessian = d.hessian - precision;
    double step = 0.0;
    if (hessian < 0.0) {
      step = -gradient / hessian;
    } else {
      // Posterior not concave here; take a bounded step uphill instead.
      step = gradient > 0.0 ? 0.5 * config_.max_newton_step : -0.5 * config_.max_newton_step;
    }
    step = std::clamp(step, -config_.max_newton_step, config_.max_newton_step);
    if (!std::isfinite(step)) {
      break;
    }
    const double next = clamp_theta(theta + step);
    const bool settled = std::abs(next - theta) < config_.convergence_epsilon;
    theta = next;
    if (settled) {
      break;
    }
  }

  FallbackUsed result;
  result.theta = clamp_theta(theta);
  result.standard_error = standard_error(history, result.theta, prior.standard_error);
  result.reason = std::move(reason);
  return result;
}

EstimationResult AbilityEstimator::estimate(const std::vector<Observation>& history,
                                            const AbilityEstimate& prior) const {
  return estimate(history, prior, prior.theta);
}

EstimationResult AbilityEstimator::estimate(const std::vector<Observation>& history,
                                            const AbilityEstimate& prior,
                                            double start_theta) const {
  if (history.empty()) {
    FallbackUsed result;
    result.theta = clamp_theta(prior.theta);
    result.standard_error = prior.standard_error;
    result.reason = "no responses";
    return result;
  }

  if (uniform_pattern(history)) {
    const char* reason =
        history.front().is_correct ? "all responses correct" : "all responses incorrect";
    detail::debug_log("estimator", std::string("bayes-modal fallback: ") + reason);
    return bayes_modal(history, prior, reason);
  }

  auto mle = maximum_likelihood(history, start_theta);
  if (auto* converged = std::get_if<Converged>(&mle)) {
    converged->theta = clamp_theta(converged->theta);
    converged->standard_error =
        standard_error(history, converged->theta, prior.standard_error);
    return *converged;
  }

  auto reason = std::get<std::string>(std::move(mle));
  detail::debug_log("estimator", "bayes-modal fallback: " + reason);
  return bayes_modal(history, prior, std::move(reason));
}

AbilityEstimate AbilityEstimator::update(const std::vector<Observation>& history,
                                         const AbilityEstimate& prior,
                                         std::int64_t timestamp_ms) const {
  return update(history, prior, prior.theta, timestamp_ms);
}

AbilityEstimate AbilityEstimator::update(const std::vector<Observation>& history,
                                         const AbilityEstimate& prior, double start_theta,
                                         std::int64_t timestamp_ms) const {
  if (history.empty()) {
    return prior;
  }
  const auto result = estimate(history, prior, start_theta);
  AbilityEstimate estimate;
  estimate.timestamp_ms = timestamp_ms;
  if (const auto* converged = std::get_if<Converged>(&result)) {
    estimate.theta = converged->theta;
    estimate.standard_error = converged->standard_error;
    estimate.method = estimation_method::kMle;
  } else {
    const auto& fallback = std::get<FallbackUsed>(result);
    estimate.theta = fallback.theta;
    estimate.standard_error = fallback.standard_error;
    estimate.method = estimation_method::kBayesModal;
  }
  return estimate;
}

double AbilityEstimator::standard_error(const std::vector<Observation>& history, double theta,
                                        double fallback) const {
  const double information = test_information(history, theta);
  if (!(information > kMinTestInformation)) {
    return fallback;
  }
  return 1.0 / std::sqrt(information);
}

double AbilityEstimator::clamp_theta(double theta) const {
  if (std::isnan(theta)) {
    return std::clamp(0.0, config_.theta_min, config_.theta_max);
  }
  return std::clamp(theta, config_.theta_min, config_.theta_max);
}

} // namespace cat::irt
