#pragma once

#include "cat/types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cat::irt {

struct EstimatorConfig {
  int max_iterations = 25;
  double convergence_epsilon = 1e-4;
  double theta_min = -4.0;
  double theta_max = 4.0;
  // Largest change of theta a single Newton-Raphson iteration may apply.
  double max_newton_step = 1.0;
  // Lower bound for the prior standard deviation used by the Bayes-modal path.
  double min_prior_sd = 0.05;

  void validate() const;
};

struct Observation {
  ItemParameter parameter;
  bool is_correct = false;
};

struct Converged {
  double theta = 0.0;
  double standard_error = 0.0;
  int iterations = 0;
};

struct FallbackUsed {
  double theta = 0.0;
  double standard_error = 0.0;
  std::string reason;
};

using EstimationResult = std::variant<Converged, FallbackUsed>;

double log_likelihood(const std::vector<Observation>& history, double theta);

double test_information(const std::vector<Observation>& history, double theta);

// Maximum likelihood ability estimation for the 3PL model.
//
// Mixed response patterns are solved by Newton-Raphson on the log-likelihood,
// started from `start_theta`. Where the observed curvature is not negative the
// iteration takes a Fisher-scoring step (curvature replaced by -sum I_i). Uniform patterns (all correct or all incorrect) have no interior maximum, so
// they, and any Newton run that fails to converge inside the plausible range,
// are solved as the posterior mode under N(prior.theta, prior.standard_error^2).
// The returned theta is always finite and inside [theta_min, theta_max].
class AbilityEstimator {
public:
  AbilityEstimator();
  explicit AbilityEstimator(EstimatorConfig config);

  const EstimatorConfig& config() const noexcept { return config_; }

  EstimationResult estimate(const std::vector<Observation>& history,
                            const AbilityEstimate& prior) const;
  EstimationResult estimate(const std::vector<Observation>& history, const AbilityEstimate& prior,
                            double start_theta) const;

  // Same as estimate(), folded into an AbilityEstimate whose method names the
  // path taken. An empty history returns the prior unchanged.
  AbilityEstimate update(const std::vector<Observation>& history, const AbilityEstimate& prior,
                         std::int64_t timestamp_ms) const;
  AbilityEstimate update(const std::vector<Observation>& history, const AbilityEstimate& prior,
                         double start_theta, std::int64_t timestamp_ms) const;

private:
  struct Derivatives {
    double gradient = 0.0;
    double hessian = 0.0;
  };

  static Derivatives derivatives(const std::vector<Observation>& history, double theta);

  std::variant<Converged, std::string> maximum_likelihood(const std::vector<Observation>& history,
                                                          double start) const;
  FallbackUsed bayes_modal(const std::vector<Observation>& history, const AbilityEstimate& prior,
                           std::string reason) const;
  double standard_error(const std::vector<Observation>& history, double theta,
                        double fallback) const;
  double clamp_theta(double theta) const;

  EstimatorConfig config_{};
};

} // namespace cat::irt
