// SPDX-License-Identifier: MIT
/**
 * @file lead_estimator_factory.hpp
 * @brief Type-erased lead-probability strategy chosen from configuration
 */

#pragma once

#include "oneup/model/exact_barrier_dp.hpp"
#include "oneup/model/stochastic_estimator.hpp"
#include <variant>

namespace oneup {

/// Type-erased estimator wrapping either strategy
class AnyLeadEstimator {
public:
    explicit AnyLeadEstimator(StochasticEstimator estimator);
    explicit AnyLeadEstimator(ExactBarrierDP estimator);

    [[nodiscard]] LeadProbabilityResult estimate(const RateEstimate& rates,
                                   std::optional<double> share_override = std::nullopt) const;

    LeadStrategy strategy() const;

private:
    std::variant<StochasticEstimator, ExactBarrierDP> estimator_;
};

/// Build the selected strategy
///
/// @throws std::invalid_argument if the selected strategy's config is invalid
[[nodiscard]] AnyLeadEstimator make_lead_estimator(LeadStrategy strategy,
                                     const StochasticConfig& stochastic,
                                     const ExactBarrierConfig& exact);

}  // namespace oneup
