// SPDX-License-Identifier: MIT
#include "oneup/model/lead_estimator_factory.hpp"

namespace oneup {

AnyLeadEstimator::AnyLeadEstimator(StochasticEstimator estimator)
    : estimator_(std::move(estimator))
{}

AnyLeadEstimator::AnyLeadEstimator(ExactBarrierDP estimator)
    : estimator_(std::move(estimator))
{}

LeadProbabilityResult AnyLeadEstimator::estimate(const RateEstimate& rates,
                                                 std::optional<double> share_override) const {
    return std::visit([&](const auto& e) {
        return e.estimate(rates, share_override);
    }, estimator_);
}

LeadStrategy AnyLeadEstimator::strategy() const {
    return std::holds_alternative<StochasticEstimator>(estimator_)
        ? LeadStrategy::Stochastic : LeadStrategy::ExactBarrier;
}

AnyLeadEstimator make_lead_estimator(LeadStrategy strategy,
                                     const StochasticConfig& stochastic,
                                     const ExactBarrierConfig& exact) {
    switch (strategy) {
        case LeadStrategy::Stochastic:
            return AnyLeadEstimator(StochasticEstimator(stochastic));
        case LeadStrategy::ExactBarrier:
            break;
    }
    return AnyLeadEstimator(ExactBarrierDP(exact));
}

}  // namespace oneup
