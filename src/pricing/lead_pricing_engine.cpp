// SPDX-License-Identifier: MIT
#include "oneup/pricing/lead_pricing_engine.hpp"
#include "oneup/math/poisson.hpp"
#include "oneup/model/rate_inference.hpp"
#include "oneup/model/split_estimator.hpp"
#include "oneup/model/supremacy_calibrator.hpp"
#include "oneup/support/pricing_trace.h"
#include <algorithm>
#include <span>

namespace oneup {

namespace {

bool has_valid_over_under(const std::vector<MarketQuote>& quotes) {
    return std::any_of(quotes.begin(), quotes.end(), is_valid_over_under);
}

/// First mandatory family without a usable quote
std::optional<MarketFamily> missing_family(const MarketBook& book) {
    if (!book.match_result.has_value() || !is_valid_three_way(*book.match_result)) {
        return MarketFamily::MatchResult;
    }
    if (!has_valid_over_under(book.total_goals)) return MarketFamily::TotalGoals;
    if (!has_valid_over_under(book.home_goals)) return MarketFamily::HomeGoals;
    if (!has_valid_over_under(book.away_goals)) return MarketFamily::AwayGoals;
    return std::nullopt;
}

void note_rate_fallback(const RateFit& fit, const char* family, PricingDiagnostics& diag) {
    if (fit.used_fallback_rate) {
        diag.degeneracies.push_back(std::string(family) + ": fallback rate used");
    }
}

/// Clamp a rate to `floor`, recording the clamp
double floor_rate(double rate, double floor, const char* name, PricingDiagnostics& diag) {
    if (rate >= floor) return rate;
    ONEUP_TRACE_DEGENERATE_CLAMP(MODULE_PRICING_ENGINE, rate, floor);
    diag.degeneracies.push_back(std::string(name) + " clamped to minimum rate");
    return floor;
}

}  // anonymous namespace

LeadPricingEngine::LeadPricingEngine(EngineConfig config,
                                     AnyScalarMinimizer minimizer,
                                     AnyLeadEstimator estimator,
                                     AnyProbabilityCalibrator calibrator)
    : config_(std::move(config))
    , minimizer_(std::move(minimizer))
    , estimator_(std::move(estimator))
    , calibrator_(std::move(calibrator))
{}

std::expected<LeadPricingEngine, ValidationError> LeadPricingEngine::create(EngineConfig config) {
    auto valid = validate_engine_config(config);
    if (!valid.has_value()) {
        return std::unexpected(valid.error());
    }

    AnyScalarMinimizer minimizer = make_scalar_minimizer(config.minimizer, config.minimizer_config);
    AnyLeadEstimator estimator = make_lead_estimator(config.lead_strategy, config.stochastic, config.exact);
    AnyProbabilityCalibrator calibrator = make_probability_calibrator(config.calibration);

    return LeadPricingEngine(std::move(config), std::move(minimizer),
                             std::move(estimator), std::move(calibrator));
}

std::expected<PriceRecord, PricingError> LeadPricingEngine::price(const PricingRequest& request) const {
    const MarketBook& book = request.markets;

    if (auto family = missing_family(book); family.has_value()) {
        ONEUP_TRACE_INSUFFICIENT_DATA(static_cast<int>(*family));
        return std::unexpected(PricingError{
            .code = PricingErrorCode::InsufficientData,
            .family = *family,
        });
    }

    ONEUP_TRACE_ALGO_START(MODULE_PRICING_ENGINE, book.total_goals.size(),
                           book.home_goals.size(), book.away_goals.size());

    PricingDiagnostics diag;
    diag.calibrator_version = std::string(calibrator_.version());
    diag.lead_strategy = to_string(estimator_.strategy());

    // Match result
    const auto& mr = book.match_result->odds;
    diag.match_result = devig_three_way(mr[0], mr[1], mr[2]);
    diag.match_result_overround = overround(mr[0], mr[1], mr[2]);

    // Rates per family
    const RateFit total_fit = fit_rate(book.total_goals, minimizer_, config_.rate_inference);
    const RateFit home_fit = fit_rate(book.home_goals, minimizer_, config_.rate_inference);
    const RateFit away_fit = fit_rate(book.away_goals, minimizer_, config_.rate_inference);
    diag.lines_total = total_fit.lines_used;
    diag.lines_home = home_fit.lines_used;
    diag.lines_away = away_fit.lines_used;
    diag.optimizer_fallback = total_fit.used_grid_fallback || home_fit.used_grid_fallback ||
                              away_fit.used_grid_fallback;
    note_rate_fallback(total_fit, "total_goals", diag);
    note_rate_fallback(home_fit, "home_goals", diag);
    note_rate_fallback(away_fit, "away_goals", diag);

    const double total = total_fit.rate;
    const RateEstimate proportional = proportional_split(home_fit.rate, away_fit.rate, total);
    diag.proportional_rates = proportional;
    RateEstimate rates = proportional;

    // First-scorer share or supremacy fit
    std::optional<double> share_override;
    if (config_.split.first_scorer_override) {
        const ShareSelection selection = select_first_scorer_share(book.first_scorer, request.source,
                                                                   config_.split);
        diag.share_source = selection.label;
        if (selection.share.has_value()) {
            share_override = clamped_share(*selection.share, config_.split);
        }
    } else {
        diag.share_source = "disabled";
    }

    if (share_override.has_value()) {
        rates = split_by_share(total, *share_override);
        diag.share_override_applied = true;
        diag.supremacy = rates.rate_home - rates.rate_away;
    } else {
        const SupremacyFit fit = calibrate_supremacy(total, diag.match_result, minimizer_,
                                                     config_.supremacy);
        diag.optimizer_fallback = diag.optimizer_fallback || fit.used_grid_fallback;
        if (fit.degenerate_bounds) {
            diag.supremacy = proportional.rate_home - proportional.rate_away;
            diag.degeneracies.push_back("supremacy: total rate too small, proportional split used");
        } else {
            rates = fit.rates;
            diag.supremacy = fit.supremacy;
        }
    }

    // Both-teams-score price, used for the optional adjustment and the cross-check
    std::optional<double> p_btts_market;
    if (book.both_teams_score.has_value() && is_valid_two_way(*book.both_teams_score)) {
        const auto& bt = book.both_teams_score->odds;
        p_btts_market = devig_two_way(bt[0], bt[1]);
    }

    std::optional<BttsAdjustment> btts_adjustment;
    if (config_.split.btts_adjustment.enabled && p_btts_market.has_value()) {
        btts_adjustment = adjust_for_btts(rates, *p_btts_market, config_.split.btts_adjustment);
        if (btts_adjustment.has_value()) {
            rates = btts_adjustment->rates;
        } else {
            diag.degeneracies.push_back("btts: model probability out of range, adjustment skipped");
        }
    }

    const double min_rate = config_.supremacy.min_rate;
    rates.rate_home = floor_rate(rates.rate_home, min_rate, "rate_home", diag);
    rates.rate_away = floor_rate(rates.rate_away, min_rate, "rate_away", diag);
    rates.rate_total = rates.rate_home + rates.rate_away;
    if (share_override.has_value()) {
        share_override = rates.rate_home / rates.rate_total;
    }
    diag.conditional_share = rates.rate_home / rates.rate_total;

    // Lead probabilities
    LeadProbabilityResult raw = estimator_.estimate(rates, share_override);
    if (clamp_lead_probabilities(raw, config_.probability_epsilon)) {
        diag.degeneracies.push_back("raw lead probability clamped");
    }
    diag.raw = raw;

    LeadProbabilityResult calibrated = calibrator_.apply(raw, rates);
    if (clamp_lead_probabilities(calibrated, config_.probability_epsilon)) {
        diag.degeneracies.push_back("calibrated lead probability clamped");
    }

    // Prices
    auto home_price = compose_price(calibrated.p_home_lead, config_.margin_fraction);
    if (!home_price.has_value()) {
        return std::unexpected(home_price.error());
    }
    auto away_price = compose_price(calibrated.p_away_lead, config_.margin_fraction);
    if (!away_price.has_value()) {
        return std::unexpected(away_price.error());
    }

    // Both-teams-score cross-check
    if (p_btts_market.has_value()) {
        diag.btts = BttsCheck{
            .p_market = *p_btts_market,
            .p_model = both_teams_score_probability(rates.rate_home, rates.rate_away),
            .implied_total = infer_total_rate_from_btts(*p_btts_market, diag.conditional_share,
                                                        config_.rate_inference),
            .rates_adjusted = btts_adjustment.has_value(),
            .adjustment_factor = btts_adjustment.has_value() ? btts_adjustment->factor : 1.0,
        };
    }

    ONEUP_TRACE_PRICE_COMPLETE(rates.rate_home, rates.rate_away,
                               calibrated.p_home_lead, calibrated.p_away_lead);

    return PriceRecord{
        .key = PriceRecordKey{
            .event_id = request.event_id,
            .snapshot_id = request.snapshot_id,
            .engine_version = config_.engine_version,
            .source = request.source,
        },
        .rate_home = rates.rate_home,
        .rate_away = rates.rate_away,
        .rate_total = rates.rate_total,
        .p_home_lead = calibrated.p_home_lead,
        .p_away_lead = calibrated.p_away_lead,
        .p_level_full_time = calibrated.p_level_full_time,
        .home = *home_price,
        .away = *away_price,
        .diagnostics = std::move(diag),
    };
}

}  // namespace oneup
