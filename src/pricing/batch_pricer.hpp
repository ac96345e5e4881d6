// SPDX-License-Identifier: MIT
/**
 * @file batch_pricer.hpp
 * @brief Parallel pricing of many requests with a single serialized writer
 *
 * Requests are independent, so they are priced in parallel with OpenMP
 * (bounded by EngineConfig::max_workers). Successful records are then handed
 * to the sink one at a time from the calling thread, in request order.
 *
 * Usage:
 * ```cpp
 * auto engine = LeadPricingEngine::create(config);
 * BatchPricer pricer(*engine);
 * PriceRecordStore store;
 * auto batch = pricer.price_batch(requests, store.sink());
 * ```
 */

#pragma once

#include "oneup/pricing/lead_pricing_engine.hpp"
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace oneup {

/// Callback receiving each successfully priced record
using PriceRecordSink = std::function<void(const PriceRecord& record)>;

/// Per-request results and aggregate statistics
struct BatchPricingResult {
    std::vector<std::expected<PriceRecord, PricingError>> results;
    size_t failed_count = 0;  ///< Requests rejected (e.g. InsufficientData)

    bool all_succeeded() const noexcept { return failed_count == 0; }
};

class BatchPricer {
public:
    /// @param engine Must outlive the pricer
    explicit BatchPricer(const LeadPricingEngine& engine) : engine_(engine) {}

    /// Price every request in parallel
    [[nodiscard]] BatchPricingResult price_batch(std::span<const PricingRequest> requests) const;

    /// Price every request, then write successes to `sink` in request order
    [[nodiscard]] BatchPricingResult price_batch(std::span<const PricingRequest> requests,
                                   const PriceRecordSink& sink) const;

private:
    const LeadPricingEngine& engine_;
};

/// In-memory record store keyed by (event, snapshot, engine version, source)
///
/// A record with an existing key replaces the stored one.
class PriceRecordStore {
public:
    void write(const PriceRecord& record);

    /// Sink writing into this store; the store must outlive it
    PriceRecordSink sink();

    [[nodiscard]] std::optional<PriceRecord> find(const PriceRecordKey& key) const;

    size_t size() const { return records_.size(); }

    /// Keys in the order records were first written
    const std::vector<PriceRecordKey>& write_order() const { return write_order_; }

private:
    std::map<PriceRecordKey, PriceRecord> records_;
    std::vector<PriceRecordKey> write_order_;
};

}  // namespace oneup
