// SPDX-License-Identifier: MIT
#include "oneup/pricing/batch_pricer.hpp"
#include "oneup/support/parallel.hpp"
#include "oneup/support/pricing_trace.h"

namespace oneup {

BatchPricingResult BatchPricer::price_batch(std::span<const PricingRequest> requests) const {
    const size_t n = requests.size();

    ONEUP_TRACE_ALGO_START(MODULE_BATCH_PRICER, n, engine_.config().max_workers, 0);

    // std::expected has no default constructor; pre-fill with a placeholder error
    BatchPricingResult batch;
    batch.results.assign(n, std::unexpected(PricingError{.code = PricingErrorCode::InsufficientData}));

    [[maybe_unused]] const int workers = worker_count(engine_.config().max_workers);

    ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC_N(workers)
    for (size_t i = 0; i < n; ++i) {
        batch.results[i] = engine_.price(requests[i]);
    }

    for (const auto& r : batch.results) {
        if (!r.has_value()) ++batch.failed_count;
    }

    ONEUP_TRACE_BATCH_COMPLETE(n, n - batch.failed_count, batch.failed_count);
    return batch;
}

BatchPricingResult BatchPricer::price_batch(std::span<const PricingRequest> requests,
                                            const PriceRecordSink& sink) const {
    BatchPricingResult batch = price_batch(requests);
    for (const auto& r : batch.results) {
        if (r.has_value()) {
            sink(*r);
        }
    }
    return batch;
}

void PriceRecordStore::write(const PriceRecord& record) {
    auto [it, inserted] = records_.insert_or_assign(record.key, record);
    if (inserted) {
        write_order_.push_back(it->first);
    }
}

PriceRecordSink PriceRecordStore::sink() {
    return [this](const PriceRecord& record) { write(record); };
}

std::optional<PriceRecord> PriceRecordStore::find(const PriceRecordKey& key) const {
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

}  // namespace oneup
