#include "monitoring/engine_metrics.hpp"
#include <cstdio>
#include <fstream>

namespace canonical {

void EngineMetrics::record_rejection(OrderError error) noexcept {
    size_t idx = static_cast<size_t>(error);
    if (idx < rejection_counts_.size()) {
        ++rejection_counts_[idx];
    }
}

uint64_t EngineMetrics::rejections() const noexcept {
    uint64_t total = 0;
    for (size_t i = 1; i < rejection_counts_.size(); ++i) {
        total += rejection_counts_[i];
    }
    return total;
}

uint64_t EngineMetrics::rejections(OrderError error) const noexcept {
    size_t idx = static_cast<size_t>(error);
    return idx < rejection_counts_.size() ? rejection_counts_[idx] : 0;
}

void EngineMetrics::print_summary(double elapsed_seconds) const {
    printf("\n");
    printf("=== Canonical Order Engine Report ===\n");
    printf("\n");

    printf("--- Activity (%.2fs elapsed) ---\n", elapsed_seconds);
    printf("  Fills:             %lu\n", static_cast<unsigned long>(fill_count_));
    printf("  Approvals:         %lu\n", static_cast<unsigned long>(approval_count_));
    printf("  Cancellations:     %lu\n", static_cast<unsigned long>(cancel_count_));
    printf("  Trade args staged: %lu\n", static_cast<unsigned long>(trade_args_count_));
    if (listener_failure_count_ > 0) {
        printf("  Listener failures: %lu\n", static_cast<unsigned long>(listener_failure_count_));
    }
    if (elapsed_seconds > 0) {
        printf("  Fill rate:         %.0f fills/sec\n",
               static_cast<double>(fill_count_) / elapsed_seconds);
    }
    printf("\n");

    printf("--- Rejections (%lu total) ---\n", static_cast<unsigned long>(rejections()));
    for (size_t i = 1; i < rejection_counts_.size(); ++i) {
        if (rejection_counts_[i] == 0) continue;
        printf("  %-20s %10lu\n", order_error_name(static_cast<OrderError>(i)),
               static_cast<unsigned long>(rejection_counts_[i]));
    }
}

void EngineMetrics::dump_csv(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) return;

    file << "error,count\n";
    for (size_t i = 1; i < rejection_counts_.size(); ++i) {
        file << order_error_name(static_cast<OrderError>(i)) << "," << rejection_counts_[i] << "\n";
    }
}

void EngineMetrics::reset() noexcept {
    fill_count_ = 0;
    approval_count_ = 0;
    cancel_count_ = 0;
    trade_args_count_ = 0;
    listener_failure_count_ = 0;
    rejection_counts_.fill(0);
}

} // namespace canonical
