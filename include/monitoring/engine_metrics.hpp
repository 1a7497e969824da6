#pragma once

#include "common/types.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace canonical {

/// Throughput and rejection counters for the order engine.
class EngineMetrics {
public:
    EngineMetrics() = default;

    void record_fill() noexcept { ++fill_count_; }
    void record_approval() noexcept { ++approval_count_; }
    void record_cancel() noexcept { ++cancel_count_; }
    void record_trade_args_staged() noexcept { ++trade_args_count_; }
    void record_listener_failure() noexcept { ++listener_failure_count_; }
    void record_rejection(OrderError error) noexcept;

    uint64_t fills() const noexcept { return fill_count_; }
    uint64_t approvals() const noexcept { return approval_count_; }
    uint64_t cancels() const noexcept { return cancel_count_; }
    uint64_t trade_args_staged() const noexcept { return trade_args_count_; }
    uint64_t listener_failures() const noexcept { return listener_failure_count_; }
    uint64_t rejections() const noexcept;
    uint64_t rejections(OrderError error) const noexcept;

    /// Print comprehensive summary
    void print_summary(double elapsed_seconds) const;

    /// Dump CSV of rejection counts
    void dump_csv(const std::string& path) const;

    void reset() noexcept;

private:
    uint64_t fill_count_ = 0;
    uint64_t approval_count_ = 0;
    uint64_t cancel_count_ = 0;
    uint64_t trade_args_count_ = 0;
    uint64_t listener_failure_count_ = 0;
    std::array<uint64_t, ORDER_ERROR_COUNT> rejection_counts_{};
};

} // namespace canonical
