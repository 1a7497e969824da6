#include <gtest/gtest.h>
#include "monitoring/engine_metrics.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace canonical;

TEST(EngineMetricsTest, CountsActivity) {
    EngineMetrics metrics;
    metrics.record_fill();
    metrics.record_fill();
    metrics.record_approval();
    metrics.record_cancel();
    metrics.record_trade_args_staged();
    metrics.record_listener_failure();

    EXPECT_EQ(metrics.fills(), 2u);
    EXPECT_EQ(metrics.listener_failures(), 1u);
    EXPECT_EQ(metrics.approvals(), 1u);
    EXPECT_EQ(metrics.cancels(), 1u);
    EXPECT_EQ(metrics.trade_args_staged(), 1u);
    EXPECT_EQ(metrics.rejections(), 0u);
}

TEST(EngineMetricsTest, RejectionsByError) {
    EngineMetrics metrics;
    metrics.record_rejection(OrderError::Overfill);
    metrics.record_rejection(OrderError::Overfill);
    metrics.record_rejection(OrderError::Expired);
    metrics.record_rejection(static_cast<OrderError>(200));  // Out of range: ignored

    EXPECT_EQ(metrics.rejections(OrderError::Overfill), 2u);
    EXPECT_EQ(metrics.rejections(OrderError::Expired), 1u);
    EXPECT_EQ(metrics.rejections(OrderError::Unauthorized), 0u);
    EXPECT_EQ(metrics.rejections(static_cast<OrderError>(200)), 0u);
    EXPECT_EQ(metrics.rejections(), 3u);
}

TEST(EngineMetricsTest, Reset) {
    EngineMetrics metrics;
    metrics.record_fill();
    metrics.record_rejection(OrderError::DecodeError);
    metrics.reset();
    EXPECT_EQ(metrics.fills(), 0u);
    EXPECT_EQ(metrics.rejections(), 0u);
}

TEST(EngineMetricsTest, DumpCsvListsEveryError) {
    EngineMetrics metrics;
    metrics.record_rejection(OrderError::PriceOutOfBounds);

    std::string path = (std::filesystem::temp_directory_path() / "canonical_metrics.csv").string();
    metrics.dump_csv(path);

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    std::string line;
    ASSERT_TRUE(std::getline(file, line));
    EXPECT_EQ(line, "error,count");

    size_t rows = 0;
    bool found = false;
    while (std::getline(file, line)) {
        ++rows;
        if (line == "PriceOutOfBounds,1") found = true;
    }
    EXPECT_EQ(rows, ORDER_ERROR_COUNT - 1);
    EXPECT_TRUE(found);

    file.close();
    std::filesystem::remove(path);
}
