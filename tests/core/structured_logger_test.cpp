// StreamHub - Real-time event fan-out server
// Tests for Structured Logging Component

#include <gtest/gtest.h>
#include "streamhub/core/json_value.hpp"
#include "streamhub/core/structured_logger.hpp"
#include "streamhub/pal/log_pal.hpp"
#include "streamhub/pal/pal_types.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace streamhub {
namespace core {
namespace test {

// =============================================================================
// Test Sink for Capturing Log Output
// =============================================================================

class TestLogSink : public pal::ILogSink {
public:
    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, message, category});
    }

    void flush() override {
        flushCount_++;
    }

    std::string getName() const override {
        return "TestLogSink";
    }

    struct Entry {
        pal::LogLevel level;
        std::string message;
        std::string category;
    };

    std::vector<Entry> getEntries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    int flushCount() const { return flushCount_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::atomic<int> flushCount_{0};
};

class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<TestLogSink>();
        logger_.addSink(sink_);
    }

    JsonValue lastRecordAsJson() const {
        auto entries = sink_->getEntries();
        EXPECT_FALSE(entries.empty());
        auto parsed = parseJson(entries.back().message);
        EXPECT_TRUE(parsed.isSuccess()) << entries.back().message;
        return parsed.isSuccess() ? parsed.value() : JsonValue();
    }

    StructuredLogger logger_;
    std::shared_ptr<TestLogSink> sink_;
};

// =============================================================================
// Level Tests
// =============================================================================

TEST(LogLevelTest, NamesRoundTripCaseInsensitively) {
    EXPECT_EQ(logLevelToString(LogLevelConfig::Warning), "warning");
    EXPECT_EQ(stringToLogLevel("DEBUG"), LogLevelConfig::Debug);
    EXPECT_EQ(stringToLogLevel("warn"), LogLevelConfig::Warning);
    EXPECT_EQ(stringToLogLevel("nonsense"), LogLevelConfig::Info);
    EXPECT_FALSE(parseLogLevelString("nonsense").has_value());
}

TEST_F(StructuredLoggerTest, DefaultsToInfoAndPlainText) {
    EXPECT_EQ(logger_.getLevel(), LogLevelConfig::Info);
    EXPECT_FALSE(logger_.isJsonFormat());
    EXPECT_FALSE(logger_.isEnabled(LogLevelConfig::Debug));
    EXPECT_TRUE(logger_.isEnabled(LogLevelConfig::Info));
}

TEST_F(StructuredLoggerTest, RecordsBelowLevelAreFiltered) {
    logger_.setLevel(LogLevelConfig::Warning);

    logger_.debug("debug");
    logger_.info("info");
    logger_.warning("warning");
    logger_.error("error");

    auto entries = sink_->getEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Warning);
    EXPECT_EQ(entries[1].level, pal::LogLevel::Error);
}

// =============================================================================
// Format Tests
// =============================================================================

TEST_F(StructuredLoggerTest, PlainTextCarriesLevelCategoryAndMessage) {
    logger_.info("Listening on 0.0.0.0:8080", "Server");

    auto entries = sink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, "Server");
    EXPECT_NE(entries[0].message.find("[info] [Server] Listening on 0.0.0.0:8080"),
              std::string::npos);
}

TEST_F(StructuredLoggerTest, JsonRecordIsParseable) {
    logger_.setJsonFormat(true);
    logger_.warning("quote \" and newline \n", "Pool");

    JsonValue record = lastRecordAsJson();
    EXPECT_EQ(record["level"].getString(), "warning");
    EXPECT_EQ(record["category"].getString(), "Pool");
    EXPECT_EQ(record["message"].getString(), "quote \" and newline \n");
    EXPECT_FALSE(record["timestamp"].getString().empty());
}

// =============================================================================
// Contextual Logging Tests
// =============================================================================

TEST_F(StructuredLoggerTest, ConnectionEventIncludesNonEmptyContext) {
    logger_.setJsonFormat(true);

    LogContext ctx;
    ctx.connectionId = "c-1";
    ctx.tenantId = "acme";
    ctx.userId = "u-1";
    logger_.logConnectionEvent(ConnectionEventType::Admitted, ctx);

    JsonValue record = lastRecordAsJson();
    EXPECT_EQ(record["message"].getString(), "Connection admitted");
    EXPECT_EQ(record["category"].getString(), "Connection");
    EXPECT_EQ(record["connection_id"].getString(), "c-1");
    EXPECT_EQ(record["tenant_id"].getString(), "acme");
    EXPECT_EQ(record["user_id"].getString(), "u-1");
    EXPECT_FALSE(record.contains("channel"));
    EXPECT_FALSE(record.contains("error_code"));
}

TEST_F(StructuredLoggerTest, RejectionAndBackpressureAreWarnings) {
    LogContext ctx;
    ctx.tenantId = "acme";
    ctx.reason = "pool_full";

    logger_.logConnectionEvent(ConnectionEventType::Rejected, ctx);
    logger_.logConnectionEvent(ConnectionEventType::Backpressure, ctx);
    logger_.logConnectionEvent(ConnectionEventType::Drained, ctx);

    auto entries = sink_->getEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Warning);
    EXPECT_EQ(entries[1].level, pal::LogLevel::Warning);
    EXPECT_EQ(entries[2].level, pal::LogLevel::Info);
    EXPECT_NE(entries[0].message.find("reason=pool_full"), std::string::npos);
}

TEST_F(StructuredLoggerTest, ErrorWithContextCarriesCode) {
    logger_.setJsonFormat(true);

    LogContext ctx;
    ctx.connectionId = "c-9";
    ctx.errorCode = 201;
    logger_.errorWithContext("Write failed: broken pipe", ctx, "Pool");

    JsonValue record = lastRecordAsJson();
    EXPECT_EQ(record["level"].getString(), "error");
    EXPECT_EQ(record["error_code"].getInt(), 201);
    EXPECT_EQ(record["connection_id"].getString(), "c-9");
}

// =============================================================================
// Sink Management Tests
// =============================================================================

TEST_F(StructuredLoggerTest, RemovedSinkStopsReceiving) {
    logger_.info("first");
    logger_.removeSink(sink_);
    logger_.info("second");

    EXPECT_EQ(sink_->size(), 1u);
}

TEST_F(StructuredLoggerTest, FlushReachesEverySink) {
    auto second = std::make_shared<TestLogSink>();
    logger_.addSink(second);
    logger_.addSink(nullptr);

    logger_.flush();

    EXPECT_EQ(sink_->flushCount(), 1);
    EXPECT_EQ(second->flushCount(), 1);
}

TEST_F(StructuredLoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i) {
                logger_.info("thread " + std::to_string(t) + " record " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(sink_->size(), 400u);
}

} // namespace test
} // namespace core
} // namespace streamhub
