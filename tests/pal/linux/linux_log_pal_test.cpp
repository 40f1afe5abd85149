// StreamHub - Real-time event fan-out server
// Tests for Linux Log PAL Implementation

#include <gtest/gtest.h>
#include "streamhub/pal/log_pal.hpp"
#include "streamhub/pal/pal_types.hpp"

#include <mutex>
#include <vector>

#if defined(__linux__)
#include "streamhub/pal/linux/linux_log_pal.hpp"
#endif

namespace streamhub {
namespace pal {
namespace test {

#if defined(__linux__)

class CapturingSink : public ILogSink {
public:
    struct Record {
        LogLevel level;
        std::string message;
        std::string category;
        int line;
    };

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(Record{level, message, category, context.line});
    }

    void flush() override { flushes_++; }

    std::string getName() const override { return "CapturingSink"; }

    std::vector<Record> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    int flushes() const { return flushes_; }

private:
    mutable std::mutex mutex_;
    std::vector<Record> records_;
    int flushes_ = 0;
};

// =============================================================================
// Linux Log PAL Tests
// =============================================================================

class LinuxLogPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        linux::LinuxLogOptions options;
        options.enableSyslog = false;
        options.enableStderr = false;
        logPal_ = std::make_shared<linux::LinuxLogPAL>(options);
        sink_ = std::make_shared<CapturingSink>();
        logPal_->addSink(sink_);
    }

    std::shared_ptr<linux::LinuxLogPAL> logPal_;
    std::shared_ptr<CapturingSink> sink_;
};

TEST_F(LinuxLogPALTest, DefaultMinimumLevelIsDebug) {
    EXPECT_EQ(logPal_->getMinLevel(), LogLevel::Debug);
    EXPECT_FALSE(logPal_->options().enableSyslog);
}

TEST_F(LinuxLogPALTest, SinksReceiveRecordsAtOrAboveMinimum) {
    logPal_->setMinLevel(LogLevel::Info);

    logPal_->log(LogLevel::Debug, "hidden", "Pool", LogContext{});
    logPal_->log(LogLevel::Info, "Listening", "Server", LogContext{});
    logPal_->log(LogLevel::Error, "Bind failed", "Server", LogContext{});

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "Listening");
    EXPECT_EQ(records[0].category, "Server");
    EXPECT_EQ(records[1].level, LogLevel::Error);
}

TEST_F(LinuxLogPALTest, OffLevelIsNeverEmitted) {
    logPal_->log(LogLevel::Off, "never", "Pool", LogContext{});
    EXPECT_TRUE(sink_->records().empty());
}

TEST_F(LinuxLogPALTest, MacrosCaptureSourceLocation) {
    STREAMHUB_LOG_WARNING(logPal_, "Pool", "Queue high-water mark reached");

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Warning);
    EXPECT_GT(records[0].line, 0);
}

TEST_F(LinuxLogPALTest, RemovedSinkStopsReceivingAndFlushReachesSinks) {
    logPal_->flush();
    EXPECT_EQ(sink_->flushes(), 1);

    logPal_->removeSink(sink_);
    logPal_->log(LogLevel::Info, "after removal", "Pool", LogContext{});
    EXPECT_TRUE(sink_->records().empty());
}

#endif // defined(__linux__)

} // namespace test
} // namespace pal
} // namespace streamhub
