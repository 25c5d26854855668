#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "logger.hpp"
#include "parsed_document.hpp"

using namespace odmeta;

namespace {

struct Record {
    LogLevel level;
    std::string message;
    std::string tag;
};

class CaptureSink final : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<Record>> records)
        : records_(std::move(records)) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        records_->push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::shared_ptr<std::vector<Record>> records_;
};

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<Record>> records = std::make_shared<std::vector<Record>>();

    void SetUp() override {
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override { Logger::clear_sinks(); }
};

} // namespace

TEST_F(LoggerTest, ForwardsToEverySink) {
    auto second = std::make_shared<std::vector<Record>>();
    Logger::add_sink(std::make_unique<CaptureSink>(second));

    Logger::log(LogLevel::Info, "hello", "unit");

    ASSERT_EQ(records->size(), 1u);
    ASSERT_EQ(second->size(), 1u);
    EXPECT_EQ(records->front().level, LogLevel::Info);
    EXPECT_EQ(records->front().message, "hello");
    EXPECT_EQ(records->front().tag, "unit");
}

TEST_F(LoggerTest, DefaultTag) {
    Logger::log(LogLevel::Debug, "x");

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ(records->front().tag, "odmeta");
}

TEST_F(LoggerTest, ClearSinksSilencesLogging) {
    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "dropped");

    EXPECT_TRUE(records->empty());
}

TEST_F(LoggerTest, NullSinkIsIgnored) {
    Logger::add_sink(nullptr);
    Logger::log(LogLevel::Warning, "still delivered");

    EXPECT_EQ(records->size(), 1u);
}

TEST_F(LoggerTest, LibraryFailuresAreLoggedAsErrors) {
    EXPECT_THROW((void)ParsedDocument::load("/nonexistent/odmeta/meta.xml"), IoError);

    ASSERT_FALSE(records->empty());
    EXPECT_EQ(records->back().level, LogLevel::Error);
}

TEST(LoggerLevelTest, LevelNamesRoundTrip) {
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Info), "INFO");
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Error), "ERROR");

    EXPECT_EQ(Logger::string_to_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("INFO"), LogLevel::Info);
    EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(Logger::string_to_level("bogus"), LogLevel::Error);
}
