#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "canal/config/units.h"
#include "canal/logging/log_sink.h"
#include "canal/logging/logger_registry.h"

namespace canal {
namespace config {
namespace test {

class RecordingLogSink : public logging::LogSink {
 public:
  void log(const logging::LogMessage& msg) override {
    messages_.push_back(msg);
  }
  void flush() override {}

  bool hasMessage(logging::LogLevel level, const std::string& substr) const {
    for (const auto& msg : messages_) {
      if (msg.level == level && msg.message.find(substr) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

 private:
  std::vector<logging::LogMessage> messages_;
};

class UnitsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_ = logging::LoggerRegistry::instance().getOrCreateLogger(
        "config.units");
    saved_sink_ = logger_->getSink();
    logger_->setSink(sink_);
  }

  void TearDown() override { logger_->setSink(saved_sink_); }

  std::shared_ptr<RecordingLogSink> sink_{
      std::make_shared<RecordingLogSink>()};
  std::shared_ptr<logging::Logger> logger_;
  std::shared_ptr<logging::LogSink> saved_sink_;
};

// ============================================================================
// Duration Tests
// ============================================================================

TEST_F(UnitsTest, DurationValidCases) {
  struct TestCase {
    std::string input;
    int64_t expected_ms;
  };

  std::vector<TestCase> cases = {
      {"0ms", 0},     {"200ms", 200},     {"1s", 1000},
      {"30s", 30000}, {"5m", 300000},     {"1h", 3600000},
      {"59s", 59000}, {"168h", 604800000},
  };

  for (const auto& tc : cases) {
    auto result = Duration::parse(tc.input);
    EXPECT_TRUE(result.first) << "Failed to parse: " << tc.input;
    EXPECT_EQ(tc.expected_ms, result.second.count()) << tc.input;
  }
}

TEST_F(UnitsTest, DurationInvalidCases) {
  std::vector<std::string> invalid_cases = {
      "",     "10",   "ms",  "10 ms", "-5s",    "1.5s",
      "10sec", "10S", "1d",  "abc",   "10m30s",
  };

  for (const auto& input : invalid_cases) {
    std::string error_message;
    auto result = Duration::parseWithError(input, error_message);
    EXPECT_FALSE(result.first) << "Should have failed to parse: " << input;
    EXPECT_FALSE(error_message.empty()) << input;
  }
}

TEST_F(UnitsTest, DurationOverflowIsRejected) {
  std::string error_message;
  auto result =
      Duration::parseWithError("9223372036854775807h", error_message);
  EXPECT_FALSE(result.first);
  EXPECT_NE(std::string::npos, error_message.find("overflow"));
}

TEST_F(UnitsTest, DurationFromJsonValue) {
  auto text = Duration::parse(nlohmann::json("30s"));
  EXPECT_TRUE(text.first);
  EXPECT_EQ(30000, text.second.count());

  // Bare numbers are milliseconds
  auto number = Duration::parse(nlohmann::json(5000));
  EXPECT_TRUE(number.first);
  EXPECT_EQ(5000, number.second.count());

  auto fraction = Duration::parse(nlohmann::json(1500.0));
  EXPECT_TRUE(fraction.first);
  EXPECT_EQ(1500, fraction.second.count());
}

TEST_F(UnitsTest, DurationRejectsNegativeAndNonScalarJson) {
  EXPECT_FALSE(Duration::parse(nlohmann::json(-1)).first);
  EXPECT_TRUE(sink_->hasMessage(logging::LogLevel::Error, "non-negative"));

  EXPECT_FALSE(Duration::parse(nlohmann::json::array()).first);
  EXPECT_TRUE(
      sink_->hasMessage(logging::LogLevel::Error, "Invalid duration value"));
}

TEST_F(UnitsTest, DurationToString) {
  EXPECT_EQ("0ms", Duration::toString(std::chrono::milliseconds(0)));
  EXPECT_EQ("500ms", Duration::toString(std::chrono::milliseconds(500)));
  EXPECT_EQ("1s", Duration::toString(std::chrono::milliseconds(1000)));
  EXPECT_EQ("1m", Duration::toString(std::chrono::milliseconds(60000)));
  EXPECT_EQ("2h", Duration::toString(std::chrono::milliseconds(7200000)));
  EXPECT_EQ("1500ms", Duration::toString(std::chrono::milliseconds(1500)));
  EXPECT_EQ("61s", Duration::toString(std::chrono::milliseconds(61000)));
}

TEST_F(UnitsTest, DurationValidation) {
  EXPECT_TRUE(Duration::isValid("10ms"));
  EXPECT_TRUE(Duration::isValid("2m"));
  EXPECT_FALSE(Duration::isValid("10"));
  EXPECT_FALSE(Duration::isValid(""));
}

// ============================================================================
// Size Tests
// ============================================================================

TEST_F(UnitsTest, SizeValidCases) {
  struct TestCase {
    std::string input;
    size_t expected_bytes;
  };

  std::vector<TestCase> cases = {
      {"0B", 0},
      {"512B", 512},
      {"8KB", 8 * UnitConversion::KILOBYTE},
      {"64MB", 64 * UnitConversion::MEGABYTE},
      {"1GB", UnitConversion::GIGABYTE},
  };

  for (const auto& tc : cases) {
    auto result = Size::parse(tc.input);
    EXPECT_TRUE(result.first) << "Failed to parse: " << tc.input;
    EXPECT_EQ(tc.expected_bytes, result.second) << tc.input;
  }
}

TEST_F(UnitsTest, SizeInvalidCases) {
  std::vector<std::string> invalid_cases = {"", "10", "KB", "10 KB", "1.5MB",
                                            "10kb", "-1B", "1TB"};

  for (const auto& input : invalid_cases) {
    std::string error_message;
    auto result = Size::parseWithError(input, error_message);
    EXPECT_FALSE(result.first) << "Should have failed to parse: " << input;
    EXPECT_FALSE(error_message.empty()) << input;
  }
}

TEST_F(UnitsTest, SizeFromJsonValue) {
  auto text = Size::parse(nlohmann::json("16KB"));
  EXPECT_TRUE(text.first);
  EXPECT_EQ(16u * 1024, text.second);

  auto number = Size::parse(nlohmann::json(4096));
  EXPECT_TRUE(number.first);
  EXPECT_EQ(4096u, number.second);

  EXPECT_FALSE(Size::parse(nlohmann::json(-4)).first);
  EXPECT_FALSE(Size::parse(nlohmann::json(true)).first);
}

TEST_F(UnitsTest, SizeToString) {
  EXPECT_EQ("0B", Size::toString(0));
  EXPECT_EQ("100B", Size::toString(100));
  EXPECT_EQ("8KB", Size::toString(8 * 1024));
  EXPECT_EQ("1MB", Size::toString(UnitConversion::MEGABYTE));
  EXPECT_EQ("2GB", Size::toString(2 * UnitConversion::GIGABYTE));
  EXPECT_EQ("1536B", Size::toString(1536));
}

}  // namespace test
}  // namespace config
}  // namespace canal
