#include <gtest/gtest.h>

#include "tq/util/logger.hpp"
#include "test_helpers.hpp"

using namespace tq::util;
using tq::ErrorCode;

class LoggerTest : public ::testing::Test {};

TEST_F(LoggerTest, ParseLevel) {
  auto trace = Logger::parseLevel("trace");
  ASSERT_OK(trace);
  EXPECT_EQ(*trace, spdlog::level::trace);

  auto warning = Logger::parseLevel("warning");
  ASSERT_OK(warning);
  EXPECT_EQ(*warning, spdlog::level::warn);

  auto error = Logger::parseLevel("error");
  ASSERT_OK(error);
  EXPECT_EQ(*error, spdlog::level::err);

  EXPECT_ERROR(Logger::parseLevel("loud"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Logger::parseLevel("WARN"), ErrorCode::kInvalidArgument);
}

TEST_F(LoggerTest, InitializeInstallsDefaultLogger) {
  auto& logger = Logger::instance();
  logger.initialize(spdlog::level::err, false);

  EXPECT_TRUE(logger.initialized());
  EXPECT_EQ(spdlog::default_logger()->name(), "tq");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

  // A second call only changes the level
  logger.initialize(spdlog::level::off, false);
  EXPECT_EQ(spdlog::default_logger()->name(), "tq");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::off);
}
