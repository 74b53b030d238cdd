#include "mercury-itc/Logger.hpp"

#include <gtest/gtest.h>

using namespace mercuryitc;

TEST(ClientLogger, InitAndShutdown) {
  auto &logger = ClientLogger::instance();
  logger.shutdown();
  EXPECT_FALSE(logger.is_initialized());

  // Dropped before init
  LOG_INFO("TEST", "LOG", "ignored {}", 1);

  logger.init("", spdlog::level::off);
  EXPECT_TRUE(logger.is_initialized());
  LOG_INFO("TEST", "LOG", "{}", "{\"braces\": true}");

  logger.shutdown();
  EXPECT_FALSE(logger.is_initialized());
}
