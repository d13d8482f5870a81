#include "xylium/router-config.hpp"

#include <gtest/gtest.h>

#include <memory>

#include "xylium/config-error.hpp"
#include "xylium/log.hpp"
#include "xylium/mode.hpp"
#include "xylium/router.hpp"

namespace xylium {

TEST(RouterConfigTest, Defaults) {
  const RouterConfig config;
  EXPECT_EQ(config.mode, Mode::Release);
  EXPECT_EQ(config.contextPoolInitialCapacity, 0U);
  EXPECT_EQ(config.logger, nullptr);
  EXPECT_NO_THROW(config.validate());
}

TEST(RouterConfigTest, FluentSetters) {
  auto logger = std::make_shared<log::logger>("router-config-test");
  const RouterConfig config =
      RouterConfig{}.withMode(Mode::Test).withContextPoolInitialCapacity(8).withLogger(logger);
  EXPECT_EQ(config.mode, Mode::Test);
  EXPECT_EQ(config.contextPoolInitialCapacity, 8U);
  EXPECT_EQ(config.logger, logger);
}

TEST(RouterConfigTest, ValidateRejectsHugePool) {
  RouterConfig config;
  config.withContextPoolInitialCapacity(RouterConfig::kMaxContextPoolInitialCapacity + 1);
  EXPECT_THROW(config.validate(), ConfigError);
  EXPECT_THROW(Router{config}, ConfigError);
}

TEST(RouterConfigTest, ModeSetsLevelOfOwnedLogger) {
  {
    Router router(RouterConfig{}.withMode(Mode::Debug));
    EXPECT_EQ(router.mode(), Mode::Debug);
    EXPECT_EQ(router.logger().underlying()->name(), kRouterLoggerName);
    EXPECT_EQ(router.logger().underlying()->level(), log::level::debug);
  }
  {
    Router router(RouterConfig{}.withMode(Mode::Release));
    EXPECT_EQ(router.logger().underlying()->level(), log::level::info);
  }
  {
    Router router(RouterConfig{}.withMode(Mode::Test).withContextPoolInitialCapacity(3));
    EXPECT_EQ(router.logger().underlying()->level(), log::level::debug);
    EXPECT_EQ(router.contextPool().nbIdle(), 3U);
  }
}

TEST(RouterConfigTest, RoutersDoNotChangeDefaultLoggerLevel) {
  const auto defaultLogger = log::default_logger();
  const auto previousLevel = defaultLogger->level();
  defaultLogger->set_level(log::level::trace);
  {
    Router releaseRouter(RouterConfig{}.withMode(Mode::Release));
    Router debugRouter(RouterConfig{}.withMode(Mode::Debug));
    EXPECT_EQ(defaultLogger->level(), log::level::trace);
    // Each router keeps its own level.
    EXPECT_EQ(releaseRouter.logger().underlying()->level(), log::level::info);
    EXPECT_EQ(debugRouter.logger().underlying()->level(), log::level::debug);
  }
  defaultLogger->set_level(previousLevel);
}

TEST(RouterConfigTest, GivenLoggerLevelIsUntouched) {
  auto logger = std::make_shared<log::logger>("router-mode-test");
  logger->set_level(log::level::warn);
  Router router(RouterConfig{}.withMode(Mode::Debug).withLogger(logger));
  EXPECT_EQ(router.logger().underlying(), logger);
  EXPECT_EQ(logger->level(), log::level::warn);
}

TEST(RouterConfigTest, ModeToStr) {
  EXPECT_EQ(ModeToStr(Mode::Debug), "debug");
  EXPECT_EQ(ModeToStr(Mode::Test), "test");
  EXPECT_EQ(ModeToStr(Mode::Release), "release");
}

}  // namespace xylium
