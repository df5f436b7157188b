#include <gtest/gtest.h>

#include "core/common/logger/logger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lanscan::core::common::log {
namespace {

class CaptureSink final : public Sink {
public:
  void Write(const Event& e) override { events.push_back(e); }
  std::vector<Event> events;
};

TEST(LoggerTests, ParseLevelIsCaseInsensitive) {
  EXPECT_EQ(ParseLevel("DEBUG"), Level::Debug);
  EXPECT_EQ(ParseLevel("warning"), Level::Warn);
  EXPECT_EQ(ParseLevel("Error"), Level::Error);
  EXPECT_FALSE(ParseLevel("verbose").has_value());
}

TEST(LoggerTests, DropsEventsBelowThreshold) {
  auto sink = std::make_shared<CaptureSink>();
  auto logger = std::make_shared<Logger>(sink);
  logger->SetLevel(Level::Warn);

  logger->Info("hidden");
  logger->Warn("shown");
  ASSERT_EQ(sink->events.size(), 1u);
  EXPECT_EQ(sink->events[0].message, "shown");
  EXPECT_FALSE(logger->Enabled(Level::Debug));
  EXPECT_TRUE(logger->Enabled(Level::Error));
}

TEST(LoggerTests, TaggedLoggerCarriesComponentTag) {
  auto sink = std::make_shared<CaptureSink>();
  auto logger = std::make_shared<Logger>(sink);
  TaggedLogger log(logger, "snapshot");

  log.Info("restored 3 devices");
  ASSERT_EQ(sink->events.size(), 1u);
  EXPECT_EQ(sink->events[0].tag, "snapshot");

  const std::string line = FormatLine(sink->events[0]);
  EXPECT_NE(line.find("[INFO] [snapshot] restored 3 devices"), std::string::npos);
  EXPECT_EQ(line.back(), '\n');
}

TEST(LoggerTests, DetachedTaggedLoggerIsSilent) {
  TaggedLogger log;
  EXPECT_FALSE(log.Enabled(Level::Error));
  log.Error("nowhere");
}

TEST(LoggerTests, TeeSinkWritesToBoth) {
  auto a = std::make_shared<CaptureSink>();
  auto b = std::make_shared<CaptureSink>();
  Logger logger(std::make_shared<TeeSink>(a, b));
  logger.Error("boom");
  EXPECT_EQ(a->events.size(), 1u);
  EXPECT_EQ(b->events.size(), 1u);
}

}  // namespace
}  // namespace lanscan::core::common::log
