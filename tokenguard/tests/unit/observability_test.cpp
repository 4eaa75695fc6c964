#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "tokenguard/observability.hpp"

namespace {

TEST(ObservabilityTest, WritesJsonLine) {
  std::ostringstream sink;
  tokenguard::Observability obs(tokenguard::LogLevel::kDebug, sink);
  obs.Log(tokenguard::LogContext{tokenguard::LogLevel::kWarn, "trace-1", "token.prev_seen", 12, 34,
                                 {{"changed", 1}}});

  auto line = nlohmann::json::parse(sink.str());
  EXPECT_EQ(line["level"], "warn");
  EXPECT_EQ(line["eventName"], "token.prev_seen");
  EXPECT_EQ(line["traceId"], "trace-1");
  EXPECT_EQ(line["userId"], 12);
  EXPECT_EQ(line["tokenId"], 34);
  EXPECT_EQ(line["detail"]["changed"], 1);
}

TEST(ObservabilityTest, OmitsEmptyFields) {
  std::ostringstream sink;
  tokenguard::Observability obs(tokenguard::LogLevel::kDebug, sink);
  obs.Log(tokenguard::LogContext{tokenguard::LogLevel::kInfo, "", "token.cleanup", std::nullopt, std::nullopt,
                                 nullptr});
  auto line = nlohmann::json::parse(sink.str());
  EXPECT_FALSE(line.contains("traceId"));
  EXPECT_FALSE(line.contains("userId"));
  EXPECT_FALSE(line.contains("detail"));
}

TEST(ObservabilityTest, FiltersBelowMinimumLevel) {
  std::ostringstream sink;
  tokenguard::Observability obs(tokenguard::LogLevel::kWarn, sink);
  obs.Log(tokenguard::LogContext{tokenguard::LogLevel::kInfo, "", "quiet", std::nullopt, std::nullopt, nullptr});
  EXPECT_TRUE(sink.str().empty());
  obs.SetMinLevel(tokenguard::LogLevel::kDebug);
  obs.Log(tokenguard::LogContext{tokenguard::LogLevel::kDebug, "", "loud", std::nullopt, std::nullopt, nullptr});
  EXPECT_NE(sink.str().find("loud"), std::string::npos);
}

TEST(ObservabilityTest, ParsesLevels) {
  EXPECT_EQ(tokenguard::ParseLogLevel("debug"), tokenguard::LogLevel::kDebug);
  EXPECT_EQ(tokenguard::ParseLogLevel("warning"), tokenguard::LogLevel::kWarn);
  EXPECT_EQ(tokenguard::ParseLogLevel("error"), tokenguard::LogLevel::kError);
  EXPECT_EQ(tokenguard::ParseLogLevel("bogus"), tokenguard::LogLevel::kInfo);
}

TEST(ObservabilityTest, CountersAccumulate) {
  std::ostringstream sink;
  tokenguard::Observability obs(tokenguard::LogLevel::kError, sink);
  obs.IncrementLookup();
  obs.IncrementLookup();
  obs.IncrementMiss();
  obs.AddSwept(7);
  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.lookups, 2u);
  EXPECT_EQ(snapshot.misses, 1u);
  EXPECT_EQ(snapshot.swept, 7u);
  EXPECT_EQ(snapshot.rotations, 0u);
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}

}  // namespace
