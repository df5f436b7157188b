#include <gtest/gtest.h>

#include "core/discovery/scheduler/scan_progress.hpp"

#include <string>
#include <vector>

namespace lanscan::core::discovery::scheduler {
namespace {

TEST(ScanProgressTests, CountsCompletionsAndSuccesses) {
  ScanProgress p;
  p.Begin(4);
  p.RecordCompleted(true);
  p.RecordCompleted(false);
  p.RecordCompleted(true);

  const auto s = p.Snapshot();
  EXPECT_TRUE(s.started);
  EXPECT_FALSE(s.finished);
  EXPECT_EQ(s.total_hosts, 4u);
  EXPECT_EQ(s.completed_hosts, 3u);
  EXPECT_EQ(s.success_hosts, 2u);
}

TEST(ScanProgressTests, BeginKeepsCurrentPhaseAndResetClears) {
  ScanProgress p;
  p.SetPhase(ScanPhase::Enumerating);
  p.Begin(10);
  EXPECT_EQ(p.Snapshot().phase, ScanPhase::Enumerating);

  p.Finish();
  EXPECT_TRUE(p.Snapshot().finished);
  EXPECT_EQ(p.Snapshot().phase, ScanPhase::Finished);

  p.Reset();
  const auto s = p.Snapshot();
  EXPECT_FALSE(s.started);
  EXPECT_FALSE(s.finished);
  EXPECT_EQ(s.phase, ScanPhase::Idle);
  EXPECT_EQ(s.total_hosts, 0u);
}

TEST(ScanProgressTests, ListenerSeesEveryUpdateButNotRepeatedPhases) {
  ScanProgress p;
  std::vector<ProgressSnapshot> seen;
  p.SetListener([&seen](const ProgressSnapshot& s) { seen.push_back(s); });

  p.Begin(2);
  p.SetPhase(ScanPhase::Pinging);
  p.SetPhase(ScanPhase::Pinging);
  p.RecordCompleted(true);
  p.Finish();

  ASSERT_EQ(seen.size(), 4u);
  EXPECT_EQ(seen[1].phase, ScanPhase::Pinging);
  EXPECT_EQ(seen[2].completed_hosts, 1u);
  EXPECT_TRUE(seen[3].finished);
}

TEST(ScanProgressTests, SerializesWithCamelCaseKeys) {
  ProgressSnapshot s;
  s.phase = ScanPhase::ArpRefresh;
  s.total_hosts = 254;
  s.completed_hosts = 10;
  s.success_hosts = 3;
  s.started = true;
  EXPECT_EQ(s.ToJson(),
            "{\"phase\":\"arpRefresh\",\"totalHosts\":254,\"completedHosts\":10,\"successHosts\":3,"
            "\"started\":true,\"finished\":false}");
}

TEST(ScanProgressTests, PhaseNames) {
  EXPECT_STREQ(ToString(ScanPhase::Idle), "idle");
  EXPECT_STREQ(ToString(ScanPhase::MdnsWarmup), "mdnsWarmup");
  EXPECT_STREQ(ToString(ScanPhase::ArpPriming), "arpPriming");
  EXPECT_STREQ(ToString(ScanPhase::Finished), "finished");
}

}  // namespace
}  // namespace lanscan::core::discovery::scheduler
