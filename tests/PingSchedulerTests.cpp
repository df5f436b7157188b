#include <gtest/gtest.h>

#include "core/device/manager/snapshot_reconciler.hpp"
#include "core/discovery/scheduler/ping_scheduler.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace lanscan::core::discovery::scheduler {
namespace {

using device::mutation::ChangeMutation;
using device::mutation::Mutation;
using device::mutation::MutationBus;
using device::mutation::MutationSource;
using lanscan::testing::FakeProbe;

std::vector<std::string> Hosts(int first, int last) {
  std::vector<std::string> out;
  for (int i = first; i <= last; ++i) out.push_back("10.0.0." + std::to_string(i));
  return out;
}

probe::ProbeConfig FastConfig() {
  probe::ProbeConfig c;
  c.count = 2;
  c.interval_ms = 0;
  c.timeout_ms = 10;
  return c;
}

TEST(PingSchedulerTests, ReplyBecomesOneDeviceWithMeasuredRtt) {
  auto probe = std::make_shared<FakeProbe>();
  probe->Add("10.0.0.201", {{true, true}, 3.2});

  auto input = std::make_shared<MutationBus>(64);
  auto output = std::make_shared<MutationBus>(64);
  device::manager::ReconcilerOptions opts;
  opts.offline_check_ms = 0;
  auto reconciler = std::make_shared<device::manager::SnapshotReconciler>(
      input, output, std::make_shared<lanscan::testing::InMemoryPersistence>(), nullptr,
      std::make_shared<lanscan::testing::FakeClock>(), opts);
  ASSERT_TRUE(reconciler->Start());

  PingScheduler scheduler({4}, probe, input);
  common::CancellationToken token;
  EXPECT_EQ(scheduler.Enqueue({"10.0.0.201"}, FastConfig(), token), 1u);
  ASSERT_TRUE(reconciler->Drain(2000));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(*devices[0].primary_ip, "10.0.0.201");
  ASSERT_TRUE(devices[0].rtt_millis.has_value());
  EXPECT_DOUBLE_EQ(*devices[0].rtt_millis, 3.2);
  reconciler->Stop();
}

TEST(PingSchedulerTests, FirstSuccessStopsFurtherAttempts) {
  auto probe = std::make_shared<FakeProbe>();
  probe->Add("10.0.0.1", {{false, true, true, true}, 1.5});
  auto bus = std::make_shared<MutationBus>(16);
  auto sub = bus->Subscribe();

  PingScheduler scheduler({1}, probe, bus);
  probe::ProbeConfig cfg = FastConfig();
  cfg.count = 4;
  common::CancellationToken token;
  EXPECT_EQ(scheduler.Enqueue({"10.0.0.1"}, cfg, token), 1u);

  EXPECT_EQ(probe->Attempts(), 2);
  EXPECT_EQ(sub->Pending(), 1u);
  Mutation m;
  ASSERT_TRUE(sub->TryNext(m));
  const auto& c = std::get<ChangeMutation>(m);
  EXPECT_EQ(c.source, MutationSource::Ping);
  EXPECT_DOUBLE_EQ(*c.after.rtt_millis, 1.5);
}

TEST(PingSchedulerTests, TimeoutsEmitNothing) {
  auto probe = std::make_shared<FakeProbe>();
  auto bus = std::make_shared<MutationBus>(16);
  auto sub = bus->Subscribe();

  PingScheduler scheduler({8}, probe, bus);
  common::CancellationToken token;
  ScanProgress progress;
  progress.Begin(3);
  EXPECT_EQ(scheduler.Enqueue(Hosts(1, 3), FastConfig(), token, &progress), 0u);

  EXPECT_EQ(sub->Pending(), 0u);
  const auto snap = progress.Snapshot();
  EXPECT_EQ(snap.completed_hosts, 3u);
  EXPECT_EQ(snap.success_hosts, 0u);
}

TEST(PingSchedulerTests, NeverExceedsConcurrencyBound) {
  auto probe = std::make_shared<FakeProbe>();
  probe->SetDelayMs(5);
  auto bus = std::make_shared<MutationBus>(16);

  PingScheduler scheduler({4}, probe, bus);
  common::CancellationToken token;
  scheduler.Enqueue(Hosts(1, 40), FastConfig(), token);

  EXPECT_LE(probe->MaxInFlight(), 4);
  EXPECT_GE(probe->MaxInFlight(), 1);
  EXPECT_EQ(probe->Probed().size(), 40u);
}

TEST(PingSchedulerTests, ProgressCountsEveryHostAndReply) {
  auto probe = std::make_shared<FakeProbe>();
  probe->Add("10.0.0.2", {{true}, 0.8});
  probe->Add("10.0.0.5", {{false, true}, 2.0});
  auto bus = std::make_shared<MutationBus>(16);

  PingScheduler scheduler({3}, probe, bus);
  common::CancellationToken token;
  ScanProgress progress;
  progress.Begin(6);
  EXPECT_EQ(scheduler.Enqueue(Hosts(1, 6), FastConfig(), token, &progress), 2u);

  const auto snap = progress.Snapshot();
  EXPECT_EQ(snap.total_hosts, 6u);
  EXPECT_EQ(snap.completed_hosts, 6u);
  EXPECT_EQ(snap.success_hosts, 2u);
}

TEST(PingSchedulerTests, CancelledTokenAbandonsQueuedHosts) {
  auto probe = std::make_shared<FakeProbe>();
  auto bus = std::make_shared<MutationBus>(16);
  PingScheduler scheduler({2}, probe, bus);

  common::CancellationToken token;
  token.Cancel();
  EXPECT_EQ(scheduler.Enqueue(Hosts(1, 10), FastConfig(), token), 0u);
  EXPECT_TRUE(probe->Probed().empty());
}

TEST(PingSchedulerTests, CancellationMidSweepStopsEarly) {
  auto probe = std::make_shared<FakeProbe>();
  probe->SetDelayMs(20);
  auto bus = std::make_shared<MutationBus>(16);
  PingScheduler scheduler({1}, probe, bus);

  common::CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.Cancel();
  });
  scheduler.Enqueue(Hosts(1, 50), FastConfig(), token);
  canceller.join();

  EXPECT_LT(probe->Probed().size(), 50u);
}

TEST(PingSchedulerTests, ZeroConcurrencyIsTreatedAsOne) {
  PingScheduler scheduler({0}, std::make_shared<FakeProbe>(), std::make_shared<MutationBus>(4));
  EXPECT_EQ(scheduler.MaxConcurrent(), 1u);
}

}  // namespace
}  // namespace lanscan::core::discovery::scheduler
