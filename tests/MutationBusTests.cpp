#include <gtest/gtest.h>

#include "core/device/mutation/mutation_bus.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace lanscan::core::device::mutation {
namespace {

Mutation HostObservation(const std::string& hostname) {
  model::Device d;
  d.hostname = hostname;
  return Observation(d, MutationSource::Mdns);
}

std::string HostnameOf(const Mutation& m) {
  const auto* c = std::get_if<ChangeMutation>(&m);
  if (c == nullptr || !c->after.hostname) return {};
  return *c->after.hostname;
}

std::vector<std::string> DrainHostnames(Subscription& sub) {
  std::vector<std::string> out;
  Mutation m;
  while (sub.TryNext(m)) out.push_back(HostnameOf(m));
  return out;
}

TEST(MutationBusTests, FansOutToEverySubscriberInOrder) {
  MutationBus bus(16);
  auto a = bus.Subscribe();
  auto b = bus.Subscribe();
  auto c = bus.Subscribe();

  bus.Emit(HostObservation("one"));
  bus.Emit(HostObservation("two"));
  bus.Emit(HostObservation("three"));

  const std::vector<std::string> expected{"one", "two", "three"};
  EXPECT_EQ(DrainHostnames(*a), expected);
  EXPECT_EQ(DrainHostnames(*b), expected);
  EXPECT_EQ(DrainHostnames(*c), expected);
  EXPECT_EQ(bus.SubscriberCount(), 3u);
}

TEST(MutationBusTests, LateSubscriberReplaysOnlyTheNewestBufferedItems) {
  MutationBus bus(4);
  for (int i = 0; i < 10; ++i) bus.Emit(HostObservation("h" + std::to_string(i)));

  EXPECT_EQ(bus.BufferedCount(), 4u);
  auto late = bus.Subscribe(true);
  const std::vector<std::string> expected{"h6", "h7", "h8", "h9"};
  EXPECT_EQ(DrainHostnames(*late), expected);
}

TEST(MutationBusTests, SubscriberWithoutReplayOnlySeesLiveItems) {
  MutationBus bus(8);
  bus.Emit(HostObservation("old"));
  auto sub = bus.Subscribe(false);
  bus.Emit(HostObservation("new"));

  const std::vector<std::string> expected{"new"};
  EXPECT_EQ(DrainHostnames(*sub), expected);
}

TEST(MutationBusTests, ClearBufferDropsReplayHistory) {
  MutationBus bus(8);
  bus.Emit(HostObservation("a"));
  bus.Emit(HostObservation("b"));
  bus.ClearBuffer();
  EXPECT_EQ(bus.BufferedCount(), 0u);

  auto sub = bus.Subscribe(true);
  Mutation m;
  EXPECT_FALSE(sub->TryNext(m));
}

TEST(MutationBusTests, ZeroCapacityKeepsNothing) {
  MutationBus bus(0);
  bus.Emit(HostObservation("a"));
  EXPECT_EQ(bus.BufferedCount(), 0u);
}

TEST(MutationBusTests, ClosedSubscriptionIsPrunedAndStopsReceiving) {
  MutationBus bus(8);
  auto keep = bus.Subscribe();
  auto gone = bus.Subscribe();
  gone->Close();

  bus.Emit(HostObservation("x"));
  EXPECT_EQ(gone->Pending(), 0u);
  EXPECT_EQ(keep->Pending(), 1u);
  EXPECT_EQ(bus.SubscriberCount(), 1u);
}

TEST(MutationBusTests, NextTimesOutWhenIdleAndReturnsOnClose) {
  MutationBus bus(8);
  auto sub = bus.Subscribe();

  Mutation m;
  EXPECT_FALSE(sub->Next(m, 10));

  bus.CloseAll();
  EXPECT_TRUE(sub->Closed());
  EXPECT_FALSE(sub->Next(m, 1000));
}

TEST(MutationBusTests, DeliveredCountsEveryItemHandedToTheSubscriber) {
  MutationBus bus(8);
  auto sub = bus.Subscribe();
  bus.Emit(HostObservation("a"));
  bus.Emit(HostObservation("b"));

  Mutation m;
  ASSERT_TRUE(sub->Next(m, 100));
  EXPECT_EQ(HostnameOf(m), "a");
  EXPECT_EQ(sub->Delivered(), 2u);
  EXPECT_EQ(sub->Pending(), 1u);
}

TEST(MutationBusTests, SnapshotAndChangeAreDistinguishable) {
  MutationBus bus(8);
  auto sub = bus.Subscribe();
  bus.Emit(SnapshotMutation{});
  bus.Emit(HostObservation("c"));

  Mutation m;
  ASSERT_TRUE(sub->TryNext(m));
  EXPECT_TRUE(IsSnapshot(m));
  ASSERT_TRUE(sub->TryNext(m));
  ASSERT_TRUE(IsChange(m));
  const auto& c = std::get<ChangeMutation>(m);
  EXPECT_FALSE(c.before.has_value());
  EXPECT_EQ(c.changed, AllFields());
  EXPECT_EQ(c.source, MutationSource::Mdns);
}

}  // namespace
}  // namespace lanscan::core::device::mutation
