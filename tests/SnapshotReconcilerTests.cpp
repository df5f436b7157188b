#include <gtest/gtest.h>

#include "core/device/manager/snapshot_reconciler.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace lanscan::core::device::manager {
namespace {

using model::Device;
using model::DiscoverySource;
using mutation::ChangeMutation;
using mutation::DeviceField;
using mutation::Mutation;
using mutation::MutationSource;
using mutation::Observation;
using mutation::SnapshotMutation;

// Uses the hostname as the display name.
class HostnameResolver final : public NameResolver {
public:
  std::optional<std::string> Resolve(const Device& d) const override {
    if (!d.hostname || d.hostname->empty()) return std::nullopt;
    return "Host " + *d.hostname;
  }
};

class SnapshotReconcilerTests : public ::testing::Test {
protected:
  void SetUp() override {
    ReconcilerOptions opts;
    opts.offline_check_ms = 0;
    Build(opts);
  }

  void Build(ReconcilerOptions options) {
    input = std::make_shared<mutation::MutationBus>(64);
    output = std::make_shared<mutation::MutationBus>(64);
    store = std::make_shared<lanscan::testing::InMemoryPersistence>();
    classifier = std::make_shared<lanscan::testing::CountingClassifier>();
    clock = std::make_shared<lanscan::testing::FakeClock>();
    reconciler = std::make_unique<SnapshotReconciler>(input, output, store, classifier, clock, options);
    feed = output->Subscribe(false);
  }

  std::vector<Mutation> Emitted() {
    std::vector<Mutation> out;
    Mutation m;
    while (feed->TryNext(m)) out.push_back(std::move(m));
    return out;
  }

  static Device MacDevice(const std::string& mac, const std::string& ip) {
    Device d;
    d.mac_address = mac;
    if (!ip.empty()) d.ips = {ip};
    return d;
  }

  static Device PingReply(const std::string& ip, std::optional<double> rtt) {
    Device d;
    d.primary_ip = ip;
    d.ips = {ip};
    d.rtt_millis = rtt;
    return d;
  }

  std::shared_ptr<mutation::MutationBus> input;
  std::shared_ptr<mutation::MutationBus> output;
  std::shared_ptr<lanscan::testing::InMemoryPersistence> store;
  std::shared_ptr<lanscan::testing::CountingClassifier> classifier;
  std::shared_ptr<lanscan::testing::FakeClock> clock;
  std::unique_ptr<SnapshotReconciler> reconciler;
  std::shared_ptr<mutation::Subscription> feed;
};

TEST_F(SnapshotReconcilerTests, SameMacOnTwoAddressesIsOneDevice) {
  reconciler->Apply(Observation(MacDevice("aa:bb:cc:00:11:22", "192.168.1.10"), MutationSource::Mdns));
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "10.0.0.5"), MutationSource::Arp));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  const Device& d = devices.front();
  EXPECT_EQ(d.id, "AA:BB:CC:00:11:22");
  EXPECT_EQ(*d.mac_address, "AA:BB:CC:00:11:22");
  EXPECT_EQ(*d.primary_ip, "192.168.1.10");
  EXPECT_EQ(d.ips, (std::set<std::string>{"10.0.0.5", "192.168.1.10"}));
  EXPECT_EQ(d.discovery_sources, (std::set<DiscoverySource>{DiscoverySource::Mdns, DiscoverySource::Arp}));
}

TEST_F(SnapshotReconcilerTests, EveryChangeCarriesThePreviousRecordAsBefore) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Mdns));
  clock->Advance(1000);
  Device named = MacDevice("AA:BB:CC:00:11:22", "");
  named.hostname = "living-room-tv";
  reconciler->Apply(Observation(named, MutationSource::Mdns));

  const auto out = Emitted();
  ASSERT_EQ(out.size(), 2u);
  const auto& first = std::get<ChangeMutation>(out[0]);
  const auto& second = std::get<ChangeMutation>(out[1]);
  EXPECT_FALSE(first.before.has_value());
  EXPECT_EQ(first.changed, mutation::AllFields());
  ASSERT_TRUE(second.before.has_value());
  EXPECT_EQ(*second.before, first.after);
  EXPECT_EQ(second.changed.count(DeviceField::Hostname), 1u);
  EXPECT_EQ(second.changed.count(DeviceField::LastSeen), 1u);
  EXPECT_EQ(second.source, MutationSource::Mdns);
}

TEST_F(SnapshotReconcilerTests, DirectUpsertFoldsAndPersists) {
  Device printer = MacDevice("AA:BB:CC:00:11:33", "192.168.1.40");
  printer.hostname = "office-printer";
  reconciler->Upsert(printer);
  reconciler->UpsertMany({MacDevice("AA:BB:CC:00:11:33", "192.168.1.41"),
                          MacDevice("AA:BB:CC:00:11:44", "192.168.1.50")},
                         MutationSource::Manual);

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 2u);
  Device found;
  ASSERT_TRUE(reconciler->FindByAddress("192.168.1.41", found));
  EXPECT_EQ(found.id, "AA:BB:CC:00:11:33");
  EXPECT_EQ(*found.hostname, "office-printer");
  EXPECT_EQ(Emitted().size(), 3u);
  EXPECT_EQ(store->SaveCount(), 3u);
}

TEST_F(SnapshotReconcilerTests, ProbeSuccessCreatesAddressKeyedDevice) {
  reconciler->Apply(Observation(PingReply("10.0.0.201", 3.2), MutationSource::Ping));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id, "10.0.0.201");
  EXPECT_EQ(*devices[0].primary_ip, "10.0.0.201");
  EXPECT_DOUBLE_EQ(*devices[0].rtt_millis, 3.2);
  EXPECT_EQ(devices[0].discovery_sources.count(DiscoverySource::Ping), 1u);
}

TEST_F(SnapshotReconcilerTests, ProbeFailureChangesNothing) {
  reconciler->Apply(Observation(PingReply("10.0.0.7", std::nullopt), MutationSource::Ping));
  EXPECT_TRUE(reconciler->Devices().empty());
  EXPECT_TRUE(Emitted().empty());
  EXPECT_EQ(store->SaveCount(), 0u);
}

TEST_F(SnapshotReconcilerTests, ProbeReplyMergesIntoRecordOwningTheAddress) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  reconciler->Apply(Observation(PingReply("192.168.1.10", 4.0), MutationSource::Ping));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id, "AA:BB:CC:00:11:22");
  EXPECT_DOUBLE_EQ(*devices[0].rtt_millis, 4.0);
  EXPECT_EQ(devices[0].discovery_sources,
            (std::set<DiscoverySource>{DiscoverySource::Arp, DiscoverySource::Ping}));
}

TEST_F(SnapshotReconcilerTests, BroadcastAndNetworkAddressesAreNeverRecorded) {
  common::net::Ipv4Network lan;
  lan.network_address = *common::net::ParseIpv4("192.168.1.0");
  lan.netmask = 0xffffff00u;
  reconciler->SetActiveNetworks({lan});

  reconciler->Apply(Observation(PingReply("192.168.1.255", 0.4), MutationSource::Ping));
  reconciler->Apply(Observation(PingReply("192.168.1.0", 0.4), MutationSource::Ping));
  reconciler->Apply(Observation(PingReply("255.255.255.255", 0.4), MutationSource::Ping));
  reconciler->Apply(Observation(PingReply("127.0.0.1", 0.1), MutationSource::Ping));

  EXPECT_TRUE(reconciler->Devices().empty());
  EXPECT_TRUE(reconciler->IsExcludedAddress("10.20.30.255"));
  EXPECT_FALSE(reconciler->IsExcludedAddress("192.168.1.1"));
}

TEST_F(SnapshotReconcilerTests, SmallPrefixesHaveNoBroadcastExclusion) {
  common::net::Ipv4Network p2p;
  p2p.network_address = *common::net::ParseIpv4("10.1.1.0");
  p2p.netmask = 0xfffffffeu;
  reconciler->SetActiveNetworks({p2p});
  EXPECT_FALSE(reconciler->IsExcludedAddress("10.1.1.1"));
}

TEST_F(SnapshotReconcilerTests, ExcludedAddressesAreStrippedFromRicherObservations) {
  Device d = MacDevice("AA:BB:CC:00:11:22", "192.168.1.255");
  d.ips.insert("192.168.1.42");
  reconciler->Apply(Observation(d, MutationSource::Mdns));

  Device addr_only;
  addr_only.ips = {"192.168.1.255"};
  reconciler->Apply(Observation(addr_only, MutationSource::Mdns));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].ips, (std::set<std::string>{"192.168.1.42"}));
  EXPECT_EQ(*devices[0].primary_ip, "192.168.1.42");
}

TEST_F(SnapshotReconcilerTests, ObservationWithoutIdentityGetsOpaqueId) {
  Device d;
  d.vendor = "Acme";
  reconciler->Apply(Observation(d, MutationSource::Manual));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id.size(), 36u);
  EXPECT_EQ(*devices[0].vendor, "Acme");
}

TEST_F(SnapshotReconcilerTests, FingerprintOnlyChangeKeepsClassification) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Mdns));
  EXPECT_EQ(classifier->calls.load(), 1);
  Emitted();

  Device fp = MacDevice("AA:BB:CC:00:11:22", "");
  fp.fingerprints = {{"http.title", "Admin"}};
  reconciler->Apply(Observation(fp, MutationSource::Mdns));

  EXPECT_EQ(classifier->calls.load(), 1);
  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  const auto& c = std::get<ChangeMutation>(out[0]);
  EXPECT_EQ(c.changed.count(DeviceField::Fingerprints), 1u);
  EXPECT_EQ(c.changed.count(DeviceField::Classification), 0u);
  EXPECT_EQ(c.before->classification, c.after.classification);
}

TEST_F(SnapshotReconcilerTests, HostnameChangeReclassifies) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Mdns));
  Emitted();

  Device named = MacDevice("AA:BB:CC:00:11:22", "");
  named.hostname = "office-printer";
  reconciler->Apply(Observation(named, MutationSource::Mdns));

  EXPECT_EQ(classifier->calls.load(), 2);
  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  const auto& c = std::get<ChangeMutation>(out[0]);
  EXPECT_EQ(c.changed.count(DeviceField::Classification), 1u);
  ASSERT_TRUE(c.after.classification.has_value());
  EXPECT_EQ(c.after.classification->form_factor, model::DeviceFormFactor::Printer);
}

TEST_F(SnapshotReconcilerTests, UnchangedObservationEmitsNothing) {
  Device d = MacDevice("AA:BB:CC:00:11:22", "192.168.1.10");
  reconciler->Apply(Observation(d, MutationSource::Arp));
  Emitted();
  const std::size_t saves = store->SaveCount();

  reconciler->Apply(Observation(d, MutationSource::Arp));
  EXPECT_TRUE(Emitted().empty());
  EXPECT_EQ(store->SaveCount(), saves);
}

TEST_F(SnapshotReconcilerTests, SweepMarksStaleDevicesOffline) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  Emitted();

  EXPECT_EQ(reconciler->SweepOffline(), 0u);
  clock->Advance(reconciler->GraceMs() + 1);
  EXPECT_EQ(reconciler->SweepOffline(), 1u);
  EXPECT_EQ(reconciler->SweepOffline(), 0u);

  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  const auto& c = std::get<ChangeMutation>(out[0]);
  EXPECT_EQ(c.source, MutationSource::Offline);
  EXPECT_EQ(c.changed, (mutation::FieldSet{DeviceField::IsOnlineOverride}));
  EXPECT_EQ(c.after.is_online_override, false);

  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", ""), MutationSource::Arp));
  Device d;
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:22", d));
  EXPECT_FALSE(d.is_online_override.has_value());
}

TEST_F(SnapshotReconcilerTests, BackgroundSweepRunsOnItsInterval) {
  ReconcilerOptions opts;
  opts.offline_check_ms = 20;
  opts.online_grace_ms = 1000;
  Build(opts);

  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  ASSERT_TRUE(reconciler->Start());
  clock->Advance(5000);

  bool offline = false;
  for (int i = 0; i < 100 && !offline; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    Device d;
    offline = reconciler->Get("AA:BB:CC:00:11:22", d) && d.is_online_override == false;
  }
  reconciler->Stop();
  EXPECT_TRUE(offline);
}

TEST_F(SnapshotReconcilerTests, FailedSaveDegradesUntilNextSuccess) {
  store->SetFailSaves(true);
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  EXPECT_TRUE(reconciler->PersistenceDegraded());
  EXPECT_EQ(reconciler->Devices().size(), 1u);
  EXPECT_EQ(Emitted().size(), 1u);

  store->SetFailSaves(false);
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:33", "192.168.1.11"), MutationSource::Arp));
  EXPECT_FALSE(reconciler->PersistenceDegraded());
  EXPECT_EQ(store->Load(ReconcilerOptions{}.persistence_key).size(), 2u);
}

TEST_F(SnapshotReconcilerTests, RemoveAllPublishesEmptySnapshot) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  Emitted();

  reconciler->RemoveAll();
  EXPECT_TRUE(reconciler->Devices().empty());
  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  ASSERT_TRUE(mutation::IsSnapshot(out[0]));
  EXPECT_TRUE(std::get<SnapshotMutation>(out[0]).devices.empty());
  EXPECT_TRUE(store->Load(ReconcilerOptions{}.persistence_key).empty());
}

TEST_F(SnapshotReconcilerTests, ClearAllDataAlsoDropsReplayBuffers) {
  input->Emit(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));

  reconciler->ClearAllData();
  EXPECT_EQ(input->BufferedCount(), 0u);
  EXPECT_EQ(output->BufferedCount(), 1u);
  EXPECT_TRUE(reconciler->Devices().empty());
}

TEST_F(SnapshotReconcilerTests, SnapshotReplacesTheWholeList) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));
  Emitted();

  SnapshotMutation snap;
  snap.devices.push_back(MacDevice("AA:BB:CC:00:11:99", "192.168.1.99"));
  reconciler->Apply(snap);

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id, "AA:BB:CC:00:11:99");
  ASSERT_TRUE(devices[0].first_seen_ms.has_value());

  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  ASSERT_TRUE(mutation::IsSnapshot(out[0]));
  EXPECT_EQ(std::get<SnapshotMutation>(out[0]).devices.size(), 1u);
}

TEST_F(SnapshotReconcilerTests, SubscribeWithSnapshotStartsWithCurrentList) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));

  auto sub = reconciler->Subscribe(true);
  Mutation m;
  ASSERT_TRUE(sub->TryNext(m));
  ASSERT_TRUE(mutation::IsSnapshot(m));
  EXPECT_EQ(std::get<SnapshotMutation>(m).devices.size(), 1u);

  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:33", "192.168.1.11"), MutationSource::Arp));
  ASSERT_TRUE(sub->TryNext(m));
  EXPECT_TRUE(mutation::IsChange(m));
}

TEST_F(SnapshotReconcilerTests, RestoreMarksEveryDeviceOffline) {
  Device a = MacDevice("AA:BB:CC:00:11:22", "192.168.1.10");
  a.id = "AA:BB:CC:00:11:22";
  a.last_seen_ms = clock->NowMs();
  Device b;
  b.id = "192.168.1.50";
  b.primary_ip = "192.168.1.50";
  store->Save({a, b}, ReconcilerOptions{}.persistence_key);

  EXPECT_EQ(reconciler->Restore(), 2u);
  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 2u);
  for (const auto& d : devices) EXPECT_EQ(d.is_online_override, false);
  EXPECT_NE(reconciler->ToJsonList().find("\"online\":false"), std::string::npos);
}

TEST_F(SnapshotReconcilerTests, ToJsonOneRendersPresentationForm) {
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));

  std::string body;
  ASSERT_TRUE(reconciler->ToJsonOne("AA:BB:CC:00:11:22", body));
  EXPECT_NE(body.find("\"displayIP\":\"192.168.1.10\""), std::string::npos);
  EXPECT_NE(body.find("\"online\":true"), std::string::npos);
  EXPECT_FALSE(reconciler->ToJsonOne("nope", body));
}

TEST_F(SnapshotReconcilerTests, WorkerFoldsBusTrafficInOrder) {
  ASSERT_TRUE(reconciler->Start());
  for (int i = 1; i <= 20; ++i) {
    Device d;
    d.primary_ip = "10.0.0." + std::to_string(i);
    d.rtt_millis = 1.0 * i;
    input->Emit(Observation(d, MutationSource::Ping));
  }
  input->Emit(Observation(PingReply("10.0.0.1", 0.5), MutationSource::Ping));

  ASSERT_TRUE(reconciler->Drain(2000));
  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 20u);
  EXPECT_EQ(devices.front().id, "10.0.0.1");
  EXPECT_DOUBLE_EQ(*devices.front().rtt_millis, 0.5);
  EXPECT_EQ(devices.back().id, "10.0.0.20");

  reconciler->Stop();
  EXPECT_FALSE(reconciler->Running());
}

TEST_F(SnapshotReconcilerTests, RefreshClassificationsOnlyEmitsDifferences) {
  Device named = MacDevice("AA:BB:CC:00:11:22", "192.168.1.10");
  named.hostname = "office-printer";
  reconciler->Apply(Observation(named, MutationSource::Mdns));
  Emitted();

  reconciler->RefreshClassifications();
  EXPECT_TRUE(Emitted().empty());
}

TEST_F(SnapshotReconcilerTests, AddressTargetedObservationKeepsOwnersMac) {
  reconciler->Upsert(MacDevice("AA:AA:AA:AA:AA:01", "192.168.1.10"));
  Device found;
  ASSERT_TRUE(reconciler->FindByAddress("192.168.1.10", found));
  Emitted();

  // The address now answers with another MAC, as after a DHCP reassignment.
  Device reassigned = MacDevice("BB:BB:BB:BB:BB:02", "192.168.1.10");
  reassigned.id = found.id;
  reassigned.primary_ip = "192.168.1.10";
  reconciler->Apply(Observation(reassigned, MutationSource::Arp));

  Device old_owner;
  ASSERT_TRUE(reconciler->Get("AA:AA:AA:AA:AA:01", old_owner));
  EXPECT_EQ(*old_owner.mac_address, "AA:AA:AA:AA:AA:01");
  Device new_owner;
  ASSERT_TRUE(reconciler->Get("BB:BB:BB:BB:BB:02", new_owner));
  EXPECT_EQ(*new_owner.mac_address, "BB:BB:BB:BB:BB:02");
  EXPECT_EQ(new_owner.ips.count("192.168.1.10"), 1u);

  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FALSE(std::get<ChangeMutation>(out[0]).before.has_value());
}

TEST_F(SnapshotReconcilerTests, AddressKeyedRecordLearnsItsMac) {
  reconciler->Apply(Observation(PingReply("10.0.0.5", 1.0), MutationSource::Ping));
  Device arp = MacDevice("aa-bb-cc-00-11-55", "10.0.0.5");
  arp.id = "10.0.0.5";
  reconciler->Apply(Observation(arp, MutationSource::Arp));

  const auto devices = reconciler->Devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id, "10.0.0.5");
  EXPECT_EQ(*devices[0].mac_address, "AA:BB:CC:00:11:55");
}

TEST_F(SnapshotReconcilerTests, ObservedClassificationIsIgnored) {
  reconciler->Upsert(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"));
  Emitted();

  Device claimed = MacDevice("AA:BB:CC:00:11:22", "");
  claimed.fingerprints = {{"http.server", "lighttpd"}};
  model::Classification router;
  router.form_factor = model::DeviceFormFactor::Router;
  router.confidence = model::ClassificationConfidence::High;
  router.reason = "provider";
  claimed.classification = router;
  reconciler->Upsert(claimed, MutationSource::HttpFingerprint);

  Device d;
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:22", d));
  ASSERT_TRUE(d.classification.has_value());
  EXPECT_EQ(d.classification->reason, "none");
  EXPECT_EQ(d.classification->form_factor, model::DeviceFormFactor::Unknown);
  const auto out = Emitted();
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(std::get<ChangeMutation>(out[0]).changed.count(DeviceField::Classification), 0u);
}

TEST_F(SnapshotReconcilerTests, FingerprintsFillMissingVendorAndModel) {
  Device d = MacDevice("AA:BB:CC:00:11:22", "192.168.1.10");
  d.fingerprints = {{"Manufacturer", "Brother"}, {"md", "HL-L2350DW"}};
  reconciler->Apply(Observation(d, MutationSource::Mdns));

  Device stored;
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:22", stored));
  EXPECT_EQ(*stored.vendor, "Brother");
  EXPECT_EQ(*stored.model_hint, "HL-L2350DW");

  Device vendor_known = MacDevice("AA:BB:CC:00:11:23", "192.168.1.11");
  vendor_known.vendor = "Acme";
  vendor_known.fingerprints = {{"manufacturer", "Other"}};
  reconciler->Apply(Observation(vendor_known, MutationSource::Mdns));
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:23", stored));
  EXPECT_EQ(*stored.vendor, "Acme");
}

TEST_F(SnapshotReconcilerTests, NameResolverFillsAutoName) {
  reconciler->SetNameResolver(std::make_shared<HostnameResolver>());
  reconciler->Apply(Observation(MacDevice("AA:BB:CC:00:11:22", "192.168.1.10"), MutationSource::Arp));

  Device named = MacDevice("AA:BB:CC:00:11:22", "");
  named.hostname = "nas";
  reconciler->Apply(Observation(named, MutationSource::Mdns));

  const auto out = Emitted();
  ASSERT_EQ(out.size(), 2u);
  EXPECT_FALSE(std::get<ChangeMutation>(out[0]).after.auto_name.has_value());
  const auto& c = std::get<ChangeMutation>(out[1]);
  EXPECT_EQ(c.changed.count(DeviceField::AutoName), 1u);
  EXPECT_EQ(*c.after.auto_name, "Host nas");

  Device stored;
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:22", stored));
  EXPECT_EQ(*stored.auto_name, "Host nas");

  Device claimed = MacDevice("AA:BB:CC:00:11:22", "");
  claimed.auto_name = "Spoofed";
  reconciler->Apply(Observation(claimed, MutationSource::Mdns));
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:22", stored));
  EXPECT_EQ(*stored.auto_name, "Host nas");
}

TEST_F(SnapshotReconcilerTests, DefaultResolverDerivesNoName) {
  Device named = MacDevice("AA:BB:CC:00:11:22", "192.168.1.10");
  named.hostname = "nas";
  reconciler->Apply(Observation(named, MutationSource::Mdns));
  Device stored;
  ASSERT_TRUE(reconciler->Get("AA:BB:CC:00:11:22", stored));
  EXPECT_FALSE(stored.auto_name.has_value());
}

}  // namespace
}  // namespace lanscan::core::device::manager
