#include "scanner/scanner_core.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "core/common/config/config_manager.hpp"
#include "core/common/config/scan_settings.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/classifier.hpp"
#include "core/device/manager/snapshot_reconciler.hpp"
#include "core/device/mutation/mutation_bus.hpp"
#include "core/device/mutation/mutation_codec.hpp"
#include "core/device/persistence/persistence.hpp"
#include "core/discovery/discovery_orchestrator.hpp"
#include "core/discovery/network/host_enumerator.hpp"
#include "core/discovery/network/neighbor_table.hpp"
#include "core/discovery/probe/icmp_probe.hpp"
#include "core/discovery/providers/neighbor_watch_provider.hpp"
#include "core/discovery/scheduler/ping_scheduler.hpp"
#include "core/discovery/scheduler/scan_progress.hpp"
#include "scanner/version.hpp"
#include "services/web_services/api/rest_api.hpp"
#include "services/web_services/websocket/websocket_server.hpp"

namespace lanscan {
namespace scanner {

namespace {

namespace cfgns = lanscan::core::common::config;
namespace logns = lanscan::core::common::log;
namespace timens = lanscan::core::common::time;
namespace dev = lanscan::core::device;
namespace disc = lanscan::core::discovery;
namespace web = lanscan::services::web_services;

std::atomic<bool> g_running{true};

void HandleSignal(int) {
  g_running.store(false);
}

std::shared_ptr<logns::Logger> MakeLogger(const cfgns::LogSettings& ls) {
  std::error_code ec;
  const std::filesystem::path log_path(ls.file);
  if (!log_path.parent_path().empty()) std::filesystem::create_directories(log_path.parent_path(), ec);

  std::shared_ptr<logns::Sink> sink = std::make_shared<logns::FileSink>(log_path);
  if (ls.console) sink = std::make_shared<logns::TeeSink>(sink, std::make_shared<logns::ConsoleSink>());
  auto logger = std::make_shared<logns::Logger>(sink);

  if (const auto lvl = logns::ParseLevel(ls.level); lvl.has_value()) {
    logger->SetLevel(*lvl);
  } else {
    std::cerr << "unknown log level '" << ls.level << "', using info\n";
  }
  return logger;
}

disc::ScanRequest DefaultScanRequest(const cfgns::ScanSettings& s) {
  disc::ScanRequest r;
  r.hosts = s.hosts;
  r.probe.count = static_cast<int>(s.ping_count);
  r.probe.interval_ms = timens::SecondsToMs(s.ping_interval_sec);
  r.probe.timeout_ms = timens::SecondsToMs(s.ping_timeout_sec);
  r.warmup_sec = s.warmup_sec;
  r.auto_enumerate = s.auto_enumerate;
  r.max_auto_hosts = static_cast<std::size_t>(s.max_auto_hosts);
  return r;
}

}  // namespace

int ScannerCore::Run(const Args& args) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  if (args.print_version) {
    std::cout << Version() << "\n";
    return 0;
  }

  cfgns::ConfigManager cfg;
  if (!args.config_yaml.empty() && !cfg.LoadYamlFile(args.config_yaml)) {
    std::cerr << "failed to load config " << args.config_yaml << ": " << cfg.LastError() << "\n";
    return 2;
  }

  cfgns::Settings settings = cfgns::LoadSettings(cfg);
  if (args.log_file) settings.log.file = *args.log_file;
  if (args.log_level) settings.log.level = *args.log_level;

  const auto errors = cfgns::ValidateSettings(settings);
  if (!errors.empty()) {
    for (const auto& e : errors) std::cerr << "config: " << e << "\n";
    return 2;
  }

  auto logger = MakeLogger(settings.log);
  logger->Info(std::string("lanscan ") + Version() + " starting");
  logger->Info(std::string("log_file=") + settings.log.file);

  auto clock = std::make_shared<timens::SystemClock>();
  auto input_bus = std::make_shared<dev::mutation::MutationBus>(settings.snapshot.bus_buffer_size, logger);
  auto output_bus = std::make_shared<dev::mutation::MutationBus>(settings.snapshot.bus_buffer_size, logger);
  auto store = std::make_shared<dev::persistence::FilePersistence>(settings.snapshot.persistence_dir, logger);

  dev::manager::ReconcilerOptions ropt;
  ropt.persistence_key = settings.snapshot.persistence_key;
  ropt.offline_check_ms = timens::SecondsToMs(settings.snapshot.offline_check_sec);
  ropt.online_grace_ms = timens::SecondsToMs(settings.snapshot.online_grace_sec);
  ropt.mark_offline_on_restore = settings.snapshot.mark_offline_on_restore;

  auto reconciler = std::make_shared<dev::manager::SnapshotReconciler>(
      input_bus, output_bus, store, std::make_shared<dev::manager::UnknownClassifier>(), clock, ropt,
      logger);
  reconciler->Restore();

  auto enumerator = std::make_shared<disc::network::LocalSubnetEnumerator>(logger);
  reconciler->SetActiveNetworks(enumerator->ActiveNetworks());
  reconciler->Start();

  auto probe = std::make_shared<disc::probe::IcmpProbe>(logger);
  disc::scheduler::PingScheduler::Options sopt;
  sopt.max_concurrent = static_cast<std::size_t>(settings.scan.max_concurrent);
  auto scheduler = std::make_shared<disc::scheduler::PingScheduler>(sopt, probe, input_bus, clock, logger);

  auto table = std::make_shared<disc::network::ProcArpTable>(settings.neighbor.table_path, logger);
  auto primer = std::make_shared<disc::network::UdpNeighborPrimer>(
      static_cast<std::uint16_t>(settings.neighbor.prime_port), logger);
  auto progress = std::make_shared<disc::scheduler::ScanProgress>();

  std::atomic<bool> progress_dirty{false};
  progress->SetListener([&progress_dirty](const disc::scheduler::ProgressSnapshot&) {
    progress_dirty.store(true);
  });

  disc::DiscoveryOrchestrator::Collaborators collab;
  collab.bus = input_bus;
  collab.reconciler = reconciler;
  collab.scheduler = scheduler;
  collab.probe = probe;
  collab.enumerator = enumerator;
  collab.neighbors = table;
  collab.primer = primer;
  collab.progress = progress;
  collab.clock = clock;
  disc::DiscoveryOrchestrator orchestrator(collab, disc::DiscoveryOrchestrator::Options{}, logger);

  std::weak_ptr<dev::manager::SnapshotReconciler> weak_reconciler = reconciler;
  disc::providers::NeighborWatchProvider::Options wopt;
  wopt.poll_interval_ms = timens::SecondsToMs(settings.neighbor.poll_interval_sec);
  orchestrator.AddPassiveProvider(std::make_shared<disc::providers::NeighborWatchProvider>(
      wopt, table,
      [weak_reconciler](const std::string& ip) -> std::optional<dev::model::Device> {
        auto r = weak_reconciler.lock();
        dev::model::Device d;
        if (r && r->FindByAddress(ip, d)) return d;
        return std::nullopt;
      },
      clock, logger));

  const disc::ScanRequest scan_defaults = DefaultScanRequest(settings.scan);

  web::api::ApiContext api_ctx;
  api_ctx.version = Version();
  api_ctx.reconciler = reconciler.get();
  api_ctx.orchestrator = &orchestrator;
  api_ctx.scan_defaults = scan_defaults;
  api_ctx.logger = logger;

  web::websocket::MongooseServer::Options web_opt;
  web_opt.listen_addr = settings.http.listen;
  web_opt.ws_path = settings.http.ws_path;
  web::websocket::MongooseServer web_server(web_opt, logger);
  bool web_up = false;
  if (settings.http.enabled) {
    web_server.SetApiContext(&api_ctx);
    web_server.SetWsOpenHandler([&](struct mg_connection* c) {
      const std::int64_t now = clock->NowMs();
      web_server.SendText(c, dev::mutation::MutationToJson(
                                 dev::mutation::SnapshotMutation{reconciler->Devices()}, now,
                                 reconciler->GraceMs()));
    });
    web_up = web_server.Start();
    if (!web_up) logger->Error("Failed to start web server on " + web_opt.listen_addr);
  }

  auto feed = reconciler->Subscribe(false);

  if (settings.scan.passive_on_start) orchestrator.StartBonjour();
  if (settings.scan.scan_on_start) orchestrator.StartScan(scan_defaults);

  const std::int64_t rescan_ms = timens::SecondsToMs(settings.scan.interval_sec);
  std::int64_t last_scan_ms = clock->NowMs();
  bool was_scanning = orchestrator.CurrentState().scanning;
  std::int64_t last_heartbeat_ms = 0;

  while (g_running.load()) {
    if (web_up) {
      web_server.Poll(50);
    } else {
      timens::SleepMs(50);
    }

    const std::int64_t now = clock->NowMs();
    dev::mutation::Mutation m;
    while (feed->TryNext(m)) {
      if (web_up) web_server.BroadcastText(dev::mutation::MutationToJson(m, now, reconciler->GraceMs()));
    }
    if (progress_dirty.exchange(false) && web_up) {
      web_server.BroadcastText(lanscan::core::common::json::Object({
          {"type", lanscan::core::common::json::Quote("progress")},
          {"progress", progress->Snapshot().ToJson()},
      }));
    }

    const bool scanning = orchestrator.CurrentState().scanning;
    if (was_scanning && !scanning) last_scan_ms = now;
    was_scanning = scanning;
    if (rescan_ms > 0 && !scanning && now - last_scan_ms >= rescan_ms) {
      logger->Info("periodic rescan");
      orchestrator.StartScan(scan_defaults);
      last_scan_ms = now;
      was_scanning = true;
    }

    if (last_heartbeat_ms == 0 || now - last_heartbeat_ms >= 10'000) {
      last_heartbeat_ms = now;
      logger->Debug("heartbeat devices=" + std::to_string(reconciler->Devices().size()));
      logger->Flush();
    }
  }

  logger->Info("lanscan stopping");
  orchestrator.StopScan();
  orchestrator.StopBonjour();
  reconciler->Stop();
  if (!reconciler->SaveSnapshotNow()) logger->Warn("final snapshot save failed");
  feed->Close();
  input_bus->CloseAll();
  output_bus->CloseAll();
  logger->Flush();
  return 0;
}

}  // namespace scanner
}  // namespace lanscan
