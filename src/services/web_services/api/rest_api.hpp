#pragma once

#include <memory>
#include <string>

#include "mongoose.h"

#include "core/common/logger/logger.hpp"
#include "core/device/manager/snapshot_reconciler.hpp"
#include "core/discovery/discovery_orchestrator.hpp"

namespace lanscan {
namespace services {
namespace web_services {
namespace api {

struct ApiContext {
    std::string base_path = "/api";
    std::string version;

    lanscan::core::device::manager::SnapshotReconciler* reconciler = nullptr;
    lanscan::core::discovery::DiscoveryOrchestrator* orchestrator = nullptr;

    // Used for POST /scan/start fields the body leaves out.
    lanscan::core::discovery::ScanRequest scan_defaults;

    std::shared_ptr<lanscan::core::common::log::Logger> logger;
};

bool HandleHttpRequest(struct mg_connection* c, struct mg_http_message* hm, const ApiContext& ctx);

bool HandleSystemApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

bool HandleScanApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                   const ApiContext& ctx);

// Fills a sweep request from a JSON body; absent fields keep the values in `out`.
bool ParseScanRequest(const std::string& body, lanscan::core::discovery::ScanRequest& out,
                      std::string& err);

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace lanscan
