#include "services/web_services/api/rest_api.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace lanscan {
namespace services {
namespace web_services {
namespace api {

namespace json = lanscan::core::common::json;

namespace {

constexpr std::size_t kMaxBodyHosts = 4096;

static std::string ToStdString(const struct mg_str& s) {
  return std::string(s.buf, s.len);
}

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static bool IsBlank(const std::string& s) {
  for (const char c : s) {
    if (c != ' ' && c != '\n' && c != '\r' && c != '\t') return false;
  }
  return true;
}

static void ReplyOk(struct mg_connection* c, bool ok) {
  const std::string resp = json::Object({{"ok", json::Bool(ok)}});
  mg_http_reply(c, ok ? 200 : 409, "Content-Type: application/json\r\n", "%s\n", resp.c_str());
}

static std::string StateJson(const lanscan::core::discovery::ControlState& s) {
  return json::Object({
      {"passiveDiscoveryActive", json::Bool(s.passive_active)},
      {"activeScanInProgress", json::Bool(s.scanning)},
  });
}

}  // namespace

bool ParseScanRequest(const std::string& body, lanscan::core::discovery::ScanRequest& out,
                      std::string& err) {
  if (IsBlank(body)) return true;

  const struct mg_str js = mg_str(body.c_str());
  int root_len = 0;
  if (mg_json_get(js, "$", &root_len) < 0) {
    err = "invalid_json";
    return false;
  }

  std::vector<std::string> hosts;
  for (std::size_t i = 0; i < kMaxBodyHosts; ++i) {
    const std::string path = "$.hosts[" + std::to_string(i) + "]";
    char* s = mg_json_get_str(js, path.c_str());
    if (s == nullptr) break;
    std::string host(s);
    mg_free(s);
    if (!lanscan::core::common::net::IsIpv4(host)) {
      err = "invalid_host";
      return false;
    }
    hosts.push_back(std::move(host));
  }
  if (!hosts.empty()) out.hosts = std::move(hosts);

  double num = 0.0;
  if (mg_json_get_num(js, "$.warmup_sec", &num)) {
    if (num < 0) {
      err = "invalid_warmup_sec";
      return false;
    }
    out.warmup_sec = num;
  }
  if (mg_json_get_num(js, "$.max_hosts", &num)) {
    if (num < 0) {
      err = "invalid_max_hosts";
      return false;
    }
    out.max_auto_hosts = static_cast<std::size_t>(num);
  }
  if (mg_json_get_num(js, "$.ping_count", &num) && num >= 1) out.probe.count = static_cast<int>(num);
  if (mg_json_get_num(js, "$.ping_timeout_sec", &num) && num > 0) {
    out.probe.timeout_ms = lanscan::core::common::time::SecondsToMs(num);
  }
  if (mg_json_get_num(js, "$.ping_interval_sec", &num) && num >= 0) {
    out.probe.interval_ms = lanscan::core::common::time::SecondsToMs(num);
  }

  bool flag = false;
  if (mg_json_get_bool(js, "$.auto_enumerate", &flag)) out.auto_enumerate = flag;
  return true;
}

bool HandleScanApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                   const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;
  const bool scan_path = rel_path.compare(0, 5, "/scan") == 0;
  const bool bonjour_path = rel_path.compare(0, 8, "/bonjour") == 0;
  if (!scan_path && !bonjour_path) return false;

  if (ctx.orchestrator == nullptr) {
    mg_http_reply(c, 500, "Content-Type: application/json\r\n", "{\"error\":\"orchestrator_null\"}\n");
    return true;
  }
  auto& orch = *ctx.orchestrator;

  if (IsMethod(hm, "GET") && rel_path == "/scan/state") {
    const std::string body = StateJson(orch.CurrentState());
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/scan/progress") {
    const std::string body = orch.Progress()->Snapshot().ToJson();
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  if (IsMethod(hm, "POST") && rel_path == "/scan/start") {
    lanscan::core::discovery::ScanRequest req = ctx.scan_defaults;
    std::string err;
    if (!ParseScanRequest(ToStdString(hm->body), req, err)) {
      const std::string resp = json::Object({{"error", json::Quote(err)}});
      mg_http_reply(c, 400, "Content-Type: application/json\r\n", "%s\n", resp.c_str());
      return true;
    }
    ReplyOk(c, orch.StartScan(std::move(req)));
    return true;
  }

  if (IsMethod(hm, "POST") && rel_path == "/scan/stop") {
    orch.StopScan();
    ReplyOk(c, true);
    return true;
  }

  if (IsMethod(hm, "POST") && rel_path == "/bonjour/start") {
    ReplyOk(c, orch.StartBonjour());
    return true;
  }

  if (IsMethod(hm, "POST") && rel_path == "/bonjour/stop") {
    orch.StopBonjour();
    ReplyOk(c, true);
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace lanscan
