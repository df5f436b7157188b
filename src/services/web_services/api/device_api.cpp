#include "services/web_services/api/rest_api.hpp"

#include <string>
#include <vector>

#include "core/common/utils/json_utils.hpp"

namespace lanscan {
namespace services {
namespace web_services {
namespace api {

namespace json = lanscan::core::common::json;

namespace {

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// MAC ids arrive with ':' percent-encoded.
static std::string UrlDecode(const std::string& s) {
  std::vector<char> buf(s.size() + 1, '\0');
  const int n = mg_url_decode(s.c_str(), s.size(), buf.data(), buf.size(), 0);
  if (n < 0) return s;
  return std::string(buf.data(), static_cast<std::size_t>(n));
}

}  // namespace

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;
  if (!StartsWith(rel_path, "/devices")) return false;
  if (ctx.reconciler == nullptr) {
    mg_http_reply(c, 500, "Content-Type: application/json\r\n", "{\"error\":\"reconciler_null\"}\n");
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/devices") {
    const std::string body = ctx.reconciler->ToJsonList();
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  if (IsMethod(hm, "POST") && rel_path == "/devices/clear") {
    ctx.reconciler->ClearAllData();
    const std::string resp = json::Object({{"ok", json::Bool(true)}});
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", resp.c_str());
    return true;
  }

  if (IsMethod(hm, "GET") && StartsWith(rel_path, "/devices/")) {
    const std::string id = UrlDecode(rel_path.substr(std::string("/devices/").size()));
    std::string body;
    if (!id.empty() && ctx.reconciler->ToJsonOne(id, body)) {
      mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    } else {
      mg_http_reply(c, 404, "Content-Type: application/json\r\n", "{\"error\":\"device_not_found\"}\n");
    }
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace lanscan
