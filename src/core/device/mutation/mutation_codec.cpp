#include "core/device/mutation/mutation_codec.hpp"

#include <string>
#include <vector>

#include "core/common/utils/json_utils.hpp"
#include "core/device/model/device_codec.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace mutation {

namespace json = common::json;

std::string FieldSetToJson(const FieldSet& fields) {
  std::vector<std::string> names;
  names.reserve(fields.size());
  for (const DeviceField f : fields) names.push_back(json::Quote(ToString(f)));
  return json::Array(names);
}

std::string MutationToJson(const Mutation& m, std::int64_t now_ms, std::int64_t grace_ms) {
  if (const auto* snap = std::get_if<SnapshotMutation>(&m)) {
    return json::Object({
        {"type", json::Quote("snapshot")},
        {"devices", model::DeviceViewsToJson(snap->devices, now_ms, grace_ms)},
    });
  }
  const auto& c = std::get<ChangeMutation>(m);
  return json::Object({
      {"type", json::Quote("change")},
      {"source", json::Quote(ToString(c.source))},
      {"changed", FieldSetToJson(c.changed)},
      {"before", c.before ? model::DeviceViewToJson(*c.before, now_ms, grace_ms) : "null"},
      {"after", model::DeviceViewToJson(c.after, now_ms, grace_ms)},
  });
}

}  // namespace mutation
}  // namespace device
}  // namespace core
}  // namespace lanscan
