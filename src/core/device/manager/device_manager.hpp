#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/device/model/device_entity.hpp"
#include "core/device/mutation/mutation.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace manager {

// Canonical device collection and the field-level merge rules. Not thread-safe;
// the owner serializes access.
class DeviceRegistry {
public:
  struct MergeResult {
    std::optional<model::Device> before;
    model::Device after;
    mutation::FieldSet changed;
    bool created = false;
  };

  bool Has(const std::string& id) const;
  bool Get(const std::string& id, model::Device& out) const;
  std::size_t Size() const { return by_id_.size(); }

  // Sorted by display address, numeric for IPv4; devices without an address last.
  std::vector<model::Device> List() const;

  // Matches the primary address first, then any known address.
  bool FindByAddress(const std::string& ip, model::Device& out) const;

  // Folds an observation into the record with the same id, creating it when absent.
  // `incoming.id` must already be resolved. Classification and auto_name are derived
  // by the owner and never taken from the observation.
  MergeResult Merge(const model::Device& incoming, std::int64_t now_ms);

  // Stores a record as-is, bypassing merge rules. Returns the previous value if any.
  std::optional<model::Device> Put(model::Device device);

  void Clear();

  std::string ToJsonList(std::int64_t now_ms, std::int64_t grace_ms) const;
  bool ToJsonOne(const std::string& id, std::int64_t now_ms, std::int64_t grace_ms,
                 std::string& out_json) const;

  static void MergeInto(model::Device& existing, const model::Device& incoming, std::int64_t now_ms);
  static std::vector<model::NetworkService> MergeServices(const std::vector<model::NetworkService>& a,
                                                          const std::vector<model::NetworkService>& b);
  static std::vector<model::Port> MergePorts(const std::vector<model::Port>& a,
                                             const std::vector<model::Port>& b);

private:
  std::unordered_map<std::string, model::Device> by_id_;
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace lanscan
