#pragma once

#include <cstdint>
#include <string>

#include "core/device/mutation/mutation.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace mutation {

// Feed frame: {"type":"snapshot","devices":[...]} or
// {"type":"change","source":...,"changed":[...],"before":...,"after":...}.
std::string MutationToJson(const Mutation& m, std::int64_t now_ms, std::int64_t grace_ms);

std::string FieldSetToJson(const FieldSet& fields);

}  // namespace mutation
}  // namespace device
}  // namespace core
}  // namespace lanscan
