#pragma once

#include "core/device/model/device_entity.hpp"

namespace lanscan {
namespace core {
namespace device {
namespace manager {

// Pure function of a device record. Implementations must always return a value.
class Classifier {
public:
  virtual ~Classifier() = default;
  virtual model::Classification Classify(const model::Device& device) const = 0;
};

class UnknownClassifier final : public Classifier {
public:
  model::Classification Classify(const model::Device&) const override {
    model::Classification c;
    c.form_factor = model::DeviceFormFactor::Unknown;
    c.confidence = model::ClassificationConfidence::Unknown;
    c.reason = "no rule matched";
    return c;
  }
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace lanscan
