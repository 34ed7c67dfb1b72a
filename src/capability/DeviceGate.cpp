#include "netdut/capability/DeviceGate.hpp"
#include "netdut/Logger.hpp"

#include <fmt/format.h>

namespace netdut {

DeviceGate &DeviceGate::allow_dialect(const std::string &dialect) {
  allowed_dialects_.insert(dialect);
  return *this;
}

DeviceGate &DeviceGate::only_device_type(const std::string &pattern) {
  requirements_.push_back({CapabilityPattern(pattern), false});
  return *this;
}

DeviceGate &DeviceGate::skip_device_type(const std::string &pattern) {
  requirements_.push_back({CapabilityPattern(pattern), true});
  return *this;
}

bool DeviceGate::empty() const {
  return requirements_.empty() && allowed_dialects_.empty();
}

std::optional<std::string>
DeviceGate::skip_reason(const DeviceIdentity &device) const {
  for (const auto &req : requirements_) {
    bool matched = req.pattern.matches(device.sku);

    if (req.skip_on_match && matched) {
      LOG_DEBUG("GATE", device.sku, "Excluded by skip pattern '{}'",
                req.pattern.pattern());
      return fmt::format("Skipped on this SKU: {}", device.sku);
    }
    if (!req.skip_on_match && !matched) {
      LOG_DEBUG("GATE", device.sku, "Not covered by only pattern '{}'",
                req.pattern.pattern());
      return fmt::format("Skipped on this SKU: {} (only runs on {})",
                         device.sku, req.pattern.pattern());
    }
  }

  if (!allowed_dialects_.empty() &&
      allowed_dialects_.count(device.dialect) == 0) {
    return fmt::format("cannot run on platform {}", device.dialect);
  }

  return std::nullopt;
}

} // namespace netdut
