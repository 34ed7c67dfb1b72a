#pragma once
#include "netdut/capability/CapabilityMatcher.hpp"
#include "netdut/export.h"
#include "netdut/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netdut {

/// Decides whether a test may run on a device.
///
/// Requirements stack with logical AND. Patterns compile when they are added,
/// so a bad pattern surfaces while the test is being declared rather than when
/// it runs.
class NETDUT_API DeviceGate {
public:
  /// Restrict to the given dialect. Several calls form an allow-list.
  DeviceGate &allow_dialect(const std::string &dialect);

  /// Run only when the SKU matches `pattern`
  DeviceGate &only_device_type(const std::string &pattern);

  /// Skip when the SKU matches `pattern`
  DeviceGate &skip_device_type(const std::string &pattern);

  /// std::nullopt when the test may run, otherwise why it must be skipped
  std::optional<std::string> skip_reason(const DeviceIdentity &device) const;

  bool allows(const DeviceIdentity &device) const {
    return !skip_reason(device).has_value();
  }

  bool empty() const;

private:
  struct Requirement {
    CapabilityPattern pattern;
    bool skip_on_match;
  };

  std::vector<Requirement> requirements_;
  std::set<std::string> allowed_dialects_;
};

} // namespace netdut
