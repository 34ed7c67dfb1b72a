#pragma once
#include "netdut/export.h"
#include "netdut/types.hpp"

#include <functional>
#include <string>

namespace netdut {

/// Renames one mapping key. Must be idempotent: transform(transform(k)) ==
/// transform(k).
using KeyTransform = std::function<std::string(const std::string &)>;

/// What to do when two keys of one mapping normalize to the same key
enum class CollisionPolicy {
  Fail,         // throw KeyCollisionError
  LastWriteWins // keep the value of the key iterated last
};

NETDUT_API CollisionPolicy parse_collision_policy(const std::string &name);
NETDUT_API std::string to_string(CollisionPolicy policy);

/// camelCase -> snake_case, applied to each '/' separated segment.
/// "modelName" -> "model_name", "ethernet1/portSpeed" -> "ethernet1/port_speed"
NETDUT_API std::string camel_to_snake(const std::string &key);

/// Recursively renames mapping keys in a Response. Values, sequence order and
/// nesting depth are preserved; only keys change.
class NETDUT_API KeyNormalizer {
public:
  explicit KeyNormalizer(KeyTransform transform = camel_to_snake,
                         CollisionPolicy policy = CollisionPolicy::Fail);

  Response normalize(const Response &data) const;

  std::string transform_key(const std::string &key) const {
    return transform_(key);
  }

  CollisionPolicy collision_policy() const { return policy_; }

private:
  Response normalize_at(const Response &data, const std::string &path) const;

  KeyTransform transform_;
  CollisionPolicy policy_;
};

} // namespace netdut
