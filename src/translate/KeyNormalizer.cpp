#include "netdut/translate/KeyNormalizer.hpp"
#include "netdut/Errors.hpp"
#include "netdut/Logger.hpp"

#include <cctype>
#include <map>

namespace netdut {

// JSON pointer escaping so error paths stay unambiguous for keys holding '/'
static std::string escape_path_token(const std::string &token) {
  std::string out;
  for (char c : token) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out += c;
    }
  }
  return out;
}

CollisionPolicy parse_collision_policy(const std::string &name) {
  if (name == "fail") {
    return CollisionPolicy::Fail;
  }
  if (name == "last_write_wins") {
    return CollisionPolicy::LastWriteWins;
  }
  throw ConfigurationError("Unknown key collision policy: '" + name +
                           "' (expected 'fail' or 'last_write_wins')");
}

std::string to_string(CollisionPolicy policy) {
  switch (policy) {
  case CollisionPolicy::Fail:
    return "fail";
  case CollisionPolicy::LastWriteWins:
    return "last_write_wins";
  }
  return "unknown";
}

std::string camel_to_snake(const std::string &key) {
  std::string out;
  out.reserve(key.size() + 4);

  bool segment_start = true;
  for (char c : key) {
    if (c == '/') {
      out += c;
      segment_start = true;
      continue;
    }
    auto uc = static_cast<unsigned char>(c);
    if (std::isupper(uc)) {
      if (!segment_start) {
        out += '_';
      }
      out += static_cast<char>(std::tolower(uc));
    } else {
      out += c;
    }
    segment_start = false;
  }
  return out;
}

KeyNormalizer::KeyNormalizer(KeyTransform transform, CollisionPolicy policy)
    : transform_(std::move(transform)), policy_(policy) {
  if (!transform_) {
    throw ConfigurationError("KeyNormalizer requires a key transform");
  }
}

Response KeyNormalizer::normalize(const Response &data) const {
  return normalize_at(data, "");
}

Response KeyNormalizer::normalize_at(const Response &data,
                                     const std::string &path) const {
  if (data.is_object()) {
    Response result = Response::object();
    // normalized key -> original key it came from
    std::map<std::string, std::string> origins;

    for (auto entry = data.begin(); entry != data.end(); ++entry) {
      const std::string &key = entry.key();
      std::string new_key = transform_(key);

      auto it = origins.find(new_key);
      if (it != origins.end()) {
        if (policy_ == CollisionPolicy::Fail) {
          throw KeyCollisionError(path, it->second, key, new_key);
        }
        LOG_WARN("NORMALIZER", "COLLISION",
                 "'{}' replaces '{}' as '{}' at '{}'", key, it->second,
                 new_key, path.empty() ? "/" : path);
      }
      origins[new_key] = key;

      result[new_key] =
          normalize_at(entry.value(), path + "/" + escape_path_token(key));
    }
    return result;
  }

  if (data.is_array()) {
    Response result = Response::array();
    size_t index = 0;
    for (const auto &item : data) {
      result.push_back(normalize_at(item, path + "/" + std::to_string(index)));
      ++index;
    }
    return result;
  }

  return data;
}

} // namespace netdut
