#include "netdut/SessionConfig.hpp"
#include "netdut/Errors.hpp"
#include "netdut/Logger.hpp"
#include "netdut/translate/DefaultRules.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace netdut {

static std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out.empty() ? "/" : out;
}

[[noreturn]] static void config_error(const std::vector<std::string> &path,
                                      const std::string &msg) {
  throw ConfigurationError("Config " + node_path(path) + ": " + msg);
}

static std::string read_string(const YAML::Node &node,
                               const std::vector<std::string> &path) {
  if (!node.IsScalar()) {
    config_error(path, "expected a string");
  }
  return node.as<std::string>();
}

static std::chrono::milliseconds
read_millis(const YAML::Node &node, const std::vector<std::string> &path) {
  if (!node.IsScalar()) {
    config_error(path, "expected a number of milliseconds");
  }
  try {
    return std::chrono::milliseconds(node.as<int64_t>());
  } catch (const YAML::BadConversion &) {
    config_error(path, "'" + node.as<std::string>() +
                           "' is not a whole number of milliseconds");
  }
}

static RuleTable read_rules(const YAML::Node &node,
                            const std::vector<std::string> &path) {
  RuleTable table;
  if (!node || node.IsNull()) {
    return table;
  }
  if (!node.IsSequence()) {
    config_error(path, "rules must be a sequence");
  }

  for (size_t i = 0; i < node.size(); ++i) {
    const auto &entry = node[i];
    std::vector<std::string> entry_path = path;
    entry_path.push_back(std::to_string(i));

    if (!entry.IsMap()) {
      config_error(entry_path, "rule must be a map");
    }
    for (const auto &req : {"pattern", "replacement"}) {
      if (!entry[req]) {
        config_error(entry_path,
                     std::string("missing required field '") + req + "'");
      }
    }

    Rule rule;
    entry_path.push_back("pattern");
    rule.pattern = read_string(entry["pattern"], entry_path);
    entry_path.back() = "replacement";
    rule.replacement = read_string(entry["replacement"], entry_path);
    table.push_back(std::move(rule));
  }
  return table;
}

static SessionConfig parse_config(const YAML::Node &doc) {
  SessionConfig config;
  if (!doc || doc.IsNull()) {
    return config;
  }
  if (!doc.IsMap()) {
    config_error({}, "document must be a map");
  }

  static const std::vector<std::string> known = {
      "dialect",  "native_dialect",   "log_level", "log_file",
      "poll",     "collision_policy", "rules"};
  for (const auto &kv : doc) {
    auto key = kv.first.as<std::string>();
    if (std::find(known.begin(), known.end(), key) == known.end()) {
      config_error({key}, "unknown field");
    }
  }

  if (doc["dialect"]) {
    config.dialect = read_string(doc["dialect"], {"dialect"});
  }
  if (doc["native_dialect"]) {
    config.native_dialect =
        read_string(doc["native_dialect"], {"native_dialect"});
  }
  if (doc["log_level"]) {
    config.log_level = read_string(doc["log_level"], {"log_level"});
    try {
      parse_log_level(config.log_level);
    } catch (const ConfigurationError &ex) {
      config_error({"log_level"}, ex.what());
    }
  }
  if (doc["log_file"]) {
    config.log_file = read_string(doc["log_file"], {"log_file"});
  }
  if (doc["collision_policy"]) {
    auto name = read_string(doc["collision_policy"], {"collision_policy"});
    try {
      config.collision_policy = parse_collision_policy(name);
    } catch (const ConfigurationError &ex) {
      config_error({"collision_policy"}, ex.what());
    }
  }

  if (const auto poll = doc["poll"]) {
    if (!poll.IsMap()) {
      config_error({"poll"}, "poll must be a map");
    }
    if (poll["timeout_ms"]) {
      config.poll.timeout =
          read_millis(poll["timeout_ms"], {"poll", "timeout_ms"});
      if (config.poll.timeout.count() < 0) {
        config_error({"poll", "timeout_ms"}, "must not be negative");
      }
    }
    if (poll["interval_ms"]) {
      config.poll.interval =
          read_millis(poll["interval_ms"], {"poll", "interval_ms"});
      if (config.poll.interval.count() <= 0) {
        config_error({"poll", "interval_ms"}, "must be positive");
      }
    }
  }

  if (const auto rules = doc["rules"]) {
    if (!rules.IsMap()) {
      config_error({"rules"}, "rules must be a map of dialect names");
    }
    for (const auto &kv : rules) {
      auto dialect = kv.first.as<std::string>();
      const auto &layer_node = kv.second;
      if (!layer_node.IsMap()) {
        config_error({"rules", dialect}, "expected 'prepend' and/or 'append'");
      }
      RuleLayer layer;
      layer.prepend =
          read_rules(layer_node["prepend"], {"rules", dialect, "prepend"});
      layer.append =
          read_rules(layer_node["append"], {"rules", dialect, "append"});
      config.rules[dialect] = std::move(layer);
    }
  }

  return config;
}

SessionConfig SessionConfig::from_yaml(const std::string &yaml_text) {
  try {
    return parse_config(YAML::Load(yaml_text));
  } catch (const YAML::Exception &ex) {
    throw ConfigurationError(std::string("Config is not valid YAML: ") +
                             ex.what());
  }
}

SessionConfig SessionConfig::from_file(const std::string &yaml_path) {
  if (!std::filesystem::exists(yaml_path)) {
    throw ConfigurationError("Config file not found: " + yaml_path);
  }
  try {
    auto config = parse_config(YAML::LoadFile(yaml_path));
    LOG_INFO("CONFIG", "LOAD", "Loaded session config from {}", yaml_path);
    return config;
  } catch (const YAML::Exception &ex) {
    throw ConfigurationError("Config " + yaml_path +
                             " is not valid YAML: " + ex.what());
  }
}

TranslatorPtr build_translator(const SessionConfig &config) {
  auto builder = default_translator_builder();
  builder.native_dialect(config.native_dialect)
      .collision_policy(config.collision_policy);

  for (const auto &[dialect, layer] : config.rules) {
    builder.prepend_rules(dialect, layer.prepend);
    builder.append_rules(dialect, layer.append);
    LOG_DEBUG("CONFIG", dialect, "Layered {} rule(s) before, {} after",
              layer.prepend.size(), layer.append.size());
  }

  auto translator = builder.build();
  if (!translator->supports(config.dialect)) {
    throw UnknownDialectError(config.dialect);
  }
  return translator;
}

void init_logging(const SessionConfig &config) {
  SessionLogger::instance().init(config.log_file,
                                 parse_log_level(config.log_level));
}

} // namespace netdut
