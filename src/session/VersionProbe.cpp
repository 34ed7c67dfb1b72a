#include "netdut/session/VersionProbe.hpp"
#include "netdut/Errors.hpp"
#include "netdut/Logger.hpp"
#include "netdut/translate/KeyNormalizer.hpp"

#include <cctype>
#include <regex>

namespace netdut {

static std::string rtrim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.pop_back();
  }
  return s;
}

static std::optional<std::string> search_group(const std::string &text,
                                               const std::regex &regex) {
  std::smatch match;
  if (std::regex_search(text, match, regex)) {
    return rtrim(match[1].str());
  }
  return std::nullopt;
}

DeviceIdentity parse_show_version(const std::string &output) {
  static const std::regex sku_re(R"((DCS-7.*))");
  static const std::regex serial_re(R"(Serial number:[ \t]*(.*))");
  static const std::regex micro_re(
      R"(System management controller version: (\d+))");

  auto sku = search_group(output, sku_re);
  if (!sku) {
    throw Error("No DCS-7 SKU found in 'show version' output");
  }

  DeviceIdentity identity;
  identity.sku = *sku;
  identity.serial = search_group(output, serial_re);
  identity.micro_version = search_group(output, micro_re);
  identity.dialect = output.find("Hardware version:") != std::string::npos
                         ? dialect::EOS
                         : dialect::MOS;

  LOG_INFO("PROBE", identity.dialect, "Got SKU: {}", identity.sku);
  return identity;
}

// Looks a field up under both its camelCase and snake_case spelling
static const Response *find_field(const Response &reply,
                                  const std::string &camel_key) {
  for (const auto &key : {camel_key, camel_to_snake(camel_key)}) {
    auto it = reply.find(key);
    if (it != reply.end() && it->is_string()) {
      return &*it;
    }
  }
  return nullptr;
}

DeviceIdentity identity_from_version_reply(const Response &reply,
                                           const std::string &dialect) {
  if (!reply.is_object()) {
    throw Error("'show version' reply is not a mapping");
  }

  const Response *model = find_field(reply, "modelName");
  if (!model) {
    throw Error("'show version' reply has no model name");
  }

  DeviceIdentity identity;
  identity.sku = model->get<std::string>();
  identity.dialect = dialect;
  if (const Response *serial = find_field(reply, "serialNumber")) {
    identity.serial = serial->get<std::string>();
  }

  LOG_INFO("PROBE", identity.dialect, "Got SKU: {}", identity.sku);
  return identity;
}

} // namespace netdut
