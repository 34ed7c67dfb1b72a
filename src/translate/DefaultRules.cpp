#include "netdut/translate/DefaultRules.hpp"

namespace netdut {

RuleTable mos_rule_table() {
  // Order matters: the ap1/ forms must be tried before the generic ones
  return {
      {R"(interface ap1/(.*))", R"(interface ap\1)"},
      {R"(l1 source interface ap1/(.*))", R"(source ap\1)"},
      {R"(l1 source interface ap(.*))", "CAN NOT TRANSLATE"},
      {R"(l1 source interface (.*))", R"(source \1)"},
      {R"(l1 source mac)", "source mac"},
      {R"(no l1 source)", "no source"},
      {R"(bash sudo cortina)", "CAN NOT TRANSLATE"},
      {R"(traffic-loopback source network device phy)", "loopback internal"},
      {R"(traffic-loopback source system device phy)", "loopback"},
      {R"(no traffic-loopback)", "no loopback"},
  };
}

TranslatorBuilder default_translator_builder() {
  TranslatorBuilder builder;
  builder.native_dialect(dialect::EOS)
      .set_rules(dialect::MOS, mos_rule_table())
      .key_transform(camel_to_snake);
  return builder;
}

TranslatorPtr make_mos_translator() {
  return default_translator_builder().build();
}

} // namespace netdut
