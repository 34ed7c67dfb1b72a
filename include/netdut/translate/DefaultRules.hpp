#pragma once
#include "netdut/export.h"
#include "netdut/translate/Translator.hpp"
#include "netdut/types.hpp"

namespace netdut {

/// EOS -> MOS command rewrites shipped with netdut.
/// Lines mapped to "CAN NOT TRANSLATE" have no MOS equivalent and are sent
/// as-is so the device rejects them loudly.
NETDUT_API RuleTable mos_rule_table();

/// Builder preloaded with the shipped tables, native dialect EOS and the
/// camelCase -> snake_case key transform
NETDUT_API TranslatorBuilder default_translator_builder();

/// Translator for talking to MOS devices in EOS terms
NETDUT_API TranslatorPtr make_mos_translator();

} // namespace netdut
