#include "netdut/Errors.hpp"
#include "netdut/translate/KeyNormalizer.hpp"

#include <cctype>
#include <gtest/gtest.h>

using namespace netdut;
using json = nlohmann::json;

namespace {

// Every scalar leaf, in document order
void collect_leaves(const json &j, std::vector<json> &out) {
  if (j.is_object() || j.is_array()) {
    for (const auto &item : j) {
      collect_leaves(item, out);
    }
  } else {
    out.push_back(j);
  }
}

} // namespace

TEST(CamelToSnake, ConvertsCamelCase) {
  EXPECT_EQ(camel_to_snake("modelName"), "model_name");
  EXPECT_EQ(camel_to_snake("startTime"), "start_time");
  EXPECT_EQ(camel_to_snake("ModelName"), "model_name");
  EXPECT_EQ(camel_to_snake("appName"), "app_name");
}

TEST(CamelToSnake, ConvertsEachPathSegment) {
  EXPECT_EQ(camel_to_snake("ethernet1/portSpeed"), "ethernet1/port_speed");
  EXPECT_EQ(camel_to_snake("Ap1/LinkStatus"), "ap1/link_status");
}

TEST(CamelToSnake, IsIdempotent) {
  for (const std::string key :
       {"model_name", "modelName", "a/bC/De", "", "x", "HTTPServer"}) {
    auto once = camel_to_snake(key);
    EXPECT_EQ(camel_to_snake(once), once) << key;
  }
}

TEST(KeyNormalizer, NormalizesNestedMappings) {
  KeyNormalizer normalizer;
  json input = {{"modelName", "DCS-7130"},
                {"daemons", {{"sleeper", {{"startTime", 0.0}}}}}};
  json expected = {{"model_name", "DCS-7130"},
                   {"daemons", {{"sleeper", {{"start_time", 0.0}}}}}};

  EXPECT_EQ(normalizer.normalize(input), expected);
}

TEST(KeyNormalizer, RecursesIntoSequencesWithoutRenamingThem) {
  KeyNormalizer normalizer;
  json input = {{"interfaceList",
                 json::array({{{"linkStatus", "up"}}, "plainString", 3,
                              json::array({{{"innerKey", true}}})})}};

  auto out = normalizer.normalize(input);
  ASSERT_TRUE(out.contains("interface_list"));
  const auto &list = out["interface_list"];
  ASSERT_EQ(list.size(), 4u);
  EXPECT_EQ(list[0], json({{"link_status", "up"}}));
  EXPECT_EQ(list[1], "plainString");
  EXPECT_EQ(list[2], 3);
  EXPECT_EQ(list[3][0], json({{"inner_key", true}}));
}

TEST(KeyNormalizer, ScalarsPassThrough) {
  KeyNormalizer normalizer;
  EXPECT_EQ(normalizer.normalize("Application is already running"),
            "Application is already running");
  EXPECT_EQ(normalizer.normalize(42), 42);
  EXPECT_EQ(normalizer.normalize(nullptr), nullptr);
  EXPECT_EQ(normalizer.normalize(json::array()), json::array());
}

TEST(KeyNormalizer, ValuesAreNotRenamed) {
  KeyNormalizer normalizer;
  json input = {{"modelName", "camelCaseValue"}};
  EXPECT_EQ(normalizer.normalize(input)["model_name"], "camelCaseValue");
}

TEST(KeyNormalizer, NormalizationIsIdempotent) {
  KeyNormalizer normalizer;
  json input = {{"modelName", "DCS-7130"},
                {"portList", json::array({{{"portSpeed", 10}}})},
                {"already_snake", {{"deepKey", nullptr}}}};

  auto once = normalizer.normalize(input);
  EXPECT_EQ(normalizer.normalize(once), once);
}

TEST(KeyNormalizer, PreservesStructure) {
  KeyNormalizer normalizer;
  json input = {{"aKey", json::array({1, 2, {{"bKey", "x"}}, json::array()})},
                {"cKey", {{"dKey", false}, {"eKey", 2.5}}}};

  auto out = normalizer.normalize(input);

  std::vector<json> before, after;
  collect_leaves(input, before);
  collect_leaves(out, after);
  EXPECT_EQ(before, after);
  EXPECT_EQ(out["a_key"].size(), input["aKey"].size());
  EXPECT_EQ(out["c_key"].size(), input["cKey"].size());
}

TEST(KeyNormalizer, CollisionFailsByDefault) {
  KeyNormalizer normalizer;
  json input = {{"status", {{"appName", "a"}, {"app_name", "b"}}}};

  try {
    normalizer.normalize(input);
    FAIL() << "Expected KeyCollisionError";
  } catch (const KeyCollisionError &ex) {
    EXPECT_EQ(ex.path(), "/status");
    EXPECT_EQ(ex.normalized_key(), "app_name");
    std::string msg = ex.what();
    EXPECT_NE(msg.find("appName"), std::string::npos);
    EXPECT_NE(msg.find("app_name"), std::string::npos);
  }
}

TEST(KeyNormalizer, CollisionLastWriteWins) {
  KeyNormalizer normalizer(camel_to_snake, CollisionPolicy::LastWriteWins);
  json input = {{"appName", "camel"}, {"app_name", "snake"}};

  // Objects iterate in key order: "appName" < "app_name"
  auto out = normalizer.normalize(input);
  EXPECT_EQ(out, json({{"app_name", "snake"}}));
}

TEST(KeyNormalizer, SameKeyInSiblingMappingsIsNotACollision) {
  KeyNormalizer normalizer;
  json input = json::array({{{"appName", "null"}}, {{"app_name", "null"}}});

  auto out = normalizer.normalize(input);
  EXPECT_TRUE(out[0].contains("app_name"));
  EXPECT_TRUE(out[1].contains("app_name"));
}

TEST(KeyNormalizer, CustomTransform) {
  KeyNormalizer normalizer([](const std::string &key) {
    std::string out = key;
    for (auto &c : out) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
  });

  EXPECT_EQ(normalizer.normalize(json({{"speed", 1}})), json({{"SPEED", 1}}));
}

TEST(KeyNormalizer, NullTransformRejected) {
  EXPECT_THROW(KeyNormalizer normalizer(KeyTransform{}), ConfigurationError);
}

TEST(CollisionPolicy, ParsesNames) {
  EXPECT_EQ(parse_collision_policy("fail"), CollisionPolicy::Fail);
  EXPECT_EQ(parse_collision_policy("last_write_wins"),
            CollisionPolicy::LastWriteWins);
  EXPECT_EQ(to_string(CollisionPolicy::LastWriteWins), "last_write_wins");
  EXPECT_THROW(parse_collision_policy("first"), ConfigurationError);
}
