#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using autopsy::core::json::Value;

TEST_CASE("Compact serialization sorts object keys", "[core][json]") {
  Value::Object object;
  object["zeta"] = Value::MakeNumber(1.0);
  object["alpha"] = Value::MakeArray({Value::MakeString("b"), Value::MakeString("a")});
  object["mid"] = Value::MakeNull();

  REQUIRE(autopsy::core::json::Serialize(Value::MakeObject(object)) ==
          R"({"alpha":["b","a"],"mid":null,"zeta":1})");
}

TEST_CASE("Pretty serialization uses two-space indent", "[core][json]") {
  Value::Object object;
  object["a"] = Value::MakeBool(true);
  object["b"] = Value::MakeArray({Value::MakeNumber(2.5)});

  REQUIRE(autopsy::core::json::Serialize(Value::MakeObject(object), 2) ==
          "{\n  \"a\": true,\n  \"b\": [\n    2.5\n  ]\n}");
}

TEST_CASE("Numbers use shortest round-trip text", "[core][json]") {
  REQUIRE(autopsy::core::FormatJsonNumber(0.1) == "0.1");
  REQUIRE(autopsy::core::FormatJsonNumber(3.0) == "3");
  REQUIRE(autopsy::core::FormatJsonNumber(1e21) == "1e+21");

  const double awkward = 0.1 + 0.2;
  Value parsed;
  std::string error;
  REQUIRE(autopsy::core::json::Parse(autopsy::core::FormatJsonNumber(awkward), parsed, error));
  REQUIRE(parsed.number_value == awkward);
}

TEST_CASE("Parser decodes escapes and surrogate pairs", "[core][json]") {
  Value parsed;
  std::string error;
  REQUIRE(autopsy::core::json::Parse(R"({"s":"a\"b\n\u00e9\ud83d\ude00"})", parsed, error));
  const Value* s = parsed.Find("s");
  REQUIRE(s != nullptr);
  REQUIRE(s->string_value == "a\"b\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("Parser reports malformed documents", "[core][json]") {
  Value parsed;
  std::string error;
  REQUIRE_FALSE(autopsy::core::json::Parse(R"({"a":1,})", parsed, error));
  REQUIRE_FALSE(error.empty());
}
