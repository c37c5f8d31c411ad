#include "core/hash/sha256.hpp"
#include "pass1/pass1_config.hpp"
#include "store/config_key.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using autopsy::core::json::Value;

namespace {

Value OverviewKeyConfig() {
  Value::Object object;
  object["time_col"] = Value::MakeString("timestamp");
  object["signals"] = Value::MakeNull();
  object["measurement_id"] = Value::MakeString("m_abc");
  object["hz"] = Value::MakeNumber(1.0);
  object["agg"] = Value::MakeArray(
      {Value::MakeString("min"), Value::MakeString("mean"), Value::MakeString("max")});
  return Value::MakeObject(std::move(object));
}

} // namespace

TEST_CASE("SHA-256 hex digest matches the reference vector", "[store][hash]") {
  std::string hex;
  std::string error;
  REQUIRE(autopsy::core::hash::Sha256Hex("abc", hex, error));
  REQUIRE(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Canonical JSON is compact with sorted keys", "[store][config_key]") {
  REQUIRE(autopsy::store::CanonicalJson(OverviewKeyConfig()) ==
          R"({"agg":["min","mean","max"],"hz":1,"measurement_id":"m_abc","signals":null,"time_col":"timestamp"})");
}

TEST_CASE("Config key is a 16-char prefix of the canonical digest", "[store][config_key]") {
  std::string key;
  std::string error;
  REQUIRE(autopsy::store::ConfigKey(OverviewKeyConfig(), key, error));
  REQUIRE(key == "2eec6a430409e5b1");
  REQUIRE(key.size() == autopsy::store::kConfigKeyLength);
}

TEST_CASE("Config key ignores insertion order but not list order", "[store][config_key]") {
  Value::Object forward;
  forward["a"] = Value::MakeNumber(1.0);
  forward["b"] = Value::MakeString("x");
  Value::Object backward;
  backward["b"] = Value::MakeString("x");
  backward["a"] = Value::MakeNumber(1.0);

  std::string key_forward;
  std::string key_backward;
  std::string error;
  REQUIRE(autopsy::store::ConfigKey(Value::MakeObject(forward), key_forward, error));
  REQUIRE(autopsy::store::ConfigKey(Value::MakeObject(backward), key_backward, error));
  REQUIRE(key_forward == key_backward);

  Value::Object listed = forward;
  listed["signals"] = Value::MakeArray({Value::MakeString("a"), Value::MakeString("b")});
  Value::Object reordered = forward;
  reordered["signals"] = Value::MakeArray({Value::MakeString("b"), Value::MakeString("a")});
  std::string key_listed;
  std::string key_reordered;
  REQUIRE(autopsy::store::ConfigKey(Value::MakeObject(listed), key_listed, error));
  REQUIRE(autopsy::store::ConfigKey(Value::MakeObject(reordered), key_reordered, error));
  REQUIRE(key_listed != key_reordered);
}

TEST_CASE("Negative zero hashes like zero", "[store][config_key]") {
  REQUIRE(autopsy::core::FormatJsonNumber(-0.0) == "0");

  autopsy::pass1::Pass1Config positive;
  positive.flatline_eps = 0.0;
  autopsy::pass1::Pass1Config negative;
  negative.flatline_eps = -0.0;

  std::string key_positive;
  std::string key_negative;
  std::string error;
  REQUIRE(autopsy::store::ConfigKey(autopsy::pass1::ToJsonValue(positive), key_positive, error));
  REQUIRE(autopsy::store::ConfigKey(autopsy::pass1::ToJsonValue(negative), key_negative, error));
  REQUIRE(key_positive == key_negative);
}
