#include "test_framework.hpp"

#include "llmgate/common/hash.hpp"
#include "llmgate/gateway/redaction.hpp"

#include <string>
#include <vector>

void register_redaction_tests(std::vector<llmgate::tests::TestCase> &tests) {
  using llmgate::tests::require;
  namespace gw = llmgate::gateway;
  using llmgate::common::JsonValue;

  tests.push_back({"redaction_detects_secret_keys", [] {
                     for (const char *key : {"api_key", "API_KEY", "clientSecret", "access_token",
                                             "Password", "keyring"}) {
                       require(gw::is_secret_key(key), std::string("should be secret: ") + key);
                     }
                     for (const char *key : {"temperature", "model", "user", "pass"}) {
                       require(!gw::is_secret_key(key), std::string("should not be secret: ") + key);
                     }
                   }});

  tests.push_back({"redaction_masks_nested_members", [] {
                     JsonValue inner = JsonValue::object();
                     inner["token"] = "t-1";
                     inner["label"] = "keep";
                     JsonValue list = JsonValue::array();
                     list.push_back(inner);
                     list.push_back("plain");
                     JsonValue root = JsonValue::object();
                     root["headers"] = inner;
                     root["items"] = list;
                     root["secret"] = JsonValue::object();

                     const JsonValue redacted = gw::redact(root);
                     require(redacted.find("headers")->find("token")->as_string() == "***",
                             "nested object member masked");
                     require(redacted.find("headers")->find("label")->as_string() == "keep",
                             "other members kept");
                     require(redacted.find("items")->as_array()[0].find("token")->as_string() == "***",
                             "array members masked");
                     require(redacted.find("items")->as_array()[1].as_string() == "plain",
                             "array scalars kept");
                     require(redacted.find("secret")->as_string() == "***",
                             "secret container replaced entirely");
                     require(root.find("headers")->find("token")->as_string() == "t-1",
                             "input is left untouched");
                   }});

  tests.push_back({"redaction_params_hash_is_stable", [] {
                     llmgate::providers::CallParameters first;
                     first.model = "gpt-4o";
                     first.temperature = 0.3;
                     first.extra["api_key"] = "one";
                     llmgate::providers::CallParameters second = first;
                     second.extra["api_key"] = "two";

                     require(gw::params_hash(first) == gw::params_hash(second),
                             "secrets do not affect the hash");
                     const std::string hash = gw::params_hash(first);
                     require(hash.rfind("sha256:", 0) == 0 && hash.size() == 7 + 64, "hash format");

                     second.top_p = 0.9;
                     require(gw::params_hash(first) != gw::params_hash(second),
                             "non-secret change alters the hash");

                     const JsonValue redacted = gw::redacted_params(first);
                     require(redacted.find("extra")->find("api_key")->as_string() == "***",
                             "extra secrets masked");
                     require(redacted.find("model")->as_string() == "gpt-4o", "model kept");
                   }});

  tests.push_back({"redaction_prompt_hash_always_present", [] {
                     require(gw::prompt_hash("") ==
                                 "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                             "empty prompt hash");
                     require(gw::prompt_hash("hi") == *llmgate::common::hash_text("hi"),
                             "prompt hash uses tagged sha256");
                   }});

  tests.push_back({"redaction_instructions_hash_lookup_order", [] {
                     llmgate::providers::CallParameters params;
                     require(!gw::instructions_hash(params).has_value(), "no instructions");

                     params.extra["instructions"] = "third";
                     require(gw::instructions_hash(params) == llmgate::common::hash_text("third"),
                             "instructions key");
                     params.extra["system_prompt"] = "second";
                     require(gw::instructions_hash(params) == llmgate::common::hash_text("second"),
                             "system_prompt wins over instructions");
                     params.extra["system"] = "first";
                     require(gw::instructions_hash(params) == llmgate::common::hash_text("first"),
                             "system wins");

                     llmgate::providers::CallParameters non_string;
                     non_string.extra["system"] = 3;
                     require(!gw::instructions_hash(non_string).has_value(),
                             "non-string instructions are ignored");
                   }});
}
