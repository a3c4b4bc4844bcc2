#include "test_framework.hpp"

#include "llmgate/common/fs.hpp"
#include "llmgate/common/hash.hpp"
#include "llmgate/common/json.hpp"
#include "llmgate/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <string>
#include <vector>

void register_common_tests(std::vector<llmgate::tests::TestCase> &tests) {
  using llmgate::tests::require;
  namespace common = llmgate::common;

  tests.push_back({"json_dump_sorts_object_keys", [] {
                     common::JsonValue value = common::JsonValue::object();
                     value["zeta"] = 1;
                     value["alpha"] = "x";
                     value["mid"] = common::JsonValue::array();
                     value["mid"].push_back(true);
                     value["mid"].push_back(nullptr);
                     require(value.dump() == R"({"alpha":"x","mid":[true,null],"zeta":1})",
                             "compact dump mismatch: " + value.dump());
                   }});

  tests.push_back({"json_parse_round_trips_canonically", [] {
                     const auto parsed =
                         common::parse_json(R"( {"b": 1, "a": [true, null, "x\n"], "c": 1.5} )");
                     require(parsed.ok(), "document should parse");
                     require(parsed.value().dump() == R"({"a":[true,null,"x\n"],"b":1,"c":1.5})",
                             "canonical dump mismatch: " + parsed.value().dump());
                     require(parsed.value().find("b")->is_int(), "integers stay integral");
                     require(parsed.value().find("c")->as_double() == 1.5, "double mismatch");
                   }});

  tests.push_back({"json_parse_rejects_malformed_input", [] {
                     require(!common::parse_json(R"({"a":})").ok(), "missing value should fail");
                     require(!common::parse_json("[1,2] x").ok(), "trailing garbage should fail");
                     require(!common::parse_json(R"("open)").ok(), "unterminated string should fail");
                     require(!common::parse_json("").ok(), "empty input should fail");
                   }});

  tests.push_back({"json_parse_unicode_escapes", [] {
                     const auto parsed = common::parse_json(R"("caf\u00e9")");
                     require(parsed.ok(), "escape should parse");
                     require(parsed.value().as_string() == "caf\xc3\xa9", "utf-8 encoding mismatch");
                   }});

  tests.push_back({"json_pretty_print_indents", [] {
                     common::JsonValue value = common::JsonValue::object();
                     value["a"] = 1;
                     value["b"] = common::JsonValue::object();
                     require(value.dump_pretty(2) == "{\n  \"a\": 1,\n  \"b\": {}\n}",
                             "pretty output mismatch: " + value.dump_pretty(2));
                   }});

  tests.push_back({"json_doubles_keep_a_fraction", [] {
                     require(common::JsonValue(2.0).dump() == "2.0", "whole doubles keep .0");
                     require(common::JsonValue(0.25).dump() == "0.25", "fraction mismatch");
                   }});

  tests.push_back({"sha256_matches_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc) mismatch");
                   }});

  tests.push_back({"hash_text_tags_and_skips_empty", [] {
                     require(!common::hash_text("").has_value(), "empty text has no hash");
                     const auto hashed = common::hash_text("abc");
                     require(hashed.has_value(), "text should hash");
                     require(*hashed == "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "tagged hash mismatch");
                   }});

  tests.push_back({"hash_json_ignores_insertion_order", [] {
                     common::JsonValue first = common::JsonValue::object();
                     first["a"] = 1;
                     first["b"] = "two";
                     common::JsonValue second = common::JsonValue::object();
                     second["b"] = "two";
                     second["a"] = 1;
                     require(common::hash_json(first) == common::hash_json(second),
                             "hash must be order independent");
                     second["a"] = 2;
                     require(common::hash_json(first) != common::hash_json(second),
                             "different values must hash differently");
                   }});

  tests.push_back({"string_helpers", [] {
                     require(common::trim("  x y \t") == "x y", "trim mismatch");
                     require(common::to_lower("OpenAI") == "openai", "to_lower mismatch");
                     require(common::starts_with("sha256:abc", "sha256:"), "starts_with mismatch");
                     const auto words = common::split_whitespace("  one\ttwo \n three ");
                     require(words.size() == 3 && words[2] == "three", "split_whitespace mismatch");
                     require(common::split_whitespace("   ").empty(), "blank input has no words");
                   }});

  tests.push_back({"is_subpath_checks_prefix_components", [] {
                     require(common::is_subpath("/srv/data/a/b", "/srv/data"), "nested path");
                     require(!common::is_subpath("/srv/database", "/srv/data"), "sibling prefix");
                     require(!common::is_subpath("/srv", "/srv/data"), "parent path");
                   }});

  tests.push_back({"write_file_atomic_creates_parents", [] {
                     llmgate::testing::TempWorkspace workspace;
                     const auto target = workspace.path() / "a" / "b" / "out.json";
                     require(common::write_file_atomic(target, "{}").ok(), "write should succeed");
                     require(common::write_file_atomic(target, "{\"v\":2}").ok(), "overwrite should succeed");
                     const auto content = common::read_file(target);
                     require(content.ok() && content.value() == "{\"v\":2}", "content mismatch");
                     require(!common::read_file(workspace.path() / "missing.txt").ok(),
                             "missing file should fail");
                   }});

  tests.push_back({"utc_timestamp_has_millisecond_precision", [] {
                     const std::string stamp = common::utc_timestamp_iso8601();
                     require(stamp.size() == 24, "timestamp length mismatch: " + stamp);
                     require(stamp[10] == 'T' && stamp[19] == '.' && stamp.back() == 'Z',
                             "timestamp layout mismatch: " + stamp);
                   }});

  tests.push_back({"toml_parses_sections_and_arrays", [] {
                     const auto doc = common::parse_toml(R"(
# gateway settings
[llm_gateway]
default_provider = "openai"   # inline comment
retry_max = 4
cost_cap_usd = 0.75
provider_chain = ["anthropic:claude-3", "ollama"]

[providers.openai]
default_model = "gpt-4o-mini"

[providers.anthropic]
default_model = "claude-3"
)");
                     require(doc.ok(), "document should parse");
                     const auto &toml = doc.value();
                     require(toml.get_string("llm_gateway.default_provider") == "openai", "string mismatch");
                     require(toml.get_u64("llm_gateway.retry_max", 0) == 4, "integer mismatch");
                     require(toml.find_double("llm_gateway.cost_cap_usd") == 0.75, "double mismatch");
                     const auto chain = toml.get_string_array("llm_gateway.provider_chain");
                     require(chain.size() == 2 && chain[0] == "anthropic:claude-3", "array mismatch");
                     const auto providers = toml.subsections("providers");
                     require(providers.size() == 2 && providers[0] == "anthropic" &&
                                 providers[1] == "openai",
                             "subsections mismatch");
                     require(!toml.find_u64("llm_gateway.cost_cap_usd").has_value(),
                             "a double is not an integer");
                   }});

  tests.push_back({"toml_rejects_lines_without_assignment", [] {
                     require(!common::parse_toml("[llm_gateway]\nretry_max\n").ok(),
                             "missing '=' should fail");
                     require(!common::parse_toml("[]\n").ok(), "empty section should fail");
                   }});

  tests.push_back({"quote_toml_string_escapes", [] {
                     require(common::quote_toml_string("a\"b") == "\"a\\\"b\"", "quote mismatch");
                   }});
}
