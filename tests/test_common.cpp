#include "test_framework.hpp"

#include "runbox/common/crypto.hpp"
#include "runbox/common/fs.hpp"
#include "runbox/common/json_util.hpp"
#include "runbox/common/toml.hpp"
#include "runbox/common/version.hpp"

void register_common_tests(std::vector<runbox::tests::TestCase> &tests) {
  using runbox::tests::require;
  namespace common = runbox::common;

  tests.push_back({"common_string_helpers", [] {
                     require(common::trim("  a b \n") == "a b", "trim mismatch");
                     require(common::starts_with("session/abc", "session/"), "starts_with");
                     require(!common::ends_with("a", "abc"), "ends_with short input");
                     require(common::to_lower("RunC") == "runc", "to_lower mismatch");
                     const auto parts = common::split("a//b", '/');
                     require(parts.size() == 3 && parts[1].empty(), "split keeps empty parts");
                     require(common::join({"x", "y", "z"}, ", ") == "x, y, z", "join mismatch");
                   }});

  tests.push_back({"common_parse_int_and_bool", [] {
                     require(common::parse_int(" 42 ") == 42, "parse_int trims");
                     require(!common::parse_int("4x").has_value(), "parse_int rejects junk");
                     require(!common::parse_int("").has_value(), "parse_int rejects empty");
                     require(common::parse_bool("Yes") == true, "parse_bool yes");
                     require(common::parse_bool("off") == false, "parse_bool off");
                     require(!common::parse_bool("maybe").has_value(), "parse_bool junk");
                   }});

  tests.push_back({"common_json_escape_control_chars", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n",
                             "basic escapes");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control bytes use \\u00XX");
                     require(common::json_quote("x") == "\"x\"", "json_quote wraps");
                   }});

  tests.push_back({"common_json_unescape_unicode", [] {
                     auto plain = common::json_unescape("line\\nnext\\t\\u0041");
                     require(plain.ok() && plain.value() == "line\nnext\tA", "simple escapes");
                     auto pair = common::json_unescape("\\ud83d\\ude00");
                     require(pair.ok() && pair.value() == "\xF0\x9F\x98\x80",
                             "surrogate pair decodes to UTF-8");
                     auto broken = common::json_unescape("\\uZZZZ");
                     require(!broken.ok(), "bad hex must fail");
                   }});

  tests.push_back({"common_json_parse_object_members", [] {
                     auto parsed = common::json_parse_object(
                         R"({"name": "demo", "count": 3, "flag": true, "list": ["a", "b"],)"
                         R"( "nested": {"x": [1, 2]}, "none": null})");
                     require(parsed.ok(), "object should parse: " + parsed.error());
                     const auto &obj = parsed.value();
                     require(common::json_as_string(obj.at("name")) == "demo", "string member");
                     require(common::json_as_int(obj.at("count")) == 3, "int member");
                     require(common::json_as_bool(obj.at("flag")) == true, "bool member");
                     const auto list = common::json_as_string_array(obj.at("list"));
                     require(list.has_value() && list->size() == 2 && (*list)[1] == "b",
                             "string array member");
                     require(common::json_is_null(obj.at("none")), "null member");
                     require(obj.contains("nested"), "nested object kept raw");
                   }});

  tests.push_back({"common_json_rejects_non_objects", [] {
                     auto array = common::json_parse_object("[1, 2]");
                     require(!array.ok(), "array is not an object");
                     require(array.code() == common::ErrorCode::InvalidArgument,
                             "parse errors are InvalidArgument");
                     auto truncated = common::json_parse_object(R"({"a": "b")");
                     require(!truncated.ok(), "truncated object must fail");
                     require(!common::json_as_string("12").has_value(), "number is not a string");
                     require(!common::json_as_string_array(R"(["a", 1])").has_value(),
                             "mixed array is not a string array");
                   }});

  tests.push_back({"common_toml_sections_and_types", [] {
                     auto parsed = common::parse_toml("environment = \"staging\" # comment\n"
                                                      "[server]\n"
                                                      "port = 8_080\n"
                                                      "api_key = 'raw\\value'\n"
                                                      "motd = \"a\\tb # not a comment\"\n"
                                                      "[sandbox]\r\n"
                                                      "keep_template = true\n"
                                                      "ratio = 0.25\n");
                     require(parsed.ok(), "toml should parse: " + parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.size() == 6, "six keys");
                     require(doc.string_or("environment", "") == "staging", "top-level string");
                     require(doc.int_or("server.port", 0) == 8080, "underscore separators");
                     require(doc.string_or("server.api_key", "") == "raw\\value",
                             "literal strings are verbatim");
                     require(doc.string_or("server.motd", "") == "a\tb # not a comment",
                             "escapes and hash inside strings");
                     require(doc.bool_or("sandbox.keep_template", false), "bool value");
                     require(doc.double_or("sandbox.ratio", 0.0) == 0.25, "double value");
                     require(doc.double_or("server.port", 0.0) == 8080.0, "int widens to double");
                     require(doc.int_or("missing", 7) == 7, "fallback for missing key");
                     require(doc.int_or("environment", 7) == 7, "fallback for wrong type");
                     require(doc.find("sandbox.ratio") != nullptr, "find");
                   }});

  tests.push_back({"common_toml_rejects_bad_lines", [] {
                     require(!common::parse_toml("[]\n").ok(), "empty section");
                     require(!common::parse_toml("[[bins]]\n").ok(), "array of tables");
                     require(!common::parse_toml("just words\n").ok(), "missing equals");
                     require(!common::parse_toml("key =\n").ok(), "missing value");
                     require(!common::parse_toml("key = \"open\n").ok(), "unterminated string");
                     require(!common::parse_toml("key = [1, 2]\n").ok(), "arrays unsupported");
                     require(!common::parse_toml("key = yes\n").ok(), "bare word");
                     auto duplicate = common::parse_toml("a = 1\n\n[s]\nb = 2\nb = 3\n");
                     require(!duplicate.ok(), "duplicate key");
                     require(duplicate.error() == "line 5: duplicate key 's.b'",
                             "line number in error: " + duplicate.error());
                     require(duplicate.code() == runbox::common::ErrorCode::InvalidArgument,
                             "invalid argument");
                   }});

  tests.push_back({"common_base64_round_trip_and_errors", [] {
                     require(common::base64_encode("hello") == "aGVsbG8=", "encode");
                     auto decoded = common::base64_decode("aGVs\nbG8=");
                     require(decoded.ok() && decoded.value() == "hello",
                             "decode ignores line wrapping");
                     auto empty = common::base64_decode("");
                     require(empty.ok() && empty.value().empty(), "empty decodes to empty");
                     auto bad = common::base64_decode("abc");
                     require(!bad.ok() && bad.code() == common::ErrorCode::ArchiveFormat,
                             "bad length is ArchiveFormat");
                     require(!common::base64_decode("a=bc").ok(), "misplaced padding");
                     require(!common::base64_decode("ab!c").ok(), "invalid character");
                   }});

  tests.push_back({"common_hash_and_random", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                     const auto token = common::random_hex(16);
                     require(token.size() == 32, "random_hex length");
                     require(token != common::random_hex(16), "random_hex should vary");
                     require(common::constant_time_equals("key", "key"), "equal strings");
                     require(!common::constant_time_equals("key", "kez"), "different strings");
                     require(!common::constant_time_equals("key", "keys"), "different lengths");
                   }});

  tests.push_back({"common_error_code_names", [] {
                     require(common::error_code_name(common::ErrorCode::SessionNotFound) ==
                                 "session_not_found",
                             "snake_case name");
                     const auto status = common::Status::error(common::ErrorCode::ImagePull, "x");
                     require(!status.ok() && status.code() == common::ErrorCode::ImagePull,
                             "status keeps its code");
                     require(!common::version().empty(), "version is set");
                   }});
}
