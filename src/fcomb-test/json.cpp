#include <fcomb-test/util.h>

#include <fcomb/base/json.h>
#include <fcomb/base/messages.h>

#include <math.h>

using namespace fcomb;
using Json::Value;

TEST_CASE ("JSON parse keywords", "[json]")
{
    auto res = Json::parse("true", "test");
    REQUIRE(res);
    REQUIRE(res.get()->is_boolean());
    REQUIRE(res.get()->boolean(FCOMB_LINE_INFO));
    res = Json::parse(" false ", "test");
    REQUIRE(res);
    REQUIRE(res.get()->is_boolean());
    REQUIRE(!res.get()->boolean(FCOMB_LINE_INFO));
    res = Json::parse(" null\t ", "test");
    REQUIRE(res);
    REQUIRE(res.get()->is_null());
}

TEST_CASE ("JSON parse strings with escapes", "[json]")
{
    auto res = Json::parse(R"("\t")", "test");
    REQUIRE(res);
    REQUIRE(res.get()->string(FCOMB_LINE_INFO) == "\t");

    res = Json::parse(R"("\\")", "test");
    REQUIRE(res);
    REQUIRE(res.get()->string(FCOMB_LINE_INFO) == "\\");

    res = Json::parse(R"("\/")", "test");
    REQUIRE(res);
    REQUIRE(res.get()->string(FCOMB_LINE_INFO) == "/");

    res = Json::parse(R"("\u001b[0m")", "test");
    REQUIRE(res);
    REQUIRE(res.get()->string(FCOMB_LINE_INFO) == "\x1b[0m");

    res = Json::parse(R"("path+file:///C:/Users/someone/\"quoted\"")", "test");
    REQUIRE(res);
    REQUIRE(res.get()->string(FCOMB_LINE_INFO) == R"(path+file:///C:/Users/someone/"quoted")");
}

TEST_CASE ("JSON parse numbers", "[json]")
{
    auto res = Json::parse("12345", "test");
    REQUIRE(res);
    REQUIRE(res.get()->is_integer());
    REQUIRE(res.get()->integer(FCOMB_LINE_INFO) == 12345);
    res = Json::parse("-9223372036854775808", "test");
    REQUIRE(res);
    REQUIRE(res.get()->is_integer());
    REQUIRE(res.get()->integer(FCOMB_LINE_INFO) == (-9223372036854775807 - 1));
    res = Json::parse("-0.0", "test");
    REQUIRE(res);
    REQUIRE(res.get()->is_number());
    REQUIRE(!res.get()->is_integer());
    REQUIRE(signbit(res.get()->number(FCOMB_LINE_INFO)));
}

TEST_CASE ("JSON parse arrays and objects", "[json]")
{
    auto res = Json::parse(R"({"features": {"default": ["std"], "std": []}, "rename": null})", "test");
    REQUIRE(res);
    const auto& obj = res.get()->object(FCOMB_LINE_INFO);
    REQUIRE(obj.size() == 2);
    REQUIRE(obj["rename"].is_null());
    const auto& features = obj["features"].object(FCOMB_LINE_INFO);
    REQUIRE(features["default"].array(FCOMB_LINE_INFO).size() == 1);
    REQUIRE(features["default"].array(FCOMB_LINE_INFO)[0].string(FCOMB_LINE_INFO) == "std");
    REQUIRE(features["std"].array(FCOMB_LINE_INFO).size() == 0);
    REQUIRE(obj.get("missing") == nullptr);
}

TEST_CASE ("JSON track newlines", "[json]")
{
    auto res = Json::parse("{\n,", "filename");
    REQUIRE(!res);
    REQUIRE(res.error() ==
            LocalizedString::from_raw(R"(filename:2:1: error: Unexpected character; expected property name
    on expression: ,
                   ^)"));
}

TEST_CASE ("JSON duplicated object keys", "[json]")
{
    auto res = Json::parse("{\"name\": 1, \"name\": 2}", "filename");
    REQUIRE(!res);
    REQUIRE(res.error() == LocalizedString::from_raw(R"(filename:1:13: error: Duplicated key "name" in an object
    on expression: {"name": 1, "name": 2}
                               ^)"));
}

TEST_CASE ("JSON parse object requires an object", "[json]")
{
    auto res = Json::parse_object("[]", "cargo metadata");
    REQUIRE(!res);
    REQUIRE(res.error() == LocalizedString::from_raw("Expected \"cargo metadata\" to be an object."));
}

TEST_CASE ("JSON merge objects", "[json]")
{
    auto target = Json::parse_object(R"({"name": "app", "env": {"RUST_LOG": "info", "CI": "1"}, "os": "linux"})")
                      .value_or_exit(FCOMB_LINE_INFO);
    const auto source = Json::parse_object(R"({"env": {"RUST_LOG": "debug"}, "os": ["linux", "macos"]})")
                            .value_or_exit(FCOMB_LINE_INFO);
    Json::merge_into(target, source);
    target.sort_keys();
    CHECK(Json::stringify(target, Json::JsonStyle::compact()) ==
          R"({"env":{"CI":"1","RUST_LOG":"debug"},"name":"app","os":["linux","macos"]})"
          "\n");
}

TEST_CASE ("JSON stringify", "[json]")
{
    Json::Object obj;
    obj.insert("name", Value::string("app"));
    obj.insert("features", Value::string("a,b"));
    obj.insert("escaped", Value::string("\"\\\n\x01"));
    CHECK(Json::stringify(obj, Json::JsonStyle::compact()) ==
          "{\"name\":\"app\",\"features\":\"a,b\",\"escaped\":\"\\\"\\\\\\n\\u0001\"}\n");
    CHECK(Json::stringify(obj) == "{\n"
                                  "  \"name\": \"app\",\n"
                                  "  \"features\": \"a,b\",\n"
                                  "  \"escaped\": \"\\\"\\\\\\n\\u0001\"\n"
                                  "}\n");
    CHECK(Json::stringify(Json::Array{}) == "[]\n");
}
