#include <fcomb-test/util.h>

#include <fcomb/base/strings.h>

#include <string>
#include <vector>

using namespace fcomb;

TEST_CASE ("find_first_of", "[strings]")
{
    using Strings::find_first_of;
    REQUIRE(find_first_of("abcdefg", "hij") == std::string());
    REQUIRE(find_first_of("abcdefg", "a") == std::string("abcdefg"));
    REQUIRE(find_first_of("abcdefg", "g") == std::string("g"));
    REQUIRE(find_first_of("abcdefg", "bg") == std::string("bcdefg"));
    REQUIRE(find_first_of("abcdefg", "gb") == std::string("bcdefg"));
}

TEST_CASE ("edit distance", "[strings]")
{
    using Strings::byte_edit_distance;
    REQUIRE(byte_edit_distance("", "") == 0);
    REQUIRE(byte_edit_distance("a", "a") == 0);
    REQUIRE(byte_edit_distance("abcd", "abcd") == 0);
    REQUIRE(byte_edit_distance("aaa", "aa") == 1);
    REQUIRE(byte_edit_distance("aa", "aaa") == 1);
    REQUIRE(byte_edit_distance("abcdef", "bcdefa") == 2);
    REQUIRE(byte_edit_distance("hello", "world") == 4);
    REQUIRE(byte_edit_distance("CAPITAL", "capital") == 7);
    REQUIRE(byte_edit_distance("", "hello") == 5);
    REQUIRE(byte_edit_distance("world", "") == 5);
    REQUIRE(byte_edit_distance("exclude_feature", "exclude_features") == 1);
}

TEST_CASE ("case insensitive equality", "[strings]")
{
    REQUIRE(Strings::case_insensitive_ascii_equals("YES", "yes"));
    REQUIRE(Strings::case_insensitive_ascii_equals("", ""));
    REQUIRE_FALSE(Strings::case_insensitive_ascii_equals("yes", "ye"));
    REQUIRE_FALSE(Strings::case_insensitive_ascii_equals("true", "truf"));
}

TEST_CASE ("join", "[strings]")
{
    const std::vector<std::string> features{"alloc", "std", "serde"};
    REQUIRE(Strings::join(",", features) == "alloc,std,serde");
    REQUIRE(Strings::join(", ", std::vector<std::string>{}) == "");
    REQUIRE(Strings::join(" ", features, [](const std::string& f) { return "+" + f; }) == "+alloc +std +serde");
}

TEST_CASE ("concat", "[strings]")
{
    REQUIRE(Strings::concat("a", 'b', std::string("c"), StringView{"d"}) == "abcd");
    std::string target = "x";
    REQUIRE(Strings::append(target, "y", 'z') == "xyz");
}

TEST_CASE ("strto", "[strings]")
{
    REQUIRE(Strings::strto<long long>("13") == 13);
    REQUIRE(Strings::strto<long long>("-1") == -1);
    REQUIRE(!Strings::strto<long long>("").has_value());
    REQUIRE(!Strings::strto<long long>(" 1").has_value());
    REQUIRE(!Strings::strto<long long>("1a").has_value());
    REQUIRE(!Strings::strto<long long>("99999999999999999999").has_value());
    REQUIRE(Strings::strto<double>("1.5") == 1.5);
    REQUIRE(!Strings::strto<double>("1.5x").has_value());
}
