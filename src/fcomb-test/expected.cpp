#include <catch2/catch.hpp>

#include <fcomb/base/chrono.h>
#include <fcomb/base/expected.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/strings.h>

#include <string>

using namespace fcomb;

namespace
{
    ExpectedL<long long> parse_count(StringView text)
    {
        auto parsed = Strings::strto<long long>(text);
        if (auto count = parsed.get())
        {
            return *count;
        }

        return LocalizedString::from_raw(Strings::concat("not a count: ", text));
    }

    ExpectedL<long long> non_negative(long long count)
    {
        if (count < 0)
        {
            return LocalizedString::from_raw("negative count");
        }

        return count;
    }
}

TEST_CASE ("optional value_or", "[optional]")
{
    Optional<std::string> empty;
    CHECK_FALSE(empty.has_value());
    CHECK(empty.value_or("cargo") == "cargo");

    Optional<std::string> present{"cross"};
    REQUIRE(present.has_value());
    CHECK(present.value_or("cargo") == "cross");
    CHECK(std::move(present).value_or("cargo") == "cross");
}

TEST_CASE ("optional emplace and clear", "[optional]")
{
    Optional<int> exit_code;
    exit_code.emplace(101);
    REQUIRE(exit_code.get());
    CHECK(*exit_code.get() == 101);
    exit_code.clear();
    CHECK(exit_code.get() == nullptr);
}

TEST_CASE ("optional map and then", "[optional]")
{
    Optional<size_t> warnings{3};
    CHECK(warnings.map([](size_t n) { return n * 2; }) == Optional<size_t>{6});
    CHECK(warnings.then([](size_t n) -> Optional<size_t> {
        if (n > 2) return nullopt;
        return n;
    }) == nullopt);

    Optional<size_t> unknown;
    CHECK_FALSE(unknown.map([](size_t n) { return n * 2; }).has_value());
}

TEST_CASE ("optional comparison", "[optional]")
{
    CHECK(Optional<int>{1} == Optional<int>{1});
    CHECK(Optional<int>{1} != Optional<int>{2});
    CHECK(Optional<int>{} == Optional<int>{});
    CHECK(Optional<int>{} != Optional<int>{0});
    CHECK(Optional<std::string>{"1"} == "1");
    CHECK_FALSE(Optional<std::string>{} == "1");
}

TEST_CASE ("expected holds value or error", "[expected]")
{
    auto good = parse_count("12");
    REQUIRE(good.has_value());
    CHECK(*good.get() == 12);

    auto bad = parse_count("twelve");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().data() == "not a count: twelve");
    CHECK(bad.value_or(7) == 7);
}

TEST_CASE ("expected map", "[expected]")
{
    CHECK(parse_count("4").map([](long long n) { return n + 1; }).value_or(0) == 5);
    auto mapped_error = parse_count("x").map([](long long n) { return n + 1; });
    REQUIRE_FALSE(mapped_error.has_value());
    CHECK(mapped_error.error().data() == "not a count: x");
}

TEST_CASE ("expected then", "[expected]")
{
    auto chained = parse_count("9").then(non_negative);
    REQUIRE(chained.has_value());
    CHECK(*chained.get() == 9);

    auto negative = parse_count("-1").then(non_negative);
    REQUIRE_FALSE(negative.has_value());
    CHECK(negative.error().data() == "negative count");

    auto first_error_wins = parse_count("?").then(non_negative);
    REQUIRE_FALSE(first_error_wins.has_value());
    CHECK(first_error_wins.error().data() == "not a count: ?");
}

TEST_CASE ("formatting of elapsed time", "[chrono]")
{
    using namespace std::chrono;
    CHECK(ElapsedTime{duration_cast<ElapsedTime::duration>(nanoseconds(100))}.to_string() == "0.000s");
    CHECK(ElapsedTime{duration_cast<ElapsedTime::duration>(milliseconds(3532))}.to_string() == "3.532s");
    CHECK(ElapsedTime{duration_cast<ElapsedTime::duration>(seconds(61))}.to_string() == "1m1.000s");
    CHECK(ElapsedTime{duration_cast<ElapsedTime::duration>(minutes(61) + milliseconds(5))}.to_string() ==
          "1h1m0.005s");
    CHECK(ElapsedTime{duration_cast<ElapsedTime::duration>(hours(25))}.to_string() == "1d1h0.000s");

    ElapsedTime total;
    total += ElapsedTime{duration_cast<ElapsedTime::duration>(milliseconds(1500))};
    total += ElapsedTime{duration_cast<ElapsedTime::duration>(milliseconds(1500))};
    CHECK(total.to_string() == "3.000s");
}
