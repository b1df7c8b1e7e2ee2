#include <fcomb-test/util.h>

#include <fcomb/combinations.h>

#include <algorithm>

using namespace fcomb;

namespace
{
    std::vector<FeatureSet> generate(const Package& package, const Config& config)
    {
        auto maybe_combinations = generate_feature_combinations(package, config);
        if (!maybe_combinations.has_value())
        {
            FAIL(maybe_combinations.error());
        }

        return std::move(*maybe_combinations.get());
    }

    size_t count_of(const std::vector<FeatureSet>& sets, const FeatureSet& needle)
    {
        return static_cast<size_t>(std::count(sets.begin(), sets.end(), needle));
    }
}

TEST_CASE ("powerset of two features", "[combinations]")
{
    auto package = Test::make_package("pkg", {"A", "B"});
    const std::vector<FeatureSet> expected{{}, {"A"}, {"A", "B"}, {"B"}};
    CHECK(generate(package, Config{}) == expected);
}

TEST_CASE ("powerset size", "[combinations]")
{
    auto package = Test::make_package("pkg", {"a", "b", "c", "d", "e", "f", "g"});
    const auto declared = declared_features(package);
    const auto combinations = generate(package, Config{});
    REQUIRE(combinations.size() == 128);
    CHECK(combinations.front().empty());
    CHECK(combinations.back() == FeatureSet{"g"});
    CHECK(count_of(combinations, declared) == 1);
    for (auto&& combination : combinations)
    {
        CHECK(declared.includes(combination));
    }

    CHECK(std::is_sorted(combinations.begin(), combinations.end()));
    CHECK(std::adjacent_find(combinations.begin(), combinations.end()) == combinations.end());
}

TEST_CASE ("package without features", "[combinations]")
{
    auto package = Test::make_package("pkg", {});
    const std::vector<FeatureSet> expected{{}};
    CHECK(generate(package, Config{}) == expected);

    Config config;
    config.no_empty_feature_set = true;
    CHECK(generate(package, config).empty());
}

TEST_CASE ("generation is deterministic", "[combinations]")
{
    auto package = Test::make_package("pkg", {"x", "a", "m", "b"});
    const auto config = Test::parse_config(R"({
    "exclude_feature_sets": [["a", "b"]],
    "include_features": ["x"]
})");
    CHECK(generate(package, config) == generate(package, config));
}

TEST_CASE ("exclude_feature_sets", "[combinations]")
{
    auto package = Test::make_package("pkg", {"A", "B", "C"});
    const auto config = Test::parse_config(R"({"exclude_feature_sets": [["A", "B"]]})");
    const std::vector<FeatureSet> expected{{}, {"A"}, {"A", "C"}, {"B"}, {"B", "C"}, {"C"}};
    const auto combinations = generate(package, config);
    CHECK(combinations == expected);
    CHECK(count_of(combinations, FeatureSet{"A", "B"}) == 0);
    CHECK(count_of(combinations, FeatureSet{"A", "B", "C"}) == 0);
}

TEST_CASE ("an empty exclude set excludes everything", "[combinations]")
{
    auto package = Test::make_package("pkg", {"A", "B"});
    const auto config = Test::parse_config(R"({"exclude_feature_sets": [[]], "include_feature_sets": [["B"]]})");
    const std::vector<FeatureSet> expected{{"B"}};
    CHECK(generate(package, config) == expected);
}

TEST_CASE ("exclude_features", "[combinations]")
{
    auto package = Test::make_package("pkg", {"default", "full", "a", "b"});
    const auto config = Test::parse_config(R"({"exclude_features": ["default", "full", "ghost"]})");
    const std::vector<FeatureSet> expected{{}, {"a"}, {"a", "b"}, {"b"}};
    CHECK(generate(package, config) == expected);
}

TEST_CASE ("include_features are part of every combination", "[combinations]")
{
    auto package = Test::make_package("pkg", {"std", "a", "b"});
    const auto config = Test::parse_config(R"({"include_features": ["std"], "exclude_features": ["std"]})");
    const std::vector<FeatureSet> expected{{"a", "b", "std"}, {"a", "std"}, {"b", "std"}, {"std"}};
    CHECK(generate(package, config) == expected);
}

TEST_CASE ("isolated_feature_sets", "[combinations]")
{
    auto package = Test::make_package("pkg", {"A", "B", "C", "D"});
    const auto config = Test::parse_config(R"({"isolated_feature_sets": [["A", "B"], ["C", "D"]]})");
    const auto combinations = generate(package, config);
    // the empty set is generated by both groups and kept once
    const std::vector<FeatureSet> expected{{}, {"A"}, {"A", "B"}, {"B"}, {"C"}, {"C", "D"}, {"D"}};
    CHECK(combinations == expected);
    CHECK(Test::all_within(combinations, config.isolated_feature_sets));
}

TEST_CASE ("isolated_feature_sets ignore undeclared and excluded features", "[combinations]")
{
    auto package = Test::make_package("pkg", {"hydrate", "ssr", "csr", "nightly"});
    const auto config = Test::parse_config(R"({
    "isolated_feature_sets": [["hydrate", "ssr", "ghost"], ["csr", "nightly"]],
    "exclude_features": ["nightly"],
    "include_features": ["nightly"]
})");
    const std::vector<FeatureSet> expected{
        {"csr", "nightly"}, {"hydrate", "nightly"}, {"hydrate", "nightly", "ssr"}, {"nightly"}, {"nightly", "ssr"}};
    const auto combinations = generate(package, config);
    CHECK(combinations == expected);

    std::vector<FeatureSet> groups;
    for (auto&& isolated : config.isolated_feature_sets)
    {
        auto group = isolated;
        group.append(config.include_features);
        groups.push_back(std::move(group));
    }

    CHECK(Test::all_within(combinations, groups));
}

TEST_CASE ("include_feature_sets are forced into the result", "[combinations]")
{
    auto package = Test::make_package("pkg", {"A", "B"});
    const auto config = Test::parse_config(R"({
    "exclude_feature_sets": [["A"]],
    "include_feature_sets": [["A", "ghost"], ["A"]]
})");
    const auto combinations = generate(package, config);
    const std::vector<FeatureSet> expected{{}, {"A"}, {"B"}};
    CHECK(combinations == expected);
    CHECK(count_of(combinations, FeatureSet{"A"}) == 1);
    for (auto&& combination : combinations)
    {
        CHECK_FALSE(combination.contains("ghost"));
    }
}

TEST_CASE ("no_empty_feature_set", "[combinations]")
{
    auto package = Test::make_package("pkg", {"A", "B"});
    const auto config = Test::parse_config(R"({"no_empty_feature_set": true, "include_feature_sets": [["ghost"]]})");
    const std::vector<FeatureSet> expected{{"A"}, {"A", "B"}, {"B"}};
    CHECK(generate(package, config) == expected);
}

TEST_CASE ("allow_feature_sets", "[combinations]")
{
    auto package = Test::make_package("leptos", {"hydrate", "ssr", "csr"});
    SECTION ("exactly the allowed sets")
    {
        const auto config = Test::parse_config(R"({
    "allow_feature_sets": [["ssr"], ["hydrate"]],
    "exclude_feature_sets": [["hydrate"]]
})");
        const std::vector<FeatureSet> expected{{"hydrate"}, {"ssr"}};
        CHECK(generate(package, config) == expected);
    }

    SECTION ("unknown names are dropped")
    {
        const auto config = Test::parse_config(R"({"allow_feature_sets": [["hydrate", "ghost"], ["hydrate"]]})");
        const std::vector<FeatureSet> expected{{"hydrate"}};
        CHECK(generate(package, config) == expected);
    }

    SECTION ("the empty set honors no_empty_feature_set")
    {
        auto config = Test::parse_config(R"({"allow_feature_sets": [[], ["hydrate"], ["ghost"]]})");
        const std::vector<FeatureSet> with_empty{{}, {"hydrate"}};
        CHECK(generate(package, config) == with_empty);

        config.no_empty_feature_set = true;
        const std::vector<FeatureSet> without_empty{{"hydrate"}};
        CHECK(generate(package, config) == without_empty);
    }
}

TEST_CASE ("skip_optional_dependencies", "[combinations]")
{
    auto package = Test::make_package("app", {"tls"});
    package.features["serde"] = {"dep:serde"};
    Dependency serde;
    serde.name = "serde";
    serde.optional = true;
    package.dependencies.push_back(serde);

    const std::vector<FeatureSet> all{{}, {"serde"}, {"serde", "tls"}, {"tls"}};
    CHECK(generate(package, Config{}) == all);

    auto config = Test::parse_config(R"({"skip_optional_dependencies": true})");
    const std::vector<FeatureSet> skipped{{}, {"tls"}};
    CHECK(generate(package, config) == skipped);

    config = Test::parse_config(R"({"skip_optional_dependencies": true, "include_feature_sets": [["serde"]]})");
    const std::vector<FeatureSet> readded{{}, {"serde"}, {"tls"}};
    CHECK(generate(package, config) == readded);
}

TEST_CASE ("too many configurations", "[combinations]")
{
    auto package = Test::make_package("huge", {"f01", "f02", "f03", "f04", "f05", "f06", "f07", "f08", "f09",
                                               "f10", "f11", "f12", "f13", "f14", "f15", "f16", "f17", "f18",
                                               "f19", "f20", "f21", "f22", "f23", "f24", "f25"});
    auto maybe_combinations = generate_feature_combinations(package, Config{});
    REQUIRE_FALSE(maybe_combinations.has_value());
    CHECK(maybe_combinations.error() ==
          LocalizedString::from_raw("huge: too many configurations: 33554432 feature combinations exceed the limit "
                                    "of 100000"));

    SECTION ("isolation keeps the count down")
    {
        const auto config = Test::parse_config(R"({
    "isolated_feature_sets": [
        ["f01", "f02", "f03", "f04", "f05", "f06", "f07", "f08", "f09", "f10", "f11", "f12"],
        ["f13", "f14", "f15", "f16", "f17", "f18", "f19", "f20", "f21", "f22", "f23", "f24", "f25"]
    ]
})");
        CHECK(generate(package, config).size() == 4096 + 8192 - 1);
    }

    SECTION ("the limit is checked across isolated groups")
    {
        const auto config = Test::parse_config(R"({
    "isolated_feature_sets": [
        ["f01", "f02", "f03", "f04", "f05", "f06", "f07", "f08", "f09", "f10", "f11", "f12", "f13", "f14", "f15",
         "f16"],
        ["f09", "f10", "f11", "f12", "f13", "f14", "f15", "f16", "f17", "f18", "f19", "f20", "f21", "f22", "f23",
         "f24"]
    ]
})");
        CHECK_FALSE(generate_feature_combinations(package, config).has_value());
    }
}
