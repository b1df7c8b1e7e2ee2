#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>

#include <fcomb/configuration.h>

using namespace fcomb;

namespace
{
    Optional<Config> resolve(BufferedDiagnosticContext& bdc, StringView json)
    {
        const auto document = Test::parse_json(json);
        return resolve_config(bdc, &document, "test", "test-package");
    }
}

TEST_CASE ("missing configuration yields defaults", "[configuration]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_config = resolve_config(bdc, nullptr, "test", "test-package");
    REQUIRE(maybe_config.has_value());
    CHECK(*maybe_config.get() == Config{});
    CHECK(bdc.empty());

    auto maybe_workspace_config = resolve_workspace_config(bdc, nullptr, "test");
    REQUIRE(maybe_workspace_config.has_value());
    CHECK(maybe_workspace_config.get()->exclude_packages.empty());
}

TEST_CASE ("resolve every field", "[configuration]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_config = resolve(bdc, R"json({
    "isolated_feature_sets": [["hydrate", "ssr"], ["csr"]],
    "exclude_features": ["default", "full"],
    "include_features": ["std"],
    "exclude_feature_sets": [["hydrate", "csr"]],
    "include_feature_sets": [["nightly"]],
    "allow_feature_sets": [["ssr"], []],
    "no_empty_feature_set": true,
    "skip_optional_dependencies": true,
    "exclude_packages": ["examples"],
    "matrix": {"os": "linux", "toolchain": {"channel": "nightly"}}
})json");
    INFO(bdc.to_string());
    REQUIRE(maybe_config.has_value());
    CHECK(bdc.empty());

    const auto& config = *maybe_config.get();
    const std::vector<FeatureSet> isolated{{"hydrate", "ssr"}, {"csr"}};
    CHECK(config.isolated_feature_sets == isolated);
    CHECK(config.exclude_features == FeatureSet{"default", "full"});
    CHECK(config.include_features == FeatureSet{"std"});
    const std::vector<FeatureSet> excluded{{"csr", "hydrate"}};
    CHECK(config.exclude_feature_sets == excluded);
    const std::vector<FeatureSet> included{{"nightly"}};
    CHECK(config.include_feature_sets == included);
    const std::vector<FeatureSet> allowed{{"ssr"}, {}};
    CHECK(config.allow_feature_sets == allowed);
    CHECK(config.no_empty_feature_set);
    CHECK(config.skip_optional_dependencies);
    CHECK(config.exclude_packages == std::vector<std::string>{"examples"});
    REQUIRE(config.matrix.size() == 2);
    CHECK(config.matrix["os"].string(FCOMB_LINE_INFO) == "linux");
    CHECK(config.matrix["toolchain"].is_object());
}

TEST_CASE ("deprecated fields are migrated", "[configuration]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_config = resolve(bdc, R"json({
    "skip_feature_sets": [["a", "b"]],
    "exclude_feature_sets": [["c"]],
    "denylist": ["default", "full"],
    "exclude_features": ["full", "nightly"]
})json");
    REQUIRE(maybe_config.has_value());
    REQUIRE(bdc.lines.size() == 2);
    CHECK(bdc.to_string() ==
          "test: warning: test-package: the configuration field \"skip_feature_sets\" is deprecated; its entries "
          "were merged into \"exclude_feature_sets\"\n"
          "test: warning: test-package: the configuration field \"denylist\" is deprecated; its entries were "
          "merged into \"exclude_features\"");

    const auto migrated = Test::parse_config(R"json({
    "exclude_feature_sets": [["c"], ["a", "b"]],
    "exclude_features": ["default", "full", "nightly"]
})json");
    CHECK(*maybe_config.get() == migrated);

    SECTION ("migrating again is a no-op")
    {
        BufferedDiagnosticContext again{out_sink};
        auto maybe_again = resolve(again, R"json({
    "exclude_feature_sets": [["c"], ["a", "b"]],
    "exclude_features": ["default", "full", "nightly"]
})json");
        REQUIRE(maybe_again.has_value());
        CHECK(again.empty());
        CHECK(*maybe_again.get() == migrated);
    }
}

TEST_CASE ("exact_combinations becomes allow_feature_sets", "[configuration]")
{
    Config config;
    config.allow_feature_sets.push_back(FeatureSet{"a"});
    DeprecatedConfig deprecated;
    deprecated.exact_combinations.push_back(FeatureSet{"b"});
    const auto migrations = migrate_deprecated_fields(config, std::move(deprecated));
    REQUIRE(migrations.size() == 1);
    CHECK(migrations[0].old_field == "exact_combinations");
    CHECK(migrations[0].new_field == "allow_feature_sets");
    const std::vector<FeatureSet> expected{{"a"}, {"b"}};
    CHECK(config.allow_feature_sets == expected);

    CHECK(migrate_deprecated_fields(config, DeprecatedConfig{}).empty());
    CHECK(config.allow_feature_sets == expected);
}

TEST_CASE ("unknown fields are warnings", "[configuration]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_config = resolve(bdc, R"json({"foo": 1, "exclude_feature": ["a"]})json");
    REQUIRE(maybe_config.has_value());
    CHECK(*maybe_config.get() == Config{});
    CHECK(bdc.to_string() == "test: warning: $ (a feature combinations configuration object): unexpected field "
                             "'foo'\n"
                             "test: warning: $ (a feature combinations configuration object): unexpected field "
                             "'exclude_feature', did you mean 'exclude_features'?");
}

TEST_CASE ("type errors fail the configuration", "[configuration]")
{
    BufferedDiagnosticContext bdc{out_sink};
    SECTION ("wrong field type")
    {
        CHECK_FALSE(resolve(bdc, R"json({"exclude_features": "default"})json").has_value());
        CHECK(bdc.to_string() ==
              "test: error: failed to parse the feature combinations configuration of test-package:\n"
              "test: error: $.exclude_features: mismatched type: expected an array of feature names");
    }

    SECTION ("wrong element type")
    {
        CHECK_FALSE(resolve(bdc, R"json({"isolated_feature_sets": [["a"], ["b", 1]]})json").has_value());
        CHECK(bdc.to_string() ==
              "test: error: failed to parse the feature combinations configuration of test-package:\n"
              "test: error: $.isolated_feature_sets[1][1]: mismatched type: expected a feature name");
    }

    SECTION ("not an object")
    {
        CHECK_FALSE(resolve(bdc, R"json([])json").has_value());
        CHECK(bdc.to_string() ==
              "test: error: failed to parse the feature combinations configuration of test-package:\n"
              "test: error: $: mismatched type: expected a feature combinations configuration object");
    }

    SECTION ("matrix must be an object")
    {
        CHECK_FALSE(resolve(bdc, R"json({"matrix": ["linux"]})json").has_value());
        CHECK(bdc.any_errors());
    }
}

TEST_CASE ("workspace configuration", "[configuration]")
{
    BufferedDiagnosticContext bdc{out_sink};
    const auto document = Test::parse_json(R"json({"exclude_packages": ["a", "b"], "denylist": ["x"]})json");
    auto maybe_config = resolve_workspace_config(bdc, &document, "/ws/Cargo.toml");
    REQUIRE(maybe_config.has_value());
    CHECK(maybe_config.get()->exclude_packages == std::vector<std::string>{"a", "b"});
    CHECK(bdc.to_string() == "/ws/Cargo.toml: warning: $ (a workspace configuration object): unexpected field "
                             "'denylist'");
}
