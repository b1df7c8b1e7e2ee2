#include <fcomb-test/util.h>

#include <fcomb/matrix.h>

using namespace fcomb;

namespace
{
    struct MatrixFixture
    {
        MatrixFixture()
        {
            app = Test::make_package("app", {"a", "b"});
            core = Test::make_package("core", {});
            packages.push_back(ConfiguredPackage{&app, Test::parse_config(R"json({"matrix": {"os": "linux"}})json")});
            packages.push_back(ConfiguredPackage{&core, Config{}});
        }

        Package app;
        Package core;
        std::vector<ConfiguredPackage> packages;
    };
}

TEST_CASE_METHOD (MatrixFixture, "feature matrix", "[matrix]")
{
    MatrixOptions options;
    auto maybe_matrix = feature_matrix(packages, options);
    REQUIRE(maybe_matrix.has_value());
    const auto& matrix = *maybe_matrix.get();
    REQUIRE(matrix.size() == 5);
    for (size_t i = 0; i < 4; ++i)
    {
        const auto& entry = matrix[i].object(FCOMB_LINE_INFO);
        CHECK(entry["name"].string(FCOMB_LINE_INFO) == "app");
        CHECK(entry["os"].string(FCOMB_LINE_INFO) == "linux");
    }

    CHECK(matrix[4].object(FCOMB_LINE_INFO).get("os") == nullptr);
    CHECK(format_feature_matrix(matrix, options) ==
          R"([{"features":"","name":"app","os":"linux"},{"features":"a","name":"app","os":"linux"},)"
          R"({"features":"a,b","name":"app","os":"linux"},{"features":"b","name":"app","os":"linux"},)"
          R"({"features":"","name":"core"}])"
          "\n");
}

TEST_CASE_METHOD (MatrixFixture, "pretty feature matrix", "[matrix]")
{
    MatrixOptions options;
    options.pretty = true;
    packages.pop_back();
    packages[0].config.matrix = Json::Object{};
    app.features.erase("b");
    auto maybe_matrix = feature_matrix(packages, options);
    REQUIRE(maybe_matrix.has_value());
    CHECK(format_feature_matrix(*maybe_matrix.get(), options) == R"([
  {
    "features": "",
    "name": "app"
  },
  {
    "features": "a",
    "name": "app"
  }
]
)");
}

TEST_CASE_METHOD (MatrixFixture, "packages only matrix", "[matrix]")
{
    MatrixOptions options;
    options.packages_only = true;
    auto maybe_matrix = feature_matrix(packages, options);
    REQUIRE(maybe_matrix.has_value());
    CHECK(format_feature_matrix(*maybe_matrix.get(), options) ==
          "[{\"name\":\"app\",\"os\":\"linux\"},{\"name\":\"core\"}]\n");
}

TEST_CASE_METHOD (MatrixFixture, "matrix values override generated fields", "[matrix]")
{
    packages.pop_back();
    packages[0].config =
        Test::parse_config(R"json({"matrix": {"name": "renamed"}, "exclude_features": ["a", "b"]})json");
    auto maybe_matrix = feature_matrix(packages, MatrixOptions{});
    REQUIRE(maybe_matrix.has_value());
    CHECK(format_feature_matrix(*maybe_matrix.get(), MatrixOptions{}) ==
          "[{\"features\":\"\",\"name\":\"renamed\"}]\n");
}

TEST_CASE ("feature matrix with too many combinations", "[matrix]")
{
    auto huge = Test::make_package("huge", {"f00", "f01", "f02", "f03", "f04", "f05", "f06", "f07", "f08",
                                            "f09", "f10", "f11", "f12", "f13", "f14", "f15", "f16", "f17",
                                            "f18", "f19", "f20", "f21", "f22", "f23", "f24"});
    std::vector<ConfiguredPackage> packages{ConfiguredPackage{&huge, Config{}}};
    auto maybe_matrix = feature_matrix(packages, MatrixOptions{});
    REQUIRE_FALSE(maybe_matrix.has_value());
    CHECK(maybe_matrix.error() ==
          LocalizedString::from_raw(
              "huge: too many configurations: 33554432 feature combinations exceed the limit of 100000"));
}
