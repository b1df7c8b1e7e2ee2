#include <fcomb-test/util.h>

#include <fcomb/featureset.h>
#include <fcomb/package.h>

using namespace fcomb;

TEST_CASE ("feature sets are canonical", "[featureset]")
{
    FeatureSet features{"ssr", "hydrate", "csr", "ssr"};
    REQUIRE(features.size() == 3);
    CHECK(features[0] == "csr");
    CHECK(features[1] == "hydrate");
    CHECK(features[2] == "ssr");
    CHECK(features == FeatureSet{"csr", "hydrate", "ssr"});
}

TEST_CASE ("feature sets order lexicographically", "[featureset]")
{
    CHECK(FeatureSet{} < FeatureSet{"a"});
    CHECK(FeatureSet{"a"} < FeatureSet{"a", "b"});
    CHECK(FeatureSet{"a", "b"} < FeatureSet{"b"});
    CHECK_FALSE(FeatureSet{"b"} < FeatureSet{"a", "b"});
}

TEST_CASE ("features_argument and display_features", "[featureset]")
{
    CHECK(features_argument(FeatureSet{}) == "");
    CHECK(features_argument(FeatureSet{"ssr", "hydrate"}) == "hydrate,ssr");
    CHECK(display_features(FeatureSet{"ssr", "hydrate"}) == "hydrate, ssr");
}

TEST_CASE ("retain_features and remove_features", "[featureset]")
{
    const FeatureSet known{"a", "b", "c"};
    CHECK(retain_features(FeatureSet{"a", "ghost"}, known) == FeatureSet{"a"});
    CHECK(retain_features(FeatureSet{"ghost"}, known).empty());
    CHECK(remove_features(known, FeatureSet{"b", "ghost"}) == FeatureSet{"a", "c"});
    CHECK(remove_features(known, FeatureSet{}) == known);
}

TEST_CASE ("declared_features", "[featureset]")
{
    auto package = Test::make_package("leptos", {"ssr", "csr", "hydrate"});
    CHECK(declared_features(package) == FeatureSet{"csr", "hydrate", "ssr"});
    CHECK(declared_features(Test::make_package("empty", {})).empty());
}

TEST_CASE ("implicit optional dependency features", "[featureset]")
{
    auto package = Test::make_package("app", {"default", "tls"});
    package.features["serde"] = {"dep:serde"};
    package.features["json"] = {"dep:serde_json", "serde"};
    package.features["tokio"] = {"dep:tokio"};
    package.features["fast-log"] = {"dep:log"};

    Dependency serde;
    serde.name = "serde";
    serde.optional = true;
    package.dependencies.push_back(serde);

    Dependency serde_json;
    serde_json.name = "serde_json";
    serde_json.optional = true;
    package.dependencies.push_back(serde_json);

    // required dependencies never get an implicit feature
    Dependency tokio;
    tokio.name = "tokio";
    package.dependencies.push_back(tokio);

    Dependency log;
    log.name = "log";
    log.rename = "fast-log";
    log.optional = true;
    package.dependencies.push_back(log);

    CHECK(log.local_name() == "fast-log");
    CHECK(serde.local_name() == "serde");
    // "fast-log" implies "dep:log", not "dep:fast-log"
    CHECK(implicit_optional_dependency_features(package) == FeatureSet{"serde"});
}
