#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/strings.h>

#include <fcomb/metadata.h>
#include <fcomb/workspace.h>

using namespace fcomb;

namespace
{
    // Trimmed `cargo metadata --format-version 1 --no-deps` output for a workspace whose root manifest is also a
    // package.
    constexpr StringLiteral WorkspaceMetadata = R"json({
  "packages": [
    {
      "name": "app",
      "version": "0.1.0",
      "id": "path+file:///ws#app@0.1.0",
      "license": null,
      "source": null,
      "dependencies": [
        {"name": "serde", "source": "registry+https://github.com/rust-lang/crates.io-index", "req": "^1",
         "kind": null, "rename": null, "optional": true, "uses_default_features": true, "features": []},
        {"name": "log", "source": "registry+https://github.com/rust-lang/crates.io-index", "req": "^0.4",
         "kind": null, "rename": "logging", "optional": false, "uses_default_features": true, "features": []}
      ],
      "targets": [],
      "features": {"default": ["tls"], "tls": [], "serde": ["dep:serde"]},
      "manifest_path": "/ws/Cargo.toml",
      "metadata": {
        "cargo-feature-combinations": {"exclude_features": ["default"], "exclude_packages": ["examples"]}
      }
    },
    {
      "name": "core",
      "version": "0.1.0",
      "id": "path+file:///ws/core#0.1.0",
      "dependencies": [],
      "features": {"std": [], "alloc": []},
      "manifest_path": "/ws/core/Cargo.toml",
      "metadata": null
    },
    {
      "name": "examples",
      "version": "0.1.0",
      "id": "path+file:///ws/examples#0.1.0",
      "dependencies": [],
      "features": {},
      "manifest_path": "/ws/examples/Cargo.toml",
      "metadata": null
    },
    {
      "name": "cli",
      "version": "0.1.0",
      "id": "path+file:///ws/cli#0.1.0",
      "dependencies": [],
      "features": {"color": []},
      "manifest_path": "/ws/cli/Cargo.toml",
      "metadata": {"cargo-feature-combinations": {"exclude_packages": ["core"]}}
    }
  ],
  "workspace_members": [
    "path+file:///ws/core#0.1.0",
    "path+file:///ws#app@0.1.0",
    "path+file:///ws/examples#0.1.0",
    "path+file:///ws/cli#0.1.0"
  ],
  "workspace_default_members": ["path+file:///ws#app@0.1.0"],
  "resolve": null,
  "target_directory": "/ws/target",
  "version": 1,
  "workspace_root": "/ws",
  "metadata": {"cargo-feature-combinations": {"exclude_packages": ["cli"]}}
})json";

    CargoMetadata parse_workspace()
    {
        BufferedDiagnosticContext bdc{out_sink};
        auto maybe_metadata = parse_cargo_metadata(bdc, WorkspaceMetadata, "cargo metadata");
        INFO(bdc.to_string());
        REQUIRE(maybe_metadata.has_value());
        CHECK(bdc.empty());
        return std::move(*maybe_metadata.get());
    }

    std::vector<std::string> names_of(const std::vector<ConfiguredPackage>& packages)
    {
        std::vector<std::string> names;
        for (auto&& configured : packages)
        {
            names.push_back(configured.package->name);
        }

        return names;
    }
}

TEST_CASE ("cargo metadata command", "[metadata]")
{
    CHECK(cargo_metadata_command("cargo", nullopt).command_line() == "cargo metadata --format-version 1 --no-deps");
    CHECK(cargo_metadata_command("cargo", Path{"/ws/my crate/Cargo.toml"}).command_line() ==
          "cargo metadata --format-version 1 --no-deps --manifest-path \"/ws/my crate/Cargo.toml\"");
}

TEST_CASE ("parse cargo metadata", "[metadata]")
{
    const auto metadata = parse_workspace();
    REQUIRE(metadata.packages.size() == 4);
    CHECK(metadata.workspace_root == Path{"/ws"});
    CHECK(metadata.workspace_members.size() == 4);
    CHECK(workspace_feature_combinations_document(metadata) != nullptr);

    const auto& app = metadata.packages[0];
    CHECK(app.name == "app");
    CHECK(app.id == "path+file:///ws#app@0.1.0");
    CHECK(app.manifest_path == Path{"/ws/Cargo.toml"});
    CHECK(declared_features(app) == FeatureSet{"default", "serde", "tls"});
    CHECK(app.features.at("default") == std::vector<std::string>{"tls"});
    REQUIRE(app.dependencies.size() == 2);
    CHECK(app.dependencies[0].name == "serde");
    CHECK_FALSE(app.dependencies[0].rename.has_value());
    CHECK(app.dependencies[0].optional);
    CHECK(app.dependencies[1].local_name() == "logging");
    CHECK_FALSE(app.dependencies[1].optional);
    CHECK(implicit_optional_dependency_features(app) == FeatureSet{"serde"});
    CHECK(feature_combinations_document(app) != nullptr);

    const auto& core = metadata.packages[1];
    CHECK(core.metadata.is_null());
    CHECK(feature_combinations_document(core) == nullptr);
}

TEST_CASE ("workspace packages and root package", "[metadata]")
{
    const auto metadata = parse_workspace();
    const auto members = workspace_packages(metadata);
    REQUIRE(members.size() == 4);
    CHECK(members[0]->name == "core");
    CHECK(members[1]->name == "app");
    CHECK(members[2]->name == "examples");
    CHECK(members[3]->name == "cli");

    const auto root = root_package(metadata);
    REQUIRE(root != nullptr);
    CHECK(root->name == "app");
}

TEST_CASE ("virtual workspace has no root package", "[metadata]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_metadata = parse_cargo_metadata(bdc,
                                               R"json({
  "packages": [
    {"name": "a", "id": "a-id", "dependencies": [], "features": {}, "manifest_path": "/ws/a/Cargo.toml"}
  ],
  "workspace_members": ["a-id"],
  "workspace_root": "/ws"
})json",
                                               "cargo metadata");
    REQUIRE(maybe_metadata.has_value());
    const auto& metadata = *maybe_metadata.get();
    CHECK(root_package(metadata) == nullptr);
    CHECK(metadata.metadata.is_null());
    CHECK(workspace_feature_combinations_document(metadata) == nullptr);
}

TEST_CASE ("malformed cargo metadata", "[metadata]")
{
    BufferedDiagnosticContext bdc{out_sink};
    SECTION ("not json")
    {
        CHECK_FALSE(parse_cargo_metadata(bdc, "error: could not find `Cargo.toml`", "cargo metadata").has_value());
        CHECK(bdc.any_errors());
        CHECK(Strings::starts_with(bdc.to_string(), "error: failed to parse the output of cargo metadata:\n"));
    }

    SECTION ("missing field")
    {
        CHECK_FALSE(parse_cargo_metadata(bdc, R"json({"packages": [], "workspace_members": []})json", "cargo metadata")
                        .has_value());
        CHECK(bdc.to_string() == "error: failed to parse the output of cargo metadata:\n"
                                 "cargo metadata: error: $ (a cargo metadata document): missing required field "
                                 "'workspace_root' (a path)");
    }
}

TEST_CASE ("configure workspace", "[workspace]")
{
    const auto metadata = parse_workspace();
    BufferedDiagnosticContext bdc{out_sink};

    SECTION ("every exclusion applies")
    {
        auto maybe_packages = configure_workspace(bdc, metadata, PackageSelection{});
        REQUIRE(maybe_packages.has_value());
        // examples is excluded by the root package, cli by the workspace; exclude_packages of cli is ignored
        CHECK(names_of(*maybe_packages.get()) == std::vector<std::string>{"core", "app"});
        CHECK(maybe_packages.get()->at(1).config.exclude_features == FeatureSet{"default"});
        CHECK(bdc.to_string() == "/ws/cli/Cargo.toml: warning: cli: \"exclude_packages\" only has an effect in the "
                                 "workspace metadata or in the root package; it is ignored here");
    }

    SECTION ("selected packages")
    {
        PackageSelection selection;
        selection.packages = {"app", "examples"};
        auto maybe_packages = configure_workspace(bdc, metadata, selection);
        REQUIRE(maybe_packages.has_value());
        CHECK(names_of(*maybe_packages.get()) == std::vector<std::string>{"app"});
    }

    SECTION ("excluded packages")
    {
        PackageSelection selection;
        selection.exclude_packages = {"core"};
        auto maybe_packages = configure_workspace(bdc, metadata, selection);
        REQUIRE(maybe_packages.has_value());
        CHECK(names_of(*maybe_packages.get()) == std::vector<std::string>{"app"});
    }
}

TEST_CASE ("configure workspace with a broken configuration", "[workspace]")
{
    auto metadata = parse_workspace();
    metadata.packages[1].metadata =
        Test::parse_json(R"json({"cargo-feature-combinations": {"include_features": "std"}})json");
    BufferedDiagnosticContext bdc{out_sink};
    CHECK_FALSE(configure_workspace(bdc, metadata, PackageSelection{}).has_value());
    CHECK(bdc.to_string() == "/ws/core/Cargo.toml: error: failed to parse the feature combinations configuration of "
                             "core:\n"
                             "/ws/core/Cargo.toml: error: $.include_features: mismatched type: expected an array of "
                             "feature names");
}
