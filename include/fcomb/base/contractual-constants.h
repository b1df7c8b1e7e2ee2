#pragma once

#include <fcomb/base/stringview.h>

// Names that are part of the contract with cargo, with users' Cargo.toml files, or with the environment.
namespace fcomb
{
    // cargo metadata --format-version 1
    inline constexpr StringLiteral JsonIdDependencies = "dependencies";
    inline constexpr StringLiteral JsonIdFeatures = "features";
    inline constexpr StringLiteral JsonIdId = "id";
    inline constexpr StringLiteral JsonIdManifestPath = "manifest_path";
    inline constexpr StringLiteral JsonIdMetadata = "metadata";
    inline constexpr StringLiteral JsonIdName = "name";
    inline constexpr StringLiteral JsonIdOptional = "optional";
    inline constexpr StringLiteral JsonIdPackages = "packages";
    inline constexpr StringLiteral JsonIdRename = "rename";
    inline constexpr StringLiteral JsonIdWorkspaceMembers = "workspace_members";
    inline constexpr StringLiteral JsonIdWorkspaceRoot = "workspace_root";

    // [package.metadata.cargo-feature-combinations] and [workspace.metadata.cargo-feature-combinations]
    inline constexpr StringLiteral JsonIdFeatureCombinations = "cargo-feature-combinations";
    inline constexpr StringLiteral JsonIdAllowFeatureSets = "allow_feature_sets";
    inline constexpr StringLiteral JsonIdExcludeFeatures = "exclude_features";
    inline constexpr StringLiteral JsonIdExcludeFeatureSets = "exclude_feature_sets";
    inline constexpr StringLiteral JsonIdExcludePackages = "exclude_packages";
    inline constexpr StringLiteral JsonIdIncludeFeatures = "include_features";
    inline constexpr StringLiteral JsonIdIncludeFeatureSets = "include_feature_sets";
    inline constexpr StringLiteral JsonIdIsolatedFeatureSets = "isolated_feature_sets";
    inline constexpr StringLiteral JsonIdMatrix = "matrix";
    inline constexpr StringLiteral JsonIdNoEmptyFeatureSet = "no_empty_feature_set";
    inline constexpr StringLiteral JsonIdSkipOptionalDependencies = "skip_optional_dependencies";
    // deprecated spellings
    inline constexpr StringLiteral JsonIdDenylist = "denylist";
    inline constexpr StringLiteral JsonIdExactCombinations = "exact_combinations";
    inline constexpr StringLiteral JsonIdSkipFeatureSets = "skip_feature_sets";

    inline constexpr StringLiteral EnvironmentVariableCargo = "CARGO";
    inline constexpr StringLiteral EnvironmentVariableFcombDebug = "FCOMB_DEBUG";
    inline constexpr StringLiteral EnvironmentVariableRustFlags = "RUSTFLAGS";
    inline constexpr StringLiteral EnvironmentVariableVerbose = "VERBOSE";

    inline constexpr StringLiteral SwitchColor = "--color";
    inline constexpr StringLiteral SwitchErrorsOnly = "--errors-only";
    inline constexpr StringLiteral SwitchExcludePackage = "--exclude-package";
    inline constexpr StringLiteral SwitchFailFast = "--fail-fast";
    inline constexpr StringLiteral SwitchHelp = "--help";
    inline constexpr StringLiteral SwitchManifestPath = "--manifest-path";
    inline constexpr StringLiteral SwitchNoDefaultFeatures = "--no-default-features";
    inline constexpr StringLiteral SwitchPackage = "--package";
    inline constexpr StringLiteral SwitchPackageShort = "-p";
    inline constexpr StringLiteral SwitchPackagesOnly = "--packages-only";
    inline constexpr StringLiteral SwitchPedantic = "--pedantic";
    inline constexpr StringLiteral SwitchPretty = "--pretty";
    inline constexpr StringLiteral SwitchSilent = "--silent";
    inline constexpr StringLiteral SubcommandMatrix = "matrix";
}
