#pragma once

#include <fcomb/base/fwd/diagnostics.h>

#include <fcomb/base/json.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/stringview.h>

#include <fcomb/featureset.h>

#include <string>
#include <vector>

namespace fcomb
{
    // [package.metadata.cargo-feature-combinations]
    struct Config
    {
        // When not empty, only combinations within each of these groups are generated.
        std::vector<FeatureSet> isolated_feature_sets;
        FeatureSet exclude_features;
        // Added to every generated combination.
        FeatureSet include_features;
        // Generated combinations containing all features of any of these sets are dropped.
        std::vector<FeatureSet> exclude_feature_sets;
        // Always part of the result, even when excluded.
        std::vector<FeatureSet> include_feature_sets;
        // When not empty, exactly these sets are the result.
        std::vector<FeatureSet> allow_feature_sets;
        bool no_empty_feature_set = false;
        bool skip_optional_dependencies = false;
        // Only honored for the root package of the workspace.
        std::vector<std::string> exclude_packages;
        // Merged into every matrix entry of the package.
        Json::Object matrix;

        friend bool operator==(const Config& lhs, const Config& rhs);
        friend bool operator!=(const Config& lhs, const Config& rhs) { return !(lhs == rhs); }
    };

    // Field spellings accepted for compatibility with older configurations.
    struct DeprecatedConfig
    {
        // replaced by exclude_feature_sets
        std::vector<FeatureSet> skip_feature_sets;
        // replaced by exclude_features
        FeatureSet denylist;
        // replaced by allow_feature_sets
        std::vector<FeatureSet> exact_combinations;
    };

    struct ConfigDocument
    {
        Config config;
        DeprecatedConfig deprecated;
    };

    struct FieldMigration
    {
        StringLiteral old_field;
        StringLiteral new_field;
    };

    // Merges every non-empty deprecated field into its replacement: lists are appended and sets are united.
    // Returns the migrations that took place, in field order.
    std::vector<FieldMigration> migrate_deprecated_fields(Config& config, DeprecatedConfig&& deprecated);

    // [workspace.metadata.cargo-feature-combinations]
    struct WorkspaceConfig
    {
        std::vector<std::string> exclude_packages;
    };

    // Deserializes `document` (nullptr means absent and yields the defaults). Unknown fields and deprecated
    // fields are reported to `context` as warnings; type errors are reported as errors and yield nullopt.
    // `origin` names the document in diagnostics and must not be empty.
    Optional<Config> resolve_config(DiagnosticContext& context,
                                    const Json::Value* document,
                                    StringView origin,
                                    StringView package_name);

    Optional<WorkspaceConfig> resolve_workspace_config(DiagnosticContext& context,
                                                       const Json::Value* document,
                                                       StringView origin);
}
