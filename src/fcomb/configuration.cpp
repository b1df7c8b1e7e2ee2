#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/diagnostics.h>
#include <fcomb/base/jsonreader.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/util.h>

#include <fcomb/configuration.h>

namespace
{
    using namespace fcomb;

    struct FeatureNameDeserializer final : Json::StringDeserializer
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAFeatureName); }

        static const FeatureNameDeserializer instance;
    };

    const FeatureNameDeserializer FeatureNameDeserializer::instance;

    struct FeatureSetDeserializer final : Json::IDeserializer<FeatureSet>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfFeatureNames); }

        virtual Optional<FeatureSet> visit_array(Json::Reader& r, const Json::Array& arr) const override
        {
            return r.array_elements(arr, FeatureNameDeserializer::instance)
                .map([](const std::vector<std::string>& names) { return FeatureSet(names); });
        }

        static const FeatureSetDeserializer instance;
    };

    const FeatureSetDeserializer FeatureSetDeserializer::instance;

    struct FeatureSetArrayDeserializer final : Json::ArrayDeserializer<FeatureSetDeserializer>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfFeatureSets); }

        static const FeatureSetArrayDeserializer instance;
    };

    const FeatureSetArrayDeserializer FeatureSetArrayDeserializer::instance;

    struct PackageNameDeserializer final : Json::StringDeserializer
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAPackageName); }

        static const PackageNameDeserializer instance;
    };

    const PackageNameDeserializer PackageNameDeserializer::instance;

    struct PackageNameArrayDeserializer final : Json::ArrayDeserializer<PackageNameDeserializer>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfPackageNames); }

        static const PackageNameArrayDeserializer instance;
    };

    const PackageNameArrayDeserializer PackageNameArrayDeserializer::instance;

    struct MatrixDeserializer final : Json::IDeserializer<Json::Object>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAMatrixObject); }

        virtual Optional<Json::Object> visit_object(Json::Reader&, const Json::Object& obj) const override
        {
            return obj;
        }

        static const MatrixDeserializer instance;
    };

    const MatrixDeserializer MatrixDeserializer::instance;

    struct ConfigDocumentDeserializer final : Json::IDeserializer<ConfigDocument>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAFeatureCombinationsConfiguration); }

        virtual View<StringLiteral> valid_fields() const noexcept override
        {
            static constexpr StringLiteral valid_fields[] = {
                JsonIdIsolatedFeatureSets,
                JsonIdExcludeFeatures,
                JsonIdIncludeFeatures,
                JsonIdExcludeFeatureSets,
                JsonIdIncludeFeatureSets,
                JsonIdAllowFeatureSets,
                JsonIdNoEmptyFeatureSet,
                JsonIdSkipOptionalDependencies,
                JsonIdExcludePackages,
                JsonIdMatrix,
                JsonIdSkipFeatureSets,
                JsonIdDenylist,
                JsonIdExactCombinations,
            };
            return valid_fields;
        }

        virtual Optional<ConfigDocument> visit_object(Json::Reader& r, const Json::Object& obj) const override
        {
            ConfigDocument document;
            auto& config = document.config;
            r.optional_object_field(
                obj, JsonIdIsolatedFeatureSets, config.isolated_feature_sets, FeatureSetArrayDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdExcludeFeatures, config.exclude_features, FeatureSetDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdIncludeFeatures, config.include_features, FeatureSetDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdExcludeFeatureSets, config.exclude_feature_sets, FeatureSetArrayDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdIncludeFeatureSets, config.include_feature_sets, FeatureSetArrayDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdAllowFeatureSets, config.allow_feature_sets, FeatureSetArrayDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdNoEmptyFeatureSet, config.no_empty_feature_set, Json::BooleanDeserializer::instance);
            r.optional_object_field(obj,
                                    JsonIdSkipOptionalDependencies,
                                    config.skip_optional_dependencies,
                                    Json::BooleanDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdExcludePackages, config.exclude_packages, PackageNameArrayDeserializer::instance);
            r.optional_object_field(obj, JsonIdMatrix, config.matrix, MatrixDeserializer::instance);

            auto& deprecated = document.deprecated;
            r.optional_object_field(
                obj, JsonIdSkipFeatureSets, deprecated.skip_feature_sets, FeatureSetArrayDeserializer::instance);
            r.optional_object_field(obj, JsonIdDenylist, deprecated.denylist, FeatureSetDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdExactCombinations, deprecated.exact_combinations, FeatureSetArrayDeserializer::instance);
            return document;
        }

        static const ConfigDocumentDeserializer instance;
    };

    const ConfigDocumentDeserializer ConfigDocumentDeserializer::instance;

    struct WorkspaceConfigDeserializer final : Json::IDeserializer<WorkspaceConfig>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAWorkspaceConfiguration); }

        virtual View<StringLiteral> valid_fields() const noexcept override
        {
            static constexpr StringLiteral valid_fields[] = {JsonIdExcludePackages};
            return valid_fields;
        }

        virtual Optional<WorkspaceConfig> visit_object(Json::Reader& r, const Json::Object& obj) const override
        {
            WorkspaceConfig config;
            r.optional_object_field(
                obj, JsonIdExcludePackages, config.exclude_packages, PackageNameArrayDeserializer::instance);
            return config;
        }

        static const WorkspaceConfigDeserializer instance;
    };

    const WorkspaceConfigDeserializer WorkspaceConfigDeserializer::instance;

    template<class Type>
    Optional<Type> read_document(DiagnosticContext& context,
                                 const Json::Value& document,
                                 StringView origin,
                                 const Json::IDeserializer<Type>& deserializer,
                                 LocalizedString&& failure_header)
    {
        Json::Reader reader(origin);
        auto maybe_result = deserializer.visit(reader, document);
        if (!maybe_result.has_value())
        {
            reader.add_expected_type_error(deserializer.type_name());
        }

        const auto& messages = reader.messages();
        if (messages.any_errors())
        {
            context.report(DiagnosticLine{DiagKind::Error, origin, std::move(failure_header)});
            messages.report(context);
            return nullopt;
        }

        messages.report(context);
        return maybe_result;
    }
}

namespace fcomb
{
    bool operator==(const Config& lhs, const Config& rhs)
    {
        return lhs.isolated_feature_sets == rhs.isolated_feature_sets &&
               lhs.exclude_features == rhs.exclude_features && lhs.include_features == rhs.include_features &&
               lhs.exclude_feature_sets == rhs.exclude_feature_sets &&
               lhs.include_feature_sets == rhs.include_feature_sets &&
               lhs.allow_feature_sets == rhs.allow_feature_sets &&
               lhs.no_empty_feature_set == rhs.no_empty_feature_set &&
               lhs.skip_optional_dependencies == rhs.skip_optional_dependencies &&
               lhs.exclude_packages == rhs.exclude_packages && lhs.matrix == rhs.matrix;
    }

    std::vector<FieldMigration> migrate_deprecated_fields(Config& config, DeprecatedConfig&& deprecated)
    {
        std::vector<FieldMigration> migrations;
        if (!deprecated.skip_feature_sets.empty())
        {
            Util::Vectors::append(&config.exclude_feature_sets, std::move(deprecated.skip_feature_sets));
            migrations.push_back({JsonIdSkipFeatureSets, JsonIdExcludeFeatureSets});
        }

        if (!deprecated.denylist.empty())
        {
            config.exclude_features.append(deprecated.denylist);
            migrations.push_back({JsonIdDenylist, JsonIdExcludeFeatures});
        }

        if (!deprecated.exact_combinations.empty())
        {
            Util::Vectors::append(&config.allow_feature_sets, std::move(deprecated.exact_combinations));
            migrations.push_back({JsonIdExactCombinations, JsonIdAllowFeatureSets});
        }

        deprecated = DeprecatedConfig{};
        return migrations;
    }

    Optional<Config> resolve_config(DiagnosticContext& context,
                                    const Json::Value* document,
                                    StringView origin,
                                    StringView package_name)
    {
        if (!document)
        {
            return Config{};
        }

        auto maybe_document =
            read_document(context,
                          *document,
                          origin,
                          ConfigDocumentDeserializer::instance,
                          msg::format(msgFailedToParseConfiguration, msg::package_name = package_name));
        auto parsed = maybe_document.get();
        if (!parsed)
        {
            return nullopt;
        }

        for (auto&& migration : migrate_deprecated_fields(parsed->config, std::move(parsed->deprecated)))
        {
            context.report(DiagnosticLine{DiagKind::Warning,
                                          origin,
                                          msg::format(msgDeprecatedConfigField,
                                                      msg::package_name = package_name,
                                                      msg::old_value = migration.old_field,
                                                      msg::new_value = migration.new_field)});
        }

        return std::move(parsed->config);
    }

    Optional<WorkspaceConfig> resolve_workspace_config(DiagnosticContext& context,
                                                       const Json::Value* document,
                                                       StringView origin)
    {
        if (!document)
        {
            return WorkspaceConfig{};
        }

        return read_document(context,
                             *document,
                             origin,
                             WorkspaceConfigDeserializer::instance,
                             msg::format(msgFailedToParseWorkspaceConfiguration));
    }
}
