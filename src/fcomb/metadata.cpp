#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/diagnostics.h>
#include <fcomb/base/jsonreader.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/util.h>

#include <fcomb/metadata.h>

#include <map>

namespace
{
    using namespace fcomb;

    struct ImpliedFeaturesDeserializer final : Json::ArrayDeserializer<Json::UntypedStringDeserializer>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfFeatureNames); }

        static const ImpliedFeaturesDeserializer instance;
    };

    const ImpliedFeaturesDeserializer ImpliedFeaturesDeserializer::instance;

    using FeatureMap = std::map<std::string, std::vector<std::string>>;

    struct FeatureMapDeserializer final : Json::IDeserializer<FeatureMap>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAFeatureMap); }

        virtual Optional<FeatureMap> visit_object(Json::Reader& r, const Json::Object& obj) const override
        {
            FeatureMap result;
            for (const auto& feature : obj)
            {
                std::vector<std::string> implied;
                r.visit_in_key(feature.second, feature.first, implied, ImpliedFeaturesDeserializer::instance);
                result.emplace(feature.first.to_string(), std::move(implied));
            }

            return result;
        }

        static const FeatureMapDeserializer instance;
    };

    const FeatureMapDeserializer FeatureMapDeserializer::instance;

    struct DependencyDeserializer final : Json::IDeserializer<Dependency>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgADependency); }

        virtual Optional<Dependency> visit_object(Json::Reader& r, const Json::Object& obj) const override
        {
            Dependency dependency;
            r.required_object_field(
                type_name(), obj, JsonIdName, dependency.name, Json::UntypedStringDeserializer::instance);
            // cargo writes "rename": null for dependencies that are not renamed
            auto rename = obj.get(JsonIdRename);
            if (rename && !rename->is_null())
            {
                std::string local_name;
                r.visit_in_key(*rename, JsonIdRename, local_name, Json::UntypedStringDeserializer::instance);
                dependency.rename = std::move(local_name);
            }

            r.optional_object_field(obj, JsonIdOptional, dependency.optional, Json::BooleanDeserializer::instance);
            return dependency;
        }

        static const DependencyDeserializer instance;
    };

    const DependencyDeserializer DependencyDeserializer::instance;

    struct DependencyArrayDeserializer final : Json::ArrayDeserializer<DependencyDeserializer>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfDependencies); }

        static const DependencyArrayDeserializer instance;
    };

    const DependencyArrayDeserializer DependencyArrayDeserializer::instance;

    struct PackageDeserializer final : Json::IDeserializer<Package>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAPackage); }

        virtual Optional<Package> visit_object(Json::Reader& r, const Json::Object& obj) const override
        {
            Package package;
            r.required_object_field(
                type_name(), obj, JsonIdName, package.name, Json::UntypedStringDeserializer::instance);
            r.required_object_field(type_name(), obj, JsonIdId, package.id, Json::UntypedStringDeserializer::instance);
            r.required_object_field(
                type_name(), obj, JsonIdManifestPath, package.manifest_path, Json::PathDeserializer::instance);
            r.optional_object_field(obj, JsonIdFeatures, package.features, FeatureMapDeserializer::instance);
            r.optional_object_field(
                obj, JsonIdDependencies, package.dependencies, DependencyArrayDeserializer::instance);
            if (auto metadata = obj.get(JsonIdMetadata))
            {
                package.metadata = *metadata;
            }

            return package;
        }

        static const PackageDeserializer instance;
    };

    const PackageDeserializer PackageDeserializer::instance;

    struct PackageArrayDeserializer final : Json::ArrayDeserializer<PackageDeserializer>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfPackages); }

        static const PackageArrayDeserializer instance;
    };

    const PackageArrayDeserializer PackageArrayDeserializer::instance;

    struct PackageIdDeserializer final : Json::StringDeserializer
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAPackageId); }

        static const PackageIdDeserializer instance;
    };

    const PackageIdDeserializer PackageIdDeserializer::instance;

    struct PackageIdArrayDeserializer final : Json::ArrayDeserializer<PackageIdDeserializer>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgAnArrayOfPackageIds); }

        static const PackageIdArrayDeserializer instance;
    };

    const PackageIdArrayDeserializer PackageIdArrayDeserializer::instance;

    // cargo metadata emits many more fields than are read here; none of them are unexpected.
    struct CargoMetadataDeserializer final : Json::IDeserializer<CargoMetadata>
    {
        virtual LocalizedString type_name() const override { return msg::format(msgACargoMetadataDocument); }

        virtual Optional<CargoMetadata> visit_object(Json::Reader& r, const Json::Object& obj) const override
        {
            CargoMetadata metadata;
            r.required_object_field(
                type_name(), obj, JsonIdPackages, metadata.packages, PackageArrayDeserializer::instance);
            r.required_object_field(type_name(),
                                    obj,
                                    JsonIdWorkspaceMembers,
                                    metadata.workspace_members,
                                    PackageIdArrayDeserializer::instance);
            r.required_object_field(
                type_name(), obj, JsonIdWorkspaceRoot, metadata.workspace_root, Json::PathDeserializer::instance);
            if (auto workspace_metadata = obj.get(JsonIdMetadata))
            {
                metadata.metadata = *workspace_metadata;
            }

            return metadata;
        }

        static const CargoMetadataDeserializer instance;
    };

    const CargoMetadataDeserializer CargoMetadataDeserializer::instance;
}

namespace fcomb
{
    Command cargo_metadata_command(StringView cargo, const Optional<Path>& manifest_path)
    {
        Command cmd{cargo};
        cmd.string_arg("metadata").string_arg("--format-version").string_arg("1").string_arg("--no-deps");
        if (auto path = manifest_path.get())
        {
            cmd.string_arg(SwitchManifestPath).string_arg(*path);
        }

        return cmd;
    }

    Optional<CargoMetadata> load_cargo_metadata(DiagnosticContext& context,
                                                StringView cargo,
                                                const Optional<Path>& manifest_path)
    {
        const auto cmd = cargo_metadata_command(cargo, manifest_path);
        auto maybe_output = cmd_execute_and_capture_output(context, cmd, RedirectedProcessLaunchSettings{});
        auto output = maybe_output.get();
        if (!output)
        {
            return nullopt;
        }

        if (auto exit_code = output->status.code.get())
        {
            if (*exit_code != 0)
            {
                context.report_error(
                    msgCargoMetadataFailed, msg::command_line = cmd.command_line(), msg::exit_code = *exit_code);
                return nullopt;
            }
        }
        else
        {
            context.report_error(msgCargoMetadataKilled, msg::command_line = cmd.command_line());
            return nullopt;
        }

        return parse_cargo_metadata(context, output->output, cmd.command_line());
    }

    Optional<CargoMetadata> parse_cargo_metadata(DiagnosticContext& context, StringView text, StringView origin)
    {
        auto maybe_document = Json::parse(text, origin);
        auto document = maybe_document.get();
        if (!document)
        {
            context.report_error(msg::format(msgCargoMetadataParseFailed, msg::command_line = origin)
                                     .append_raw('\n')
                                     .append(maybe_document.error()));
            return nullopt;
        }

        Json::Reader reader(origin);
        auto maybe_metadata = CargoMetadataDeserializer::instance.visit(reader, *document);
        if (!maybe_metadata.has_value())
        {
            reader.add_expected_type_error(CargoMetadataDeserializer::instance.type_name());
        }

        const auto& messages = reader.messages();
        if (messages.any_errors())
        {
            context.report_error(msgCargoMetadataParseFailed, msg::command_line = origin);
            messages.report(context);
            return nullopt;
        }

        return maybe_metadata;
    }

    std::vector<const Package*> workspace_packages(const CargoMetadata& metadata)
    {
        std::vector<const Package*> result;
        for (auto&& member : metadata.workspace_members)
        {
            auto package =
                Util::find_if(metadata.packages, [&](const Package& candidate) { return candidate.id == member; });
            if (package != metadata.packages.end())
            {
                result.push_back(&*package);
            }
        }

        return result;
    }

    const Package* root_package(const CargoMetadata& metadata)
    {
        const auto root_manifest = metadata.workspace_root / "Cargo.toml";
        for (auto&& package : metadata.packages)
        {
            if (package.manifest_path == root_manifest)
            {
                return &package;
            }
        }

        return nullptr;
    }

    const Json::Value* workspace_feature_combinations_document(const CargoMetadata& metadata)
    {
        if (auto obj = metadata.metadata.maybe_object())
        {
            return obj->get(JsonIdFeatureCombinations);
        }

        return nullptr;
    }
}
