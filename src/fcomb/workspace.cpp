#include <fcomb/base/diagnostics.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/util.h>

#include <fcomb/workspace.h>

namespace fcomb
{
    Optional<std::vector<ConfiguredPackage>> configure_workspace(DiagnosticContext& context,
                                                                 const CargoMetadata& metadata,
                                                                 const PackageSelection& selection)
    {
        const auto root_manifest = metadata.workspace_root / "Cargo.toml";
        auto maybe_workspace_config =
            resolve_workspace_config(context, workspace_feature_combinations_document(metadata), root_manifest);
        auto workspace_config = maybe_workspace_config.get();
        if (!workspace_config)
        {
            return nullopt;
        }

        const auto root = root_package(metadata);
        std::vector<std::string> excluded = selection.exclude_packages;
        Util::Vectors::append(&excluded, workspace_config->exclude_packages);

        std::vector<ConfiguredPackage> configured;
        for (auto package : workspace_packages(metadata))
        {
            auto maybe_config = resolve_config(
                context, feature_combinations_document(*package), package->manifest_path, package->name);
            auto config = maybe_config.get();
            if (!config)
            {
                return nullopt;
            }

            if (!config->exclude_packages.empty())
            {
                if (package == root)
                {
                    Util::Vectors::append(&excluded, config->exclude_packages);
                }
                else
                {
                    context.report(DiagnosticLine{
                        DiagKind::Warning,
                        package->manifest_path,
                        msg::format(msgExcludePackagesOnNonRootPackage, msg::package_name = package->name)});
                }
            }

            configured.push_back(ConfiguredPackage{package, std::move(*config)});
        }

        Util::erase_remove_if(configured, [&](const ConfiguredPackage& candidate) {
            const auto& name = candidate.package->name;
            if (!selection.packages.empty() && !Util::Vectors::contains(selection.packages, name))
            {
                return true;
            }

            return Util::Vectors::contains(excluded, name);
        });

        return configured;
    }
}
