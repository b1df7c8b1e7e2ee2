#pragma once

#include <fcomb/base/fwd/diagnostics.h>

#include <fcomb/base/optional.h>

#include <fcomb/configuration.h>
#include <fcomb/metadata.h>
#include <fcomb/package.h>

#include <string>
#include <vector>

namespace fcomb
{
    // Package names given on the command line.
    struct PackageSelection
    {
        // when not empty, only these packages are kept
        std::vector<std::string> packages;
        std::vector<std::string> exclude_packages;
    };

    struct ConfiguredPackage
    {
        const Package* package;
        Config config;
    };

    // Resolves the configuration of every workspace member and returns the selected members in workspace order.
    // A member is dropped when `selection` excludes it, or when the workspace configuration or the root package's
    // configuration lists it in exclude_packages. exclude_packages of other members is diagnosed and ignored.
    Optional<std::vector<ConfiguredPackage>> configure_workspace(DiagnosticContext& context,
                                                                 const CargoMetadata& metadata,
                                                                 const PackageSelection& selection);
}
