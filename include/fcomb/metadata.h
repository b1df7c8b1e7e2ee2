#pragma once

#include <fcomb/base/fwd/diagnostics.h>

#include <fcomb/base/json.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/path.h>
#include <fcomb/base/stringview.h>
#include <fcomb/base/system.process.h>

#include <fcomb/package.h>

#include <string>
#include <vector>

namespace fcomb
{
    // The parts of `cargo metadata --format-version 1` output this tool reads.
    struct CargoMetadata
    {
        std::vector<Package> packages;
        // package ids
        std::vector<std::string> workspace_members;
        Path workspace_root;
        // workspace.metadata; null when the workspace has none
        Json::Value metadata;
    };

    Command cargo_metadata_command(StringView cargo, const Optional<Path>& manifest_path);

    // Runs `cargo metadata` and parses its output. Failures are reported to `context`.
    Optional<CargoMetadata> load_cargo_metadata(DiagnosticContext& context,
                                                StringView cargo,
                                                const Optional<Path>& manifest_path);

    Optional<CargoMetadata> parse_cargo_metadata(DiagnosticContext& context, StringView text, StringView origin);

    // The workspace members, in workspace_members order.
    std::vector<const Package*> workspace_packages(const CargoMetadata& metadata);

    // The package whose manifest is <workspace_root>/Cargo.toml, or nullptr for a virtual workspace.
    const Package* root_package(const CargoMetadata& metadata);

    // workspace.metadata.cargo-feature-combinations, or nullptr.
    const Json::Value* workspace_feature_combinations_document(const CargoMetadata& metadata);
}
