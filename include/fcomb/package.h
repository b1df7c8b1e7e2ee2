#pragma once

#include <fcomb/base/json.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/path.h>

#include <fcomb/featureset.h>

#include <map>
#include <string>
#include <vector>

namespace fcomb
{
    struct Dependency
    {
        std::string name;
        Optional<std::string> rename;
        bool optional = false;

        // The name the dependency is known by inside the depending package.
        const std::string& local_name() const noexcept;
    };

    struct Package
    {
        std::string name;
        std::string id;
        Path manifest_path;
        // feature name -> features and dependencies it enables
        std::map<std::string, std::vector<std::string>> features;
        std::vector<Dependency> dependencies;
        // package.metadata; null when the manifest has none
        Json::Value metadata;
    };

    FeatureSet declared_features(const Package& package);

    // Features cargo creates for optional dependencies: a feature named like an optional dependency whose only
    // effect is "dep:<name>".
    FeatureSet implicit_optional_dependency_features(const Package& package);

    // package.metadata.cargo-feature-combinations, or nullptr.
    const Json::Value* feature_combinations_document(const Package& package);
}
