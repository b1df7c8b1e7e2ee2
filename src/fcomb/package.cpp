#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/strings.h>

#include <fcomb/package.h>

namespace fcomb
{
    const std::string& Dependency::local_name() const noexcept
    {
        if (auto r = rename.get())
        {
            return *r;
        }

        return name;
    }

    FeatureSet declared_features(const Package& package)
    {
        std::vector<std::string> names;
        names.reserve(package.features.size());
        for (auto&& feature : package.features)
        {
            names.push_back(feature.first);
        }

        return FeatureSet(std::move(names));
    }

    FeatureSet implicit_optional_dependency_features(const Package& package)
    {
        FeatureSet result;
        for (auto&& dependency : package.dependencies)
        {
            if (!dependency.optional)
            {
                continue;
            }

            const auto& name = dependency.local_name();
            auto feature = package.features.find(name);
            if (feature == package.features.end())
            {
                continue;
            }

            const auto& implied = feature->second;
            if (implied.size() == 1 && implied[0] == Strings::concat("dep:", name))
            {
                result.insert(name);
            }
        }

        return result;
    }

    const Json::Value* feature_combinations_document(const Package& package)
    {
        if (auto obj = package.metadata.maybe_object())
        {
            return obj->get(JsonIdFeatureCombinations);
        }

        return nullptr;
    }
}
