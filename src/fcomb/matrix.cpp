#include <fcomb/base/contractual-constants.h>

#include <fcomb/combinations.h>
#include <fcomb/matrix.h>

namespace
{
    using namespace fcomb;

    Json::Object matrix_entry(const ConfiguredPackage& configured, const FeatureSet* features)
    {
        Json::Object entry;
        entry.insert(JsonIdName, configured.package->name);
        if (features)
        {
            entry.insert(JsonIdFeatures, features_argument(*features));
        }

        Json::merge_into(entry, configured.config.matrix);
        entry.sort_keys();
        return entry;
    }
}

namespace fcomb
{
    ExpectedL<Json::Array> feature_matrix(View<ConfiguredPackage> packages, const MatrixOptions& options)
    {
        Json::Array matrix;
        for (auto&& configured : packages)
        {
            if (options.packages_only)
            {
                matrix.push_back(matrix_entry(configured, nullptr));
                continue;
            }

            auto maybe_combinations = generate_feature_combinations(*configured.package, configured.config);
            auto combinations = maybe_combinations.get();
            if (!combinations)
            {
                return std::move(maybe_combinations).error();
            }

            for (auto&& features : *combinations)
            {
                matrix.push_back(matrix_entry(configured, &features));
            }
        }

        return matrix;
    }

    std::string format_feature_matrix(const Json::Array& matrix, const MatrixOptions& options)
    {
        return Json::stringify(matrix, options.pretty ? Json::JsonStyle{} : Json::JsonStyle::compact());
    }
}
