#include <fcomb/base/strings.h>

#include <fcomb/featureset.h>

#include <algorithm>
#include <iterator>
#include <vector>

namespace fcomb
{
    std::string features_argument(const FeatureSet& features) { return Strings::join(",", features); }

    std::string display_features(const FeatureSet& features) { return Strings::join(", ", features); }

    FeatureSet retain_features(const FeatureSet& features, const FeatureSet& known)
    {
        std::vector<std::string> result;
        std::set_intersection(
            features.begin(), features.end(), known.begin(), known.end(), std::back_inserter(result));
        return FeatureSet(std::move(result));
    }

    FeatureSet remove_features(const FeatureSet& features, const FeatureSet& removed)
    {
        std::vector<std::string> result;
        std::set_difference(
            features.begin(), features.end(), removed.begin(), removed.end(), std::back_inserter(result));
        return FeatureSet(std::move(result));
    }
}
