#pragma once

#include <fcomb/base/sortedvector.h>

#include <string>

namespace fcomb
{
    // A canonical set of feature names: sorted bytewise, without duplicates. FeatureSets order lexicographically
    // over their members, so [] < [a] < [a, b] < [b].
    using FeatureSet = SortedVector<std::string>;

    // "a,b", the value of cargo's --features flag.
    std::string features_argument(const FeatureSet& features);

    // "a, b", for display.
    std::string display_features(const FeatureSet& features);

    // The members of `features` that are also members of `known`.
    FeatureSet retain_features(const FeatureSet& features, const FeatureSet& known);

    // The members of `features` that are not members of `removed`.
    FeatureSet remove_features(const FeatureSet& features, const FeatureSet& removed);
}
