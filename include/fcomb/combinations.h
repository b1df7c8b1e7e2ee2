#pragma once

#include <fcomb/base/expected.h>

#include <fcomb/configuration.h>
#include <fcomb/featureset.h>
#include <fcomb/package.h>

#include <stddef.h>

#include <vector>

namespace fcomb
{
    // The largest number of combinations the powerset stage may produce for one package.
    inline constexpr size_t MaxFeatureCombinations = 100000;

    // Returns the distinct feature sets to build `package` with, in ascending order, or an error when the
    // configured powersets would exceed MaxFeatureCombinations.
    //
    // Without an allowlist the candidates are the powerset of the eligible features, or the union of the
    // powersets of every isolated group; include_features are added to each candidate. Candidates that contain
    // an exclude_feature_sets entry are dropped, then include_feature_sets are added back unconditionally.
    // An empty exclude_feature_sets entry therefore drops every candidate.
    ExpectedL<std::vector<FeatureSet>> generate_feature_combinations(const Package& package, const Config& config);
}
