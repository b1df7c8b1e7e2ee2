#pragma once

#include <fcomb/base/expected.h>
#include <fcomb/base/json.h>
#include <fcomb/base/span.h>

#include <fcomb/workspace.h>

#include <string>

namespace fcomb
{
    struct MatrixOptions
    {
        bool pretty = false;
        // one entry per package instead of one per feature combination
        bool packages_only = false;
    };

    // One object per package and feature combination holding "name" and "features" (comma separated), with the
    // package's configured matrix object merged in. Keys are sorted.
    ExpectedL<Json::Array> feature_matrix(View<ConfiguredPackage> packages, const MatrixOptions& options);

    std::string format_feature_matrix(const Json::Array& matrix, const MatrixOptions& options);
}
