#pragma once

#include <catch2/catch.hpp>

#include <fcomb/base/fmt.h>
#include <fcomb/base/json.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/path.h>
#include <fcomb/base/strings.h>

#include <fcomb/configuration.h>
#include <fcomb/featureset.h>
#include <fcomb/package.h>

#include <initializer_list>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>

namespace Catch
{
    template<>
    struct StringMaker<fcomb::LocalizedString>
    {
        static const std::string convert(const fcomb::LocalizedString& value) { return "LL\"" + value.data() + "\""; }
    };

    template<>
    struct StringMaker<fcomb::Path>
    {
        static const std::string convert(const fcomb::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<>
    struct StringMaker<fcomb::FeatureSet>
    {
        static const std::string convert(const fcomb::FeatureSet& value)
        {
            return "[" + fcomb::display_features(value) + "]";
        }
    };
}

namespace fcomb
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace fcomb::Test
{
    // A package at /ws/<name>/Cargo.toml declaring `features`, each implying nothing.
    Package make_package(StringView name, std::initializer_list<StringLiteral> features);

    // Parses `json` as a [package.metadata.cargo-feature-combinations] document; fails the test on any error.
    Config parse_config(StringView json);

    Json::Value parse_json(StringView json);

    // Whether every member of `sets` is a subset of at least one of `groups`.
    bool all_within(const std::vector<FeatureSet>& sets, const std::vector<FeatureSet>& groups);
}
