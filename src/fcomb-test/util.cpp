#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/util.h>

namespace fcomb::Test
{
    Package make_package(StringView name, std::initializer_list<StringLiteral> features)
    {
        Package package;
        package.name = name.to_string();
        package.id = Strings::concat(name, " 0.1.0 (path+file:///ws/", name, ")");
        package.manifest_path = Path("/ws") / name / "Cargo.toml";
        for (auto&& feature : features)
        {
            package.features.emplace(feature.to_string(), std::vector<std::string>{});
        }

        return package;
    }

    Json::Value parse_json(StringView json) { return Json::parse(json, "test").value_or_exit(FCOMB_LINE_INFO); }

    Config parse_config(StringView json)
    {
        const auto document = parse_json(json);
        BufferedDiagnosticContext bdc{out_sink};
        auto maybe_config = resolve_config(bdc, &document, "test", "test-package");
        INFO(bdc.to_string());
        REQUIRE(maybe_config.has_value());
        return std::move(*maybe_config.get());
    }

    bool all_within(const std::vector<FeatureSet>& sets, const std::vector<FeatureSet>& groups)
    {
        return Util::all_of(sets, [&](const FeatureSet& set) {
            return Util::any_of(groups, [&](const FeatureSet& group) { return group.includes(set); });
        });
    }
}
