#include <fcomb/base/messages.h>
#include <fcomb/base/util.h>

#include <fcomb/combinations.h>

#include <stdint.h>

namespace
{
    using namespace fcomb;

    uint64_t powerset_size(size_t features) noexcept
    {
        if (features >= 63)
        {
            return UINT64_MAX;
        }

        return uint64_t{1} << features;
    }

    uint64_t saturating_add(uint64_t lhs, uint64_t rhs) noexcept
    {
        return rhs > UINT64_MAX - lhs ? UINT64_MAX : lhs + rhs;
    }

    void append_powerset(std::vector<FeatureSet>& target, const FeatureSet& features, const FeatureSet& always)
    {
        const auto count = powerset_size(features.size());
        for (uint64_t mask = 0; mask < count; ++mask)
        {
            std::vector<std::string> members(always.begin(), always.end());
            for (size_t idx = 0; idx < features.size(); ++idx)
            {
                if (mask & (uint64_t{1} << idx))
                {
                    members.push_back(features[idx]);
                }
            }

            target.emplace_back(std::move(members));
        }
    }

    LocalizedString too_many_configurations(const Package& package, uint64_t count)
    {
        return msg::format(msgTooManyConfigurations,
                           msg::package_name = package.name,
                           msg::count = count,
                           msg::limit = MaxFeatureCombinations);
    }

    std::vector<FeatureSet> allowed_feature_sets(const Config& config, const FeatureSet& declared)
    {
        std::vector<FeatureSet> result;
        for (auto&& allowed : config.allow_feature_sets)
        {
            auto known = retain_features(allowed, declared);
            if (config.no_empty_feature_set && known.empty())
            {
                continue;
            }

            result.push_back(std::move(known));
        }

        Util::sort_unique_erase(result);
        return result;
    }
}

namespace fcomb
{
    ExpectedL<std::vector<FeatureSet>> generate_feature_combinations(const Package& package, const Config& config)
    {
        const auto declared = declared_features(package);
        if (!config.allow_feature_sets.empty())
        {
            return allowed_feature_sets(config, declared);
        }

        auto eligible = declared;
        if (config.skip_optional_dependencies)
        {
            eligible = remove_features(eligible, implicit_optional_dependency_features(package));
        }

        eligible = remove_features(eligible, config.exclude_features);

        std::vector<FeatureSet> groups;
        if (config.isolated_feature_sets.empty())
        {
            groups.push_back(std::move(eligible));
        }
        else
        {
            for (auto&& isolated : config.isolated_feature_sets)
            {
                groups.push_back(retain_features(isolated, eligible));
            }
        }

        uint64_t total = 0;
        for (auto&& group : groups)
        {
            total = saturating_add(total, powerset_size(group.size()));
            if (total > MaxFeatureCombinations)
            {
                return too_many_configurations(package, total);
            }
        }

        std::vector<FeatureSet> result;
        result.reserve(static_cast<size_t>(total));
        for (auto&& group : groups)
        {
            append_powerset(result, group, config.include_features);
        }

        Util::erase_remove_if(result, [&](const FeatureSet& candidate) {
            return Util::any_of(config.exclude_feature_sets,
                                [&](const FeatureSet& excluded) { return candidate.includes(excluded); });
        });

        for (auto&& included : config.include_feature_sets)
        {
            result.push_back(retain_features(included, declared));
        }

        if (config.no_empty_feature_set)
        {
            Util::erase_remove_if(result, [](const FeatureSet& candidate) { return candidate.empty(); });
        }

        Util::sort_unique_erase(result);
        return result;
    }
}
