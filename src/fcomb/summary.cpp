#include <fcomb/base/message_sinks.h>
#include <fcomb/base/strings.h>

#include <fcomb/summary.h>

#include <algorithm>
#include <set>
#include <utility>

namespace
{
    using namespace fcomb;

    std::string format_count(const Optional<size_t>& count, size_t width)
    {
        if (auto c = count.get())
        {
            return fmt::format("{:0{}}", *c, width);
        }

        return fmt::format("{:>{}}", "?", width);
    }

    size_t count_width(View<RunOutcome> outcomes, Optional<size_t> RunOutcome::*field)
    {
        size_t most = 0;
        for (auto&& outcome : outcomes)
        {
            most = std::max(most, (outcome.*field).value_or(0));
        }

        return fmt::formatted_size("{}", most);
    }

    LocalizedString format_totals(View<RunOutcome> outcomes, const ElapsedTime& elapsed)
    {
        std::set<std::string> packages;
        std::set<std::pair<std::string, FeatureSet>> combinations;
        for (auto&& outcome : outcomes)
        {
            packages.insert(outcome.package_name);
            combinations.emplace(outcome.package_name, outcome.features);
        }

        const auto combination_count = combinations.size();
        const auto package_count = packages.size();
        return msg::format(msgSummaryTotals,
                           msg::combinations = msg::format(combination_count > 1 ? msgFeatureCombinationCount
                                                                                 : msgFeatureCombinationCountOne,
                                                           msg::count = combination_count),
                           msg::packages = msg::format(package_count > 1 ? msgPackageCount : msgPackageCountOne,
                                                       msg::count = package_count),
                           msg::elapsed = elapsed);
    }
}

namespace fcomb
{
    bool is_pedantic_success(bool cargo_succeeded, Optional<size_t> warnings, Optional<size_t> errors, bool pedantic)
    {
        const bool pedantic_fail = pedantic && (errors.value_or(0) > 0 || warnings.value_or(0) > 0);
        return cargo_succeeded && !pedantic_fail;
    }

    std::string format_status(const LocalizedString& status) { return fmt::format("{:>12} ", status); }

    int summary_exit_code(View<RunOutcome> outcomes)
    {
        for (auto&& outcome : outcomes)
        {
            if (!outcome.pedantic_success)
            {
                const auto exit_code = outcome.exit_code.value_or(1);
                return exit_code == 0 ? 1 : exit_code;
            }
        }

        return 0;
    }

    int print_summary(MessageSink& sink, View<RunOutcome> outcomes, const ElapsedTime& elapsed)
    {
        const auto errors_width = count_width(outcomes, &RunOutcome::errors);
        const auto warnings_width = count_width(outcomes, &RunOutcome::warnings);

        sink.println(LocalizedString{});
        MessageLine totals;
        totals.print(Color::info, format_status(msg::format(msgStatusFinished)));
        totals.print(format_totals(outcomes, elapsed));
        sink.println(totals);
        sink.println(LocalizedString{});

        for (auto&& outcome : outcomes)
        {
            MessageLine line;
            if (!outcome.pedantic_success)
            {
                line.print(Color::error, format_status(msg::format(msgStatusFail)));
            }
            else if (outcome.warnings.value_or(0) > 0)
            {
                line.print(Color::warning, format_status(msg::format(msgStatusWarn)));
            }
            else
            {
                line.print(Color::success, format_status(msg::format(msgStatusPass)));
            }

            line.print(msg::format(msgSummaryOutcome,
                                   msg::package_name = outcome.package_name,
                                   msg::errors = format_count(outcome.errors, errors_width),
                                   msg::warnings = format_count(outcome.warnings, warnings_width),
                                   msg::features = display_features(outcome.features)));
            sink.println(line);
        }

        sink.println(LocalizedString{});
        return summary_exit_code(outcomes);
    }
}
