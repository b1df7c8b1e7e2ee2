#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/diagnostics.h>
#include <fcomb/base/message_sinks.h>
#include <fcomb/base/strings.h>
#include <fcomb/base/system.h>
#include <fcomb/base/util.h>

#include <fcomb/cmdarguments.h>

#include <algorithm>

namespace
{
    using namespace fcomb;

    constexpr StringLiteral CargoSubcommandName = "fc";
    constexpr StringLiteral EndOfOptions = "--";

    // Options are only recognized before "--"; everything after it belongs to the program cargo runs.
    std::vector<std::string>::iterator end_of_options(std::vector<std::string>& args)
    {
        return std::find(args.begin(), args.end(), EndOfOptions);
    }

    bool is_option_with_value(StringView candidate, StringView arg)
    {
        return candidate.size() > arg.size() && Strings::starts_with(candidate, arg) && candidate[arg.size()] == '=';
    }

    struct HelpTableFormatter
    {
        void header(const LocalizedString& text) { m_lines.emplace_back(text.data()); }

        void format(StringView name, const LocalizedString& help)
        {
            m_lines.push_back(fmt::format("    {:<32}{}", name, help));
        }

        void blank_line() { m_lines.emplace_back(); }

        void print_to(MessageSink& sink) const
        {
            for (auto&& line : m_lines)
            {
                sink.println(LocalizedString::from_raw(line));
            }
        }

    private:
        std::vector<std::string> m_lines;
    };
}

namespace fcomb
{
    Args Args::from_command_line(int argc, const char* const* argv)
    {
        std::vector<std::string> args;
        int first = 1;
        if (first < argc && StringView{argv[first]} == CargoSubcommandName)
        {
            ++first;
        }

        for (int idx = first; idx < argc; ++idx)
        {
            args.emplace_back(argv[idx]);
        }

        return Args{std::move(args)};
    }

    bool contains_argument(View<std::string> args, StringView arg)
    {
        return Util::any_of(args, [&](const std::string& candidate) {
            return StringView{candidate} == arg || is_option_with_value(candidate, arg);
        });
    }

    bool Args::extract_switch(StringView arg)
    {
        const auto options_end = end_of_options(args);
        const auto removed_begin = std::remove_if(
            args.begin(), options_end, [&](const std::string& candidate) { return StringView{candidate} == arg; });
        if (removed_begin == options_end)
        {
            return false;
        }

        args.erase(removed_begin, options_end);
        return true;
    }

    Optional<std::vector<std::string>> Args::extract_option(DiagnosticContext& context, StringView arg)
    {
        std::vector<std::string> values;
        auto it = args.begin();
        while (it != end_of_options(args))
        {
            if (StringView{*it} == arg)
            {
                auto value = it + 1;
                if (value == end_of_options(args))
                {
                    context.report_error(msgOptionRequiresValue, msg::option = arg);
                    return nullopt;
                }

                values.push_back(std::move(*value));
                it = args.erase(it, value + 1);
            }
            else if (is_option_with_value(*it, arg))
            {
                values.emplace_back(it->begin() + arg.size() + 1, it->end());
                it = args.erase(it);
            }
            else
            {
                ++it;
            }
        }

        return values;
    }

    Optional<Options> parse_options(DiagnosticContext& context, Args& args)
    {
        Options options;
        options.verbose =
            get_environment_variable(EnvironmentVariableVerbose).map(is_truthy_environment_value).value_or(false);

        bool failed = false;
        auto maybe_manifest_paths = args.extract_option(context, SwitchManifestPath);
        if (auto manifest_paths = maybe_manifest_paths.get())
        {
            if (!manifest_paths->empty())
            {
                Path manifest_path = std::move(manifest_paths->back());
                if (path_exists(manifest_path))
                {
                    options.manifest_path = std::move(manifest_path);
                }
                else
                {
                    context.report_error(msgManifestDoesNotExist, msg::path = manifest_path);
                    failed = true;
                }
            }
        }
        else
        {
            failed = true;
        }

        for (auto&& option : {SwitchPackage, SwitchPackageShort})
        {
            auto maybe_packages = args.extract_option(context, option);
            if (auto packages = maybe_packages.get())
            {
                Util::Vectors::append(&options.packages, std::move(*packages));
            }
            else
            {
                failed = true;
            }
        }

        auto maybe_excluded = args.extract_option(context, SwitchExcludePackage);
        if (auto excluded = maybe_excluded.get())
        {
            options.exclude_packages = std::move(*excluded);
        }
        else
        {
            failed = true;
        }

        if (failed)
        {
            return nullopt;
        }

        if (args.extract_switch(SubcommandMatrix))
        {
            options.subcommand = Subcommand::Matrix;
        }

        options.pretty = args.extract_switch(SwitchPretty);
        options.packages_only = args.extract_switch(SwitchPackagesOnly);
        if (args.extract_switch(SwitchHelp))
        {
            options.subcommand = Subcommand::Help;
        }

        options.pedantic = args.extract_switch(SwitchPedantic);
        options.silent = args.extract_switch(SwitchSilent);
        options.fail_fast = args.extract_switch(SwitchFailFast);
        options.errors_only = args.extract_switch(SwitchErrorsOnly);
        return options;
    }

    void print_help(MessageSink& sink)
    {
        HelpTableFormatter table;
        table.header(msg::format(msgHelpDescription));
        table.blank_line();
        table.header(msg::format(msgHelpUsage));
        table.blank_line();
        table.header(msg::format(msgHelpSubcommandHeader));
        table.format(SubcommandMatrix, msg::format(msgHelpMatrix));
        table.blank_line();
        table.header(msg::format(msgHelpOptionsHeader));
        table.format(fmt::format("{} <path>", SwitchManifestPath), msg::format(msgHelpManifestPath));
        table.format(fmt::format("{}, {} <name>", SwitchPackageShort, SwitchPackage), msg::format(msgHelpPackage));
        table.format(fmt::format("{} <name>", SwitchExcludePackage), msg::format(msgHelpExcludePackage));
        table.format(SwitchPretty, msg::format(msgHelpPretty));
        table.format(SwitchPackagesOnly, msg::format(msgHelpPackagesOnly));
        table.format(SwitchSilent, msg::format(msgHelpSilent));
        table.format(SwitchFailFast, msg::format(msgHelpFailFast));
        table.format(SwitchErrorsOnly, msg::format(msgHelpErrorsOnly));
        table.format(SwitchPedantic, msg::format(msgHelpPedantic));
        table.format(SwitchHelp, msg::format(msgHelpHelp));
        table.blank_line();
        table.header(msg::format(msgHelpConfiguration));
        table.print_to(sink);
    }
}
