#include <fcomb/base/chrono.h>
#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/diagnostics.h>
#include <fcomb/base/message_sinks.h>
#include <fcomb/base/strings.h>
#include <fcomb/base/system.debug.h>
#include <fcomb/base/system.h>
#include <fcomb/base/system.process.h>
#include <fcomb/base/util.h>

#include <fcomb/combinations.h>
#include <fcomb/outputanalysis.h>
#include <fcomb/runner.h>
#include <fcomb/summary.h>
#include <fcomb/tee.h>

#include <algorithm>

namespace
{
    using namespace fcomb;

    constexpr StringLiteral SuppressWarningsFlag = "-Awarnings";

    Optional<Environment> cargo_environment(bool errors_only)
    {
        if (!errors_only)
        {
            return nullopt;
        }

        auto rust_flags = get_environment_variable(EnvironmentVariableRustFlags).value_or(std::string{});
        if (!rust_flags.empty())
        {
            rust_flags.push_back(' ');
        }

        rust_flags.append(SuppressWarningsFlag.data(), SuppressWarningsFlag.size());
        Environment environment;
        environment.add_entry(EnvironmentVariableRustFlags, rust_flags);
        return environment;
    }

    struct CapturedOutput
    {
        std::string text;
        bool complete = false;
    };

    CapturedOutput capture_output(DiagnosticContext& context, SpawnedProcess& process, OutputWriter* mirror)
    {
        CapturedOutput captured;
        auto tee = make_tee_reader(process, mirror);
        captured.complete = read_to_end(context, tee, captured.text);
        return captured;
    }

    struct PlannedPackage
    {
        const Package* package;
        Path working_directory;
        std::vector<FeatureSet> combinations;
    };
}

namespace fcomb
{
    CargoInvocation split_cargo_arguments(std::vector<std::string>&& args)
    {
        CargoInvocation invocation;
        auto separator = std::find(args.begin(), args.end(), "--");
        invocation.extra_args.assign(std::make_move_iterator(separator), std::make_move_iterator(args.end()));
        args.erase(separator, args.end());
        invocation.cargo_args = std::move(args);
        invocation.missing_arguments = invocation.cargo_args.empty() && invocation.extra_args.empty();
        if (!contains_argument(invocation.cargo_args, SwitchColor))
        {
            invocation.cargo_args.emplace_back(SwitchColor.data(), SwitchColor.size());
            invocation.cargo_args.emplace_back("always");
        }

        return invocation;
    }

    std::vector<std::string> combination_arguments(const CargoInvocation& invocation, const FeatureSet& features)
    {
        std::vector<std::string> args = invocation.cargo_args;
        if (!invocation.missing_arguments)
        {
            args.emplace_back(SwitchNoDefaultFeatures.data(), SwitchNoDefaultFeatures.size());
            args.push_back(fmt::format("--features={}", features_argument(features)));
        }

        args.insert(args.end(), invocation.extra_args.begin(), invocation.extra_args.end());
        return args;
    }

    LocalizedString status_for_arguments(View<std::string> cargo_args)
    {
        if (contains_argument(cargo_args, "build"))
        {
            return msg::format(msgStatusBuilding);
        }

        if (contains_argument(cargo_args, "check") || contains_argument(cargo_args, "clippy"))
        {
            return msg::format(msgStatusChecking);
        }

        if (contains_argument(cargo_args, "test"))
        {
            return msg::format(msgStatusTesting);
        }

        return msg::format(msgStatusRunning);
    }

    MessageLine package_line(const LocalizedString& status,
                             StringView package_name,
                             const FeatureSet& features,
                             View<std::string> args,
                             bool verbose)
    {
        MessageLine line;
        line.print(Color::info, format_status(status));
        line.print(msg::format(msgPackageFeatures,
                               msg::package_name = package_name,
                               msg::features = display_features(features)));
        if (verbose)
        {
            line.print(" ");
            line.print(msg::format(msgCargoCommandLine, msg::command_line = Strings::join(" ", args)));
        }

        return line;
    }

    Optional<int> run_cargo_command(DiagnosticContext& context,
                                    MessageSink& sink,
                                    OutputWriter& cargo_output,
                                    StringView cargo,
                                    View<ConfiguredPackage> packages,
                                    std::vector<std::string>&& args,
                                    const Options& options)
    {
        const ElapsedTimer timer;
        const auto invocation = split_cargo_arguments(std::move(args));
        const auto status = status_for_arguments(invocation.cargo_args);
        RedirectedProcessLaunchSettings settings;
        settings.environment = cargo_environment(options.errors_only);
        settings.redirected_stream = RedirectedStream::StdErr;

        // every package is planned before the first cargo process starts
        std::vector<PlannedPackage> plan;
        for (auto&& configured : packages)
        {
            const auto& package = *configured.package;
            auto maybe_combinations = generate_feature_combinations(package, configured.config);
            auto combinations = maybe_combinations.get();
            if (!combinations)
            {
                context.report_error(std::move(maybe_combinations).error());
                return nullopt;
            }

            const auto working_directory = package.manifest_path.parent_path();
            if (working_directory.empty())
            {
                context.report_error(msgNoParentDirectory, msg::path = package.manifest_path);
                return nullopt;
            }

            plan.push_back({&package, working_directory, std::move(*combinations)});
        }

        std::vector<RunOutcome> outcomes;
        for (auto&& planned : plan)
        {
            const auto& package = *planned.package;
            settings.working_directory.emplace(planned.working_directory);
            for (auto&& features : planned.combinations)
            {
                const auto combination_args = combination_arguments(invocation, features);
                if (!options.silent)
                {
                    sink.println(LocalizedString{});
                }

                sink.println(package_line(status, package.name, features, combination_args, options.verbose));
                if (!options.silent)
                {
                    sink.println(LocalizedString{});
                }

                const auto cmd = Command{cargo}.forwarded_args(combination_args);
                auto maybe_process = cmd_spawn_redirected(context, cmd, settings);
                auto process = maybe_process.get();
                if (!process)
                {
                    context.report_error(msgFailedToSpawnCargo, msg::command_line = cmd.command_line());
                    return nullopt;
                }

                WarningDiagnosticContext read_context{context};
                auto captured = capture_output(read_context, *process, options.silent ? nullptr : &cargo_output);
                auto maybe_exit_status = process->wait_for_termination(context);
                auto exit_status = maybe_exit_status.get();
                if (!exit_status)
                {
                    return nullopt;
                }

                RunOutcome outcome;
                outcome.package_name = package.name;
                outcome.features = features;
                outcome.exit_code = exit_status->code;
                if (captured.complete)
                {
                    const auto counts = count_diagnostics(captured.text);
                    outcome.warnings = counts.warnings;
                    outcome.errors = counts.errors;
                }
                else
                {
                    read_context.report(DiagnosticLine{DiagKind::Warning,
                                                       msg::format(msgFailedToReadCargoOutput,
                                                                   msg::package_name = package.name)});
                }

                outcome.pedantic_success =
                    is_pedantic_success(exit_status->success(), outcome.warnings, outcome.errors, options.pedantic);
                Debug::println(fmt::format("{} [{}]: exit code {}, {} warnings, {} errors",
                                           package.name,
                                           features_argument(features),
                                           exit_status->code.value_or(-1),
                                           outcome.warnings.value_or(0),
                                           outcome.errors.value_or(0)));
                const bool failed = !outcome.pedantic_success;
                outcomes.push_back(std::move(outcome));
                if (failed && options.fail_fast)
                {
                    if (options.silent)
                    {
                        cargo_output.write(captured.text);
                        cargo_output.flush();
                    }

                    return print_summary(sink, outcomes, timer.elapsed());
                }
            }
        }

        return print_summary(sink, outcomes, timer.elapsed());
    }
}
