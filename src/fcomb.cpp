#include <fcomb/base/chrono.h>
#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/diagnostics.h>
#include <fcomb/base/message_sinks.h>
#include <fcomb/base/strings.h>
#include <fcomb/base/system.debug.h>
#include <fcomb/base/system.h>

#include <fcomb/cmdarguments.h>
#include <fcomb/matrix.h>
#include <fcomb/metadata.h>
#include <fcomb/runner.h>
#include <fcomb/tee.h>
#include <fcomb/workspace.h>

#include <stdlib.h>

using namespace fcomb;

namespace
{
    const ElapsedTimer g_total_time;

    std::string cargo_executable()
    {
        return get_environment_variable(EnvironmentVariableCargo).value_or(std::string{"cargo"});
    }

    [[noreturn]] void print_matrix(View<ConfiguredPackage> packages, const Options& options)
    {
        MatrixOptions matrix_options;
        matrix_options.pretty = options.pretty;
        matrix_options.packages_only = options.packages_only;
        const auto matrix = feature_matrix(packages, matrix_options).value_or_exit(FCOMB_LINE_INFO);
        msg::write_raw_text(OutputStream::StdOut, format_feature_matrix(matrix, matrix_options));
        Checks::exit_success(FCOMB_LINE_INFO);
    }
}

namespace fcomb::Checks
{
    void on_final_cleanup_and_exit()
    {
        if (Debug::g_debugging)
        {
            msg::write_unlocalized_text_to_stderr(Color::none,
                                                  fmt::format("[DEBUG] Exiting after {}\n", g_total_time.to_string()));
        }
    }
}

int main(const int argc, const char* const* const argv)
{
    if (argc == 0) abort();

    // standard output is reserved for cargo's output, the run summary and the matrix
    msg::default_output_stream = OutputStream::StdErr;

    auto args = Args::from_command_line(argc, argv);
    auto maybe_options = parse_options(stderr_diagnostic_context, args);
    auto options = maybe_options.get();
    if (!options)
    {
        Checks::exit_fail(FCOMB_LINE_INFO);
    }

    Debug::g_debugging = options->verbose || get_environment_variable(EnvironmentVariableFcombDebug) == "1";
    Debug::println("cargo arguments: ", Strings::join(" ", args.args));

    if (options->subcommand == Subcommand::Help)
    {
        print_help(stdout_sink);
        Checks::exit_success(FCOMB_LINE_INFO);
    }

    const auto cargo = cargo_executable();
    auto maybe_metadata = load_cargo_metadata(stderr_diagnostic_context, cargo, options->manifest_path);
    auto metadata = maybe_metadata.get();
    if (!metadata)
    {
        Checks::exit_fail(FCOMB_LINE_INFO);
    }

    PackageSelection selection;
    selection.packages = options->packages;
    selection.exclude_packages = options->exclude_packages;
    auto maybe_packages = configure_workspace(stderr_diagnostic_context, *metadata, selection);
    auto packages = maybe_packages.get();
    if (!packages)
    {
        Checks::exit_fail(FCOMB_LINE_INFO);
    }

    if (options->subcommand == Subcommand::Matrix)
    {
        print_matrix(*packages, *options);
    }

    StdOutWriter cargo_output;
    auto maybe_exit_code = run_cargo_command(
        stderr_diagnostic_context, stdout_sink, cargo_output, cargo, *packages, std::move(args.args), *options);
    if (auto exit_code = maybe_exit_code.get())
    {
        Checks::exit_with_code(FCOMB_LINE_INFO, *exit_code);
    }

    Checks::exit_fail(FCOMB_LINE_INFO);
}
