#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/message_sinks.h>
#include <fcomb/base/system.h>

#include <fcomb/cmdarguments.h>

using namespace fcomb;

namespace
{
    Args make_args(std::initializer_list<StringLiteral> args)
    {
        std::vector<std::string> result;
        for (auto&& arg : args)
        {
            result.push_back(arg.to_string());
        }

        return Args{std::move(result)};
    }
}

TEST_CASE ("args from the command line", "[cmdarguments]")
{
    SECTION ("invoked as cargo fc")
    {
        const char* const argv[] = {"/usr/bin/cargo-fc", "fc", "check", "--all-targets"};
        CHECK(Args::from_command_line(4, argv).args == std::vector<std::string>{"check", "--all-targets"});
    }

    SECTION ("invoked directly")
    {
        const char* const argv[] = {"cargo-fc", "check"};
        CHECK(Args::from_command_line(2, argv).args == std::vector<std::string>{"check"});
    }

    SECTION ("no arguments")
    {
        const char* const argv[] = {"cargo-fc"};
        CHECK(Args::from_command_line(1, argv).args.empty());
    }
}

TEST_CASE ("contains argument", "[cmdarguments]")
{
    const std::vector<std::string> args{"build", "--color=never", "--target", "x86_64-unknown-linux-gnu"};
    CHECK(contains_argument(args, "--color"));
    CHECK(contains_argument(args, "--target"));
    CHECK(contains_argument(args, "build"));
    CHECK_FALSE(contains_argument(args, "--col"));
    CHECK_FALSE(contains_argument(args, "--colo"));
    CHECK_FALSE(contains_argument(args, "check"));
}

TEST_CASE ("extract switch", "[cmdarguments]")
{
    auto args = make_args({"--silent", "check", "--silent", "--silently"});
    CHECK(args.extract_switch("--silent"));
    CHECK(args.args == std::vector<std::string>{"check", "--silently"});
    CHECK_FALSE(args.extract_switch("--silent"));
}

TEST_CASE ("switches after the separator belong to cargo", "[cmdarguments]")
{
    auto args = make_args({"test", "--pedantic", "--", "--silent", "--pedantic"});
    CHECK(args.extract_switch("--pedantic"));
    CHECK_FALSE(args.extract_switch("--silent"));
    CHECK(args.args == std::vector<std::string>{"test", "--", "--silent", "--pedantic"});
}

TEST_CASE ("extract option", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    SECTION ("separate and joined values")
    {
        auto args = make_args({"-p", "core", "check", "-p=app", "--", "--nocapture"});
        auto maybe_values = args.extract_option(bdc, "-p");
        REQUIRE(maybe_values.has_value());
        CHECK(*maybe_values.get() == std::vector<std::string>{"core", "app"});
        CHECK(args.args == std::vector<std::string>{"check", "--", "--nocapture"});
    }

    SECTION ("absent")
    {
        auto args = make_args({"check"});
        auto maybe_values = args.extract_option(bdc, "--package");
        REQUIRE(maybe_values.has_value());
        CHECK(maybe_values.get()->empty());
        CHECK(args.args == std::vector<std::string>{"check"});
    }

    SECTION ("missing value")
    {
        auto args = make_args({"check", "--package"});
        CHECK_FALSE(args.extract_option(bdc, "--package").has_value());
        CHECK(bdc.to_string() == "error: the option --package requires a value");
    }

    SECTION ("after the separator")
    {
        auto args = make_args({"test", "--", "-p", "x", "--package=y"});
        auto maybe_values = args.extract_option(bdc, "-p");
        REQUIRE(maybe_values.has_value());
        CHECK(maybe_values.get()->empty());
        CHECK(args.extract_option(bdc, "--package").value_or_exit(FCOMB_LINE_INFO).empty());
        CHECK(args.args == std::vector<std::string>{"test", "--", "-p", "x", "--package=y"});
    }

    SECTION ("separator is not a value")
    {
        auto args = make_args({"test", "-p", "--", "x"});
        CHECK_FALSE(args.extract_option(bdc, "-p").has_value());
        CHECK(bdc.to_string() == "error: the option -p requires a value");
    }
}

TEST_CASE ("parse options leaves arguments after the separator alone", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto args = make_args({"test", "--", "--silent", "-p", "x", "--help"});
    auto maybe_options = parse_options(bdc, args);
    REQUIRE(maybe_options.has_value());
    CHECK_FALSE(maybe_options.get()->silent);
    CHECK(maybe_options.get()->packages.empty());
    CHECK(maybe_options.get()->subcommand == Subcommand::Run);
    CHECK(args.args == std::vector<std::string>{"test", "--", "--silent", "-p", "x", "--help"});
}

TEST_CASE ("parse options", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto args = make_args({"matrix",
                           "--pretty",
                           "--package",
                           "app",
                           "-p",
                           "core",
                           "--exclude-package=cli",
                           "--packages-only",
                           "--pedantic",
                           "--silent",
                           "--fail-fast",
                           "--errors-only",
                           "--all-targets"});
    auto maybe_options = parse_options(bdc, args);
    REQUIRE(maybe_options.has_value());
    const auto& options = *maybe_options.get();
    CHECK(options.subcommand == Subcommand::Matrix);
    CHECK_FALSE(options.manifest_path.has_value());
    CHECK(options.packages == std::vector<std::string>{"app", "core"});
    CHECK(options.exclude_packages == std::vector<std::string>{"cli"});
    CHECK(options.pretty);
    CHECK(options.packages_only);
    CHECK(options.pedantic);
    CHECK(options.silent);
    CHECK(options.fail_fast);
    CHECK(options.errors_only);
    CHECK_FALSE(options.verbose);
    CHECK(args.args == std::vector<std::string>{"--all-targets"});
    CHECK(bdc.empty());
}

TEST_CASE ("parse default options", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto args = make_args({"test", "--", "--nocapture"});
    auto maybe_options = parse_options(bdc, args);
    REQUIRE(maybe_options.has_value());
    const auto& options = *maybe_options.get();
    CHECK(options.subcommand == Subcommand::Run);
    CHECK(options.packages.empty());
    CHECK_FALSE(options.silent);
    CHECK_FALSE(options.fail_fast);
    CHECK(args.args == std::vector<std::string>{"test", "--", "--nocapture"});
}

TEST_CASE ("help wins over matrix", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto args = make_args({"matrix", "--help"});
    auto maybe_options = parse_options(bdc, args);
    REQUIRE(maybe_options.has_value());
    CHECK(maybe_options.get()->subcommand == Subcommand::Help);
}

TEST_CASE ("verbose from the environment", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto args = make_args({"check"});
    set_environment_variable("VERBOSE", "Yes");
    auto maybe_options = parse_options(bdc, args);
    set_environment_variable("VERBOSE", nullopt);
    REQUIRE(maybe_options.has_value());
    CHECK(maybe_options.get()->verbose);
}

TEST_CASE ("manifest path", "[cmdarguments]")
{
    BufferedDiagnosticContext bdc{out_sink};
    SECTION ("existing")
    {
        auto args = make_args({"--manifest-path", "/does/not/exist/Cargo.toml", "--manifest-path=/", "check"});
        auto maybe_options = parse_options(bdc, args);
        REQUIRE(maybe_options.has_value());
        CHECK(maybe_options.get()->manifest_path == Path{"/"});
        CHECK(args.args == std::vector<std::string>{"check"});
    }

    SECTION ("missing file")
    {
        auto args = make_args({"--manifest-path", "/does/not/exist/Cargo.toml", "check"});
        CHECK_FALSE(parse_options(bdc, args).has_value());
        CHECK(bdc.to_string() == "error: manifest /does/not/exist/Cargo.toml does not exist");
    }

    SECTION ("missing value")
    {
        auto args = make_args({"check", "--manifest-path"});
        CHECK_FALSE(parse_options(bdc, args).has_value());
        CHECK(bdc.to_string() == "error: the option --manifest-path requires a value");
    }
}

TEST_CASE ("help text", "[cmdarguments]")
{
    BufferedMessageSink sink;
    print_help(sink);
    const auto text = sink.to_string();
    CHECK(Strings::starts_with(text, "Run cargo commands for all feature combinations\n\nUSAGE:\n"));
    CHECK(text.find("\nSUBCOMMAND:\n"
                    "    matrix                          Print JSON feature combination matrix to stdout\n") !=
          std::string::npos);
    CHECK(text.find("\n    -p, --package <name>            Only run on the named package") != std::string::npos);
    CHECK(text.find("\n    --help                          Print help information\n") != std::string::npos);
}
