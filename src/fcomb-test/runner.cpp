#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/message_sinks.h>
#include <fcomb/base/system.h>

#include <fcomb/runner.h>
#include <fcomb/tee.h>

using namespace fcomb;

namespace
{
    std::vector<std::string> arguments_of(const CargoInvocation& invocation, const FeatureSet& features)
    {
        return combination_arguments(invocation, features);
    }

    struct CapturingWriter final : OutputWriter
    {
        virtual void write(StringView text) override { written.append(text.data(), text.size()); }
        virtual void flush() override { }

        std::string written;
    };

    // A package rooted at / so that the spawned shell can change into its directory.
    struct RunnerFixture
    {
        RunnerFixture()
        {
            app = Test::make_package("app", {"a"});
            app.manifest_path = Path{"/Cargo.toml"};
            packages.push_back(ConfiguredPackage{&app, Config{}});
            options.silent = true;
        }

        // Runs `sh -c script` in place of cargo; the script sees "--features=..." as $3.
        Optional<int> run(StringView script)
        {
            return run_cargo_command(bdc, sink, cargo_output, "sh", packages, {"-c", script.to_string()}, options);
        }

        std::vector<std::string> summary_lines() const
        {
            std::vector<std::string> result;
            for (auto&& line : sink.lines())
            {
                result.push_back(line.to_string());
            }

            return result;
        }

        Package app;
        std::vector<ConfiguredPackage> packages;
        Options options;
        BufferedDiagnosticContext bdc{out_sink};
        BufferedMessageSink sink;
        CapturingWriter cargo_output;
    };

    constexpr StringLiteral FailWithFeatureA =
        "case \"$3\" in --features=a) echo 'error: could not compile `app` due to 3 previous errors' >&2; "
        "exit 101;; esac; echo 'warning: `app` (lib) generated 2 warnings' >&2";
}

TEST_CASE ("split cargo arguments", "[runner]")
{
    SECTION ("with extra arguments")
    {
        auto invocation = split_cargo_arguments({"test", "--all-targets", "--", "--nocapture"});
        CHECK(invocation.cargo_args == std::vector<std::string>{"test", "--all-targets", "--color", "always"});
        CHECK(invocation.extra_args == std::vector<std::string>{"--", "--nocapture"});
        CHECK_FALSE(invocation.missing_arguments);
    }

    SECTION ("color already chosen")
    {
        auto invocation = split_cargo_arguments({"build", "--color=never"});
        CHECK(invocation.cargo_args == std::vector<std::string>{"build", "--color=never"});
        CHECK(invocation.extra_args.empty());
    }

    SECTION ("nothing for cargo")
    {
        auto invocation = split_cargo_arguments({});
        CHECK(invocation.missing_arguments);
        CHECK(invocation.cargo_args == std::vector<std::string>{"--color", "always"});
    }
}

TEST_CASE ("combination arguments", "[runner]")
{
    const auto invocation = split_cargo_arguments({"test", "--", "--nocapture"});
    CHECK(arguments_of(invocation, {"a", "b"}) == std::vector<std::string>{"test",
                                                                          "--color",
                                                                          "always",
                                                                          "--no-default-features",
                                                                          "--features=a,b",
                                                                          "--",
                                                                          "--nocapture"});
    CHECK(arguments_of(invocation, {}) ==
          std::vector<std::string>{
              "test", "--color", "always", "--no-default-features", "--features=", "--", "--nocapture"});

    const auto bare = split_cargo_arguments({});
    CHECK(arguments_of(bare, {"a"}) == std::vector<std::string>{"--color", "always"});
}

TEST_CASE ("status for arguments", "[runner]")
{
    CHECK(status_for_arguments(std::vector<std::string>{"build", "--release"}) == msg::format(msgStatusBuilding));
    CHECK(status_for_arguments(std::vector<std::string>{"check"}) == msg::format(msgStatusChecking));
    CHECK(status_for_arguments(std::vector<std::string>{"clippy", "--all-targets"}) ==
          msg::format(msgStatusChecking));
    CHECK(status_for_arguments(std::vector<std::string>{"test"}) == msg::format(msgStatusTesting));
    CHECK(status_for_arguments(std::vector<std::string>{"doc"}) == msg::format(msgStatusRunning));
}

TEST_CASE ("package line", "[runner]")
{
    const std::vector<std::string> args{"check", "--no-default-features", "--features=a,b"};
    CHECK(package_line(msg::format(msgStatusChecking), "app", {"a", "b"}, args, false).to_string() ==
          "    Checking app ( features = [a, b] )");
    CHECK(package_line(msg::format(msgStatusChecking), "app", {}, args, true).to_string() ==
          "    Checking app ( features = [] ) [cargo check --no-default-features --features=a,b]");
}

TEST_CASE_METHOD (RunnerFixture, "run every combination", "[runner]")
{
    auto maybe_exit_code = run(FailWithFeatureA);
    INFO(bdc.to_string());
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 101);
    CHECK(bdc.empty());

    const auto lines = summary_lines();
    REQUIRE(lines.size() == 8);
    CHECK(lines[0] == "     Running app ( features = [] )");
    CHECK(lines[1] == "     Running app ( features = [a] )");
    CHECK(lines[2].empty());
    CHECK(Strings::starts_with(lines[3], "    Finished 2 total feature combinations for 1 package in "));
    CHECK(lines[4].empty());
    CHECK(lines[5] == "        WARN app ( 0 errors, 2 warnings, features = [] )");
    CHECK(lines[6] == "        FAIL app ( 3 errors, 0 warnings, features = [a] )");
    CHECK(lines[7].empty());
}

TEST_CASE_METHOD (RunnerFixture, "pedantic fail fast stops at the first warning", "[runner]")
{
    options.pedantic = true;
    options.fail_fast = true;
    auto maybe_exit_code = run(FailWithFeatureA);
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 1);

    const auto lines = summary_lines();
    REQUIRE(lines.size() == 6);
    CHECK(lines[0] == "     Running app ( features = [] )");
    CHECK(lines[4] == "        FAIL app ( 0 errors, 2 warnings, features = [] )");
}

TEST_CASE_METHOD (RunnerFixture, "successful run", "[runner]")
{
    options.silent = false;
    auto maybe_exit_code = run("exit 0");
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 0);

    const auto lines = summary_lines();
    // each invocation is surrounded by blank lines unless silent
    REQUIRE(lines.size() == 12);
    CHECK(lines[0].empty());
    CHECK(lines[1] == "     Running app ( features = [] )");
    CHECK(lines[2].empty());
    CHECK(lines[4] == "     Running app ( features = [a] )");
    CHECK(lines[9] == "        PASS app ( 0 errors, 0 warnings, features = [] )");
    CHECK(lines[10] == "        PASS app ( 0 errors, 0 warnings, features = [a] )");
}

TEST_CASE_METHOD (RunnerFixture, "errors only suppresses warnings through RUSTFLAGS", "[runner]")
{
    options.errors_only = true;
    set_environment_variable("RUSTFLAGS", "-Dunsafe_code");
    auto maybe_exit_code = run("test \"$RUSTFLAGS\" = \"-Dunsafe_code -Awarnings\"");
    set_environment_variable("RUSTFLAGS", nullopt);
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 0);
}

TEST_CASE_METHOD (RunnerFixture, "manifest without a parent directory", "[runner]")
{
    app.manifest_path = Path{"Cargo.toml"};
    CHECK_FALSE(run("exit 0").has_value());
    CHECK(bdc.to_string() == "error: could not find parent dir of package Cargo.toml");
}

TEST_CASE_METHOD (RunnerFixture, "too many combinations", "[runner]")
{
    for (int i = 0; i < 20; ++i)
    {
        app.features.emplace(fmt::format("f{:02}", i), std::vector<std::string>{});
    }

    CHECK_FALSE(run("exit 0").has_value());
    CHECK(bdc.to_string() ==
          "error: app: too many configurations: 2097152 feature combinations exceed the limit of 100000");
    CHECK(sink.lines().empty());
}

TEST_CASE_METHOD (RunnerFixture, "later packages are checked before anything runs", "[runner]")
{
    auto wide = Test::make_package("wide", {});
    wide.manifest_path = Path{"/Cargo.toml"};
    for (int i = 0; i < 17; ++i)
    {
        wide.features.emplace(fmt::format("f{:02}", i), std::vector<std::string>{});
    }

    packages.push_back(ConfiguredPackage{&wide, Config{}});
    CHECK_FALSE(run("exit 0").has_value());
    CHECK(bdc.to_string() ==
          "error: wide: too many configurations: 131072 feature combinations exceed the limit of 100000");
    CHECK(sink.lines().empty());
}

TEST_CASE_METHOD (RunnerFixture, "silent fail fast shows the output of the failing combination", "[runner]")
{
    options.fail_fast = true;
    auto maybe_exit_code = run(FailWithFeatureA);
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 101);
    CHECK(cargo_output.written == "error: could not compile `app` due to 3 previous errors\n");
}

TEST_CASE_METHOD (RunnerFixture, "silent output stays hidden without fail fast", "[runner]")
{
    auto maybe_exit_code = run(FailWithFeatureA);
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 101);
    CHECK(cargo_output.written.empty());
}

TEST_CASE_METHOD (RunnerFixture, "output is mirrored and still counted", "[runner]")
{
    options.silent = false;
    auto maybe_exit_code = run(FailWithFeatureA);
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 101);
    CHECK(cargo_output.written ==
          "warning: `app` (lib) generated 2 warnings\n"
          "error: could not compile `app` due to 3 previous errors\n");

    const auto lines = summary_lines();
    REQUIRE(lines.size() == 12);
    CHECK(lines[9] == "        WARN app ( 0 errors, 2 warnings, features = [] )");
    CHECK(lines[10] == "        FAIL app ( 3 errors, 0 warnings, features = [a] )");
}

TEST_CASE_METHOD (RunnerFixture, "fail fast skips the remaining combinations", "[runner]")
{
    options.silent = false;
    options.fail_fast = true;
    auto maybe_exit_code = run("echo failed >&2; exit 101");
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 101);
    // mirrored once while running, not dumped again
    CHECK(cargo_output.written == "failed\n");

    const auto lines = summary_lines();
    REQUIRE(lines.size() == 8);
    CHECK(lines[1] == "     Running app ( features = [] )");
    CHECK(Strings::starts_with(lines[4], "    Finished 1 total feature combination for 1 package in "));
    CHECK(lines[6] == "        FAIL app ( 0 errors, 0 warnings, features = [] )");
}

TEST_CASE_METHOD (RunnerFixture, "missing cargo is reported", "[runner]")
{
    auto maybe_exit_code =
        run_cargo_command(bdc, sink, cargo_output, "fcomb-test-no-such-cargo", packages, {"check"}, options);
    CHECK_FALSE(maybe_exit_code.has_value());
    const auto diagnostics = bdc.to_string();
    CHECK(StringView{diagnostics}.contains("error: calling posix_spawnp failed with 2"));
    CHECK(StringView{diagnostics}.contains(
        "error: failed to launch fcomb-test-no-such-cargo check --color always --no-default-features --features="));
}

TEST_CASE_METHOD (RunnerFixture, "cargo killed by a signal fails the run", "[runner]")
{
    auto maybe_exit_code = run("kill -9 $$");
    REQUIRE(maybe_exit_code.has_value());
    CHECK(*maybe_exit_code.get() == 1);
    CHECK(bdc.empty());

    const auto lines = summary_lines();
    REQUIRE(lines.size() == 8);
    CHECK(lines[5] == "        FAIL app ( 0 errors, 0 warnings, features = [] )");
    CHECK(lines[6] == "        FAIL app ( 0 errors, 0 warnings, features = [a] )");
}
