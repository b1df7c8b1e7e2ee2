#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/stringview.h>
#include <fcomb/base/system.h>
#include <fcomb/base/system.process.h>

using namespace fcomb;

TEST_CASE ("command line quoting", "[system.process]")
{
    CHECK(Command{"cargo"}.string_arg("check").command_line() == "cargo check");
    CHECK(Command{"cargo"}.string_arg("").command_line() == "cargo \"\"");
    CHECK(Command{"cargo"}.string_arg("--features=a,b").command_line() == "cargo \"--features=a,b\"");
    CHECK(Command{"cargo"}.string_arg("a \"quoted\" $HOME `x` \\").command_line() ==
          "cargo \"a \\\"quoted\\\" \\$HOME \\`x\\` \\\\\"");

    const std::vector<std::string> args{"test", "--", "--nocapture"};
    CHECK(Command{"cargo"}.forwarded_args(args).command_line() == "cargo test -- --nocapture");
}

TEST_CASE ("captures output", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_run = cmd_execute_and_capture_output(
        bdc, Command{"echo"}.string_arg("hello world"), RedirectedProcessLaunchSettings{});
    REQUIRE(maybe_run.has_value());
    auto& run = *maybe_run.get();
    CHECK(run.status.code == 0);
    CHECK(run.status.success());
    CHECK(run.output == "hello world\n");
    CHECK(bdc.empty());
}

TEST_CASE ("captures standard error", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    RedirectedProcessLaunchSettings settings;
    settings.redirected_stream = RedirectedStream::StdErr;
    auto maybe_run = cmd_execute_and_capture_output(
        bdc, Command{"sh"}.string_arg("-c").string_arg("echo ignored; echo captured >&2; exit 3"), settings);
    REQUIRE(maybe_run.has_value());
    auto& run = *maybe_run.get();
    CHECK(run.status.code == 3);
    CHECK_FALSE(run.status.success());
    CHECK(run.output == "captured\n");
}

TEST_CASE ("working directory and environment", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    RedirectedProcessLaunchSettings settings;
    settings.working_directory.emplace("/");
    Environment environment;
    environment.add_entry("FCOMB_TEST_VALUE", "two words");
    settings.environment.emplace(std::move(environment));
    auto maybe_run = cmd_execute_and_capture_output(
        bdc, Command{"sh"}.string_arg("-c").string_arg("echo \"$(pwd):$FCOMB_TEST_VALUE\""), settings);
    REQUIRE(maybe_run.has_value());
    CHECK(maybe_run.get()->status.code == 0);
    CHECK(maybe_run.get()->output == "/:two words\n");
}

TEST_CASE ("arguments reach the program unchanged", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_run = cmd_execute_and_capture_output(
        bdc,
        Command{"printf"}.string_arg("[%s]").string_arg("a b").string_arg("$HOME").string_arg("").string_arg("'q'"),
        RedirectedProcessLaunchSettings{});
    REQUIRE(maybe_run.has_value());
    CHECK(maybe_run.get()->output == "[a b][$HOME][]['q']");
}

TEST_CASE ("environment entries replace inherited variables", "[system.process]")
{
    set_environment_variable("FCOMB_TEST_INHERITED", "old");
    set_environment_variable("FCOMB_TEST_KEPT", "kept");
    BufferedDiagnosticContext bdc{out_sink};
    RedirectedProcessLaunchSettings settings;
    Environment environment;
    environment.add_entry("FCOMB_TEST_INHERITED", "first");
    environment.add_entry("FCOMB_TEST_INHERITED", "new");
    settings.environment.emplace(std::move(environment));
    auto maybe_run = cmd_execute_and_capture_output(bdc, Command{"env"}, settings);
    set_environment_variable("FCOMB_TEST_INHERITED", nullopt);
    set_environment_variable("FCOMB_TEST_KEPT", nullopt);
    REQUIRE(maybe_run.has_value());
    const StringView output = maybe_run.get()->output;
    CHECK(output.contains("FCOMB_TEST_INHERITED=new\n"));
    CHECK_FALSE(output.contains("FCOMB_TEST_INHERITED=old"));
    CHECK_FALSE(output.contains("FCOMB_TEST_INHERITED=first"));
    CHECK(output.contains("FCOMB_TEST_KEPT=kept\n"));
}

TEST_CASE ("missing program fails to spawn", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_process = cmd_spawn_redirected(
        bdc, Command{"fcomb-test-no-such-program"}.string_arg("check"), RedirectedProcessLaunchSettings{});
    CHECK_FALSE(maybe_process.has_value());
    CHECK(bdc.any_errors());
    CHECK(StringView{bdc.to_string()}.contains("calling posix_spawnp failed with 2"));
}

TEST_CASE ("missing working directory fails to spawn", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    RedirectedProcessLaunchSettings settings;
    settings.working_directory.emplace("/fcomb-test-no-such-directory");
    auto maybe_run = cmd_execute_and_capture_output(bdc, Command{"true"}, settings);
    CHECK_FALSE(maybe_run.has_value());
    CHECK(bdc.any_errors());
}

TEST_CASE ("signal termination has no exit code", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_run = cmd_execute_and_capture_output(
        bdc, Command{"sh"}.string_arg("-c").string_arg("kill -9 $$"), RedirectedProcessLaunchSettings{});
    REQUIRE(maybe_run.has_value());
    CHECK_FALSE(maybe_run.get()->status.code.has_value());
    CHECK(maybe_run.get()->status.signal == 9);
    CHECK_FALSE(maybe_run.get()->status.success());
}

TEST_CASE ("spawned process is read incrementally", "[system.process]")
{
    BufferedDiagnosticContext bdc{out_sink};
    auto maybe_process =
        cmd_spawn_redirected(bdc, Command{"printf"}.string_arg("abc"), RedirectedProcessLaunchSettings{});
    REQUIRE(maybe_process.has_value());
    auto& process = *maybe_process.get();
    std::string output;
    char buffer[2];
    for (;;)
    {
        auto maybe_read_amount = process.read(bdc, buffer, sizeof(buffer));
        REQUIRE(maybe_read_amount.has_value());
        if (*maybe_read_amount.get() == 0)
        {
            break;
        }

        output.append(buffer, *maybe_read_amount.get());
    }

    CHECK(output == "abc");
    auto maybe_status = process.wait_for_termination(bdc);
    REQUIRE(maybe_status.has_value());
    CHECK(maybe_status.get()->success());
    CHECK(bdc.empty());
}
