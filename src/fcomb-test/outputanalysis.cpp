#include <fcomb-test/util.h>

#include <fcomb/outputanalysis.h>

using namespace fcomb;

TEST_CASE ("strip ansi escapes", "[outputanalysis]")
{
    CHECK(strip_ansi_escapes("plain text") == "plain text");
    CHECK(strip_ansi_escapes("\x1b[0m\x1b[1m\x1b[33mwarning\x1b[0m\x1b[1m: unused\x1b[0m") == "warning: unused");
    CHECK(strip_ansi_escapes("\x1b[38;5;12m-->\x1b[0m src/lib.rs") == "--> src/lib.rs");
    CHECK(strip_ansi_escapes("\x1b]8;;https://example.com\x07link\x1b]8;;\x1b\\ done") == "link done");
    CHECK(strip_ansi_escapes("\x1b(Bcharset") == "charset");
    CHECK(strip_ansi_escapes("truncated \x1b[1") == "truncated ");
    CHECK(strip_ansi_escapes("") == "");
}

TEST_CASE ("warning counts", "[outputanalysis]")
{
    static constexpr StringLiteral output = R"(   Compiling app v0.1.0 (/ws/app)
warning: unused variable: `x`
 --> src/lib.rs:2:9
  |
2 |     let x = 1;
  |         ^ help: if this is intentional, prefix it with an underscore: `_x`
warning: `core` (lib) generated 6 warnings
warning: `app` (lib) generated 7 warnings (run `cargo fix --lib -p app` to apply 2 suggestions)
warning: `app` (lib test) generated 1 warning
    Finished dev [unoptimized + debuginfo] target(s) in 0.52s
)";

    CHECK(warning_counts(output) == std::vector<size_t>{6, 7, 1});
    CHECK(error_counts(output).empty());
    const auto counts = count_diagnostics(output);
    CHECK(counts.warnings == 14);
    CHECK(counts.errors == 0);
}

TEST_CASE ("error counts", "[outputanalysis]")
{
    SECTION ("with counts")
    {
        static constexpr StringLiteral output = R"(error[E0425]: cannot find value `y` in this scope
error: could not compile `app` due to 2 previous errors
error: could not compile `cli` due to 3 previous errors; 1 warning emitted
)";
        CHECK(error_counts(output) == std::vector<size_t>{2, 3});
        CHECK(count_diagnostics(output).errors == 5);
    }

    SECTION ("single error without a count")
    {
        static constexpr StringLiteral output = "error: could not compile `app` due to previous error\n";
        CHECK(error_counts(output) == std::vector<size_t>{1});
    }

    SECTION ("with the target named")
    {
        static constexpr StringLiteral output = R"(error: could not compile `app` (lib) due to 4 previous errors
error: could not compile `app` (lib test) due to 1 previous error; 2 warnings emitted
error: could not compile `cli` (bin "cli") due to previous error
)";
        CHECK(error_counts(output) == std::vector<size_t>{4, 1, 1});
        CHECK(count_diagnostics(output).errors == 6);
    }
}

TEST_CASE ("count colored diagnostics", "[outputanalysis]")
{
    static constexpr StringLiteral output =
        "\x1b[0m\x1b[1m\x1b[33mwarning\x1b[0m\x1b[0m\x1b[1m: `app` (lib) generated 13 warnings\x1b[0m\n"
        "\x1b[0m\x1b[1m\x1b[31merror\x1b[0m\x1b[0m\x1b[1m: could not compile `app` due to 2 previous errors\x1b[0m\n";
    const auto counts = count_diagnostics(output);
    CHECK(counts.warnings == 13);
    CHECK(counts.errors == 2);
}

TEST_CASE ("no diagnostics", "[outputanalysis]")
{
    const auto counts = count_diagnostics("    Finished dev [unoptimized + debuginfo] target(s) in 0.01s\n");
    CHECK(counts.warnings == 0);
    CHECK(counts.errors == 0);
}
