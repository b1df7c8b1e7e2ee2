#pragma once

#include <fcomb/base/fwd/diagnostics.h>
#include <fcomb/base/fwd/message_sinks.h>

#include <fcomb/base/optional.h>
#include <fcomb/base/path.h>
#include <fcomb/base/span.h>
#include <fcomb/base/stringview.h>

#include <string>
#include <vector>

namespace fcomb
{
    enum class Subcommand
    {
        Run,
        Matrix,
        Help,
    };

    // Whether any of `args` equals `arg` or starts with "`arg`=".
    bool contains_argument(View<std::string> args, StringView arg);

    // The arguments cargo-fc was invoked with. Options belonging to cargo-fc are extracted; whatever remains is
    // forwarded to cargo.
    struct Args
    {
        Args() = default;
        explicit Args(std::vector<std::string>&& args) : args(std::move(args)) { }

        // Skips the program name and the "fc" token cargo inserts when running `cargo fc`.
        static Args from_command_line(int argc, const char* const* argv);

        // Removes every occurrence of the flag `arg` before "--". Returns true if there was at least one.
        bool extract_switch(StringView arg);

        // Removes every occurrence of the option `arg` before "--", written as "`arg` value" or "`arg`=value", and
        // returns the values in order of appearance. Returns nullopt after reporting an error if `arg` is the last
        // argument before "--" or the end.
        Optional<std::vector<std::string>> extract_option(DiagnosticContext& context, StringView arg);

        std::vector<std::string> args;
    };

    struct Options
    {
        Optional<Path> manifest_path;
        std::vector<std::string> packages;
        std::vector<std::string> exclude_packages;
        Subcommand subcommand = Subcommand::Run;
        bool pretty = false;
        bool packages_only = false;
        bool silent = false;
        bool verbose = false;
        bool pedantic = false;
        bool errors_only = false;
        bool fail_fast = false;
    };

    // Extracts cargo-fc's options from `args`. Returns nullopt if any of them was malformed.
    Optional<Options> parse_options(DiagnosticContext& context, Args& args);

    void print_help(MessageSink& sink);
}
