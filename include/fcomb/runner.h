#pragma once

#include <fcomb/base/fwd/diagnostics.h>
#include <fcomb/base/fwd/message_sinks.h>

#include <fcomb/base/messages.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/span.h>
#include <fcomb/base/stringview.h>

#include <fcomb/cmdarguments.h>
#include <fcomb/featureset.h>
#include <fcomb/tee.h>
#include <fcomb/workspace.h>

#include <string>
#include <vector>

namespace fcomb
{
    struct CargoInvocation
    {
        // the arguments before "--", with "--color always" added unless a color was requested
        std::vector<std::string> cargo_args;
        // "--" and everything after it
        std::vector<std::string> extra_args;
        // cargo-fc was invoked without any arguments for cargo
        bool missing_arguments = false;
    };

    CargoInvocation split_cargo_arguments(std::vector<std::string>&& args);

    std::vector<std::string> combination_arguments(const CargoInvocation& invocation, const FeatureSet& features);

    // "Building", "Checking", "Testing" or "Running", after the cargo subcommand found in `cargo_args`.
    LocalizedString status_for_arguments(View<std::string> cargo_args);

    // The line printed before each cargo invocation; `args` is appended only when `verbose`.
    MessageLine package_line(const LocalizedString& status,
                             StringView package_name,
                             const FeatureSet& features,
                             View<std::string> args,
                             bool verbose);

    // Runs `cargo` once per package and feature combination, then prints the summary to `sink`. Cargo's output
    // is mirrored to `cargo_output` as it arrives, or, when silent, written there only for the combination that
    // stopped a fail-fast run. Returns the exit code for the whole invocation, or nullopt after reporting an error
    // that prevented the run.
    Optional<int> run_cargo_command(DiagnosticContext& context,
                                    MessageSink& sink,
                                    OutputWriter& cargo_output,
                                    StringView cargo,
                                    View<ConfiguredPackage> packages,
                                    std::vector<std::string>&& args,
                                    const Options& options);
}
