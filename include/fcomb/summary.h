#pragma once

#include <fcomb/base/fwd/message_sinks.h>

#include <fcomb/base/chrono.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/span.h>

#include <fcomb/featureset.h>

#include <stddef.h>

#include <string>

namespace fcomb
{
    // The result of building one package with one feature set.
    struct RunOutcome
    {
        std::string package_name;
        FeatureSet features;
        // absent when cargo did not exit normally
        Optional<int> exit_code;
        // absent when cargo's output could not be read
        Optional<size_t> warnings;
        Optional<size_t> errors;
        bool pedantic_success = false;
    };

    // A run fails when cargo fails, or in pedantic mode when cargo reported any warning or error.
    bool is_pedantic_success(bool cargo_succeeded, Optional<size_t> warnings, Optional<size_t> errors, bool pedantic);

    // "    Finished " and the like: a status word right aligned to cargo's 12 columns, plus a space.
    std::string format_status(const LocalizedString& status);

    // The exit code of the first outcome that is not a pedantic success, or 0. An outcome without an exit code,
    // or whose exit code is 0, maps to 1.
    int summary_exit_code(View<RunOutcome> outcomes);

    // Prints the totals and one PASS, WARN or FAIL line per outcome; returns summary_exit_code(outcomes).
    int print_summary(MessageSink& sink, View<RunOutcome> outcomes, const ElapsedTime& elapsed);
}
