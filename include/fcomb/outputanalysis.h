#pragma once

#include <fcomb/base/stringview.h>

#include <stddef.h>

#include <string>
#include <vector>

namespace fcomb
{
    // Removes terminal control sequences (CSI, OSC and other escape sequences) from captured output.
    std::string strip_ansi_escapes(StringView text);

    // The N of every "warning: `crate` (lib) generated N warnings" line.
    std::vector<size_t> warning_counts(StringView text);

    // The N of every "error: could not compile `crate` due to N previous errors" line; 1 when N is omitted.
    std::vector<size_t> error_counts(StringView text);

    struct DiagnosticCounts
    {
        size_t warnings = 0;
        size_t errors = 0;
    };

    // Sums warning_counts and error_counts of text with its escape sequences removed.
    DiagnosticCounts count_diagnostics(StringView colored_text);
}
