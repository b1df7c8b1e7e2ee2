#pragma once

#include <fcomb/base/fwd/stringview.h>

#include <string>

namespace fcomb
{
    enum class Color : char
    {
        none = 0,
        success = '2', // [with 9] bright green
        error = '1',   // [with 9] bright red
        warning = '3', // [with 9] bright yellow
        info = '6',    // [with 9] bright cyan
    };

    enum class OutputStream
    {
        StdOut,
        StdErr,
    };

    struct LocalizedString;
    struct MessageSink;

    namespace msg
    {
        template<class... Tags>
        struct MessageT;

        template<class Tag, class Type>
        struct TagArg;
    }
}

namespace fcomb::msg
{
    extern OutputStream default_output_stream;
    void write_unlocalized_text_to_stderr(Color c, fcomb::StringView sv);

    // Appends sv to into, wrapped in the color sequences for c when stream is a terminal.
    void append_colored_text(std::string& into, OutputStream stream, Color c, fcomb::StringView sv);
    // Writes sv to stream with a single write call where possible.
    void write_raw_text(OutputStream stream, fcomb::StringView sv);
}
