#pragma once

namespace fcomb
{
    struct MessageLineSegment;
    struct MessageLine;
    struct MessageSink;
    struct BufferedMessageSink;

    extern MessageSink& null_sink;
    extern MessageSink& out_sink;
    extern MessageSink& stdout_sink;
    extern MessageSink& stderr_sink;
}
