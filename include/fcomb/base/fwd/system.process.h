#pragma once

namespace fcomb
{
    // Which standard stream of a child is redirected into a pipe; the other one is inherited.
    enum class RedirectedStream
    {
        StdOut,
        StdErr,
    };

    struct Command;
    struct Environment;
    struct ExitStatus;
    struct ExitCodeAndOutput;
    struct RedirectedProcessLaunchSettings;
    struct SpawnedProcess;
}
