#pragma once

#include <fcomb/base/fwd/system.process.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/expected.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/path.h>
#include <fcomb/base/span.h>
#include <fcomb/base/stringview.h>

#include <string>
#include <utility>
#include <vector>

namespace fcomb
{
    void append_shell_escaped(std::string& target, StringView content);

    // A program and its arguments. The program is executed directly, found through PATH when it contains no
    // slash; command_line() is the shell-quoted rendering used in messages.
    struct Command
    {
        Command() = default;
        explicit Command(StringView s) { string_arg(s); }

        Command& string_arg(StringView s) &;
        Command& forwarded_args(View<std::string> args) &;

        Command&& string_arg(StringView s) && { return std::move(string_arg(s)); };
        Command&& forwarded_args(View<std::string> args) && { return std::move(forwarded_args(args)); }

        StringView command_line() const { return buf; }
        const std::vector<std::string>& arguments() const noexcept { return m_args; }

        bool empty() const { return m_args.empty(); }

    private:
        std::string buf;
        std::vector<std::string> m_args;
    };

    // Variables set for a child on top of the inherited environment.
    struct Environment
    {
        void add_entry(StringView key, StringView value);
        const std::vector<std::pair<std::string, std::string>>& entries() const noexcept { return m_entries; }

    private:
        std::vector<std::pair<std::string, std::string>> m_entries;
    };

    struct ExitStatus
    {
        // absent when the child did not exit normally
        Optional<int> code;
        // the terminating signal, or 0
        int signal = 0;

        bool success() const noexcept { return code == 0; }
    };

    struct ExitCodeAndOutput
    {
        ExitStatus status;
        std::string output;
    };

    struct RedirectedProcessLaunchSettings
    {
        Optional<Path> working_directory;
        Optional<Environment> environment;
        RedirectedStream redirected_stream = RedirectedStream::StdOut;
    };

    // A running child whose redirected stream is read incrementally. The child is waited for on destruction if
    // wait_for_termination was never called.
    struct SpawnedProcess
    {
        SpawnedProcess(int pid, int read_fd) noexcept : m_pid(pid), m_read_fd(read_fd) { }
        SpawnedProcess(SpawnedProcess&& other) noexcept;
        SpawnedProcess(const SpawnedProcess&) = delete;
        SpawnedProcess& operator=(const SpawnedProcess&) = delete;
        SpawnedProcess& operator=(SpawnedProcess&&) = delete;
        ~SpawnedProcess();

        // Reads up to `size` bytes of the redirected stream. Returns 0 at the end of the stream, or nullopt after
        // reporting a read failure.
        Optional<size_t> read(DiagnosticContext& context, char* buffer, size_t size);

        Optional<ExitStatus> wait_for_termination(DiagnosticContext& context);

    private:
        int m_pid;
        int m_read_fd;
    };

    Optional<SpawnedProcess> cmd_spawn_redirected(DiagnosticContext& context,
                                                  const Command& cmd,
                                                  const RedirectedProcessLaunchSettings& settings);

    Optional<ExitCodeAndOutput> cmd_execute_and_capture_output(DiagnosticContext& context,
                                                               const Command& cmd,
                                                               const RedirectedProcessLaunchSettings& settings);
}
