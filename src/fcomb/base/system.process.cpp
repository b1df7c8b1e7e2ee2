#include <fcomb/base/chrono.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/strings.h>
#include <fcomb/base/system.debug.h>
#include <fcomb/base/system.process.h>

#include <errno.h>
#include <fcntl.h>
#include <spawn.h>
#include <stdio.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <utility>
#include <vector>

extern char** environ;

namespace
{
    using namespace fcomb;

    std::atomic<int> g_debug_id(0);

    void close_mark_invalid(int& fd) noexcept
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    struct AnonymousPipe
    {
        // pipefd[0] is the read end of the pipe, pipefd[1] is the write end
        int pipefd[2];

        AnonymousPipe() : pipefd{-1, -1} { }
        AnonymousPipe(const AnonymousPipe&) = delete;
        AnonymousPipe& operator=(const AnonymousPipe&) = delete;
        ~AnonymousPipe()
        {
            for (size_t idx = 0; idx < 2; ++idx)
            {
                close_mark_invalid(pipefd[idx]);
            }
        }

        bool create(DiagnosticContext& context)
        {
            if (pipe2(pipefd, O_CLOEXEC))
            {
                context.report_system_error("pipe2", errno);
                return false;
            }

            return true;
        }
    };

    struct PosixSpawnFileActions
    {
        posix_spawn_file_actions_t actions;

        PosixSpawnFileActions() { Checks::check_exit(FCOMB_LINE_INFO, posix_spawn_file_actions_init(&actions) == 0); }

        ~PosixSpawnFileActions()
        {
            Checks::check_exit(FCOMB_LINE_INFO, posix_spawn_file_actions_destroy(&actions) == 0);
        }

        PosixSpawnFileActions(const PosixSpawnFileActions&) = delete;
        PosixSpawnFileActions& operator=(const PosixSpawnFileActions&) = delete;

        bool adddup2(DiagnosticContext& context, int fd, int newfd)
        {
            const int error = posix_spawn_file_actions_adddup2(&actions, fd, newfd);
            if (error)
            {
                context.report_system_error("posix_spawn_file_actions_adddup2", error);
                return false;
            }

            return true;
        }

        bool addchdir(DiagnosticContext& context, const Path& directory)
        {
            const int error = posix_spawn_file_actions_addchdir_np(&actions, directory.c_str());
            if (error)
            {
                context.report_system_error("posix_spawn_file_actions_addchdir_np", error);
                return false;
            }

            return true;
        }
    };

    // The inherited environment with every variable named in `overrides` replaced.
    std::vector<std::string> merged_environment(const Environment& overrides)
    {
        std::vector<std::string> result;
        for (char** entry = environ; *entry; ++entry)
        {
            StringView current{*entry};
            const auto equals = Strings::find_first_of(current, "=");
            const StringView key{current.begin(), equals};
            bool overridden = false;
            for (auto&& kv : overrides.entries())
            {
                if (key == kv.first)
                {
                    overridden = true;
                    break;
                }
            }

            if (!overridden)
            {
                result.emplace_back(*entry);
            }
        }

        for (auto&& kv : overrides.entries())
        {
            result.push_back(Strings::concat(kv.first, '=', kv.second));
        }

        return result;
    }

    std::vector<char*> to_null_terminated(std::vector<std::string>& strings)
    {
        std::vector<char*> result;
        result.reserve(strings.size() + 1);
        for (std::string& str : strings)
        {
            result.emplace_back(&str[0]);
        }

        result.emplace_back(nullptr);
        return result;
    }

    Optional<ExitStatus> wait_for_pid(DiagnosticContext& context, pid_t pid)
    {
        int status;
        pid_t child;
        do
        {
            child = waitpid(pid, &status, 0);
        } while (child == -1 && errno == EINTR);
        if (child != pid)
        {
            context.report_system_error("waitpid", errno);
            return nullopt;
        }

        ExitStatus result;
        if (WIFEXITED(status))
        {
            result.code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            result.signal = WTERMSIG(status);
        }

        return result;
    }
} // unnamed namespace

namespace fcomb
{
    void append_shell_escaped(std::string& target, StringView content)
    {
        if (content.empty())
        {
            target.append("\"\"");
        }
        else if (Strings::find_first_of(content, " \t\n\r\"\\`$,;&^|'()<>*?[]#~=!{}") != content.end())
        {
            // `\` is the escape character and always requires doubling. Inner double-quotes must be escaped.
            // Additionally, '`' and '$' must be escaped or they will retain their special meaning in the shell.
            target.push_back('"');
            for (auto ch : content)
            {
                if (ch == '\\' || ch == '"' || ch == '`' || ch == '$') target.push_back('\\');
                target.push_back(ch);
            }
            target.push_back('"');
        }
        else
        {
            target.append(content.data(), content.size());
        }
    }

    Command& Command::string_arg(StringView s) &
    {
        if (!buf.empty()) buf.push_back(' ');
        append_shell_escaped(buf, s);
        m_args.emplace_back(s.data(), s.size());
        return *this;
    }

    Command& Command::forwarded_args(View<std::string> args) &
    {
        for (auto&& arg : args)
        {
            string_arg(arg);
        }

        return *this;
    }

    void Environment::add_entry(StringView key, StringView value)
    {
        for (auto&& kv : m_entries)
        {
            if (key == kv.first)
            {
                kv.second.assign(value.data(), value.size());
                return;
            }
        }

        m_entries.emplace_back(key.to_string(), value.to_string());
    }

    SpawnedProcess::SpawnedProcess(SpawnedProcess&& other) noexcept
        : m_pid(std::exchange(other.m_pid, -1)), m_read_fd(std::exchange(other.m_read_fd, -1))
    {
    }

    SpawnedProcess::~SpawnedProcess()
    {
        close_mark_invalid(m_read_fd);
        if (m_pid != -1)
        {
            (void)wait_for_pid(null_diagnostic_context, m_pid);
        }
    }

    Optional<size_t> SpawnedProcess::read(DiagnosticContext& context, char* buffer, size_t size)
    {
        if (m_read_fd < 0)
        {
            return size_t{0};
        }

        for (;;)
        {
            auto read_amount = ::read(m_read_fd, buffer, size);
            if (read_amount >= 0)
            {
                if (read_amount == 0)
                {
                    close_mark_invalid(m_read_fd);
                }

                return static_cast<size_t>(read_amount);
            }

            if (errno == EINTR)
            {
                continue;
            }

            context.report_system_error("read", errno);
            close_mark_invalid(m_read_fd);
            return nullopt;
        }
    }

    Optional<ExitStatus> SpawnedProcess::wait_for_termination(DiagnosticContext& context)
    {
        close_mark_invalid(m_read_fd);
        if (m_pid == -1)
        {
            Checks::unreachable(FCOMB_LINE_INFO, "the process was already waited for");
        }

        auto result = wait_for_pid(context, m_pid);
        m_pid = -1;
        return result;
    }

    Optional<SpawnedProcess> cmd_spawn_redirected(DiagnosticContext& context,
                                                  const Command& cmd,
                                                  const RedirectedProcessLaunchSettings& settings)
    {
        if (cmd.empty())
        {
            Checks::unreachable(FCOMB_LINE_INFO, "attempted to launch an empty command");
        }

        const auto debug_id = g_debug_id.fetch_add(1);
        std::string display_line;
        if (auto wd = settings.working_directory.get())
        {
            display_line.append("cd ");
            append_shell_escaped(display_line, *wd);
            display_line.append(" && ");
        }

        if (auto env = settings.environment.get())
        {
            for (auto&& kv : env->entries())
            {
                Strings::append(display_line, kv.first, '=');
                append_shell_escaped(display_line, kv.second);
                display_line.push_back(' ');
            }
        }

        const auto unwrapped_to_execute = cmd.command_line();
        display_line.append(unwrapped_to_execute.data(), unwrapped_to_execute.size());

        Debug::print(fmt::format("{}: execute_process({})\n", debug_id, display_line));
        // Flush stdout before launching external process
        fflush(stdout);

        AnonymousPipe child_output;
        if (!child_output.create(context))
        {
            return nullopt;
        }

        const int redirected_fd = settings.redirected_stream == RedirectedStream::StdErr ? 2 : 1;
        PosixSpawnFileActions actions;
        if (!actions.adddup2(context, child_output.pipefd[1], redirected_fd))
        {
            return nullopt;
        }

        if (auto wd = settings.working_directory.get())
        {
            if (!actions.addchdir(context, *wd))
            {
                return nullopt;
            }
        }

        std::vector<std::string> argv_builder = cmd.arguments();
        auto argv = to_null_terminated(argv_builder);

        std::vector<std::string> envp_builder;
        std::vector<char*> envp;
        char** child_environment = environ;
        if (auto env = settings.environment.get())
        {
            envp_builder = merged_environment(*env);
            envp = to_null_terminated(envp_builder);
            child_environment = envp.data();
        }

        // glibc reports exec failures, such as a program missing from PATH, as the return value here
        pid_t pid;
        int error = posix_spawnp(&pid, argv[0], &actions.actions, nullptr, argv.data(), child_environment);
        if (error)
        {
            context.report_system_error("posix_spawnp", error);
            return nullopt;
        }

        close_mark_invalid(child_output.pipefd[1]);
        return SpawnedProcess{pid, std::exchange(child_output.pipefd[0], -1)};
    }

    Optional<ExitCodeAndOutput> cmd_execute_and_capture_output(DiagnosticContext& context,
                                                               const Command& cmd,
                                                               const RedirectedProcessLaunchSettings& settings)
    {
        ElapsedTimer timer;
        auto maybe_process = cmd_spawn_redirected(context, cmd, settings);
        auto process = maybe_process.get();
        if (!process)
        {
            return nullopt;
        }

        std::string output;
        char buf[1024];
        bool read_failed = false;
        for (;;)
        {
            auto maybe_read_amount = process->read(context, buf, sizeof(buf));
            auto read_amount = maybe_read_amount.get();
            if (!read_amount)
            {
                read_failed = true;
                break;
            }

            if (*read_amount == 0)
            {
                break;
            }

            output.append(buf, *read_amount);
        }

        auto maybe_status = process->wait_for_termination(context);
        auto status = maybe_status.get();
        if (!status || read_failed)
        {
            return nullopt;
        }

        Debug::print(fmt::format("cmd_execute_and_capture_output() returned {} after {}\n",
                                 status->code.value_or(-1),
                                 timer.elapsed()));
        return ExitCodeAndOutput{std::move(*status), std::move(output)};
    }
}
