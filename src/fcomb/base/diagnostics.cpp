#include <fcomb/base/diagnostics.h>
#include <fcomb/base/message_sinks.h>

#include <string.h>

#include <iterator>

using namespace fcomb;

namespace
{
    static constexpr StringLiteral ColonSpace{": "};

    void append_file_prefix(std::string& target, const Optional<std::string>& maybe_origin, const TextRowCol& position)
    {
        // file:line:col: kind: message
        if (auto origin = maybe_origin.get())
        {
            target.append(*origin);
            if (position.row)
            {
                fmt::format_to(std::back_inserter(target), ":{}", position.row);

                if (position.column)
                {
                    fmt::format_to(std::back_inserter(target), ":{}", position.column);
                }
            }

            target.append(ColonSpace.data(), ColonSpace.size());
        }
    }

    void append_kind_prefix(std::string& target, DiagKind kind)
    {
        static constexpr StringLiteral Empty{""};
        static constexpr const StringLiteral* prefixes[] = {
            &Empty, &MessagePrefix, &ErrorPrefix, &WarningPrefix, &NotePrefix};
        static_assert(std::size(prefixes) == static_cast<unsigned int>(DiagKind::COUNT));

        const auto diag_index = static_cast<unsigned int>(kind);
        if (diag_index >= static_cast<unsigned int>(DiagKind::COUNT))
        {
            Checks::unreachable(FCOMB_LINE_INFO);
        }

        const auto prefix = prefixes[diag_index];
        target.append(prefix->data(), prefix->size());
    }
}

namespace fcomb
{
    void DiagnosticContext::report(DiagnosticLine&& line) { report(line); }

    void DiagnosticContext::report_system_error(StringLiteral system_api_name, int error_value)
    {
        report_error(msgSystemApiErrorMessage,
                     msg::system_api = system_api_name,
                     msg::exit_code = error_value,
                     msg::error_msg = ::strerror(error_value));
    }

    void DiagnosticLine::print_to(MessageSink& sink) const { sink.println(to_message_line()); }
    std::string DiagnosticLine::to_string() const
    {
        std::string result;
        this->to_string(result);
        return result;
    }
    void DiagnosticLine::to_string(std::string& target) const
    {
        append_file_prefix(target, m_origin, m_position);
        append_kind_prefix(target, m_kind);
        target.append(m_message.data());
    }

    MessageLine DiagnosticLine::to_message_line() const
    {
        MessageLine ret;
        {
            std::string file_prefix;
            append_file_prefix(file_prefix, m_origin, m_position);
            ret.print(file_prefix);
        }
        switch (m_kind)
        {
            case DiagKind::None:
                // intentionally blank
                break;
            case DiagKind::Message: ret.print(MessagePrefix); break;
            case DiagKind::Error:
            {
                ret.print(Color::error, "error");
                ret.print(ColonSpace);
            }
            break;
            case DiagKind::Warning:
            {
                ret.print(Color::warning, "warning");
                ret.print(ColonSpace);
            }
            break;
            case DiagKind::Note: ret.print(NotePrefix); break;
            default: Checks::unreachable(FCOMB_LINE_INFO);
        }

        ret.print(m_message);
        return ret;
    }

    DiagnosticLine DiagnosticLine::reduce_to_warning() const&
    {
        return DiagnosticLine{InternalTag{},
                              m_kind == DiagKind::Error ? DiagKind::Warning : m_kind,
                              Optional<std::string>{m_origin},
                              m_position,
                              LocalizedString{m_message}};
    }
    DiagnosticLine DiagnosticLine::reduce_to_warning() &&
    {
        return DiagnosticLine{InternalTag{},
                              m_kind == DiagKind::Error ? DiagKind::Warning : m_kind,
                              std::move(m_origin),
                              m_position,
                              std::move(m_message)};
    }

    DiagnosticLine::DiagnosticLine(
        InternalTag, DiagKind kind, Optional<std::string>&& origin, TextRowCol position, LocalizedString&& message)
        : m_kind(kind), m_origin(std::move(origin)), m_position(position), m_message(std::move(message))
    {
    }

    void PrintingDiagnosticContext::report(const DiagnosticLine& line) { line.print_to(sink); }

    void PrintingDiagnosticContext::statusln(const LocalizedString& message) { sink.println(message); }
    void PrintingDiagnosticContext::statusln(const MessageLine& message) { sink.println(message); }

    void BufferedDiagnosticContext::report(const DiagnosticLine& line) { lines.push_back(line); }
    void BufferedDiagnosticContext::report(DiagnosticLine&& line) { lines.push_back(std::move(line)); }
    void BufferedDiagnosticContext::statusln(const LocalizedString& message) { status_sink.println(message); }
    void BufferedDiagnosticContext::statusln(const MessageLine& message) { status_sink.println(message); }

    void BufferedDiagnosticContext::print_to(MessageSink& sink) const
    {
        for (auto&& line : lines)
        {
            line.print_to(sink);
        }
    }

    std::string BufferedDiagnosticContext::to_string() const
    {
        std::string result;
        this->to_string(result);
        return result;
    }

    void BufferedDiagnosticContext::to_string(std::string& target) const
    {
        auto first = lines.begin();
        const auto last = lines.end();
        if (first == last)
        {
            return;
        }

        for (;;)
        {
            first->to_string(target);
            if (++first == last)
            {
                return;
            }

            target.push_back('\n');
        }
    }

    bool BufferedDiagnosticContext::any_errors() const noexcept
    {
        for (auto&& line : lines)
        {
            if (line.kind() == DiagKind::Error)
            {
                return true;
            }
        }

        return false;
    }

    bool BufferedDiagnosticContext::empty() const noexcept { return lines.empty(); }

    void WarningDiagnosticContext::report(const DiagnosticLine& line)
    {
        inner_context.report(line.reduce_to_warning());
    }
    void WarningDiagnosticContext::report(DiagnosticLine&& line)
    {
        inner_context.report(std::move(line).reduce_to_warning());
    }

    void WarningDiagnosticContext::statusln(const LocalizedString& message) { inner_context.statusln(message); }
    void WarningDiagnosticContext::statusln(const MessageLine& message) { inner_context.statusln(message); }
}

namespace
{
    struct NullDiagnosticContext final : DiagnosticContext
    {
        // these are all intentionally empty
        virtual void report(const DiagnosticLine&) override { }
        virtual void statusln(const LocalizedString&) override { }
        virtual void statusln(const MessageLine&) override { }
    };

    NullDiagnosticContext null_diagnostic_context_instance;
    PrintingDiagnosticContext stderr_diagnostic_context_instance{stderr_sink};
}

namespace fcomb
{
    DiagnosticContext& null_diagnostic_context = null_diagnostic_context_instance;
    DiagnosticContext& stderr_diagnostic_context = stderr_diagnostic_context_instance;
}
