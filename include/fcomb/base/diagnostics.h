#pragma once

#include <fcomb/base/fwd/diagnostics.h>

#include <fcomb/base/expected.h>
#include <fcomb/base/message_sinks.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/optional.h>

#include <string>
#include <vector>

namespace fcomb
{
    struct TextRowCol
    {
        // '0' indicates that line and column information is unknown; '1' is the first row/column
        int row = 0;
        int column = 0;
    };

    struct DiagnosticLine
    {
        template<class MessageLike, std::enable_if_t<std::is_convertible_v<MessageLike, LocalizedString>, int> = 0>
        DiagnosticLine(DiagKind kind, MessageLike&& message)
            : m_kind(kind), m_origin(), m_position(), m_message(std::forward<MessageLike>(message))
        {
        }

        template<class MessageLike, std::enable_if_t<std::is_convertible_v<MessageLike, LocalizedString>, int> = 0>
        DiagnosticLine(DiagKind kind, StringView origin, MessageLike&& message)
            : m_kind(kind), m_origin(origin.to_string()), m_position(), m_message(std::forward<MessageLike>(message))
        {
            if (origin.empty())
            {
                Checks::unreachable(FCOMB_LINE_INFO, "origin must not be empty");
            }
        }

        template<class MessageLike, std::enable_if_t<std::is_convertible_v<MessageLike, LocalizedString>, int> = 0>
        DiagnosticLine(DiagKind kind, StringView origin, TextRowCol position, MessageLike&& message)
            : m_kind(kind)
            , m_origin(origin.to_string())
            , m_position(position)
            , m_message(std::forward<MessageLike>(message))
        {
            if (origin.empty())
            {
                Checks::unreachable(FCOMB_LINE_INFO, "origin must not be empty");
            }
        }

        // Prints this diagnostic to the supplied sink.
        void print_to(MessageSink& sink) const;
        // Converts this message into a string
        // Prefer print() if possible because it applies color
        std::string to_string() const;
        void to_string(std::string& target) const;

        MessageLine to_message_line() const;

        DiagKind kind() const noexcept { return m_kind; }
        // Returns this DiagnosticLine with kind == Error reduced to Warning.
        DiagnosticLine reduce_to_warning() const&;
        DiagnosticLine reduce_to_warning() &&;

    private:
        struct InternalTag
        {
        };

        DiagnosticLine(
            InternalTag, DiagKind kind, Optional<std::string>&& origin, TextRowCol position, LocalizedString&& message);

        DiagKind m_kind;
        Optional<std::string> m_origin;
        TextRowCol m_position;
        LocalizedString m_message;
    };

    struct DiagnosticContext
    {
        // The `report` family are used to report errors or warnings that may result in a function failing
        // to do what it is intended to do. Data sent to the `report` family is expected to not be printed
        // to the console if a caller decides to handle an error.
        virtual void report(const DiagnosticLine& line) = 0;
        virtual void report(DiagnosticLine&& line);

        void report_error(const LocalizedString& message) { report(DiagnosticLine{DiagKind::Error, message}); }
        void report_error(LocalizedString&& message) { report(DiagnosticLine{DiagKind::Error, std::move(message)}); }
        template<FCOMB_DECL_MSG_TEMPLATE>
        void report_error(FCOMB_DECL_MSG_ARGS)
        {
            LocalizedString message;
            msg::format_to(message, FCOMB_EXPAND_MSG_ARGS);
            this->report_error(std::move(message));
        }

        void report_system_error(StringLiteral system_api_name, int error_value);

        // The `status` family are used to report status or progress information that callers are expected
        // to show on the console, even if it would decide to handle errors or warnings itself.
        virtual void statusln(const LocalizedString& message) = 0;
        virtual void statusln(const MessageLine& message) = 0;

    protected:
        ~DiagnosticContext() = default;
    };

    struct PrintingDiagnosticContext final : DiagnosticContext
    {
        PrintingDiagnosticContext(MessageSink& sink) : sink(sink) { }

        virtual void report(const DiagnosticLine& line) override;
        using DiagnosticContext::report;

        virtual void statusln(const LocalizedString& message) override;
        virtual void statusln(const MessageLine& message) override;

    private:
        MessageSink& sink;
    };

    // Stores all diagnostics into a vector, while passing through status lines to an underlying MessageSink.
    struct BufferedDiagnosticContext final : DiagnosticContext
    {
        BufferedDiagnosticContext(MessageSink& status_sink) : status_sink(status_sink) { }

        virtual void report(const DiagnosticLine& line) override;
        virtual void report(DiagnosticLine&& line) override;

        virtual void statusln(const LocalizedString& message) override;
        virtual void statusln(const MessageLine& message) override;

        MessageSink& status_sink;
        std::vector<DiagnosticLine> lines;

        // Prints all diagnostics to the supplied sink.
        void print_to(MessageSink& sink) const;
        // Converts this message into a string
        // Prefer print() if possible because it applies color
        std::string to_string() const;
        void to_string(std::string& target) const;

        bool any_errors() const noexcept;
        bool empty() const noexcept;
    };

    // Wraps another DiagnosticContext and reduces the severity of any reported diagnostics to warning from error.
    struct WarningDiagnosticContext final : DiagnosticContext
    {
        WarningDiagnosticContext(DiagnosticContext& inner_context) : inner_context(inner_context) { }

        virtual void report(const DiagnosticLine& line) override;
        virtual void report(DiagnosticLine&& line) override;

        virtual void statusln(const LocalizedString& message) override;
        virtual void statusln(const MessageLine& message) override;

        DiagnosticContext& inner_context;
    };
}
