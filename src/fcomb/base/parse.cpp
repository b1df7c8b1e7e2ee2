#include <fcomb/base/checks.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/parse.h>

#include <algorithm>
#include <utility>

namespace fcomb
{
    static void advance_rowcol(char ch, int& row, int& column)
    {
        if (row == 0)
        {
            if (column != 0)
            {
                ++column;
            }

            return;
        }

        if (ch == '\t')
        {
            column = ((column + 7) & ~7) + 1; // round to next 8-width tab stop
        }
        else if (ch == '\n')
        {
            row++;
            column = 1;
        }
        else
        {
            ++column;
        }
    }

    void append_caret_line(LocalizedString& res, const char* cursor, const char* start_of_line, const char* text_end)
    {
        auto line_end = std::find_if(cursor, text_end, ParserBase::is_lineend);
        StringView line{start_of_line, line_end};

        LocalizedString line_prefix = msg::format(msgFormattedParseMessageExpressionPrefix);
        const size_t line_prefix_space = line_prefix.data().size() + 1; // for the space after the prefix

        res.append_indent().append(line_prefix).append_raw(' ').append_raw(line).append_raw('\n');

        std::string caret_string;
        caret_string.append(line_prefix_space, ' ');
        // note *cursor is excluded because it is where the ^ goes
        for (auto it = start_of_line; it != cursor; ++it)
        {
            caret_string.push_back(*it == '\t' ? '\t' : ' ');
        }

        caret_string.push_back('^');

        res.append_indent().append_raw(caret_string);
    }

    void ParseMessages::add_line(DiagnosticLine&& line)
    {
        switch (line.kind())
        {
            case DiagKind::Error: ++m_error_count; break;
            case DiagKind::Warning:
            case DiagKind::None:
            case DiagKind::Message:
            case DiagKind::Note: break;
            default: Checks::unreachable(FCOMB_LINE_INFO);
        }

        m_lines.push_back(std::move(line));
    }

    void ParseMessages::report(DiagnosticContext& context) const
    {
        for (auto&& line : m_lines)
        {
            context.report(line);
        }
    }

    LocalizedString ParseMessages::join() const
    {
        std::string combined_messages;
        auto first = m_lines.begin();
        const auto last = m_lines.end();
        if (first != last)
        {
            first->to_string(combined_messages);
            while (++first != last)
            {
                combined_messages.push_back('\n');
                first->to_string(combined_messages);
            }
        }

        return LocalizedString::from_raw(std::move(combined_messages));
    }

    ParserBase::ParserBase(StringView text, Optional<StringView> origin, TextRowCol init_rowcol)
        : m_it(text.begin())
        , m_start_of_line(text.begin())
        , m_row(init_rowcol.row)
        , m_column(init_rowcol.column)
        , m_text(text)
        , m_origin(origin)
    {
        if (auto check_origin = origin.get())
        {
            if (check_origin->empty())
            {
                m_origin.clear();
            }
        }
    }

    StringView ParserBase::skip_whitespace() { return match_while(is_whitespace); }

    void ParserBase::skip_to_eof() { m_it = m_text.end(); }

    char ParserBase::next()
    {
        if (at_eof())
        {
            return '\0';
        }

        auto ch = *m_it;
        // See https://www.gnu.org/prep/standards/standards.html#Errors
        advance_rowcol(ch, m_row, m_column);

        ++m_it;
        if (ch == '\n')
        {
            m_start_of_line = m_it;
        }

        return cur();
    }

    void ParserBase::add_error(LocalizedString&& message) { add_error(std::move(message), cur_loc()); }

    void ParserBase::add_error(LocalizedString&& message, const SourceLoc& loc)
    {
        // avoid cascading errors by only saving the first
        if (!m_messages.any_errors())
        {
            add_line(DiagKind::Error, std::move(message), loc);
        }

        // Avoid error loops by skipping to the end
        skip_to_eof();
    }

    void ParserBase::add_line(DiagKind kind, LocalizedString&& message, const SourceLoc& loc)
    {
        message.append_raw('\n');
        append_caret_line(message, loc.it, loc.start_of_line, m_text.end());
        if (auto origin = m_origin.get())
        {
            m_messages.add_line(DiagnosticLine{kind, *origin, TextRowCol{loc.row, loc.column}, std::move(message)});
        }
        else
        {
            m_messages.add_line(DiagnosticLine{kind, std::move(message)});
        }
    }
}
