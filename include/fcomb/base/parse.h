#pragma once

#include <fcomb/base/fwd/parse.h>

#include <fcomb/base/diagnostics.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/stringview.h>

#include <string>
#include <vector>

namespace fcomb
{
    struct SourceLoc
    {
        const char* it;
        const char* start_of_line;
        int row;
        int column;
    };

    void append_caret_line(LocalizedString& res, const char* cursor, const char* start_of_line, const char* text_end);

    struct ParseMessages
    {
        bool any_errors() const noexcept { return m_error_count != 0; }

        const std::vector<DiagnosticLine>& lines() const noexcept { return m_lines; }

        void add_line(DiagnosticLine&& line);

        // Reports every line to `context`.
        void report(DiagnosticContext& context) const;

        LocalizedString join() const;

    private:
        std::vector<DiagnosticLine> m_lines;
        size_t m_error_count = 0;
    };

    // Byte oriented recursive descent helper; `cur()` is '\0' at the end of the text.
    struct ParserBase
    {
        ParserBase(StringView text, Optional<StringView> origin, TextRowCol init_rowcol);

        static constexpr bool is_whitespace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }
        static constexpr bool is_ascii_digit(char ch) { return ch >= '0' && ch <= '9'; }
        static constexpr bool is_lineend(char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; }
        static constexpr bool is_hex_digit(char ch)
        {
            return is_ascii_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
        }

        StringView skip_whitespace();
        void skip_to_eof();

        template<class Pred>
        StringView match_while(Pred p)
        {
            const char* start = m_it;
            while (!at_eof() && p(*m_it))
            {
                next();
            }

            return {start, m_it};
        }

        char cur() const { return at_eof() ? '\0' : *m_it; }
        SourceLoc cur_loc() const { return {m_it, m_start_of_line, m_row, m_column}; }
        char next();
        bool at_eof() const { return m_it == m_text.end(); }

        void add_error(LocalizedString&& message);
        void add_error(LocalizedString&& message, const SourceLoc& loc);

        const ParseMessages& messages() const { return m_messages; }

    private:
        void add_line(DiagKind kind, LocalizedString&& message, const SourceLoc& loc);

        const char* m_it;
        const char* m_start_of_line;
        int m_row;
        int m_column;

        StringView m_text;
        Optional<StringView> m_origin;

        ParseMessages m_messages;
    };
}
