#include <fcomb/base/message_sinks.h>

namespace
{
    using namespace fcomb;

    struct NullMessageSink final : MessageSink
    {
        virtual void println(const MessageLine&) override { }
        virtual void println(const LocalizedString&) override { }
        virtual void println(Color, const LocalizedString&) override { }
    };

    NullMessageSink null_sink_instance;

    // Renders the whole line, colors included, so that it reaches the terminal in one write.
    void write_line(OutputStream stream, const MessageLine& line)
    {
        std::string rendered;
        for (auto&& segment : line.get_segments())
        {
            msg::append_colored_text(rendered, stream, segment.color, segment.text);
        }

        rendered.push_back('\n');
        msg::write_raw_text(stream, rendered);
    }

    struct OutMessageSink final : MessageSink
    {
        virtual void println(const MessageLine& line) override { write_line(msg::default_output_stream, line); }
    };

    OutMessageSink out_sink_instance;

    struct StdOutMessageSink final : MessageSink
    {
        virtual void println(const MessageLine& line) override { write_line(OutputStream::StdOut, line); }
    };

    StdOutMessageSink stdout_sink_instance;

    struct StdErrMessageSink final : MessageSink
    {
        virtual void println(const MessageLine& line) override { write_line(OutputStream::StdErr, line); }
    };

    StdErrMessageSink stderr_sink_instance;
}

namespace fcomb
{
    MessageLine::MessageLine(const LocalizedString& ls) { segments.push_back({Color::none, ls.data()}); }
    MessageLine::MessageLine(LocalizedString&& ls) { segments.push_back({Color::none, ls.extract_data()}); }
    void MessageLine::print(Color color, StringView text)
    {
        if (!segments.empty() && segments.back().color == color)
        {
            segments.back().text.append(text.data(), text.size());
        }
        else
        {
            segments.push_back({color, text.to_string()});
        }
    }
    void MessageLine::print(StringView text) { print(Color::none, text); }
    const std::vector<MessageLineSegment>& MessageLine::get_segments() const noexcept { return segments; }

    std::string MessageLine::to_string() const
    {
        std::string result;
        to_string(result);
        return result;
    }
    void MessageLine::to_string(std::string& target) const
    {
        for (auto&& segment : segments)
        {
            target.append(segment.text);
        }
    }

    void MessageSink::println(const LocalizedString& s) { this->println(MessageLine(s)); }

    void MessageSink::println(Color c, const LocalizedString& s)
    {
        MessageLine line;
        line.print(c, s);
        this->println(line);
    }

    void BufferedMessageSink::println(const MessageLine& line) { m_lines.push_back(line); }

    std::string BufferedMessageSink::to_string() const
    {
        std::string result;
        for (auto&& line : m_lines)
        {
            line.to_string(result);
            result.push_back('\n');
        }

        return result;
    }

    void BufferedMessageSink::print_to(MessageSink& sink) const
    {
        for (auto&& line : m_lines)
        {
            sink.println(line);
        }
    }

    MessageSink& null_sink = null_sink_instance;
    MessageSink& out_sink = out_sink_instance;
    MessageSink& stdout_sink = stdout_sink_instance;
    MessageSink& stderr_sink = stderr_sink_instance;
}
