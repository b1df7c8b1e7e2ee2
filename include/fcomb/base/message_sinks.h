#pragma once

#include <fcomb/base/fwd/message_sinks.h>

#include <fcomb/base/messages.h>

#include <string>
#include <vector>

namespace fcomb
{
    struct MessageLineSegment
    {
        Color color;
        std::string text;
    };

    struct MessageLine
    {
        MessageLine() = default;
        MessageLine(const MessageLine&) = default;
        MessageLine(MessageLine&&) = default;

        explicit MessageLine(const LocalizedString& ls);
        explicit MessageLine(LocalizedString&& ls);

        void print(Color color, StringView text);
        void print(StringView text);
        const std::vector<MessageLineSegment>& get_segments() const noexcept;

        std::string to_string() const;
        void to_string(std::string& target) const;

    private:
        std::vector<MessageLineSegment> segments;
    };

    struct MessageSink
    {
        virtual void println(const MessageLine& line) = 0;

        virtual void println(const LocalizedString& s);
        virtual void println(Color c, const LocalizedString& s);

        template<FCOMB_DECL_MSG_TEMPLATE>
        void println(FCOMB_DECL_MSG_ARGS)
        {
            this->println(msg::format(FCOMB_EXPAND_MSG_ARGS));
        }

        template<FCOMB_DECL_MSG_TEMPLATE>
        void println(Color c, FCOMB_DECL_MSG_ARGS)
        {
            this->println(c, msg::format(FCOMB_EXPAND_MSG_ARGS));
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };

    // Keeps every line printed to it, for later inspection or replay.
    struct BufferedMessageSink final : MessageSink
    {
        BufferedMessageSink() = default;

        virtual void println(const MessageLine& line) override;
        using MessageSink::println;

        const std::vector<MessageLine>& lines() const noexcept { return m_lines; }
        // All lines without color, each terminated with a newline.
        std::string to_string() const;
        void print_to(MessageSink& sink) const;

    private:
        std::vector<MessageLine> m_lines;
    };
}

FCOMB_FORMAT_WITH_TO_STRING(fcomb::MessageLine);
