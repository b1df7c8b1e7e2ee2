#include <fcomb/base/checks.h>
#include <fcomb/base/messages.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iterator>
#include <utility>

using namespace fcomb;

namespace fcomb
{
    LocalizedString::operator StringView() const noexcept { return m_data; }
    const std::string& LocalizedString::data() const noexcept { return m_data; }
    const std::string& LocalizedString::to_string() const noexcept { return m_data; }
    std::string LocalizedString::extract_data() { return std::exchange(m_data, std::string{}); }

    template<class T, std::enable_if_t<std::is_same<char, T>::value, int>>
    LocalizedString LocalizedString::from_raw(std::basic_string<T>&& s) noexcept
    {
        return LocalizedString(std::move(s));
    }
    template LocalizedString LocalizedString::from_raw<char>(std::basic_string<char>&& s) noexcept;
    LocalizedString LocalizedString::from_raw(StringView s) { return LocalizedString(s); }

    LocalizedString& LocalizedString::append_raw(char c) &
    {
        m_data.push_back(c);
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(char c) && { return std::move(append_raw(c)); }

    LocalizedString& LocalizedString::append_raw(StringView s) &
    {
        m_data.append(s.begin(), s.size());
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(StringView s) && { return std::move(append_raw(s)); }

    LocalizedString& LocalizedString::append(const LocalizedString& s) &
    {
        m_data.append(s.m_data);
        return *this;
    }

    LocalizedString&& LocalizedString::append(const LocalizedString& s) && { return std::move(append(s)); }

    LocalizedString& LocalizedString::append_indent(size_t indent) &
    {
        m_data.append(indent * 4, ' ');
        return *this;
    }

    LocalizedString&& LocalizedString::append_indent(size_t indent) && { return std::move(append_indent(indent)); }

    bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() == rhs.data();
    }

    bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() != rhs.data();
    }

    bool operator<(const LocalizedString& lhs, const LocalizedString& rhs) noexcept { return lhs.data() < rhs.data(); }

    bool LocalizedString::empty() const noexcept { return m_data.empty(); }
    void LocalizedString::clear() noexcept { m_data.clear(); }

    LocalizedString::LocalizedString(StringView data) : m_data(data.data(), data.size()) { }
    LocalizedString::LocalizedString(std::string&& data) noexcept : m_data(std::move(data)) { }

    LocalizedString internal_error_prefix() { return LocalizedString::from_raw(InternalErrorPrefix); }
}

namespace fcomb::msg
{
    template LocalizedString format<>(MessageT<>);
    template void format_to<>(LocalizedString&, MessageT<>);
}

#define DECLARE_MSG_ARG(NAME, EXAMPLE) const StringLiteral fcomb::msg::NAME##_t::name = #NAME;
#include <fcomb/base/message-args.inc.h>
#undef DECLARE_MSG_ARG

namespace fcomb
{
    namespace
    {
        struct MessageData
        {
            StringLiteral name;
            const char* comment;
            StringLiteral builtin_message;
        };

        constexpr MessageData message_data[] = {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) {#NAME, COMMENT, __VA_ARGS__},
#include <fcomb/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };

        enum class message_index
        {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) NAME,
#include <fcomb/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };
    }

    namespace msg::detail
    {
        static constexpr const size_t number_of_messages = std::size(message_data);

        void format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args)
        {
            if (index >= number_of_messages) Checks::unreachable(FCOMB_LINE_INFO);
            const auto format_string = message_data[index].builtin_message;
            try
            {
                fmt::vformat_to(std::back_inserter(s.m_data), {format_string.data(), format_string.size()}, args);
                return;
            }
            catch (const fmt::format_error&)
            {
            }

            msg::write_unlocalized_text_to_stderr(
                Color::error,
                fmt::format("INTERNAL ERROR: failed to format message {}\nformat string: {}\n",
                            message_data[index].name,
                            format_string));
            Checks::exit_fail(FCOMB_LINE_INFO);
        }

        LocalizedString format_message_by_index(size_t index, fmt::format_args args)
        {
            LocalizedString s;
            format_message_by_index_to(s, index, args);
            return s;
        }
    }

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    const decltype(::fcomb::msg::detail::make_message_base ARGS) msg##NAME{static_cast<size_t>(message_index::NAME)};
#include <fcomb/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

namespace fcomb::msg
{
    OutputStream default_output_stream = OutputStream::StdOut;

    static void write_all(const char* ptr, size_t to_write, int fd)
    {
        while (to_write != 0)
        {
            auto written = ::write(fd, ptr, to_write);
            if (written == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }

                ::fprintf(stderr, "[DEBUG] Failed to write to fd %d: %d\n", fd, errno);
                std::abort();
            }

            ptr += written;
            to_write -= static_cast<size_t>(written);
        }
    }

    static bool is_a_tty(OutputStream stream)
    {
        static const bool stdout_is_a_tty = ::isatty(STDOUT_FILENO);
        static const bool stderr_is_a_tty = ::isatty(STDERR_FILENO);
        return stream == OutputStream::StdErr ? stderr_is_a_tty : stdout_is_a_tty;
    }

    static int fd_for(OutputStream stream) { return stream == OutputStream::StdErr ? STDERR_FILENO : STDOUT_FILENO; }

    void append_colored_text(std::string& into, OutputStream stream, Color c, StringView sv)
    {
        static constexpr char reset_color_sequence[] = {'\033', '[', '0', 'm'};

        if (sv.empty()) return;

        if (c != Color::none && is_a_tty(stream))
        {
            into.append({'\033', '[', '9', static_cast<char>(c), 'm'});
            into.append(sv.data(), sv.size());
            into.append(reset_color_sequence, sizeof(reset_color_sequence));
            return;
        }

        into.append(sv.data(), sv.size());
    }

    void write_raw_text(OutputStream stream, StringView sv) { write_all(sv.data(), sv.size(), fd_for(stream)); }

    static void write_unlocalized_text_impl(Color c, StringView sv, OutputStream stream)
    {
        if (sv.empty()) return;

        if (c == Color::none)
        {
            write_raw_text(stream, sv);
            return;
        }

        // one write per colored segment
        std::string colored;
        colored.reserve(sv.size() + 9);
        append_colored_text(colored, stream, c, sv);
        write_raw_text(stream, colored);
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        write_unlocalized_text_impl(c, sv, OutputStream::StdErr);
    }

    void println_error(const LocalizedString& s)
    {
        write_unlocalized_text_to_stderr(Color::error, "error");
        write_unlocalized_text_to_stderr(Color::none, LocalizedString::from_raw(": ").append(s).append_raw('\n'));
    }
}
