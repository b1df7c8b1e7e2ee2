#pragma once

#include <fcomb/base/fwd/messages.h>

#include <fcomb/base/fmt.h>
#include <fcomb/base/span.h>
#include <fcomb/base/stringview.h>

#include <string>
#include <type_traits>
#include <vector>

namespace fcomb
{
    template<class T>
    struct identity
    {
        using type = T;
    };
    template<class T>
    using identity_t = typename identity<T>::type;
}

#define FCOMB_DECL_MSG_TEMPLATE class... MessageTags, class... MessageTypes
#define FCOMB_DECL_MSG_ARGS                                                                                            \
    ::fcomb::msg::MessageT<MessageTags...> _message_token,                                                             \
        ::fcomb::msg::TagArg<::fcomb::identity_t<MessageTags>, MessageTypes>... _message_args
#define FCOMB_EXPAND_MSG_ARGS _message_token, _message_args...

namespace fcomb::msg
{
    namespace detail
    {
        template<class... Tags>
        struct MessageT<Tags...> make_message_base(Tags...);

        LocalizedString format_message_by_index(size_t index, fmt::format_args args);
        void format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args);
    }
    template<class Tag, class Type>
    struct TagArg
    {
        static_assert(!std::is_constructible<StringView, Type>::value, "string-like arguments must be StringViews");
        const Type& t;
        auto arg() const { return fmt::arg(Tag::name.c_str(), t); }
    };
    template<class Tag>
    struct TagArg<Tag, StringView>
    {
        StringView const t;
        auto arg() const { return fmt::arg(Tag::name.c_str(), t); }
    };

    template<class Type>
    using StringViewable = std::conditional_t<std::is_constructible<StringView, Type>::value, StringView, Type>;

    template<class... Tags>
    struct MessageT
    {
        const size_t index;
    };

    template<FCOMB_DECL_MSG_TEMPLATE>
    LocalizedString format(FCOMB_DECL_MSG_ARGS);
    template<FCOMB_DECL_MSG_TEMPLATE>
    void format_to(LocalizedString&, FCOMB_DECL_MSG_ARGS);

    extern template LocalizedString format<>(MessageT<>);
    extern template void format_to<>(LocalizedString&, MessageT<>);
}

namespace fcomb
{
    struct LocalizedString
    {
        LocalizedString() = default;
        operator StringView() const noexcept;
        const std::string& data() const noexcept;
        const std::string& to_string() const noexcept;
        std::string extract_data();

        template<class T, std::enable_if_t<std::is_same<char, T>::value, int> = 0>
        static LocalizedString from_raw(std::basic_string<T>&& s) noexcept;
        static LocalizedString from_raw(StringView s);

        LocalizedString& append_raw(char c) &;
        LocalizedString&& append_raw(char c) &&;
        LocalizedString& append_raw(StringView s) &;
        LocalizedString&& append_raw(StringView s) &&;
        LocalizedString& append(const LocalizedString& s) &;
        LocalizedString&& append(const LocalizedString& s) &&;
        template<FCOMB_DECL_MSG_TEMPLATE>
        LocalizedString& append(FCOMB_DECL_MSG_ARGS) &
        {
            msg::format_to(*this, FCOMB_EXPAND_MSG_ARGS);
            return *this;
        }
        template<FCOMB_DECL_MSG_TEMPLATE>
        LocalizedString&& append(FCOMB_DECL_MSG_ARGS) &&
        {
            return std::move(append(FCOMB_EXPAND_MSG_ARGS));
        }
        LocalizedString& append_indent(size_t indent = 1) &;
        LocalizedString&& append_indent(size_t indent = 1) &&;

        // 0 items - Does nothing
        // 1 item - .append_raw(' ').append(item)
        // 2+ items - foreach: .append_raw('\n').append_indent(indent).append(item)
        friend bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept;
        friend bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept;
        friend bool operator<(const LocalizedString& lhs, const LocalizedString& rhs) noexcept;
        bool empty() const noexcept;
        void clear() noexcept;

        friend void msg::detail::format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args);

    private:
        std::string m_data;

        explicit LocalizedString(StringView data);
        explicit LocalizedString(std::string&& data) noexcept;
    };

    // constants for the
    // <origin>: <prefix>: <content>
    // error message format
    inline constexpr StringLiteral ErrorPrefix = "error: ";
    inline constexpr StringLiteral InternalErrorPrefix = "internal error: ";
    LocalizedString internal_error_prefix();
    inline constexpr StringLiteral MessagePrefix = "message: ";
    inline constexpr StringLiteral NotePrefix = "note: ";
    inline constexpr StringLiteral WarningPrefix = "warning: ";
}

FCOMB_FORMAT_AS(fcomb::LocalizedString, fcomb::StringView);

namespace fcomb::msg
{
    namespace detail
    {
        template<class... FmtArgs>
        LocalizedString format_impl(std::size_t index, FmtArgs&&... args)
        {
            // no forward to intentionally make an lvalue here
            return detail::format_message_by_index(index, fmt::make_format_args(args...));
        }
        template<class... FmtArgs>
        void format_to_impl(LocalizedString& s, std::size_t index, FmtArgs&&... args)
        {
            // no forward to intentionally make an lvalue here
            return detail::format_message_by_index_to(s, index, fmt::make_format_args(args...));
        }
    }

    template<class... Tags, class... Types>
    LocalizedString format(MessageT<Tags...> m, TagArg<identity_t<Tags>, Types>... args)
    {
        return detail::format_impl(m.index, args.arg()...);
    }
    template<class... Tags, class... Types>
    void format_to(LocalizedString& s, MessageT<Tags...> m, TagArg<identity_t<Tags>, Types>... args)
    {
        return detail::format_to_impl(s, m.index, args.arg()...);
    }

    void println_error(const LocalizedString& s);
    template<FCOMB_DECL_MSG_TEMPLATE>
    void println_error(FCOMB_DECL_MSG_ARGS)
    {
        msg::write_unlocalized_text_to_stderr(Color::error, "error");
        msg::write_unlocalized_text_to_stderr(Color::none, ": ");
        msg::write_unlocalized_text_to_stderr(Color::none, msg::format(FCOMB_EXPAND_MSG_ARGS).append_raw('\n'));
    }

#define DECLARE_MSG_ARG(NAME, EXAMPLE)                                                                                 \
    static constexpr struct NAME##_t                                                                                   \
    {                                                                                                                  \
        static const ::fcomb::StringLiteral name;                                                                      \
        template<class T>                                                                                              \
        TagArg<NAME##_t, StringViewable<T>> operator=(const T& t) const noexcept                                       \
        {                                                                                                              \
            return TagArg<NAME##_t, StringViewable<T>>{t};                                                             \
        }                                                                                                              \
    } NAME = {};

#include <fcomb/base/message-args.inc.h>

#undef DECLARE_MSG_ARG
}
namespace fcomb
{

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    extern const decltype(::fcomb::msg::detail::make_message_base ARGS) msg##NAME;

#include <fcomb/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}
