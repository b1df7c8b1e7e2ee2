#pragma once

#include <fmt/format.h>

#include <string>

#define FCOMB_FORMAT_AS(Type, Base)                                                                                    \
    template<typename Char>                                                                                            \
    struct fmt::formatter<Type, Char, void> : fmt::formatter<Base, Char, void>                                         \
    {                                                                                                                  \
        template<typename FormatContext>                                                                               \
        auto format(Type const& val, FormatContext& ctx) const -> decltype(ctx.out())                                  \
        {                                                                                                              \
            return fmt::formatter<Base, Char, void>::format(static_cast<Base>(val), ctx);                              \
        }                                                                                                              \
    }

#define FCOMB_FORMAT_WITH_TO_STRING(Type)                                                                              \
    template<typename Char>                                                                                            \
    struct fmt::formatter<Type, Char, void> : fmt::formatter<fmt::basic_string_view<char>, Char, void>                 \
    {                                                                                                                  \
        template<typename FormatContext>                                                                               \
        auto format(Type const& val, FormatContext& ctx) const -> decltype(ctx.out())                                  \
        {                                                                                                              \
            const std::string as_string = val.to_string();                                                             \
            return fmt::formatter<fmt::basic_string_view<char>, Char, void>::format(                                   \
                fmt::basic_string_view<char>{as_string.data(), as_string.size()}, ctx);                                \
        }                                                                                                              \
    }
