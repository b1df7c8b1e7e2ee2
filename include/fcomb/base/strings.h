#pragma once

#include <fcomb/base/lineinfo.h>
#include <fcomb/base/optional.h>
#include <fcomb/base/stringview.h>

#include <errno.h>

#include <algorithm>
#include <iterator>
#include <string>

namespace fcomb::Strings::details
{
    void append_internal(std::string& into, char c);
    void append_internal(std::string& into, const char* v);
    void append_internal(std::string& into, const std::string& s);
    void append_internal(std::string& into, StringView s);
    template<class T, class = decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>
    void append_internal(std::string& into, const T& t)
    {
        t.to_string(into);
    }
    template<class T, class = void, class = decltype(to_string(std::declval<std::string&>(), std::declval<const T&>()))>
    void append_internal(std::string& into, const T& t)
    {
        to_string(into, t);
    }

    static constexpr struct IdentityTransformer
    {
        template<class T>
        T&& operator()(T&& t) const noexcept
        {
            return static_cast<T&&>(t);
        }
    } identity_transformer;
}

namespace fcomb::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string into;
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(std::string&& into, const Args&... args)
    {
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return std::move(into);
    }

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept;

    bool starts_with(StringView s, StringView pattern);

    template<class InputIterator, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter,
                                   InputIterator first,
                                   InputIterator last,
                                   Transformer transformer)
    {
        std::string output;
        if (first == last)
        {
            return output;
        }

        for (;;)
        {
            Strings::append(output, transformer(*first));
            if (++first == last)
            {
                return output;
            }

            output.append(delimiter.data(), delimiter.size());
        }
    }

    template<class Container, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v, Transformer transformer)
    {
        return join(delimiter, std::begin(v), std::end(v), transformer);
    }

    template<class Container>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v)
    {
        return join(delimiter, std::begin(v), std::end(v), details::identity_transformer);
    }

    const char* find_first_of(StringView searched, StringView candidates);

    // Equivalent to one of the `::strto[T]` functions. Returns `nullopt` if there is an error.
    template<class T>
    Optional<T> strto(StringView sv);

    template<>
    Optional<long long> strto<long long>(StringView);
    template<>
    Optional<double> strto<double>(StringView);

    // Implements https://en.wikipedia.org/wiki/Levenshtein_distance with a "give-up" clause for large strings
    // Guarantees 0 for equal strings and nonzero for inequal strings.
    size_t byte_edit_distance(StringView a, StringView b);
}
