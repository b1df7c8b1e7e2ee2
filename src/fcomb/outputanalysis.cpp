#include <fcomb/base/strings.h>

#include <fcomb/outputanalysis.h>

#include <numeric>
#include <regex>

namespace
{
    using namespace fcomb;

    constexpr char ESC = '\x1b';
    constexpr char BEL = '\x07';

    bool in_range(char ch, unsigned char first, unsigned char last) noexcept
    {
        const auto uch = static_cast<unsigned char>(ch);
        return first <= uch && uch <= last;
    }

    // Skips a string terminated by BEL or ESC '\'; returns the position after the terminator.
    const char* skip_control_string(const char* first, const char* last) noexcept
    {
        while (first != last)
        {
            if (*first == BEL)
            {
                return first + 1;
            }

            if (*first == ESC && first + 1 != last && first[1] == '\\')
            {
                return first + 2;
            }

            ++first;
        }

        return last;
    }

    // `first` points after ESC; returns the position after the escape sequence.
    const char* skip_escape_sequence(const char* first, const char* last) noexcept
    {
        if (first == last)
        {
            return last;
        }

        switch (*first)
        {
            case '[':
                // CSI: parameter bytes, intermediate bytes, one final byte
                ++first;
                while (first != last && in_range(*first, 0x20, 0x3f))
                {
                    ++first;
                }

                return first == last ? last : first + 1;
            case ']':
            case 'P':
            case 'X':
            case '^':
            case '_': return skip_control_string(first + 1, last);
            default:
                while (first != last && in_range(*first, 0x20, 0x2f))
                {
                    ++first;
                }

                return first == last ? last : first + 1;
        }
    }

    template<class Fn>
    std::vector<size_t> collect_counts(StringView text, const std::regex& pattern, Fn count_from_capture)
    {
        std::vector<size_t> result;
        std::cregex_iterator first(text.begin(), text.end(), pattern);
        const std::cregex_iterator last;
        for (; first != last; ++first)
        {
            const auto& capture = (*first)[1];
            result.push_back(count_from_capture(StringView{capture.first, capture.second}));
        }

        return result;
    }

    size_t parse_count(StringView digits, size_t otherwise)
    {
        auto maybe_count = Strings::strto<long long>(digits);
        if (auto count = maybe_count.get())
        {
            if (*count >= 0)
            {
                return static_cast<size_t>(*count);
            }
        }

        return otherwise;
    }

    size_t sum(const std::vector<size_t>& counts) { return std::accumulate(counts.begin(), counts.end(), size_t{0}); }
}

namespace fcomb
{
    std::string strip_ansi_escapes(StringView text)
    {
        std::string result;
        result.reserve(text.size());
        const char* first = text.begin();
        const char* const last = text.end();
        while (first != last)
        {
            if (*first == ESC)
            {
                first = skip_escape_sequence(first + 1, last);
                continue;
            }

            result.push_back(*first);
            ++first;
        }

        return result;
    }

    std::vector<size_t> warning_counts(StringView text)
    {
        static const std::regex warning_regex{R"(warning: .* generated (\d+) warnings?)"};
        return collect_counts(text, warning_regex, [](StringView digits) { return parse_count(digits, 0); });
    }

    std::vector<size_t> error_counts(StringView text)
    {
        // newer cargo names the target between the package and "due to", e.g. "`app` (lib test) due to"
        static const std::regex error_regex{
            R"(error: could not compile `[^`]*`[^\n]*? due to\s*(\d*)\s*previous errors?)"};
        return collect_counts(text, error_regex, [](StringView digits) { return parse_count(digits, 1); });
    }

    DiagnosticCounts count_diagnostics(StringView colored_text)
    {
        const auto text = strip_ansi_escapes(colored_text);
        DiagnosticCounts counts;
        counts.warnings = sum(warning_counts(text));
        counts.errors = sum(error_counts(text));
        return counts;
    }
}
