#include <fcomb/base/path.h>

#include <sys/stat.h>

#include <algorithm>

namespace
{
    using namespace fcomb;

    constexpr bool is_slash(char c) noexcept { return c == '/'; }

    const char* find_relative_path(const char* const first, const char* const last) noexcept
    {
        return std::find_if_not(first, last, is_slash);
    }

    StringView parse_parent_path(const StringView str) noexcept
    {
        // attempt to parse str as a path and return the parent_path if it exists; otherwise, an empty view
        const auto first = str.data();
        auto last = first + str.size();
        const auto relative_path = find_relative_path(first, last);
        // remove the trailing filename, then any directory-separators before it, so that "/cat/dog" yields "/cat" and
        // "/cat/dog/" yields "/cat/dog"
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        while (relative_path != last && is_slash(last[-1]))
        {
            --last;
        }

        return StringView(first, static_cast<size_t>(last - first));
    }
}

namespace fcomb
{
    Path::Path(const StringView sv) : m_str(sv.to_string()) { }
    Path::Path(const std::string& s) : m_str(s) { }
    Path::Path(std::string&& s) : m_str(std::move(s)) { }
    Path::Path(const char* s) : m_str(s) { }

    const std::string& Path::native() const& noexcept { return m_str; }
    std::string&& Path::native() && noexcept { return std::move(m_str); }
    Path::operator StringView() const noexcept { return m_str; }

    const char* Path::c_str() const noexcept { return m_str.c_str(); }

    bool Path::empty() const noexcept { return m_str.empty(); }

    Path Path::operator/(StringView sv) const&
    {
        Path result = *this;
        result /= sv;
        return result;
    }

    Path Path::operator/(StringView sv) &&
    {
        *this /= sv;
        return std::move(*this);
    }

    Path& Path::operator/=(StringView sv)
    {
        if (!sv.empty() && is_slash(sv[0]))
        {
            m_str.assign(sv.data(), sv.size());
            return *this;
        }

        if (!m_str.empty() && !is_slash(m_str.back()))
        {
            m_str.push_back('/');
        }

        m_str.append(sv.data(), sv.size());
        return *this;
    }

    StringView Path::parent_path() const { return parse_parent_path(m_str); }


    bool path_exists(const Path& target) noexcept
    {
        struct stat s;
        return ::stat(target.c_str(), &s) == 0;
    }
}
