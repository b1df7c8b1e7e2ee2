#pragma once

#include <fcomb/base/fmt.h>
#include <fcomb/base/stringview.h>

#include <string>

namespace fcomb
{
    struct Path
    {
        Path() = default;
        Path(const StringView sv);
        Path(const std::string& s);
        Path(std::string&& s);
        Path(const char* s);

        const std::string& native() const& noexcept;
        std::string&& native() && noexcept;
        operator StringView() const noexcept;

        const char* c_str() const noexcept;

        bool empty() const noexcept;

        Path operator/(StringView sv) const&;
        Path operator/(StringView sv) &&;
        Path& operator/=(StringView sv);

        StringView parent_path() const;


        friend bool operator==(const Path& lhs, const Path& rhs) noexcept { return lhs.m_str == rhs.m_str; }
        friend bool operator!=(const Path& lhs, const Path& rhs) noexcept { return lhs.m_str != rhs.m_str; }

    private:
        std::string m_str;
    };

    // Whether something exists at `target`, following symlinks.
    bool path_exists(const Path& target) noexcept;
}

FCOMB_FORMAT_AS(fcomb::Path, fcomb::StringView);
