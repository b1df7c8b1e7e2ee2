#include <fcomb/base/checks.h>
#include <fcomb/base/strings.h>
#include <fcomb/base/system.debug.h>
#include <fcomb/base/system.h>

#include <stdlib.h>

namespace fcomb
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
        auto v = getenv(varname.c_str());
        if (!v) return nullopt;
        return std::string(v);
    }

    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept
    {
        if (auto v = value.get())
        {
            Checks::check_exit(FCOMB_LINE_INFO, setenv(varname.c_str(), v->c_str(), 1) == 0);
        }
        else
        {
            Checks::check_exit(FCOMB_LINE_INFO, unsetenv(varname.c_str()) == 0);
        }
    }

    bool is_truthy_environment_value(StringView value) noexcept
    {
        static constexpr StringLiteral truthy[] = {"yes", "true", "y", "t"};
        for (auto&& candidate : truthy)
        {
            if (Strings::case_insensitive_ascii_equals(value, candidate))
            {
                return true;
            }
        }

        return false;
    }
}

namespace fcomb::Debug
{
    std::atomic<bool> g_debugging(false);
}
