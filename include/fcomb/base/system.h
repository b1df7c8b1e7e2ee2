#pragma once

#include <fcomb/base/optional.h>
#include <fcomb/base/stringview.h>

#include <string>

namespace fcomb
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept;

    // Whether `value` is one of the spellings of "on": yes, true, y or t, ignoring ASCII case.
    bool is_truthy_environment_value(StringView value) noexcept;
}
