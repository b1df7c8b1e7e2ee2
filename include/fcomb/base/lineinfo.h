#pragma once

#include <fcomb/base/fmt.h>

#include <string>

namespace fcomb
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        std::string to_string() const;
    };
}

#define FCOMB_LINE_INFO                                                                                                \
    fcomb::LineInfo { __LINE__, __FILE__, __func__ }

FCOMB_FORMAT_WITH_TO_STRING(fcomb::LineInfo);
