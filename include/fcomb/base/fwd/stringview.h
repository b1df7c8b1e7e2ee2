#pragma once

namespace fcomb
{
    struct StringView;
    struct ZStringView;
    struct StringLiteral;
}
