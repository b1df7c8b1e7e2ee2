#pragma once

namespace fcomb
{
    struct SourceLoc;
    struct ParseMessages;
    struct ParserBase;
}
