#pragma once

namespace fcomb
{
    struct NullOpt;

    template<class T>
    struct Optional;
}
