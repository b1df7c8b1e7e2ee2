#pragma once

#include <fcomb/base/fwd/messages.h>

namespace fcomb
{
    struct Unit;
    struct ExpectedLeftTag;
    struct ExpectedRightTag;

    template<class T>
    struct ExpectedHolder;

    template<class T, class Error>
    struct ExpectedT;

    template<class T>
    using ExpectedL = ExpectedT<T, LocalizedString>;
}
