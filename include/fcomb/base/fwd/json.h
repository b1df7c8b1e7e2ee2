#pragma once

namespace fcomb::Json
{
    struct JsonStyle;
    enum class ValueKind : int;
    struct Value;
    struct Array;
    struct Object;

    template<class Type>
    struct IDeserializer;

    struct Reader;
}
