#include <fcomb/base/json.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/parse.h>
#include <fcomb/base/strings.h>

#include <math.h>

#include <algorithm>
#include <type_traits>

namespace fcomb::Json
{
    using VK = ValueKind;

    // struct Value {
    namespace impl
    {
        template<ValueKind Vk>
        using ValueKindConstant = std::integral_constant<ValueKind, Vk>;

        struct ValueImpl
        {
            VK tag;
            union
            {
                std::nullptr_t null;
                bool boolean;
                int64_t integer;
                double number;
                std::string string;
                Array array;
                Object object;
            };

            ValueImpl(ValueKindConstant<VK::Null> vk, std::nullptr_t) : tag(vk), null() { }
            ValueImpl(ValueKindConstant<VK::Boolean> vk, bool b) : tag(vk), boolean(b) { }
            ValueImpl(ValueKindConstant<VK::Integer> vk, int64_t i) : tag(vk), integer(i) { }
            ValueImpl(ValueKindConstant<VK::Number> vk, double d) : tag(vk), number(d) { }
            ValueImpl(ValueKindConstant<VK::String> vk, std::string&& s) : tag(vk), string(std::move(s)) { }
            ValueImpl(ValueKindConstant<VK::String> vk, const std::string& s) : tag(vk), string(s) { }
            ValueImpl(ValueKindConstant<VK::Array> vk, Array&& arr) : tag(vk), array(std::move(arr)) { }
            ValueImpl(ValueKindConstant<VK::Array> vk, const Array& arr) : tag(vk), array(arr) { }
            ValueImpl(ValueKindConstant<VK::Object> vk, Object&& obj) : tag(vk), object(std::move(obj)) { }
            ValueImpl(ValueKindConstant<VK::Object> vk, const Object& obj) : tag(vk), object(obj) { }

            ~ValueImpl() { destroy_underlying(); }

        private:
            void destroy_underlying() noexcept
            {
                switch (tag)
                {
                    case VK::String: string.~basic_string(); break;
                    case VK::Array: array.~Array(); break;
                    case VK::Object: object.~Object(); break;
                    default: break;
                }
                new (&null) std::nullptr_t();
                tag = VK::Null;
            }
        };
    }

    using impl::ValueImpl;
    using impl::ValueKindConstant;

    VK Value::kind() const noexcept
    {
        if (underlying_)
        {
            return underlying_->tag;
        }
        else
        {
            return VK::Null;
        }
    }

    bool Value::is_null() const noexcept { return kind() == VK::Null; }
    bool Value::is_boolean() const noexcept { return kind() == VK::Boolean; }
    bool Value::is_integer() const noexcept { return kind() == VK::Integer; }
    bool Value::is_number() const noexcept
    {
        auto k = kind();
        return k == VK::Integer || k == VK::Number;
    }
    bool Value::is_string() const noexcept { return kind() == VK::String; }
    bool Value::is_array() const noexcept { return kind() == VK::Array; }
    bool Value::is_object() const noexcept { return kind() == VK::Object; }

    bool Value::boolean(LineInfo li) const noexcept
    {
        fcomb::Checks::check_exit(li, is_boolean());
        return underlying_->boolean;
    }
    int64_t Value::integer(LineInfo li) const noexcept
    {
        fcomb::Checks::check_exit(li, is_integer());
        return underlying_->integer;
    }
    double Value::number(LineInfo li) const noexcept
    {
        auto k = kind();
        if (k == VK::Number)
        {
            return underlying_->number;
        }
        else
        {
            return static_cast<double>(integer(li));
        }
    }
    StringView Value::string(LineInfo li) const noexcept
    {
        fcomb::Checks::msg_check_exit(li, is_string(), msgJsonValueNotString);
        return underlying_->string;
    }

    const Array& Value::array(LineInfo li) const& noexcept
    {
        fcomb::Checks::msg_check_exit(li, is_array(), msgJsonValueNotArray);
        return underlying_->array;
    }
    Array& Value::array(LineInfo li) & noexcept
    {
        fcomb::Checks::msg_check_exit(li, is_array(), msgJsonValueNotArray);
        return underlying_->array;
    }
    Array&& Value::array(LineInfo li) && noexcept { return std::move(this->array(li)); }

    Array* Value::maybe_array() noexcept
    {
        if (underlying_ && underlying_->tag == VK::Array)
        {
            return &underlying_->array;
        }

        return nullptr;
    }

    const Array* Value::maybe_array() const noexcept
    {
        if (underlying_ && underlying_->tag == VK::Array)
        {
            return &underlying_->array;
        }

        return nullptr;
    }

    const Object& Value::object(LineInfo li) const& noexcept
    {
        fcomb::Checks::msg_check_exit(li, is_object(), msgJsonValueNotObject);
        return underlying_->object;
    }
    Object& Value::object(LineInfo li) & noexcept
    {
        fcomb::Checks::msg_check_exit(li, is_object(), msgJsonValueNotObject);
        return underlying_->object;
    }
    Object&& Value::object(LineInfo li) && noexcept { return std::move(this->object(li)); }

    Object* Value::maybe_object() noexcept
    {
        if (underlying_ && underlying_->tag == VK::Object)
        {
            return &underlying_->object;
        }

        return nullptr;
    }

    const Object* Value::maybe_object() const noexcept
    {
        if (underlying_ && underlying_->tag == VK::Object)
        {
            return &underlying_->object;
        }

        return nullptr;
    }

    Value::Value() noexcept = default;
    Value::Value(Value&&) noexcept = default;
    Value& Value::operator=(Value&&) noexcept = default;

    static std::unique_ptr<ValueImpl> copy_underlying(const Value& other, const ValueImpl* other_impl)
    {
        switch (other.kind())
        {
            case ValueKind::Null: return nullptr;
            case ValueKind::Boolean:
                return std::make_unique<ValueImpl>(ValueKindConstant<VK::Boolean>(), other_impl->boolean);
            case ValueKind::Integer:
                return std::make_unique<ValueImpl>(ValueKindConstant<VK::Integer>(), other_impl->integer);
            case ValueKind::Number:
                return std::make_unique<ValueImpl>(ValueKindConstant<VK::Number>(), other_impl->number);
            case ValueKind::String:
                return std::make_unique<ValueImpl>(ValueKindConstant<VK::String>(), other_impl->string);
            case ValueKind::Array:
                return std::make_unique<ValueImpl>(ValueKindConstant<VK::Array>(), other_impl->array);
            case ValueKind::Object:
                return std::make_unique<ValueImpl>(ValueKindConstant<VK::Object>(), other_impl->object);
            default: Checks::unreachable(FCOMB_LINE_INFO);
        }
    }

    Value::Value(const Value& other) : underlying_(copy_underlying(other, other.underlying_.get())) { }

    Value& Value::operator=(const Value& other)
    {
        if (this != &other)
        {
            underlying_ = copy_underlying(other, other.underlying_.get());
        }

        return *this;
    }

    Value::~Value() = default;

    Value Value::null(std::nullptr_t) noexcept { return Value(); }
    Value Value::boolean(bool b) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Boolean>(), b);
        return val;
    }
    Value Value::integer(int64_t i) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Integer>(), i);
        return val;
    }
    Value Value::number(double d) noexcept
    {
        fcomb::Checks::check_exit(FCOMB_LINE_INFO, isfinite(d));
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Number>(), d);
        return val;
    }
    Value Value::string(std::string&& s) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::String>(), std::move(s));
        return val;
    }
    Value Value::array(Array&& arr) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Array>(), std::move(arr));
        return val;
    }
    Value Value::array(const Array& arr) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Array>(), arr);
        return val;
    }
    Value Value::object(Object&& obj) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Object>(), std::move(obj));
        return val;
    }
    Value Value::object(const Object& obj) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Object>(), obj);
        return val;
    }

    bool operator==(const Value& lhs, const Value& rhs)
    {
        if (lhs.kind() != rhs.kind()) return false;

        switch (lhs.kind())
        {
            case ValueKind::Null: return true;
            case ValueKind::Boolean: return lhs.underlying_->boolean == rhs.underlying_->boolean;
            case ValueKind::Integer: return lhs.underlying_->integer == rhs.underlying_->integer;
            case ValueKind::Number: return lhs.underlying_->number == rhs.underlying_->number;
            case ValueKind::String: return lhs.underlying_->string == rhs.underlying_->string;
            case ValueKind::Array: return lhs.underlying_->array == rhs.underlying_->array;
            case ValueKind::Object: return lhs.underlying_->object == rhs.underlying_->object;
            default: Checks::unreachable(FCOMB_LINE_INFO);
        }
    }
    // } struct Value
    // struct Array {
    Value& Array::push_back(std::string&& value) { return this->push_back(Json::Value::string(std::move(value))); }
    Value& Array::push_back(Value&& value) { return underlying_.emplace_back(std::move(value)); }
    Object& Array::push_back(Object&& obj) { return push_back(Value::object(std::move(obj))).object(FCOMB_LINE_INFO); }
    Array& Array::push_back(Array&& arr) { return push_back(Value::array(std::move(arr))).array(FCOMB_LINE_INFO); }
    bool operator==(const Array& lhs, const Array& rhs) { return lhs.underlying_ == rhs.underlying_; }
    // } struct Array
    // struct Object {
    Value& Object::insert(StringView key, std::string&& value) { return insert(key, Value::string(std::move(value))); }
    Value& Object::insert(StringView key, Value&& value)
    {
        if (contains(key))
        {
            Checks::unreachable(FCOMB_LINE_INFO,
                                fmt::format("attempted to insert duplicate key {} into JSON object", key));
        }

        return underlying_.emplace_back(key.to_string(), std::move(value)).second;
    }
    Value& Object::insert(StringView key, const Value& value)
    {
        if (contains(key))
        {
            Checks::unreachable(FCOMB_LINE_INFO,
                                fmt::format("attempted to insert duplicate key {} into JSON object", key));
        }

        return underlying_.emplace_back(key.to_string(), value).second;
    }
    Array& Object::insert(StringView key, Array&& value)
    {
        return insert(key, Value::array(std::move(value))).array(FCOMB_LINE_INFO);
    }
    Object& Object::insert(StringView key, Object&& value)
    {
        return insert(key, Value::object(std::move(value))).object(FCOMB_LINE_INFO);
    }

    Value& Object::insert_or_replace(StringView key, std::string&& value)
    {
        return this->insert_or_replace(key, Json::Value::string(std::move(value)));
    }
    Value& Object::insert_or_replace(StringView key, Value&& value)
    {
        auto v = get(key);
        if (v)
        {
            *v = std::move(value);
            return *v;
        }
        else
        {
            return underlying_.emplace_back(key.to_string(), std::move(value)).second;
        }
    }
    Value& Object::insert_or_replace(StringView key, const Value& value)
    {
        auto v = get(key);
        if (v)
        {
            *v = value;
            return *v;
        }
        else
        {
            return underlying_.emplace_back(key.to_string(), value).second;
        }
    }

    auto Object::internal_find_key(StringView key) const noexcept -> underlying_t::const_iterator
    {
        return std::find_if(
            underlying_.begin(), underlying_.end(), [key](const auto& pair) { return pair.first == key; });
    }

    Value* Object::get(StringView key) noexcept
    {
        auto it = internal_find_key(key);
        if (it == underlying_.end())
        {
            return nullptr;
        }
        else
        {
            return &underlying_[it - underlying_.begin()].second;
        }
    }
    const Value* Object::get(StringView key) const noexcept
    {
        auto it = internal_find_key(key);
        if (it == underlying_.end())
        {
            return nullptr;
        }
        else
        {
            return &it->second;
        }
    }

    static void sort_nested_keys(Value& value)
    {
        if (auto obj = value.maybe_object())
        {
            obj->sort_keys();
        }
        else if (auto arr = value.maybe_array())
        {
            for (auto&& element : *arr)
            {
                sort_nested_keys(element);
            }
        }
    }

    void Object::sort_keys()
    {
        std::sort(underlying_.begin(), underlying_.end(), [](const value_type& lhs, const value_type& rhs) {
            return lhs.first < rhs.first;
        });

        for (auto&& member : underlying_)
        {
            sort_nested_keys(member.second);
        }
    }

    bool operator==(const Object& lhs, const Object& rhs) { return lhs.underlying_ == rhs.underlying_; }
    // } struct Object

    void merge_into(Object& target, const Object& source)
    {
        for (const auto& member : source)
        {
            auto existing = target.get(member.first);
            if (existing)
            {
                auto existing_object = existing->maybe_object();
                auto source_object = member.second.maybe_object();
                if (existing_object && source_object)
                {
                    merge_into(*existing_object, *source_object);
                    continue;
                }
            }

            target.insert_or_replace(member.first, member.second);
        }
    }

    // auto parse() {
    namespace
    {
        bool is_leading_surrogate(uint32_t code_unit) { return code_unit >= 0xD800 && code_unit <= 0xDBFF; }
        bool is_trailing_surrogate(uint32_t code_unit) { return code_unit >= 0xDC00 && code_unit <= 0xDFFF; }

        void utf8_append_code_point(std::string& str, uint32_t code_point)
        {
            if (code_point < 0x80)
            {
                str.push_back(static_cast<char>(code_point));
            }
            else if (code_point < 0x800)
            {
                str.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
                str.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else if (code_point < 0x10000)
            {
                str.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
                str.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                str.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else
            {
                str.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
                str.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
                str.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                str.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
        }

        struct Parser : private ParserBase
        {
            Parser(StringView text, StringView origin, TextRowCol init_rowcol) : ParserBase(text, origin, init_rowcol)
            {
            }

            static bool is_number_start(char ch) noexcept { return ch == '-' || is_ascii_digit(ch); }

            static unsigned char from_hex_digit(char ch) noexcept
            {
                if (is_ascii_digit(ch))
                {
                    return static_cast<unsigned char>(ch - '0');
                }
                else if (ch >= 'a' && ch <= 'f')
                {
                    return static_cast<unsigned char>(ch - 'a' + 10);
                }
                else if (ch >= 'A' && ch <= 'F')
                {
                    return static_cast<unsigned char>(ch - 'A' + 10);
                }
                else
                {
                    fcomb::Checks::unreachable(FCOMB_LINE_INFO);
                }
            }

            // parses the 4 hex digits after "\u"; the cursor is on the 'u'
            Optional<uint32_t> parse_unicode_escape() noexcept
            {
                uint32_t code_unit = 0;
                for (unsigned int i = 0; i < 4; ++i)
                {
                    const char current = next();
                    if (at_eof())
                    {
                        add_error(msg::format(msgUnexpectedEOFMidUnicodeEscape));
                        return nullopt;
                    }

                    if (!is_hex_digit(current))
                    {
                        add_error(msg::format(msgInvalidHexDigit));
                        return nullopt;
                    }

                    code_unit = code_unit * 16 + from_hex_digit(current);
                }

                next();
                return code_unit;
            }

            std::string parse_string() noexcept
            {
                Checks::check_exit(FCOMB_LINE_INFO, cur() == '"');
                next();

                std::string res;
                // an escaped leading surrogate waiting for its trailing half
                uint32_t pending_surrogate = 0;
                const auto flush_pending = [&] {
                    if (pending_surrogate != 0)
                    {
                        utf8_append_code_point(res, pending_surrogate);
                        pending_surrogate = 0;
                    }
                };

                while (!at_eof())
                {
                    char current = cur();
                    if (current == '"')
                    {
                        flush_pending();
                        next();
                        return res;
                    }

                    if (static_cast<unsigned char>(current) <= 0x1F)
                    {
                        add_error(msg::format(msgControlCharacterInString));
                        return res;
                    }

                    if (current != '\\')
                    {
                        flush_pending();
                        res.push_back(current);
                        next();
                        continue;
                    }

                    current = next();
                    if (at_eof())
                    {
                        add_error(msg::format(msgUnexpectedEOFAfterEscape));
                        return res;
                    }

                    if (current == 'u')
                    {
                        auto maybe_code_unit = parse_unicode_escape();
                        auto code_unit = maybe_code_unit.get();
                        if (!code_unit)
                        {
                            return res;
                        }

                        if (pending_surrogate != 0 && is_trailing_surrogate(*code_unit))
                        {
                            utf8_append_code_point(
                                res, 0x10000 + ((pending_surrogate - 0xD800) << 10) + (*code_unit - 0xDC00));
                            pending_surrogate = 0;
                            continue;
                        }

                        flush_pending();
                        if (is_leading_surrogate(*code_unit))
                        {
                            pending_surrogate = *code_unit;
                        }
                        else
                        {
                            utf8_append_code_point(res, *code_unit);
                        }

                        continue;
                    }

                    flush_pending();
                    switch (current)
                    {
                        case '"': res.push_back('"'); break;
                        case '\\': res.push_back('\\'); break;
                        case '/': res.push_back('/'); break;
                        case 'b': res.push_back('\b'); break;
                        case 'f': res.push_back('\f'); break;
                        case 'n': res.push_back('\n'); break;
                        case 'r': res.push_back('\r'); break;
                        case 't': res.push_back('\t'); break;
                        default: add_error(msg::format(msgUnexpectedEscapeSequence)); return res;
                    }

                    next();
                }

                add_error(msg::format(msgUnexpectedEOFMidString));
                return res;
            }

            Value parse_number() noexcept
            {
                Checks::check_exit(FCOMB_LINE_INFO, is_number_start(cur()));

                bool floating = false;
                bool negative = false; // negative & 0 -> floating, so keep track of it
                std::string number_to_parse;

                char current = cur();
                if (current == '-')
                {
                    number_to_parse.push_back('-');
                    negative = true;
                    current = next();
                    if (at_eof())
                    {
                        add_error(msg::format(msgUnexpectedEOFAfterMinus));
                        return Value();
                    }
                }

                if (current == '0')
                {
                    current = next();
                    if (current == '.')
                    {
                        number_to_parse.append("0.");
                        floating = true;
                        current = next();
                    }
                    else if (is_ascii_digit(current))
                    {
                        add_error(msg::format(msgUnexpectedDigitsAfterLeadingZero));
                        return Value();
                    }
                    else
                    {
                        if (negative)
                        {
                            return Value::number(-0.0);
                        }
                        else
                        {
                            return Value::integer(0);
                        }
                    }
                }

                while (is_ascii_digit(current))
                {
                    number_to_parse.push_back(current);
                    current = next();
                }
                if (!floating && current == '.')
                {
                    floating = true;
                    number_to_parse.push_back('.');
                    current = next();
                    if (!is_ascii_digit(current))
                    {
                        add_error(msg::format(msgExpectedDigitsAfterDecimal));
                        return Value();
                    }
                    while (is_ascii_digit(current))
                    {
                        number_to_parse.push_back(current);
                        current = next();
                    }
                }

                if (floating)
                {
                    auto opt = Strings::strto<double>(number_to_parse);
                    if (auto res = opt.get())
                    {
                        if (isfinite(*res))
                        {
                            return Value::number(*res);
                        }
                        else
                        {
                            add_error(msg::format(msgFloatingPointConstTooBig, msg::count = number_to_parse));
                        }
                    }
                    else
                    {
                        add_error(msg::format(msgInvalidFloatingPointConst, msg::count = number_to_parse));
                    }
                }
                else
                {
                    auto opt = Strings::strto<long long>(number_to_parse);
                    if (auto res = opt.get())
                    {
                        return Value::integer(static_cast<int64_t>(*res));
                    }
                    else
                    {
                        add_error(msg::format(msgInvalidIntegerConst, msg::count = number_to_parse));
                    }
                }

                return Value();
            }

            Value parse_keyword() noexcept
            {
                const char* rest;
                Value val;
                switch (cur())
                {
                    case 't': // parse true
                        rest = "rue";
                        val = Value::boolean(true);
                        break;
                    case 'f': // parse false
                        rest = "alse";
                        val = Value::boolean(false);
                        break;
                    case 'n': // parse null
                        rest = "ull";
                        val = Value::null(nullptr);
                        break;
                    default: fcomb::Checks::unreachable(FCOMB_LINE_INFO);
                }

                for (const char* rest_it = rest; *rest_it != '\0'; ++rest_it)
                {
                    const char current = next();

                    if (at_eof())
                    {
                        add_error(msg::format(msgUnexpectedEOFMidKeyword));
                        return Value();
                    }
                    if (current != *rest_it)
                    {
                        add_error(msg::format(msgUnexpectedCharMidKeyword));
                        return Value();
                    }
                }
                next();

                return val;
            }

            Value parse_array() noexcept
            {
                Checks::check_exit(FCOMB_LINE_INFO, cur() == '[');
                next();

                Array arr;
                bool first = true;
                for (;;)
                {
                    skip_whitespace();

                    if (at_eof())
                    {
                        add_error(msg::format(msgUnexpectedEOFMidArray));
                        return Value();
                    }

                    char current = cur();
                    if (current == ']')
                    {
                        next();
                        return Value::array(std::move(arr));
                    }

                    if (first)
                    {
                        first = false;
                    }
                    else if (current == ',')
                    {
                        auto comma_loc = cur_loc();
                        next();
                        skip_whitespace();
                        if (at_eof())
                        {
                            add_error(msg::format(msgUnexpectedEOFMidArray));
                            return Value();
                        }
                        if (cur() == ']')
                        {
                            add_error(msg::format(msgTrailingCommaInArray), comma_loc);
                            return Value();
                        }
                    }
                    else
                    {
                        add_error(msg::format(msgUnexpectedCharMidArray));
                        return Value();
                    }

                    arr.push_back(parse_value());
                }
            }

            std::pair<std::string, Value> parse_kv_pair() noexcept
            {
                skip_whitespace();

                std::pair<std::string, Value> res = {std::string(""), Value()};

                if (at_eof())
                {
                    add_error(msg::format(msgUnexpectedEOFExpectedName));
                    return res;
                }
                if (cur() != '"')
                {
                    add_error(msg::format(msgUnexpectedCharExpectedName));
                    return res;
                }
                res.first = parse_string();

                skip_whitespace();
                if (at_eof())
                {
                    add_error(msg::format(msgUnexpectedEOFExpectedColon));
                    return res;
                }
                if (cur() != ':')
                {
                    add_error(msg::format(msgUnexpectedCharExpectedColon));
                    return res;
                }

                next();
                res.second = parse_value();

                return res;
            }

            Value parse_object() noexcept
            {
                Checks::check_exit(FCOMB_LINE_INFO, cur() == '{');
                next();

                Object obj;
                bool first = true;
                for (;;)
                {
                    skip_whitespace();
                    if (at_eof())
                    {
                        add_error(msg::format(msgUnexpectedEOFExpectedCloseBrace));
                        return Value();
                    }

                    char current = cur();
                    if (current == '}')
                    {
                        next();
                        return Value::object(std::move(obj));
                    }

                    if (first)
                    {
                        first = false;
                    }
                    else if (current == ',')
                    {
                        auto comma_loc = cur_loc();
                        next();
                        skip_whitespace();
                        if (at_eof())
                        {
                            add_error(msg::format(msgUnexpectedEOFExpectedCloseBrace));
                            return Value();
                        }
                        else if (cur() == '}')
                        {
                            add_error(msg::format(msgTrailingCommaInObj), comma_loc);
                            return Value();
                        }
                    }
                    else
                    {
                        add_error(msg::format(msgUnexpectedCharExpectedCloseBrace));
                        return Value();
                    }

                    auto key_pair_loc = cur_loc();
                    auto val = parse_kv_pair();
                    if (messages().any_errors())
                    {
                        return Value();
                    }

                    if (obj.contains(val.first))
                    {
                        add_error(msg::format(msgDuplicatedKeyInObj, msg::value = val.first), key_pair_loc);
                        return Value();
                    }

                    obj.insert(val.first, std::move(val.second));
                }
            }

            Value parse_value() noexcept
            {
                skip_whitespace();
                if (at_eof())
                {
                    add_error(msg::format(msgUnexpectedEOFExpectedValue));
                    return Value();
                }

                const char current = cur();
                switch (current)
                {
                    case '{': return parse_object();
                    case '[': return parse_array();
                    case '"': return Value::string(parse_string());
                    case 'n':
                    case 't':
                    case 'f': return parse_keyword();
                    default:
                        if (is_number_start(current))
                        {
                            return parse_number();
                        }
                        else
                        {
                            add_error(msg::format(msgUnexpectedCharExpectedValue));
                            return Value();
                        }
                }
            }

            static ExpectedL<Value> parse(StringView json, StringView origin)
            {
                static constexpr StringLiteral utf8_bom = "\xEF\xBB\xBF";
                if (json.starts_with(utf8_bom))
                {
                    json = json.substr(utf8_bom.size());
                }

                auto parser = Parser(json, origin, {1, 1});

                auto val = parser.parse_value();

                parser.skip_whitespace();
                if (!parser.at_eof())
                {
                    parser.add_error(msg::format(msgUnexpectedEOFExpectedChar));
                }

                if (parser.messages().any_errors())
                {
                    return parser.messages().join();
                }

                return val;
            }
        };
    }

    ExpectedL<Value> parse(StringView json, StringView origin) { return Parser::parse(json, origin); }

    ExpectedL<Object> parse_object(StringView text, StringView origin)
    {
        return parse(text, origin).then([&](Value&& value) -> ExpectedL<Object> {
            if (auto as_object = value.maybe_object())
            {
                return std::move(*as_object);
            }

            return msg::format(msgJsonErrorMustBeAnObject, msg::path = origin);
        });
    }
    // } auto parse()

    namespace
    {
        struct Stringifier
        {
            JsonStyle style;
            std::string& buffer;

            void append_newline_and_indent(size_t indent) const
            {
                if (!style.is_compact())
                {
                    buffer.push_back('\n');
                    buffer.append(indent * style.spaces(), ' ');
                }
            }

            void append_member_separator() const { buffer.append(style.is_compact() ? ":" : ": "); }

            void append_unicode_escape(unsigned char code_unit) const
            {
                fmt::format_to(std::back_inserter(buffer), "\\u{:04x}", code_unit);
            }

            void append_quoted_json_string(StringView sv)
            {
                buffer.push_back('"');
                for (const char ch : sv)
                {
                    switch (ch)
                    {
                        case '\b': buffer.append(R"(\b)"); break;
                        case '\t': buffer.append(R"(\t)"); break;
                        case '\n': buffer.append(R"(\n)"); break;
                        case '\f': buffer.append(R"(\f)"); break;
                        case '\r': buffer.append(R"(\r)"); break;
                        case '"': buffer.append(R"(\")"); break;
                        case '\\': buffer.append(R"(\\)"); break;
                        default:
                            if (static_cast<unsigned char>(ch) < 0x20)
                            {
                                append_unicode_escape(static_cast<unsigned char>(ch));
                            }
                            else
                            {
                                buffer.push_back(ch);
                            }
                            break;
                    }
                }

                buffer.push_back('"');
            }

            void stringify_object(const Object& obj, size_t current_indent)
            {
                buffer.push_back('{');
                if (obj.size() != 0)
                {
                    bool first = true;

                    for (const auto& el : obj)
                    {
                        if (!first)
                        {
                            buffer.push_back(',');
                        }
                        first = false;

                        append_newline_and_indent(current_indent + 1);

                        append_quoted_json_string(el.first);
                        append_member_separator();
                        stringify(el.second, current_indent + 1);
                    }
                    append_newline_and_indent(current_indent);
                }
                buffer.push_back('}');
            }

            void stringify_array(const Array& arr, size_t current_indent)
            {
                buffer.push_back('[');
                if (arr.size() != 0)
                {
                    bool first = true;

                    for (const auto& el : arr)
                    {
                        if (!first)
                        {
                            buffer.push_back(',');
                        }
                        first = false;

                        append_newline_and_indent(current_indent + 1);

                        stringify(el, current_indent + 1);
                    }
                    append_newline_and_indent(current_indent);
                }
                buffer.push_back(']');
            }

            void stringify(const Value& value, size_t current_indent)
            {
                switch (value.kind())
                {
                    case VK::Null: buffer.append("null"); break;
                    case VK::Boolean:
                    {
                        auto v = value.boolean(FCOMB_LINE_INFO);
                        buffer.append(v ? "true" : "false");
                        break;
                    }
                    case VK::Integer:
                        fmt::format_to(std::back_inserter(buffer), "{}", value.integer(FCOMB_LINE_INFO));
                        break;
                    case VK::Number:
                        fmt::format_to(std::back_inserter(buffer), "{}", value.number(FCOMB_LINE_INFO));
                        break;
                    case VK::String:
                    {
                        append_quoted_json_string(value.string(FCOMB_LINE_INFO));
                        break;
                    }
                    case VK::Array:
                    {
                        stringify_array(value.array(FCOMB_LINE_INFO), current_indent);
                        break;
                    }
                    case VK::Object:
                    {
                        stringify_object(value.object(FCOMB_LINE_INFO), current_indent);
                        break;
                    }
                }
            }
        };
    }

    std::string stringify(const Value& value) { return stringify(value, JsonStyle{}); }
    std::string stringify(const Value& value, JsonStyle style)
    {
        std::string res;
        Stringifier{style, res}.stringify(value, 0);
        res.push_back('\n');
        return res;
    }
    std::string stringify(const Object& obj) { return stringify(obj, JsonStyle{}); }
    std::string stringify(const Object& obj, JsonStyle style)
    {
        std::string res;
        Stringifier{style, res}.stringify_object(obj, 0);
        res.push_back('\n');
        return res;
    }
    std::string stringify(const Array& arr) { return stringify(arr, JsonStyle{}); }
    std::string stringify(const Array& arr, JsonStyle style)
    {
        std::string res;
        Stringifier{style, res}.stringify_array(arr, 0);
        res.push_back('\n');
        return res;
    }
}
