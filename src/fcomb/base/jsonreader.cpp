#include <fcomb/base/jsonreader.h>
#include <fcomb/base/messages.h>
#include <fcomb/base/strings.h>

#include <algorithm>
#include <iterator>

namespace fcomb::Json
{
    static std::vector<std::string> invalid_json_fields(const Json::Object& obj,
                                                        View<StringLiteral> known_fields) noexcept
    {
        const auto field_is_unknown = [known_fields](StringView sv) {
            // allow directives
            if (sv.size() != 0 && *sv.begin() == '$')
            {
                return false;
            }
            return std::find(known_fields.begin(), known_fields.end(), sv) == known_fields.end();
        };

        std::vector<std::string> res;
        for (const auto& kv : obj)
        {
            if (field_is_unknown(kv.first))
            {
                res.push_back(kv.first.to_string());
            }
        }

        return res;
    }

    Reader::Reader(StringView origin) : m_origin(origin.data(), origin.size()) { }

    void Reader::add_missing_field_error(const LocalizedString& type, StringView key, const LocalizedString& key_type)
    {
        add_generic_error(type, msg::format(msgMissingRequiredField, msg::json_field = key, msg::json_type = key_type));
    }

    void Reader::add_expected_type_error(const LocalizedString& expected_type)
    {
        m_messages.add_line(
            DiagnosticLine{DiagKind::Error,
                           m_origin,
                           msg::format(msgMismatchedType, msg::json_field = path(), msg::json_type = expected_type)});
    }

    void Reader::add_extra_field_warning(const LocalizedString& type, StringView field, StringView suggestion)
    {
        if (suggestion.size() > 0)
        {
            add_warning(type, msg::format(msgUnexpectedFieldSuggest, msg::json_field = field, msg::value = suggestion));
        }
        else
        {
            add_warning(type, msg::format(msgUnexpectedField, msg::json_field = field));
        }
    }

    void Reader::add_generic_error(const LocalizedString& type, StringView message)
    {
        m_messages.add_line(DiagnosticLine{
            DiagKind::Error,
            m_origin,
            LocalizedString::from_raw(path()).append_raw(" (").append(type).append_raw("): ").append_raw(message)});
    }

    void Reader::check_for_unexpected_fields(const Object& obj,
                                             View<StringLiteral> valid_fields,
                                             const LocalizedString& type_name)
    {
        if (valid_fields.size() == 0)
        {
            return;
        }

        auto extra_fields = invalid_json_fields(obj, valid_fields);
        for (auto&& f : extra_fields)
        {
            auto best_it = valid_fields.begin();
            auto best_value = Strings::byte_edit_distance(f, *best_it);
            for (auto i = best_it + 1; i != valid_fields.end(); ++i)
            {
                auto v = Strings::byte_edit_distance(f, *i);
                if (v < best_value)
                {
                    best_value = v;
                    best_it = i;
                }
            }

            // only suggest names which are plausibly typos
            if (best_value <= f.size() / 2)
            {
                add_extra_field_warning(type_name, f, *best_it);
            }
            else
            {
                add_extra_field_warning(type_name, f);
            }
        }
    }

    void Reader::add_warning(const LocalizedString& type, StringView message)
    {
        m_messages.add_line(DiagnosticLine{
            DiagKind::Warning,
            m_origin,
            LocalizedString::from_raw(path()).append_raw(" (").append(type).append_raw("): ").append_raw(message)});
    }

    std::string Reader::path() const noexcept
    {
        std::string p("$");
        for (auto&& s : m_path)
        {
            if (s.index < 0)
            {
                p.push_back('.');
                p.append(s.field.data(), s.field.size());
            }
            else
            {
                fmt::format_to(std::back_inserter(p), "[{}]", s.index);
            }
        }
        return p;
    }

    StringView Reader::origin() const noexcept { return m_origin; }

    Optional<std::string> StringDeserializer::visit_string(Reader&, StringView sv) const { return sv.to_string(); }

    LocalizedString UntypedStringDeserializer::type_name() const { return msg::format(msgAString); }

    const UntypedStringDeserializer UntypedStringDeserializer::instance;

    LocalizedString PathDeserializer::type_name() const { return msg::format(msgAPath); }
    Optional<Path> PathDeserializer::visit_string(Reader&, StringView sv) const { return sv; }

    const PathDeserializer PathDeserializer::instance;

    LocalizedString BooleanDeserializer::type_name() const { return msg::format(msgABoolean); }

    Optional<bool> BooleanDeserializer::visit_boolean(Reader&, bool b) const { return b; }

    const BooleanDeserializer BooleanDeserializer::instance;

    LocalizedString ObjectDeserializer::type_name() const { return msg::format(msgAMetadataObject); }

    Optional<Object> ObjectDeserializer::visit_object(Reader&, const Object& obj) const { return obj; }

    const ObjectDeserializer ObjectDeserializer::instance;
}
