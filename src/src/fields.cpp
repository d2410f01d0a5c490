#include <ms/fields.h>

#include <ms/datetime.h>
#include <ms/log.h>
#include <ms/reflect.h>
#include <ms/schema.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace ms {

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string& s) {
        size_t a = 0;
        while (a < s.size() and std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        size_t b = s.size();
        while (b > a and std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    // whole-text numeric parses; std::nullopt on trailing garbage
    std::optional<int64_t> parse_int(const std::string& text) {
        std::string t = trim(text);
        if (t.empty()) return std::nullopt;
        char* end = nullptr;
        errno = 0;
        long long v = std::strtoll(t.c_str(), &end, 10);
        if (errno != 0 or end != t.c_str() + t.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    }

    std::optional<double> parse_double(const std::string& text) {
        std::string t = trim(text);
        if (t.empty()) return std::nullopt;
        char* end = nullptr;
        double v = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size()) return std::nullopt;
        return v;
    }

    // [-2^63, 2^63) as doubles
    bool fits_int64(double x) { return x >= -9223372036854775808.0 and x < 9223372036854775808.0; }

    std::string format_timestamp(const Timestamp& ts, const std::string& fmt) {
        if (fmt.empty() or fmt == "iso") return datetime::isoformat(datetime::to_utc(ts));
        if (fmt == "rfc") return datetime::rfcformat(ts);
        return datetime::format(ts, fmt);
    }

    int64_t total_seconds(std::chrono::microseconds d) {
        return std::chrono::floor<std::chrono::seconds>(d).count();
    }

    Timestamp date_part(Timestamp ts) {
        ts.hour = ts.minute = ts.second = ts.microsecond = 0;
        ts.utc_offset.reset();
        return ts;
    }

    Timestamp time_part(const Timestamp& ts) {
        Timestamp out;
        out.hour = ts.hour;
        out.minute = ts.minute;
        out.second = ts.second;
        out.microsecond = ts.microsecond;
        return out;
    }
}  // namespace

// ---------------------------------------------------------------------------
// Field

void Field::bind(const std::string& name, const Schema&) { m_name = name; }

void Field::setContext(std::shared_ptr<Dictionary> context) { m_context = std::move(context); }

std::optional<Dictionary> Field::getValue(const Dictionary& obj) const {
    return resolve(obj, m_attribute.empty() ? m_name : m_attribute);
}

Dictionary Field::serialize(const Dictionary& obj) const {
    auto value = getValue(obj);
    return output(value ? *value : Dictionary::null());
}

Dictionary Field::output(const Dictionary& value) const {
    if (value.isNull()) {
        if (m_default) return *m_default;
        return emptyValue();
    }
    return format(value);
}

Dictionary Field::deserialize(const Dictionary& value) const {
    Dictionary result = value.isNull() ? value : convert(value);
    runValidators(result);
    return result;
}

bool Field::isMissing(const Dictionary& obj) const {
    auto value = getValue(obj);
    return !value or value->isNull();
}

bool Field::skippable(const Dictionary& obj) const {
    if (!isMissing(obj)) return false;
    if (!m_default) return true;
    return m_default->isNull() or *m_default == emptyValue();
}

Dictionary Field::format(const Dictionary& value) const { return value; }

Dictionary Field::convert(const Dictionary& value) const { return value; }

Dictionary Field::emptyValue() const { return Dictionary::null(); }

void Field::fail(const std::string& msg) const {
    throw ConversionError(m_error.empty() ? msg : m_error, m_name);
}

void Field::runValidators(const Dictionary& value) const {
    for (auto const& predicate : m_validators) {
        bool ok = false;
        try {
            ok = predicate(value);
        } catch (const ValidationError& e) {
            fail(e.what());
        } catch (const std::exception& e) {
            fail(e.what());
        }
        if (!ok) fail("Invalid value.");
    }
}

std::string Field::literal(const Dictionary& value) {
    switch (value.type()) {
        case Dictionary::String:
            return value.asString();
        case Dictionary::Reference:
            return "<object>";
        default:
            return value.to_string();
    }
}

namespace fields {

    // -----------------------------------------------------------------------
    // scalars

    Dictionary String::format(const Dictionary& value) const {
        switch (value.type()) {
            case Dictionary::String:
                return value;
            case Dictionary::Duration:
                return Dictionary(std::to_string(total_seconds(value.asDuration())));
            case Dictionary::Reference:
                fail("'" + literal(value) + "' cannot be formatted as a string.");
            default:
                return Dictionary(value.to_string());
        }
    }

    Dictionary Integer::format(const Dictionary& value) const {
        if (value.isInt()) return value;
        if (value.isDouble() and fits_int64(value.asDouble())) return Dictionary(value.asInt());
        if (value.isBool()) return Dictionary(value.asBool() ? 1 : 0);
        if (value.isString()) {
            if (auto n = parse_int(value.asString())) return Dictionary(*n);
        }
        fail("'" + literal(value) + "' cannot be formatted as an integer.");
    }

    double Number::toDouble(const Dictionary& value) const {
        if (value.isNumber()) return value.asDouble();
        if (value.isBool()) return value.asBool() ? 1.0 : 0.0;
        if (value.isString()) {
            if (auto x = parse_double(value.asString())) return *x;
        }
        fail("'" + literal(value) + "' cannot be formatted as " + m_noun + ".");
    }

    Dictionary Number::format(const Dictionary& value) const { return Dictionary(toDouble(value)); }

    Dictionary Fixed::format(const Dictionary& value) const {
        double x = toDouble(value);
        if (!std::isfinite(x)) fail("'" + literal(value) + "' cannot be formatted as " + m_noun + ".");
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(m_decimals) << x;
        return Dictionary(ss.str());
    }

    Dictionary Boolean::format(const Dictionary& value) const {
        static const std::vector<std::string> truthy = {"true", "t", "yes", "y", "on", "1"};
        static const std::vector<std::string> falsy = {"false", "f", "no", "n", "off", "0", ""};
        if (value.isBool()) return value;
        if (value.isInt()) return Dictionary(value.asInt() != 0);
        if (value.isDouble()) return Dictionary(value.asDouble() != 0.0);
        if (value.isString()) {
            std::string text = lower(trim(value.asString()));
            if (std::find(truthy.begin(), truthy.end(), text) != truthy.end()) return Dictionary(true);
            if (std::find(falsy.begin(), falsy.end(), text) != falsy.end()) return Dictionary(false);
        }
        fail("'" + literal(value) + "' is not a valid boolean.");
    }

    // -----------------------------------------------------------------------
    // temporal

    void DateTime::bind(const std::string& name, const Schema& owner) {
        Field::bind(name, owner);
        if (!m_format) m_format = owner.options().dateformat;
    }

    Timestamp DateTime::toTimestamp(const Dictionary& value, const char* verb) const {
        if (value.isTimestamp()) return value.asTimestamp();
        if (value.isString()) {
            if (auto ts = datetime::from_iso(value.asString())) return *ts;
            if (auto ts = datetime::from_rfc(value.asString())) return *ts;
        }
        fail("'" + literal(value) + "' cannot be " + verb + " as a datetime.");
    }

    Dictionary DateTime::format(const Dictionary& value) const {
        return Dictionary(format_timestamp(toTimestamp(value, "formatted"), m_format.value_or("")));
    }

    Dictionary DateTime::convert(const Dictionary& value) const {
        if (value.isTimestamp()) return value;
        if (value.isString()) {
            const std::string fmt = m_format.value_or("");
            std::optional<Timestamp> ts;
            if (fmt.empty() or fmt == "iso")
                ts = datetime::from_iso(value.asString());
            else if (fmt == "rfc")
                ts = datetime::from_rfc(value.asString());
            else
                ts = datetime::parse(value.asString(), fmt);
            if (ts) return Dictionary(*ts);
        }
        fail("'" + literal(value) + "' cannot be parsed as a datetime.");
    }

    Dictionary LocalDateTime::format(const Dictionary& value) const {
        Timestamp local = datetime::to_local(toTimestamp(value, "formatted"));
        const std::string fmt = m_format.value_or("");
        if (fmt.empty() or fmt == "iso") return Dictionary(datetime::isoformat(local));
        return Dictionary(format_timestamp(local, fmt));
    }

    Dictionary Date::format(const Dictionary& value) const {
        if (value.isTimestamp()) return Dictionary(datetime::isodate(value.asTimestamp()));
        if (value.isString()) {
            if (auto ts = datetime::from_iso(value.asString())) return Dictionary(datetime::isodate(*ts));
        }
        fail("'" + literal(value) + "' cannot be formatted as a date.");
    }

    Dictionary Date::convert(const Dictionary& value) const {
        if (value.isTimestamp()) return Dictionary(date_part(value.asTimestamp()));
        if (value.isString()) {
            if (auto ts = datetime::from_iso(value.asString())) return Dictionary(date_part(*ts));
        }
        fail("'" + literal(value) + "' cannot be parsed as a date.");
    }

    Dictionary Time::format(const Dictionary& value) const {
        if (value.isTimestamp()) return Dictionary(datetime::isotime(value.asTimestamp()));
        if (value.isString()) {
            if (auto ts = datetime::from_iso_time(value.asString())) return Dictionary(datetime::isotime(*ts));
            if (auto ts = datetime::from_iso(value.asString())) return Dictionary(datetime::isotime(*ts));
        }
        fail("'" + literal(value) + "' cannot be formatted as a time.");
    }

    Dictionary Time::convert(const Dictionary& value) const {
        if (value.isTimestamp()) return Dictionary(time_part(value.asTimestamp()));
        if (value.isString()) {
            if (auto ts = datetime::from_iso_time(value.asString())) return Dictionary(*ts);
        }
        fail("'" + literal(value) + "' cannot be parsed as a time.");
    }

    Dictionary TimeDelta::format(const Dictionary& value) const {
        if (value.isDuration()) return Dictionary(total_seconds(value.asDuration()));
        if (value.isInt()) return value;
        if (value.isDouble() and fits_int64(std::floor(value.asDouble())))
            return Dictionary(static_cast<int64_t>(std::floor(value.asDouble())));
        fail("'" + literal(value) + "' cannot be formatted as a timedelta.");
    }

    Dictionary TimeDelta::convert(const Dictionary& value) const {
        if (value.isDuration()) return value;
        std::optional<double> seconds;
        if (value.isNumber()) seconds = value.asDouble();
        if (value.isString()) seconds = parse_double(value.asString());
        if (seconds and fits_int64(*seconds * 1e6)) {
            return Dictionary(std::chrono::microseconds(static_cast<int64_t>(std::llround(*seconds * 1e6))));
        }
        fail("'" + literal(value) + "' cannot be parsed as a timedelta.");
    }

    // -----------------------------------------------------------------------
    // lexical

    Dictionary UUID::format(const Dictionary& value) const {
        if (value.isString()) {
            std::string text = lower(trim(value.asString()));
            if (text.rfind("urn:uuid:", 0) == 0) text = text.substr(9);
            if (text.size() >= 2 and text.front() == '{' and text.back() == '}')
                text = text.substr(1, text.size() - 2);
            std::string hex;
            for (char c : text)
                if (c != '-') hex.push_back(c);
            bool ok = hex.size() == 32 and
                      std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c); });
            if (ok) {
                return Dictionary(hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
                                  hex.substr(16, 4) + "-" + hex.substr(20));
            }
        }
        fail("'" + literal(value) + "' is not a valid UUID.");
    }

    Dictionary Url::format(const Dictionary& value) const {
        std::string text = literal(value);
        if (value.isString()) {
            bool ok = m_lexical ? m_lexical(text) : lexical::is_url(text, m_relative);
            if (ok) return value;
        }
        std::string msg = "\"" + text + "\" is not a valid URL.";
        if (!m_lexical and value.isString()) {
            if (auto suggestion = lexical::suggest_url(text)) msg += " Did you mean: \"" + *suggestion + "\"?";
        }
        fail(msg);
    }

    Dictionary Email::format(const Dictionary& value) const {
        std::string text = literal(value);
        if (value.isString()) {
            bool ok = m_lexical ? m_lexical(text) : lexical::is_email(text);
            if (ok) return value;
        }
        fail("\"" + text + "\" is not a valid email address.");
    }

    Dictionary Select::format(const Dictionary& value) const {
        for (auto const& choice : m_choices)
            if (choice == value) return value;
        fail("'" + literal(value) + "' is not a valid choice for this field.");
    }

    // -----------------------------------------------------------------------
    // containers

    void List::bind(const std::string& name, const Schema& owner) {
        Field::bind(name, owner);
        m_inner->bind(name, owner);
    }

    void List::setContext(std::shared_ptr<Dictionary> context) {
        Field::setContext(context);
        m_inner->setContext(std::move(context));
    }

    Dictionary List::format(const Dictionary& value) const {
        Dictionary out = Dictionary::array();
        if (!value.isArrayObject()) {
            out.push_back(m_inner->output(value));
            return out;
        }
        for (auto const& el : value.elements()) out.push_back(m_inner->output(el));
        return out;
    }

    Dictionary List::convert(const Dictionary& value) const {
        if (!value.isArrayObject()) fail("'" + literal(value) + "' is not a valid list.");
        Dictionary out = Dictionary::array();
        for (auto const& el : value.elements()) out.push_back(m_inner->deserialize(el));
        return out;
    }

    // -----------------------------------------------------------------------
    // computed

    namespace {
        template <typename Fn>
        Dictionary call_user(const Field& field, Fn&& fn) {
            try {
                return fn();
            } catch (const Error&) {
                throw;
            } catch (const std::exception& e) {
                throw ConversionError(field.errorMessage().empty() ? std::string(e.what()) : field.errorMessage(),
                                      field.name());
            }
        }
    }  // namespace

    void Method::bind(const std::string& name, const Schema& owner) {
        Field::bind(name, owner);
        m_owner = &owner;
        const SchemaMethod* method = owner.schemaClass()->findMethod(m_method_name);
        if (method == nullptr) {
            throw SchemaDefinitionError("Method field '" + name + "': schema '" + owner.schemaClass()->name() +
                                        "' has no method named '" + m_method_name + "'");
        }
        m_method = *method;
    }

    Dictionary Method::serialize(const Dictionary& obj) const {
        if (m_method.contextual) {
            if (!m_context) fail("No context available for Method field '" + m_name + "'");
            return call_user(*this, [&] { return m_method.contextual(*m_owner, obj, *m_context); });
        }
        return call_user(*this, [&] { return m_method.plain(*m_owner, obj); });
    }

    Dictionary Function::serialize(const Dictionary& obj) const {
        if (m_context_fn) {
            if (!m_context) fail("No context available for Function field '" + m_name + "'");
            return call_user(*this, [&] { return m_context_fn(obj, *m_context); });
        }
        return call_user(*this, [&] { return m_fn(obj); });
    }

    // -----------------------------------------------------------------------
    // Nested

    Nested::Nested(std::shared_ptr<const SchemaClass> target) : m_target(std::move(target)) {
        if (!m_target) throw SchemaDefinitionError("Nested field must be given a schema class");
    }

    Nested::Nested(std::string class_name) : m_target_name(std::move(class_name)) {}

    Nested::Nested(SelfReference) : m_self(true) {}

    Nested::Nested(const Nested& other)
        : FieldBuilder<Nested>(other),
          m_target(other.m_target),
          m_target_name(other.m_target_name),
          m_self(other.m_self),
          m_only(other.m_only),
          m_flat(other.m_flat),
          m_exclude(other.m_exclude),
          m_many(other.m_many) {}

    Nested& Nested::only(std::initializer_list<std::string> names) {
        return only(std::vector<std::string>(names));
    }

    Nested& Nested::only(std::vector<std::string> names) {
        m_only = std::move(names);
        m_flat = false;
        return *this;
    }

    Nested& Nested::only(const std::string& name) {
        m_only = std::vector<std::string>{name};
        m_flat = true;
        return *this;
    }

    Nested& Nested::exclude(std::initializer_list<std::string> names) {
        return exclude(std::vector<std::string>(names));
    }

    Nested& Nested::exclude(std::vector<std::string> names) {
        m_exclude = std::move(names);
        return *this;
    }

    Nested& Nested::many(bool value) {
        m_many = value;
        return *this;
    }

    void Nested::bind(const std::string& name, const Schema& owner) {
        Field::bind(name, owner);
        if (m_self) {
            m_target = owner.schemaClass();
        } else if (!m_target) {
            m_target = SchemaClass::lookup(m_target_name);
            if (!m_target) {
                throw SchemaDefinitionError("Nested field '" + name + "' refers to unknown schema class '" +
                                            m_target_name + "'");
            }
        }
        if (m_only) {
            auto names = m_target->fieldNames();
            for (auto const& n : *m_only) {
                if (std::find(names.begin(), names.end(), n) == names.end()) {
                    throw SchemaDefinitionError("Nested field '" + name + "': '" + n + "' is not a field of schema '" +
                                                m_target->name() + "'");
                }
            }
        }
    }

    void Nested::setContext(std::shared_ptr<Dictionary> context) {
        Field::setContext(std::move(context));
        if (m_schema) m_schema->setContext(m_context);
    }

    Schema& Nested::schema() const {
        if (!m_target) throw SchemaDefinitionError("Nested field '" + m_name + "' is not bound to a schema");
        std::call_once(m_once, [this] {
            SchemaArgs args;
            args.only = m_only;
            args.exclude = m_exclude;
            args.many = m_many;
            args.strict = false;
            auto inner = std::make_shared<Schema>(m_target, args);
            inner->setContext(m_context);
            log::debug("Nested field '" + m_name + "' created " + inner->repr());
            m_schema = std::move(inner);
        });
        return *m_schema;
    }

    Dictionary Nested::format(const Dictionary& value) const {
        MarshalResult result = schema().dump(value);
        if (!result.errors.empty()) {
            throw ConversionError("Nested schema '" + m_target->name() + "' reported errors.", m_name,
                                  result.errors);
        }
        if (!m_flat) return result.data;
        const std::string& key = m_only->front();
        auto pluck = [&key](const Dictionary& item) {
            return item.isMappedObject() and item.has(key) ? item.at(key) : Dictionary::null();
        };
        if (!result.data.isArrayObject()) return pluck(result.data);
        Dictionary out = Dictionary::array();
        for (auto const& item : result.data.elements()) out.push_back(pluck(item));
        return out;
    }

    Dictionary Nested::convert(const Dictionary& value) const {
        UnmarshalResult result = schema().load(value);
        if (!result.errors.empty()) {
            throw ConversionError("Nested schema '" + m_target->name() + "' reported errors.", m_name,
                                  result.errors);
        }
        return result.data;
    }

    // -----------------------------------------------------------------------
    // Inferred

    void Inferred::bind(const std::string& name, const Schema& owner) {
        Field::bind(name, owner);
        m_dateformat = owner.options().dateformat;
    }

    Dictionary Inferred::serialize(const Dictionary& obj) const {
        if (obj.isNull()) return Dictionary::null();
        const std::string& path = m_attribute.empty() ? m_name : m_attribute;
        auto value = getValue(obj);
        if (!value) throw AttributeLookupError("source object has no attribute '" + path + "'", path);
        return output(*value);
    }

    Dictionary Inferred::format(const Dictionary& value) const {
        if (value.isTimestamp()) return Dictionary(format_timestamp(value.asTimestamp(), m_dateformat.value_or("")));
        if (value.isDuration()) return Dictionary(total_seconds(value.asDuration()));
        return value;
    }

}  // namespace fields
}  // namespace ms
