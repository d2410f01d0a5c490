#include <ms/marshalling.h>

#include <ms/exceptions.h>
#include <ms/log.h>

#include <optional>
#include <stdexcept>

namespace ms {

namespace {
    enum class Direction { Dump, Load };

    // Per-record error sink. Collects conversion and validation failures under
    // their keys; raises as soon as one arrives when the schema is strict.
    struct Collector {
        const Schema& schema;
        Direction direction;
        bool raise;
        // decimal element index in many mode
        std::optional<std::string> index;
        Dictionary errors = Dictionary::object();

        template <typename Fn>
        void call(const std::string& key, Fn&& fn) {
            try {
                fn();
            } catch (const ConversionError& e) {
                if (e.nested_errors)
                    errors[key] = *e.nested_errors;
                else
                    store_error(errors, key, e.what());
                log::debug(schema.repr() + ": error on '" + key + "': " + e.what());
                if (raise) fail(key, e.what());
            } catch (const ValidationError& e) {
                const std::string target = e.field.empty() ? key : e.field;
                store_error(errors, target, e.what());
                log::debug(schema.repr() + ": validation error on '" + target + "': " + e.what());
                if (raise) fail(target, e.what());
            }
        }

        // only called from inside a handler, so std::current_exception() is the cause
        [[noreturn]] void fail(const std::string& key, const std::string& msg) const {
            std::string text = key == SCHEMA_ERRORS_KEY ? msg : "field '" + key + "': " + msg;
            Dictionary all = errors;
            if (index) {
                all = Dictionary::object();
                all[*index] = errors;
            }
            if (direction == Direction::Dump) throw MarshallingError(text, std::current_exception(), all);
            throw UnmarshallingError(text, std::current_exception(), all);
        }
    };

    std::string describe(const Dictionary& data) {
        try {
            return data.dump();
        } catch (const std::runtime_error&) {
            return "<" + data.typeString() + ">";
        }
    }

    Dictionary marshal_one(const Schema& schema, const Dictionary& obj, Collector& c) {
        Dictionary data = Dictionary::object();
        const bool skip_missing = schema.skipMissing();
        for (auto const& entry : schema.fields()) {
            const std::string& name = entry.first;
            const Field& field = *entry.second;
            if (skip_missing and field.skippable(obj)) continue;
            c.call(name, [&] {
                Dictionary value = field.serialize(obj);
                data[schema.prefix() + name] = std::move(value);
            });
        }
        for (auto const& handler : schema.dataHandlers()) {
            c.call(SCHEMA_ERRORS_KEY, [&] { data = handler(schema, data, obj); });
        }
        const Dictionary& extra = schema.extra();
        if (extra.isMappedObject() and data.isMappedObject()) {
            for (auto const& p : extra.items()) data[p.first] = p.second;
        }
        return data;
    }

    Dictionary unmarshal_one(const Schema& schema, const Dictionary& raw, Collector& c) {
        Dictionary input = raw;
        for (auto const& pre : schema.preprocessors()) {
            c.call(SCHEMA_ERRORS_KEY, [&] { input = pre(schema, input); });
        }

        Dictionary data = Dictionary::object();
        if (!input.isMappedObject()) {
            c.call(SCHEMA_ERRORS_KEY, [] { throw ValidationError("Invalid input type: expected a mapping."); });
            return data;
        }

        for (auto const& entry : schema.fields()) {
            const std::string& name = entry.first;
            const Field& field = *entry.second;
            if (!input.has(name)) {
                if (field.isRequired()) c.call(name, [&] { throw RequiredFieldError(name); });
                continue;
            }
            c.call(name, [&] {
                Dictionary value = field.deserialize(input.at(name));
                data[field.attributePath().empty() ? name : field.attributePath()] = std::move(value);
            });
        }

        for (auto const& validator : schema.validators()) {
            c.call(SCHEMA_ERRORS_KEY, [&] {
                if (!validator.fn(schema, data)) {
                    throw ValidationError("Schema validator " + validator.name + "(" + describe(data) + ") is False");
                }
            });
        }

        if (c.errors.empty()) {
            if (auto factory = schema.schemaClass()->objectFactory()) {
                c.call(SCHEMA_ERRORS_KEY, [&] { data = factory(data); });
            }
        }
        return data;
    }
}  // namespace

void store_error(Dictionary& errors, const std::string& key, const std::string& message) {
    Dictionary& slot = errors[key];
    if (slot.isMappedObject() and !slot.empty()) {
        store_error(slot, SCHEMA_ERRORS_KEY, message);
        return;
    }
    slot.push_back(Dictionary(message));
}

MarshalResult Marshaller::operator()(const Dictionary& obj) const {
    const ErrorHandler handler = m_schema.errorHandler();
    const bool raise = m_schema.strict() and !handler;
    log::debug("dump " + m_schema.repr());

    MarshalResult result;
    if (!m_schema.many()) {
        if (obj.isArrayObject()) {
            log::warn("deprecation", "Implicit collection handling is deprecated. Set many=true to dump a collection.");
            throw SchemaDefinitionError("Schema '" + m_schema.schemaClass()->name() +
                                        "' received a collection; construct it with many=true to dump a collection");
        }
        Collector c{m_schema, Direction::Dump, raise, std::nullopt};
        result.data = marshal_one(m_schema, obj, c);
        result.errors = std::move(c.errors);
    } else {
        if (!obj.isNull() and !obj.isArrayObject()) {
            throw SchemaDefinitionError("Schema '" + m_schema.schemaClass()->name() +
                                        "' was constructed with many=true and expects a collection, got " +
                                        obj.typeString());
        }
        result.data = Dictionary::array();
        if (obj.isArrayObject()) {
            int i = 0;
            for (auto const& item : obj.elements()) {
                const std::string key = std::to_string(i++);
                Collector c{m_schema, Direction::Dump, raise, key};
                result.data.push_back(marshal_one(m_schema, item, c));
                if (!c.errors.empty()) result.errors[key] = std::move(c.errors);
            }
        }
    }

    if (handler and !result.errors.empty()) handler(m_schema, result.errors, obj);
    return result;
}

UnmarshalResult Unmarshaller::operator()(const Dictionary& data) const {
    const ErrorHandler handler = m_schema.errorHandler();
    const bool raise = m_schema.strict() and !handler;
    log::debug("load " + m_schema.repr());

    UnmarshalResult result;
    if (!m_schema.many()) {
        Collector c{m_schema, Direction::Load, raise, std::nullopt};
        result.data = unmarshal_one(m_schema, data, c);
        result.errors = std::move(c.errors);
    } else {
        result.data = Dictionary::array();
        if (!data.isArrayObject()) {
            Collector c{m_schema, Direction::Load, raise, std::nullopt};
            c.call(SCHEMA_ERRORS_KEY, [] { throw ValidationError("Invalid input type: expected a list."); });
            result.errors = std::move(c.errors);
        } else {
            int i = 0;
            for (auto const& item : data.elements()) {
                const std::string key = std::to_string(i++);
                Collector c{m_schema, Direction::Load, raise, key};
                result.data.push_back(unmarshal_one(m_schema, item, c));
                if (!c.errors.empty()) result.errors[key] = std::move(c.errors);
            }
        }
    }

    if (handler and !result.errors.empty()) handler(m_schema, result.errors, data);
    return result;
}

}  // namespace ms
