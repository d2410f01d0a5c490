#include <ms/schema.h>

#include <ms/exceptions.h>
#include <ms/log.h>
#include <ms/marshalling.h>

#include <algorithm>
#include <mutex>
#include <sstream>

namespace ms {

namespace {
    using ClassPtr = std::shared_ptr<const SchemaClass>;

    std::mutex& registry_mutex() {
        static std::mutex m;
        return m;
    }

    std::map<std::string, std::weak_ptr<const SchemaClass>>& registry() {
        static std::map<std::string, std::weak_ptr<const SchemaClass>> classes;
        return classes;
    }

    // C3 merge of the base linearizations and the base list itself.
    std::vector<ClassPtr> c3_merge(std::vector<std::vector<ClassPtr>> seqs, const std::string& class_name) {
        std::vector<ClassPtr> result;
        while (true) {
            seqs.erase(std::remove_if(seqs.begin(), seqs.end(), [](const std::vector<ClassPtr>& s) { return s.empty(); }),
                       seqs.end());
            if (seqs.empty()) return result;

            ClassPtr candidate;
            for (auto const& seq : seqs) {
                const ClassPtr& head = seq.front();
                bool in_tail = false;
                for (auto const& other : seqs) {
                    if (std::find(other.begin() + 1, other.end(), head) != other.end()) {
                        in_tail = true;
                        break;
                    }
                }
                if (!in_tail) {
                    candidate = head;
                    break;
                }
            }
            if (!candidate) {
                throw SchemaDefinitionError("Cannot create a consistent method resolution order for schema '" +
                                            class_name + "'");
            }
            result.push_back(candidate);
            for (auto& seq : seqs) {
                if (seq.front() == candidate) seq.erase(seq.begin());
            }
        }
    }

    void put_field(FieldList& list, const std::string& name, std::shared_ptr<const Field> field) {
        for (auto& entry : list) {
            if (entry.first == name) {
                entry.second = std::move(field);
                return;
            }
        }
        list.emplace_back(name, std::move(field));
    }

    const std::shared_ptr<const Field>* find_field(const FieldList& list, const std::string& name) {
        for (auto const& entry : list)
            if (entry.first == name) return &entry.second;
        return nullptr;
    }
}  // namespace

// ---------------------------------------------------------------------------
// SchemaClass

std::vector<std::shared_ptr<const SchemaClass>> SchemaClass::mro() const {
    std::vector<ClassPtr> out;
    out.push_back(shared_from_this());
    out.insert(out.end(), m_ancestors.begin(), m_ancestors.end());
    return out;
}

std::vector<std::string> SchemaClass::fieldNames() const {
    std::vector<std::string> names;
    names.reserve(m_resolved_fields.size());
    for (auto const& entry : m_resolved_fields) names.push_back(entry.first);
    return names;
}

void SchemaClass::addValidator(ValidatorFn fn, std::string name) {
    m_validators.push_back(SchemaValidator{name.empty() ? "validator" : std::move(name), std::move(fn)});
}

void SchemaClass::addPreprocessor(Preprocessor fn) { m_preprocessors.push_back(std::move(fn)); }

void SchemaClass::addDataHandler(DataHandler fn) { m_data_handlers.push_back(std::move(fn)); }

void SchemaClass::setErrorHandler(ErrorHandler fn) { m_error_handler = std::move(fn); }

std::vector<SchemaValidator> SchemaClass::validators() const {
    std::vector<SchemaValidator> out;
    for (auto it = m_ancestors.rbegin(); it != m_ancestors.rend(); ++it)
        out.insert(out.end(), (*it)->m_validators.begin(), (*it)->m_validators.end());
    out.insert(out.end(), m_validators.begin(), m_validators.end());
    return out;
}

std::vector<Preprocessor> SchemaClass::preprocessors() const {
    std::vector<Preprocessor> out;
    for (auto it = m_ancestors.rbegin(); it != m_ancestors.rend(); ++it)
        out.insert(out.end(), (*it)->m_preprocessors.begin(), (*it)->m_preprocessors.end());
    out.insert(out.end(), m_preprocessors.begin(), m_preprocessors.end());
    return out;
}

std::vector<DataHandler> SchemaClass::dataHandlers() const {
    std::vector<DataHandler> out;
    for (auto it = m_ancestors.rbegin(); it != m_ancestors.rend(); ++it)
        out.insert(out.end(), (*it)->m_data_handlers.begin(), (*it)->m_data_handlers.end());
    out.insert(out.end(), m_data_handlers.begin(), m_data_handlers.end());
    return out;
}

ErrorHandler SchemaClass::errorHandler() const {
    if (m_error_handler) return m_error_handler;
    for (auto const& base : m_ancestors)
        if (base->m_error_handler) return base->m_error_handler;
    return ErrorHandler();
}

ObjectFactory SchemaClass::objectFactory() const {
    if (m_object_factory) return m_object_factory;
    for (auto const& base : m_ancestors)
        if (base->m_object_factory) return base->m_object_factory;
    return ObjectFactory();
}

const SchemaMethod* SchemaClass::findMethod(const std::string& name) const {
    auto it = m_methods.find(name);
    if (it != m_methods.end()) return &it->second;
    for (auto const& base : m_ancestors) {
        auto found = base->m_methods.find(name);
        if (found != base->m_methods.end()) return &found->second;
    }
    return nullptr;
}

std::shared_ptr<const SchemaClass> SchemaClass::lookup(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    auto it = registry().find(name);
    if (it == registry().end()) return nullptr;
    return it->second.lock();
}

// ---------------------------------------------------------------------------
// SchemaBuilder

SchemaBuilder::SchemaBuilder(std::string name) : m_name(std::move(name)) {}

SchemaBuilder& SchemaBuilder::inherit(std::shared_ptr<const SchemaClass> base) {
    if (!base) throw SchemaDefinitionError("schema '" + m_name + "' cannot inherit from a null schema class");
    m_bases.push_back(std::move(base));
    return *this;
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, const Field& field) {
    put_field(m_fields, name, std::shared_ptr<const Field>(field.clone()));
    return *this;
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, std::shared_ptr<const Field> field) {
    if (!field) {
        throw SchemaDefinitionError("Field '" + name + "' of schema '" + m_name +
                                    "' must be declared as a Field instance");
    }
    put_field(m_fields, name, std::move(field));
    return *this;
}

SchemaBuilder& SchemaBuilder::meta(SchemaOptions options) {
    m_options = std::move(options);
    return *this;
}

SchemaBuilder& SchemaBuilder::meta(const Dictionary& options) {
    auto json = std::move(m_options.json_module);
    m_options = SchemaOptions::fromDictionary(options);
    m_options.json_module = std::move(json);
    return *this;
}

SchemaBuilder& SchemaBuilder::jsonModule(JsonModule module) {
    m_options.json_module = std::move(module);
    return *this;
}

SchemaBuilder& SchemaBuilder::method(const std::string& name, MethodFn fn) {
    m_methods[name] = SchemaMethod{std::move(fn), ContextMethodFn()};
    return *this;
}

SchemaBuilder& SchemaBuilder::method(const std::string& name, ContextMethodFn fn) {
    m_methods[name] = SchemaMethod{MethodFn(), std::move(fn)};
    return *this;
}

SchemaBuilder& SchemaBuilder::validator(ValidatorFn fn, std::string name) {
    m_validators.push_back(SchemaValidator{name.empty() ? "validator" : std::move(name), std::move(fn)});
    return *this;
}

SchemaBuilder& SchemaBuilder::preprocessor(Preprocessor fn) {
    m_preprocessors.push_back(std::move(fn));
    return *this;
}

SchemaBuilder& SchemaBuilder::dataHandler(DataHandler fn) {
    m_data_handlers.push_back(std::move(fn));
    return *this;
}

SchemaBuilder& SchemaBuilder::errorHandler(ErrorHandler fn) {
    m_error_handler = std::move(fn);
    return *this;
}

SchemaBuilder& SchemaBuilder::objectFactory(ObjectFactory fn) {
    m_object_factory = std::move(fn);
    return *this;
}

std::shared_ptr<SchemaClass> SchemaBuilder::build() const {
    m_options.check(m_name);

    std::shared_ptr<SchemaClass> cls(new SchemaClass(m_name));
    cls->m_bases = m_bases;

    std::vector<std::vector<ClassPtr>> seqs;
    for (auto const& base : m_bases) seqs.push_back(base->mro());
    seqs.push_back(m_bases);
    cls->m_ancestors = c3_merge(std::move(seqs), m_name);

    cls->m_own_fields = m_fields;
    for (auto it = cls->m_ancestors.rbegin(); it != cls->m_ancestors.rend(); ++it) {
        for (auto const& entry : (*it)->m_own_fields) put_field(cls->m_declared_fields, entry.first, entry.second);
    }
    for (auto const& entry : m_fields) put_field(cls->m_declared_fields, entry.first, entry.second);

    cls->m_own_options = m_options;
    SchemaOptions resolved = m_options;
    for (auto const& base : cls->m_ancestors) resolved = resolved.inheritFrom(base->m_own_options);
    resolved.check(m_name);
    cls->m_options = resolved;

    if (resolved.fields) {
        for (auto const& name : *resolved.fields) {
            if (auto declared = find_field(cls->m_declared_fields, name))
                put_field(cls->m_resolved_fields, name, *declared);
            else
                put_field(cls->m_resolved_fields, name, std::make_shared<fields::Inferred>());
        }
    } else {
        cls->m_resolved_fields = cls->m_declared_fields;
        if (resolved.additional) {
            for (auto const& name : *resolved.additional) {
                if (!find_field(cls->m_resolved_fields, name))
                    put_field(cls->m_resolved_fields, name, std::make_shared<fields::Inferred>());
            }
        }
    }
    if (resolved.exclude) {
        auto const& excluded = *resolved.exclude;
        auto& fields = cls->m_resolved_fields;
        fields.erase(std::remove_if(fields.begin(), fields.end(),
                                    [&excluded](const FieldList::value_type& entry) {
                                        return std::find(excluded.begin(), excluded.end(), entry.first) !=
                                               excluded.end();
                                    }),
                     fields.end());
    }

    cls->m_methods = m_methods;
    cls->m_validators = m_validators;
    cls->m_preprocessors = m_preprocessors;
    cls->m_data_handlers = m_data_handlers;
    cls->m_error_handler = m_error_handler;
    cls->m_object_factory = m_object_factory;

    {
        std::lock_guard<std::mutex> lock(registry_mutex());
        registry()[m_name] = cls;
    }
    log::debug("built schema class '" + m_name + "' with " + std::to_string(cls->m_resolved_fields.size()) +
               " fields");
    return cls;
}

// ---------------------------------------------------------------------------
// Schema

Schema::Schema(std::shared_ptr<const SchemaClass> cls, SchemaArgs args)
    : m_class(std::move(cls)),
      m_context(args.context ? args.context : std::make_shared<Dictionary>()),
      m_prefix(std::move(args.prefix)),
      m_extra(std::move(args.extra)),
      m_many(args.many) {
    if (!m_class) throw SchemaDefinitionError("a schema needs a schema class");
    m_strict = args.strict.value_or(m_class->options().isStrict());
    m_json = m_class->options().json_module.value_or(default_json_module());

    auto const& resolved = m_class->resolvedFields();
    if (args.only) {
        for (auto const& name : *args.only) {
            if (!find_field(resolved, name)) {
                throw SchemaDefinitionError("'" + name + "' is not a field of schema '" + m_class->name() + "'");
            }
        }
    }
    for (auto const& entry : resolved) {
        const std::string& name = entry.first;
        if (args.only) {
            if (std::find(args.only->begin(), args.only->end(), name) == args.only->end()) continue;
        } else if (std::find(args.exclude.begin(), args.exclude.end(), name) != args.exclude.end()) {
            continue;
        }
        m_fields.emplace_back(name, entry.second->clone());
    }
    for (auto& entry : m_fields) {
        entry.second->bind(entry.first, *this);
        entry.second->setContext(m_context);
    }
}

MarshalResult Schema::dump(const Dictionary& obj) const { return Marshaller(*this)(obj); }

SerializedResult Schema::dumps(const Dictionary& obj) const {
    MarshalResult result = dump(obj);
    return SerializedResult{m_json.dumps(result.data), std::move(result.errors)};
}

UnmarshalResult Schema::load(const Dictionary& data) const { return Unmarshaller(*this)(data); }

UnmarshalResult Schema::loads(const std::string& text) const { return load(m_json.loads(text)); }

const Field& Schema::field(const std::string& name) const {
    for (auto const& entry : m_fields)
        if (entry.first == name) return *entry.second;
    throw std::out_of_range("schema '" + m_class->name() + "' has no field '" + name + "'");
}

std::vector<std::string> Schema::fieldNames() const {
    std::vector<std::string> names;
    names.reserve(m_fields.size());
    for (auto const& entry : m_fields) names.push_back(entry.first);
    return names;
}

Dictionary& Schema::context() {
    if (!m_context) setContext(std::make_shared<Dictionary>());
    return *m_context;
}

void Schema::setContext(std::shared_ptr<Dictionary> context) {
    m_context = std::move(context);
    for (auto& entry : m_fields) entry.second->setContext(m_context);
}

void Schema::setContext(const Dictionary& context) { setContext(std::make_shared<Dictionary>(context)); }

void Schema::addValidator(ValidatorFn fn, std::string name) {
    m_validators.push_back(SchemaValidator{name.empty() ? "validator" : std::move(name), std::move(fn)});
}

void Schema::addPreprocessor(Preprocessor fn) { m_preprocessors.push_back(std::move(fn)); }

void Schema::addDataHandler(DataHandler fn) { m_data_handlers.push_back(std::move(fn)); }

void Schema::setErrorHandler(ErrorHandler fn) { m_error_handler = std::move(fn); }

std::vector<SchemaValidator> Schema::validators() const {
    auto out = m_class->validators();
    out.insert(out.end(), m_validators.begin(), m_validators.end());
    return out;
}

std::vector<Preprocessor> Schema::preprocessors() const {
    auto out = m_class->preprocessors();
    out.insert(out.end(), m_preprocessors.begin(), m_preprocessors.end());
    return out;
}

std::vector<DataHandler> Schema::dataHandlers() const {
    auto out = m_class->dataHandlers();
    out.insert(out.end(), m_data_handlers.begin(), m_data_handlers.end());
    return out;
}

ErrorHandler Schema::errorHandler() const {
    if (m_error_handler) return m_error_handler;
    return m_class->errorHandler();
}

std::string Schema::repr() const {
    std::ostringstream ss;
    ss << "<" << m_class->name() << "(many=" << (m_many ? "true" : "false")
       << ", strict=" << (m_strict ? "true" : "false") << ")>";
    return ss.str();
}

}  // namespace ms
