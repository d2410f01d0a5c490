#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <ms/dictionary.h>
#include <ms/fields.h>
#include <ms/json.h>
#include <ms/options.h>

namespace ms {

class Schema;

// Key under which schema-level (cross-field) errors are stored.
inline constexpr const char* SCHEMA_ERRORS_KEY = "_schema";

using ValidatorFn = std::function<bool(const Schema&, const Dictionary& data)>;
using Preprocessor = std::function<Dictionary(const Schema&, Dictionary data)>;
using DataHandler = std::function<Dictionary(const Schema&, Dictionary data, const Dictionary& obj)>;
using ErrorHandler = std::function<void(const Schema&, const Dictionary& errors, const Dictionary& obj)>;
using ObjectFactory = std::function<Dictionary(const Dictionary& data)>;

struct SchemaValidator {
    std::string name;
    ValidatorFn fn;
};

using FieldList = std::vector<std::pair<std::string, std::shared_ptr<const Field>>>;

// A schema definition: declared fields, options and hooks, merged with those of
// its bases. Created by SchemaBuilder and registered by name.
class SchemaClass : public std::enable_shared_from_this<SchemaClass> {
  public:
    const std::string& name() const { return m_name; }
    const std::vector<std::shared_ptr<const SchemaClass>>& bases() const { return m_bases; }
    // C3 linearization, starting with this class
    std::vector<std::shared_ptr<const SchemaClass>> mro() const;

    // own fields only, in declaration order
    const FieldList& ownFields() const { return m_own_fields; }
    // inherited and own fields merged along the linearization
    const FieldList& declaredFields() const { return m_declared_fields; }
    // declared fields after the fields, additional and exclude options
    const FieldList& resolvedFields() const { return m_resolved_fields; }
    std::vector<std::string> fieldNames() const;

    // resolved options, inheritance applied
    const SchemaOptions& options() const { return m_options; }

    void addValidator(ValidatorFn fn, std::string name = "");
    void addPreprocessor(Preprocessor fn);
    void addDataHandler(DataHandler fn);
    void setErrorHandler(ErrorHandler fn);

    // Hooks of this class and its bases, base-most first.
    std::vector<SchemaValidator> validators() const;
    std::vector<Preprocessor> preprocessors() const;
    std::vector<DataHandler> dataHandlers() const;
    // nearest along the linearization; empty when none is registered
    ErrorHandler errorHandler() const;
    ObjectFactory objectFactory() const;

    // nullptr when neither this class nor a base registers the method
    const SchemaMethod* findMethod(const std::string& name) const;

    // nullptr when no live class was built under that name
    static std::shared_ptr<const SchemaClass> lookup(const std::string& name);

  private:
    friend class SchemaBuilder;
    explicit SchemaClass(std::string name) : m_name(std::move(name)) {}

    std::string m_name;
    std::vector<std::shared_ptr<const SchemaClass>> m_bases;
    std::vector<std::shared_ptr<const SchemaClass>> m_ancestors;
    FieldList m_own_fields;
    FieldList m_declared_fields;
    FieldList m_resolved_fields;
    SchemaOptions m_own_options;
    SchemaOptions m_options;
    std::map<std::string, SchemaMethod> m_methods;

    std::vector<SchemaValidator> m_validators;
    std::vector<Preprocessor> m_preprocessors;
    std::vector<DataHandler> m_data_handlers;
    ErrorHandler m_error_handler;
    ObjectFactory m_object_factory;
};

class SchemaBuilder {
  public:
    explicit SchemaBuilder(std::string name);

    // repeatable; order is base order
    SchemaBuilder& inherit(std::shared_ptr<const SchemaClass> base);
    // redeclaring a name replaces it in place
    SchemaBuilder& field(const std::string& name, const Field& field);
    SchemaBuilder& field(const std::string& name, std::shared_ptr<const Field> field);
    SchemaBuilder& meta(SchemaOptions options);
    SchemaBuilder& meta(const Dictionary& options);
    SchemaBuilder& jsonModule(JsonModule module);
    SchemaBuilder& method(const std::string& name, MethodFn fn);
    SchemaBuilder& method(const std::string& name, ContextMethodFn fn);
    SchemaBuilder& validator(ValidatorFn fn, std::string name = "");
    SchemaBuilder& preprocessor(Preprocessor fn);
    SchemaBuilder& dataHandler(DataHandler fn);
    SchemaBuilder& errorHandler(ErrorHandler fn);
    SchemaBuilder& objectFactory(ObjectFactory fn);

    // Linearizes bases, merges fields, resolves options and registers the class.
    // Throws SchemaDefinitionError for inconsistent hierarchies or options.
    std::shared_ptr<SchemaClass> build() const;

  private:
    std::string m_name;
    std::vector<std::shared_ptr<const SchemaClass>> m_bases;
    FieldList m_fields;
    SchemaOptions m_options;
    std::map<std::string, SchemaMethod> m_methods;
    std::vector<SchemaValidator> m_validators;
    std::vector<Preprocessor> m_preprocessors;
    std::vector<DataHandler> m_data_handlers;
    ErrorHandler m_error_handler;
    ObjectFactory m_object_factory;
};

struct SchemaArgs {
    // field names to keep; takes precedence over exclude
    std::optional<std::vector<std::string>> only;
    std::vector<std::string> exclude;
    std::string prefix;
    // merged into every dumped record
    Dictionary extra;
    bool many = false;
    // overrides the strict option when set
    std::optional<bool> strict;
    // shared context; a fresh empty mapping when null
    std::shared_ptr<Dictionary> context;
};

struct MarshalResult {
    Dictionary data;
    Dictionary errors;
};

struct UnmarshalResult {
    Dictionary data;
    Dictionary errors;
};

struct SerializedResult {
    std::string data;
    Dictionary errors;
};

using BoundFields = std::vector<std::pair<std::string, std::unique_ptr<Field>>>;

// A configured schema: its own copies of the class's fields, bound to this
// instance, plus per-instance overrides and hooks.
class Schema {
  public:
    explicit Schema(std::shared_ptr<const SchemaClass> cls, SchemaArgs args = {});
    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    MarshalResult dump(const Dictionary& obj) const;

    // Single-pass sequences: the range is consumed once.
    template <typename InputIt>
    MarshalResult dump(InputIt first, InputIt last) const {
        Dictionary items = Dictionary::array();
        for (; first != last; ++first) items.push_back(Dictionary(*first));
        return dump(items);
    }

    SerializedResult dumps(const Dictionary& obj) const;
    UnmarshalResult load(const Dictionary& data) const;
    UnmarshalResult loads(const std::string& text) const;

    const BoundFields& fields() const { return m_fields; }
    // throws std::out_of_range for unknown names
    const Field& field(const std::string& name) const;
    std::vector<std::string> fieldNames() const;

    // Creates an empty context when none is set.
    Dictionary& context();
    bool hasContext() const { return m_context != nullptr; }
    void setContext(std::shared_ptr<Dictionary> context);
    void setContext(const Dictionary& context);
    void clearContext() { setContext(std::shared_ptr<Dictionary>()); }

    bool many() const { return m_many; }
    bool strict() const { return m_strict; }
    void setStrict(bool strict) { m_strict = strict; }
    bool skipMissing() const { return m_class->options().skipMissing(); }
    const std::string& prefix() const { return m_prefix; }
    const Dictionary& extra() const { return m_extra; }
    const std::shared_ptr<const SchemaClass>& schemaClass() const { return m_class; }
    const SchemaOptions& options() const { return m_class->options(); }
    const JsonModule& jsonModule() const { return m_json; }

    void addValidator(ValidatorFn fn, std::string name = "");
    void addPreprocessor(Preprocessor fn);
    void addDataHandler(DataHandler fn);
    void setErrorHandler(ErrorHandler fn);

    // class hooks followed by instance hooks
    std::vector<SchemaValidator> validators() const;
    std::vector<Preprocessor> preprocessors() const;
    std::vector<DataHandler> dataHandlers() const;
    // the instance handler, else the class handler
    ErrorHandler errorHandler() const;

    // e.g. <UserSchema(many=false, strict=false)>
    std::string repr() const;

  private:
    std::shared_ptr<const SchemaClass> m_class;
    BoundFields m_fields;
    std::shared_ptr<Dictionary> m_context;
    std::string m_prefix;
    Dictionary m_extra;
    bool m_many;
    bool m_strict;
    JsonModule m_json;

    std::vector<SchemaValidator> m_validators;
    std::vector<Preprocessor> m_preprocessors;
    std::vector<DataHandler> m_data_handlers;
    ErrorHandler m_error_handler;
};

}  // namespace ms
