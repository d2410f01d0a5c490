#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <ms/dictionary.h>
#include <ms/exceptions.h>
#include <ms/lexical.h>

namespace ms {

class Schema;
class SchemaClass;

using Predicate = std::function<bool(const Dictionary&)>;

// Schema-registered methods and free functions computing a dumped value.
using MethodFn = std::function<Dictionary(const Schema&, const Dictionary& obj)>;
using ContextMethodFn =
            std::function<Dictionary(const Schema&, const Dictionary& obj, const Dictionary& context)>;
using FunctionFn = std::function<Dictionary(const Dictionary& obj)>;
using ContextFunctionFn = std::function<Dictionary(const Dictionary& obj, const Dictionary& context)>;

struct SchemaMethod {
    MethodFn plain;
    ContextMethodFn contextual;
};

// Typed converter for one attribute. Declared once on a schema class and copied
// into every schema instance, where it is bound to its name and owner.
class Field {
  public:
    virtual ~Field() = default;

    virtual std::unique_ptr<Field> clone() const = 0;
    virtual std::string kind() const = 0;

    virtual void bind(const std::string& name, const Schema& owner);
    virtual void setContext(std::shared_ptr<Dictionary> context);

    // Value of this field for the source object or mapping. Throws ConversionError.
    virtual Dictionary serialize(const Dictionary& obj) const;
    // Throws ConversionError when the input cannot be converted or a validator rejects it.
    virtual Dictionary deserialize(const Dictionary& value) const;
    // True when the source attribute is absent or null.
    virtual bool isMissing(const Dictionary& obj) const;
    // Missing and without a meaningful default, so skip_missing may drop the key.
    bool skippable(const Dictionary& obj) const;

    // Formats a resolved attribute value; null yields the default or the empty value.
    Dictionary output(const Dictionary& value) const;

    const std::string& name() const { return m_name; }
    const std::string& attributePath() const { return m_attribute; }
    const std::optional<Dictionary>& getDefault() const { return m_default; }
    bool isRequired() const { return m_required; }
    const std::string& errorMessage() const { return m_error; }
    const std::shared_ptr<Dictionary>& context() const { return m_context; }

  protected:
    virtual Dictionary format(const Dictionary& value) const;
    virtual Dictionary convert(const Dictionary& value) const;
    virtual Dictionary emptyValue() const;
    virtual std::optional<Dictionary> getValue(const Dictionary& obj) const;

    [[noreturn]] void fail(const std::string& msg) const;
    void runValidators(const Dictionary& value) const;

    // quoted form of a value for error messages
    static std::string literal(const Dictionary& value);

    std::string m_name;
    std::string m_attribute;
    std::optional<Dictionary> m_default;
    bool m_required = false;
    std::vector<Predicate> m_validators;
    std::string m_error;
    std::shared_ptr<Dictionary> m_context;
};

// Fluent common options, returning the concrete field type.
template <class Derived, class Base = Field>
class FieldBuilder : public Base {
  public:
    using Base::Base;

    Derived& attribute(std::string path) {
        this->m_attribute = std::move(path);
        return self();
    }
    Derived& defaultValue(Dictionary value) {
        this->m_default = std::move(value);
        return self();
    }
    Derived& required(bool value = true) {
        this->m_required = value;
        return self();
    }
    Derived& validate(Predicate predicate) {
        this->m_validators.push_back(std::move(predicate));
        return self();
    }
    Derived& error(std::string message) {
        this->m_error = std::move(message);
        return self();
    }

    std::unique_ptr<Field> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

  protected:
    Derived& self() { return static_cast<Derived&>(*this); }
};

namespace fields {

    struct SelfReference {};
    // Nested target meaning the schema class that declares the field.
    inline constexpr SelfReference self{};

    class Raw : public FieldBuilder<Raw> {
      public:
        std::string kind() const override { return "Raw"; }
    };

    class String : public FieldBuilder<String> {
      public:
        std::string kind() const override { return "String"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }
        Dictionary emptyValue() const override { return Dictionary(""); }
    };

    class Integer : public FieldBuilder<Integer> {
      public:
        std::string kind() const override { return "Integer"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }
        Dictionary emptyValue() const override { return Dictionary(0); }
    };

    class Number : public FieldBuilder<Number> {
      public:
        Number() = default;
        std::string kind() const override { return "Number"; }

      protected:
        explicit Number(std::string noun) : m_noun(std::move(noun)) {}
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }
        Dictionary emptyValue() const override { return Dictionary(0.0); }
        double toDouble(const Dictionary& value) const;

        std::string m_noun = "a number";
    };

    class Float : public FieldBuilder<Float, Number> {
      public:
        Float() : FieldBuilder<Float, Number>(std::string("a float")) {}
        std::string kind() const override { return "Float"; }
    };

    // Fixed-point decimal rendered as a string with a set number of places.
    class Fixed : public FieldBuilder<Fixed, Number> {
      public:
        explicit Fixed(int decimals = 5) : FieldBuilder<Fixed, Number>(std::string("a fixed-point number")), m_decimals(decimals) {}
        std::string kind() const override { return "Fixed"; }
        int decimals() const { return m_decimals; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary emptyValue() const override { return format(Dictionary(0.0)); }

        int m_decimals;
    };

    class Price : public FieldBuilder<Price, Fixed> {
      public:
        Price() : FieldBuilder<Price, Fixed>(2) {}
        std::string kind() const override { return "Price"; }
    };

    class Boolean : public FieldBuilder<Boolean> {
      public:
        std::string kind() const override { return "Boolean"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }
        Dictionary emptyValue() const override { return Dictionary(false); }
    };

    // format: empty or "iso" for ISO-8601 in UTC, "rfc" for RFC 822, anything else
    // is a strftime pattern. Without a format the schema's dateformat option applies.
    class DateTime : public FieldBuilder<DateTime> {
      public:
        DateTime() = default;
        explicit DateTime(std::string format) : m_format(std::move(format)) {}
        std::string kind() const override { return "DateTime"; }
        void bind(const std::string& name, const Schema& owner) override;
        const std::optional<std::string>& dateFormat() const { return m_format; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override;
        Timestamp toTimestamp(const Dictionary& value, const char* verb) const;

        std::optional<std::string> m_format;
    };

    class LocalDateTime : public FieldBuilder<LocalDateTime, DateTime> {
      public:
        std::string kind() const override { return "LocalDateTime"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
    };

    class Date : public FieldBuilder<Date> {
      public:
        std::string kind() const override { return "Date"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override;
    };

    class Time : public FieldBuilder<Time> {
      public:
        std::string kind() const override { return "Time"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override;
    };

    // Dumps total seconds; loads seconds into a Duration.
    class TimeDelta : public FieldBuilder<TimeDelta> {
      public:
        std::string kind() const override { return "TimeDelta"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override;
    };

    class UUID : public FieldBuilder<UUID> {
      public:
        std::string kind() const override { return "UUID"; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }
    };

    class Url : public FieldBuilder<Url> {
      public:
        explicit Url(bool relative = false) : m_relative(relative) {}
        std::string kind() const override { return "Url"; }
        // replaces the URL predicate
        Url& lexical(lexical::Predicate predicate) {
            m_lexical = std::move(predicate);
            return *this;
        }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }

        bool m_relative;
        lexical::Predicate m_lexical;
    };

    class Email : public FieldBuilder<Email> {
      public:
        std::string kind() const override { return "Email"; }
        Email& lexical(lexical::Predicate predicate) {
            m_lexical = std::move(predicate);
            return *this;
        }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }

        lexical::Predicate m_lexical;
    };

    class Select : public FieldBuilder<Select> {
      public:
        explicit Select(std::vector<Dictionary> choices) : m_choices(std::move(choices)) {}
        Select(std::initializer_list<Dictionary> choices) : m_choices(choices) {}
        std::string kind() const override { return "Select"; }
        const std::vector<Dictionary>& choices() const { return m_choices; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override { return format(value); }

        std::vector<Dictionary> m_choices;
    };

    // Applies an inner field to every element.
    class List : public FieldBuilder<List> {
      public:
        explicit List(const Field& inner) : m_inner(inner.clone()) {}
        List(const List& other) : FieldBuilder<List>(other), m_inner(other.m_inner->clone()) {}
        std::string kind() const override { return "List"; }
        void bind(const std::string& name, const Schema& owner) override;
        void setContext(std::shared_ptr<Dictionary> context) override;
        const Field& inner() const { return *m_inner; }

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override;
        Dictionary emptyValue() const override { return Dictionary::array(); }

        std::unique_ptr<Field> m_inner;
    };

    // Dump-only value computed by a method registered on the schema class.
    class Method : public FieldBuilder<Method> {
      public:
        explicit Method(std::string method_name) : m_method_name(std::move(method_name)) {}
        std::string kind() const override { return "Method"; }
        void bind(const std::string& name, const Schema& owner) override;
        Dictionary serialize(const Dictionary& obj) const override;
        bool isMissing(const Dictionary&) const override { return false; }

      protected:
        std::string m_method_name;
        SchemaMethod m_method;
        const Schema* m_owner = nullptr;
    };

    // Dump-only value computed by a free function.
    class Function : public FieldBuilder<Function> {
      public:
        explicit Function(FunctionFn fn) : m_fn(std::move(fn)) {}
        explicit Function(ContextFunctionFn fn) : m_context_fn(std::move(fn)) {}
        std::string kind() const override { return "Function"; }
        Dictionary serialize(const Dictionary& obj) const override;
        bool isMissing(const Dictionary&) const override { return false; }

      protected:
        FunctionFn m_fn;
        ContextFunctionFn m_context_fn;
    };

    // Delegates to an embedded schema instance, created on first use.
    class Nested : public FieldBuilder<Nested> {
      public:
        explicit Nested(std::shared_ptr<const SchemaClass> target);
        // resolved through the class registry when the owner is constructed
        explicit Nested(std::string class_name);
        explicit Nested(SelfReference);
        Nested(const Nested& other);

        std::string kind() const override { return "Nested"; }

        Nested& only(std::initializer_list<std::string> names);
        Nested& only(std::vector<std::string> names);
        // flat form: dump just this key's value instead of a mapping
        Nested& only(const std::string& name);
        Nested& exclude(std::initializer_list<std::string> names);
        Nested& exclude(std::vector<std::string> names);
        Nested& many(bool value = true);

        void bind(const std::string& name, const Schema& owner) override;
        void setContext(std::shared_ptr<Dictionary> context) override;

        const std::shared_ptr<const SchemaClass>& target() const { return m_target; }
        bool isMany() const { return m_many; }
        // The embedded schema; throws SchemaDefinitionError before bind().
        Schema& schema() const;

      protected:
        Dictionary format(const Dictionary& value) const override;
        Dictionary convert(const Dictionary& value) const override;

        std::shared_ptr<const SchemaClass> m_target;
        std::string m_target_name;
        bool m_self = false;
        std::optional<std::vector<std::string>> m_only;
        bool m_flat = false;
        std::vector<std::string> m_exclude;
        bool m_many = false;

        mutable std::once_flag m_once;
        mutable std::shared_ptr<Schema> m_schema;
    };

    // Pass-through field synthesized for names listed in the fields or additional
    // options. Formats by the runtime kind of the value.
    class Inferred : public FieldBuilder<Inferred> {
      public:
        std::string kind() const override { return "Inferred"; }
        void bind(const std::string& name, const Schema& owner) override;
        Dictionary serialize(const Dictionary& obj) const override;

      protected:
        Dictionary format(const Dictionary& value) const override;

        std::optional<std::string> m_dateformat;
    };

}  // namespace fields
}  // namespace ms
