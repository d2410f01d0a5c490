#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <ms/dictionary.h>

namespace ms {

struct Error : public std::runtime_error {
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Structurally invalid schema: bad options, unknown names, wrong field targets.
struct SchemaDefinitionError : public Error {
    explicit SchemaDefinitionError(const std::string& msg) : Error(msg) {}
};

// A pass-through field whose attribute is absent from the source object.
struct AttributeLookupError : public Error {
    std::string attribute;
    AttributeLookupError(const std::string& msg, std::string attr)
        : Error(msg), attribute(std::move(attr)) {}
};

// A single field failed to convert one value.
struct ConversionError : public Error {
    std::string field;
    // set when the failure came from an embedded schema
    std::optional<Dictionary> nested_errors;

    explicit ConversionError(const std::string& msg, std::string field_name = "")
        : Error(msg), field(std::move(field_name)) {}
    ConversionError(const std::string& msg, std::string field_name, Dictionary nested)
        : Error(msg), field(std::move(field_name)), nested_errors(std::move(nested)) {}
};

struct RequiredFieldError : public ConversionError {
    explicit RequiredFieldError(std::string field_name)
        : ConversionError("Missing data for required field.", std::move(field_name)) {}
};

// Raised by validators. An empty field attaches the message to the schema error key.
struct ValidationError : public Error {
    std::string field;
    explicit ValidationError(const std::string& msg, std::string field_name = "")
        : Error(msg), field(std::move(field_name)) {}
};

// Raised in strict mode. Carries the first underlying exception and the errors
// accumulated up to that point.
struct StrictModeFailure : public Error {
    std::exception_ptr underlying;
    Dictionary errors;

    StrictModeFailure(const std::string& msg, std::exception_ptr cause, Dictionary errs)
        : Error(msg), underlying(std::move(cause)), errors(std::move(errs)) {}

    [[noreturn]] void rethrowUnderlying() const { std::rethrow_exception(underlying); }
};

struct MarshallingError : public StrictModeFailure {
    using StrictModeFailure::StrictModeFailure;
};

struct UnmarshallingError : public StrictModeFailure {
    using StrictModeFailure::StrictModeFailure;
};

}  // namespace ms
