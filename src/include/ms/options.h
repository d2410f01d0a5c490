#pragma once

#include <optional>
#include <string>
#include <vector>

#include <ms/dictionary.h>
#include <ms/json.h>

namespace ms {

// Declarative class-level options. Unset members inherit from the nearest base
// class that sets them.
struct SchemaOptions {
    // exact field set; names without a declared field become pass-through fields
    std::optional<std::vector<std::string>> fields;
    // pass-through names appended after the declared fields
    std::optional<std::vector<std::string>> additional;
    std::optional<std::vector<std::string>> exclude;
    std::optional<std::string> dateformat;
    std::optional<bool> skip_missing;
    std::optional<bool> strict;
    std::optional<JsonModule> json_module;

    // Reads {"fields": [...], "additional": [...], "exclude": [...],
    // "dateformat": "...", "skip_missing": bool, "strict": bool}.
    // Throws SchemaDefinitionError for unknown keys or wrongly typed values.
    static SchemaOptions fromDictionary(const Dictionary& config);

    // Options set here win; everything unset is taken from base. fields and
    // additional travel together.
    SchemaOptions inheritFrom(const SchemaOptions& base) const;

    // Throws SchemaDefinitionError when fields and additional are both set.
    void check(const std::string& class_name) const;

    bool skipMissing() const { return skip_missing.value_or(false); }
    bool isStrict() const { return strict.value_or(false); }
};

}  // namespace ms
