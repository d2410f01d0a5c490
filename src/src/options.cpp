#include <ms/options.h>

#include <ms/exceptions.h>

namespace ms {

namespace {
    std::vector<std::string> name_list(const Dictionary& value, const std::string& option) {
        if (!value.isArrayObject()) {
            throw SchemaDefinitionError("option '" + option + "' must be a list of field names, got " +
                                        value.typeString());
        }
        std::vector<std::string> names;
        for (auto const& el : value.elements()) {
            if (!el.isString()) {
                throw SchemaDefinitionError("option '" + option + "' must contain only strings, got " +
                                            el.typeString());
            }
            names.push_back(el.asString());
        }
        return names;
    }

    bool flag(const Dictionary& value, const std::string& option) {
        if (!value.isBool()) {
            throw SchemaDefinitionError("option '" + option + "' must be a boolean, got " + value.typeString());
        }
        return value.asBool();
    }
}  // namespace

SchemaOptions SchemaOptions::fromDictionary(const Dictionary& config) {
    if (!config.isMappedObject()) {
        throw SchemaDefinitionError("schema options must be an object, got " + config.typeString());
    }
    SchemaOptions opts;
    for (auto const& p : config.items()) {
        const std::string& key = p.first;
        const Dictionary& value = p.second;
        if (key == "fields") {
            opts.fields = name_list(value, key);
        } else if (key == "additional") {
            opts.additional = name_list(value, key);
        } else if (key == "exclude") {
            opts.exclude = name_list(value, key);
        } else if (key == "dateformat") {
            if (!value.isString())
                throw SchemaDefinitionError("option 'dateformat' must be a string, got " + value.typeString());
            opts.dateformat = value.asString();
        } else if (key == "skip_missing") {
            opts.skip_missing = flag(value, key);
        } else if (key == "strict") {
            opts.strict = flag(value, key);
        } else {
            throw SchemaDefinitionError("unknown schema option '" + key + "'");
        }
    }
    return opts;
}

SchemaOptions SchemaOptions::inheritFrom(const SchemaOptions& base) const {
    SchemaOptions out = *this;
    if (!fields && !additional) {
        out.fields = base.fields;
        out.additional = base.additional;
    }
    if (!exclude) out.exclude = base.exclude;
    if (!dateformat) out.dateformat = base.dateformat;
    if (!skip_missing) out.skip_missing = base.skip_missing;
    if (!strict) out.strict = base.strict;
    if (!json_module) out.json_module = base.json_module;
    return out;
}

void SchemaOptions::check(const std::string& class_name) const {
    if (fields && additional) {
        throw SchemaDefinitionError("Cannot set both 'fields' and 'additional' options on schema '" +
                                    class_name + "'");
    }
}

}  // namespace ms
