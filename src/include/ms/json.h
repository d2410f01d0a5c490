#pragma once

#include <functional>
#include <string>

#include <ms/dictionary.h>
#include <ms/exceptions.h>

namespace ms {

struct JsonParseError : public Error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c) : Error(msg), line(l), col(c) {}
};

// Parses one JSON document. Object members keep their textual order.
Dictionary parse_json(const std::string& text);

// Compact JSON text.
std::string to_json(const Dictionary& value);

namespace json_literals {
    inline Dictionary operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

// Encoder/decoder pair used by Schema::dumps and Schema::loads.
struct JsonModule {
    std::function<std::string(const Dictionary&)> dumps;
    std::function<Dictionary(const std::string&)> loads;
};

JsonModule default_json_module();

}  // namespace ms
