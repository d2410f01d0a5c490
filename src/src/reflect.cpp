#include <ms/reflect.h>

namespace ms {

std::optional<Dictionary> resolve(const Dictionary& source, const std::string& path) {
    Dictionary current = source;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (current.isReference()) {
            auto value = current.asReference()->attribute(part);
            if (!value) return std::nullopt;
            current = std::move(*value);
        } else if (current.isMappedObject()) {
            if (!current.has(part)) return std::nullopt;
            Dictionary next = current.at(part);
            current = std::move(next);
        } else {
            return std::nullopt;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return current;
}

}  // namespace ms
