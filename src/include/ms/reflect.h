#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <ms/dictionary.h>

namespace ms {

// Walk a dotted attribute path. Each step is an attribute access on a host object
// reference or a key lookup on a mapping. Returns std::nullopt as soon as a step
// is absent or the current value supports neither.
std::optional<Dictionary> resolve(const Dictionary& source, const std::string& path);

template <typename T>
Dictionary make_reference(std::shared_ptr<T> object) {
    static_assert(std::is_base_of<Reflectable, T>::value, "host objects must derive from ms::Reflectable");
    return Dictionary(std::shared_ptr<const Reflectable>(std::move(object)));
}

}  // namespace ms
