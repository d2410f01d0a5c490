#pragma once

#include <functional>
#include <optional>
#include <string>

namespace ms {
namespace lexical {

    using Predicate = std::function<bool(const std::string&)>;

    // Absolute URLs need a scheme and a host (domain, localhost, IPv4 or IPv6).
    // With relative = true a bare path such as "/foo" is accepted as well.
    bool is_url(const std::string& text, bool relative = false);

    bool is_email(const std::string& text);

    // "http://" + text, when that is a valid absolute URL and text is not.
    std::optional<std::string> suggest_url(const std::string& text);

}  // namespace lexical
}  // namespace ms
