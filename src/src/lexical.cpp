#include <ms/lexical.h>

#include <regex>

namespace ms {
namespace lexical {

    namespace {
        const std::string host_pattern =
                    R"((?:(?:[A-Z0-9](?:[A-Z0-9-]{0,61}[A-Z0-9])?\.)+(?:[A-Z]{2,6}\.?|[A-Z0-9-]{2,}\.?))"
                    R"(|localhost)"
                    R"(|\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})"
                    R"(|\[?[A-F0-9]*:[A-F0-9:]+\]?))";

        const std::regex& absolute_url() {
            static const std::regex rx("^(?:[a-z0-9.+-]*)://" + host_pattern + R"((?::\d+)?(?:/?|[/?]\S+)$)",
                                       std::regex::icase);
            return rx;
        }

        const std::regex& relative_url() {
            static const std::regex rx(
                        "^(?:(?:[a-z0-9.+-]*)://" + host_pattern + R"((?::\d+)?)?(?:/?|[/?]\S+)$)",
                        std::regex::icase);
            return rx;
        }

        const std::regex& email_user() {
            // dot-atom or quoted-string
            static const std::regex rx(
                        R"(^(?:[-!#$%&'*+/=?^_`{}|~0-9A-Z]+(?:\.[-!#$%&'*+/=?^_`{}|~0-9A-Z]+)*)"
                        R"(|"(?:[\x01-\x08\x0b\x0c\x0e-\x1f!#-\[\]-\x7f]|\\[\x01-\x09\x0b\x0c\x0e-\x7f])*")$)",
                        std::regex::icase);
            return rx;
        }

        const std::regex& email_domain() {
            static const std::regex rx(
                        R"(^(?:(?:[A-Z0-9](?:[A-Z0-9-]{0,61}[A-Z0-9])?\.)+[A-Z]{2,6}\.?|localhost)$)",
                        std::regex::icase);
            return rx;
        }

        const std::regex& email_literal() {
            static const std::regex rx(R"(^\[(?:\d{1,3}\.){3}\d{1,3}\]$)");
            return rx;
        }
    }  // namespace

    bool is_url(const std::string& text, bool relative) {
        if (text.empty()) return false;
        return std::regex_match(text, relative ? relative_url() : absolute_url());
    }

    bool is_email(const std::string& text) {
        auto at = text.rfind('@');
        if (at == std::string::npos or at == 0 or at + 1 == text.size()) return false;
        std::string user = text.substr(0, at);
        std::string domain = text.substr(at + 1);
        if (!std::regex_match(user, email_user())) return false;
        return std::regex_match(domain, email_domain()) or std::regex_match(domain, email_literal());
    }

    std::optional<std::string> suggest_url(const std::string& text) {
        if (is_url(text)) return std::nullopt;
        std::string candidate = "http://" + text;
        if (is_url(candidate)) return candidate;
        return std::nullopt;
    }

}  // namespace lexical
}  // namespace ms
