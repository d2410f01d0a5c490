#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <iomanip>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <ms/datetime.h>

namespace ms {

struct Dictionary;

// A host object that exposes named attributes. Sources handed to a schema are
// either mappings (Dictionary objects) or references to one of these.
class Reflectable {
  public:
    virtual ~Reflectable() = default;
    // std::nullopt when the object has no such attribute
    virtual std::optional<Dictionary> attribute(const std::string& name) const = 0;
};

struct DictionaryScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string;
    Timestamp m_timestamp;
    std::chrono::microseconds m_duration{0};
    std::shared_ptr<const Reflectable> m_reference;
};

struct Dictionary {
    enum TYPE { Object, Boolean, String, Integer, Double, Array, Null, Timestamp, Duration, Reference };

    using Member = std::pair<std::string, Dictionary>;

  private:
    TYPE my_type = Object;
    DictionaryScalarImpl scalar;

    std::vector<Dictionary> m_array;
    // insertion ordered; assigning an existing key keeps its slot
    std::vector<Member> m_object;

    Member* findMember(const std::string& k) {
        for (auto& p : m_object)
            if (p.first == k) return &p;
        return nullptr;
    }

    const Member* findMember(const std::string& k) const {
        for (auto const& p : m_object)
            if (p.first == k) return &p;
        return nullptr;
    }

    void writeJson(std::ostringstream& out, int indent, int level) const;

    [[noreturn]] void throwMissingKey(const std::string& k) const {
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        throw std::out_of_range(ss.str());
    }

  public:
    Dictionary() = default;

    Dictionary(const std::string& s) : my_type(TYPE::String) { scalar.m_string = s; }
    Dictionary(std::string&& s) : my_type(TYPE::String) { scalar.m_string = std::move(s); }
    Dictionary(const char* s) : Dictionary(std::string(s)) {}
    Dictionary(int64_t n) : my_type(TYPE::Integer) { scalar.m_int = n; }
    Dictionary(int n) : Dictionary(int64_t(n)) {}
    Dictionary(double x) : my_type(TYPE::Double) { scalar.m_double = x; }
    Dictionary(bool b) : my_type(TYPE::Boolean) { scalar.m_bool = b; }
    Dictionary(const ms::Timestamp& ts) : my_type(TYPE::Timestamp) { scalar.m_timestamp = ts; }

    template <typename Rep, typename Period>
    Dictionary(std::chrono::duration<Rep, Period> d) : my_type(TYPE::Duration) {
        scalar.m_duration = std::chrono::duration_cast<std::chrono::microseconds>(d);
    }

    Dictionary(std::shared_ptr<const Reflectable> ref) {
        if (ref) {
            my_type = TYPE::Reference;
            scalar.m_reference = std::move(ref);
        } else {
            my_type = TYPE::Null;
        }
    }

    template <typename T, typename = std::enable_if_t<std::is_base_of<Reflectable, T>::value>>
    Dictionary(std::shared_ptr<T> ref)
        : Dictionary(std::shared_ptr<const Reflectable>(std::move(ref))) {}

    Dictionary(const std::vector<Dictionary>& v) : my_type(TYPE::Array), m_array(v) {}
    Dictionary(std::vector<Dictionary>&& v) : my_type(TYPE::Array), m_array(std::move(v)) {}

    Dictionary(const std::vector<std::string>& v) : my_type(TYPE::Array) {
        for (auto const& s : v) m_array.emplace_back(s);
    }

    Dictionary(const std::vector<int>& v) : my_type(TYPE::Array) {
        for (auto n : v) m_array.emplace_back(int64_t(n));
    }

    Dictionary(const std::vector<double>& v) : my_type(TYPE::Array) {
        for (auto x : v) m_array.emplace_back(x);
    }

    // Construct an object from initializer list of (key, value) pairs
    Dictionary(std::initializer_list<Member> init) : my_type(TYPE::Object) {
        for (auto const& p : init) (*this)[p.first] = p.second;
    }

    static Dictionary null() {
        Dictionary d;
        d.my_type = TYPE::Null;
        return d;
    }

    static Dictionary array() {
        Dictionary d;
        d.my_type = TYPE::Array;
        return d;
    }

    // Construct an array from an initializer list of convertible values
    static Dictionary array(std::initializer_list<Dictionary> init) {
        Dictionary d = array();
        for (auto const& v : init) d.m_array.push_back(v);
        return d;
    }

    static Dictionary object() { return Dictionary(); }

    bool operator==(const Dictionary& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::Double:
                return scalar.m_double == rhs.scalar.m_double;
            case TYPE::Integer:
                return scalar.m_int == rhs.scalar.m_int;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Timestamp:
                return scalar.m_timestamp == rhs.scalar.m_timestamp;
            case TYPE::Duration:
                return scalar.m_duration == rhs.scalar.m_duration;
            case TYPE::Reference:
                return scalar.m_reference == rhs.scalar.m_reference;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object: {
                if (m_object.size() != rhs.m_object.size()) return false;
                for (auto const& p : m_object) {
                    const Member* other = rhs.findMember(p.first);
                    if (other == nullptr) return false;
                    if (p.second != other->second) return false;
                }
                return true;
            }
            case TYPE::Null:
                return true;
        }
        return false;
    }

    bool operator!=(const Dictionary& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return findMember(key) ? 1 : 0;
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_object.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept {
        switch (my_type) {
            case TYPE::Object:
                return m_object.empty();
            case TYPE::Array:
                return m_array.empty();
            default:
                return false;
        }
    }

    Dictionary& erase(const std::string& k) {
        if (my_type == TYPE::Object) {
            for (auto it = m_object.begin(); it != m_object.end(); ++it) {
                if (it->first == k) {
                    m_object.erase(it);
                    break;
                }
            }
        }
        return *this;
    }

    void clear() noexcept {
        m_object.clear();
        m_array.clear();
        my_type = TYPE::Object;
    }

    TYPE type() const noexcept { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "Object";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Double:
                return "Double";
            case TYPE::Integer:
                return "Integer";
            case TYPE::String:
                return "String";
            case TYPE::Array:
                return "Array";
            case TYPE::Null:
                return "Null";
            case TYPE::Timestamp:
                return "Timestamp";
            case TYPE::Duration:
                return "Duration";
            case TYPE::Reference:
                return "Reference";
        }
        throw std::logic_error("Not a valid type");
    }

    template <typename DefaultValue>
    Dictionary get(const std::string& key, const DefaultValue& default_value) const {
        if (has(key)) return at(key);
        return Dictionary(default_value);
    }

    Dictionary& operator[](int index) {
        // an untouched object becomes an array on first integer-index access
        if (my_type == TYPE::Object && m_object.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0) throw std::logic_error("Negative index");
        while (static_cast<int>(m_array.size()) <= index) m_array.emplace_back();
        return m_array[static_cast<size_t>(index)];
    }

    const Dictionary& operator[](int index) const { return at(index); }

    Dictionary& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            my_type = TYPE::Object;
            m_object.clear();
        }
        if (Member* p = findMember(k)) return p->second;
        m_object.emplace_back(k, Dictionary());
        return m_object.back().second;
    }

    Dictionary& operator[](const char* k) { return (*this)[std::string(k)]; }

    const Dictionary& operator[](const std::string& k) const { return at(k); }

    Dictionary& at(int index) {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array.at(static_cast<size_t>(index));
    }

    const Dictionary& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array.at(static_cast<size_t>(index));
    }

    const Dictionary& at(const std::string& k) const {
        if (const Member* p = findMember(k)) return p->second;
        throwMissingKey(k);
    }

    Dictionary& at(const std::string& k) {
        if (Member* p = findMember(k)) return p->second;
        throwMissingKey(k);
    }

    void push_back(Dictionary value) {
        if (my_type == TYPE::Object && m_object.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(value));
    }

    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) return {};
        std::vector<std::string> out;
        out.reserve(m_object.size());
        for (auto const& p : m_object) out.push_back(p.first);
        return out;
    }

    std::vector<Dictionary> values() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get values of non-object type");
        }
        std::vector<Dictionary> out;
        out.reserve(m_object.size());
        for (auto const& p : m_object) out.push_back(p.second);
        return out;
    }

    const std::vector<Member>& items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        return m_object;
    }

    const std::vector<Dictionary>& elements() const {
        if (my_type != TYPE::Array) throw std::logic_error("Cannot get elements of non-array type");
        return m_array;
    }

    std::string asString() const {
        if (my_type == TYPE::String) return scalar.m_string;
        if (my_type == TYPE::Integer) return std::to_string(scalar.m_int);
        if (my_type == TYPE::Double) return formatDouble(scalar.m_double);
        if (my_type == TYPE::Boolean) return scalar.m_bool ? "true" : "false";
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        if (my_type == TYPE::Double) return static_cast<int64_t>(scalar.m_double);
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar.m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar.m_bool;
        throw std::runtime_error("not a bool");
    }

    const ms::Timestamp& asTimestamp() const {
        if (my_type == TYPE::Timestamp) return scalar.m_timestamp;
        throw std::runtime_error("not a timestamp");
    }

    std::chrono::microseconds asDuration() const {
        if (my_type == TYPE::Duration) return scalar.m_duration;
        throw std::runtime_error("not a duration");
    }

    const std::shared_ptr<const Reflectable>& asReference() const {
        if (my_type == TYPE::Reference) return scalar.m_reference;
        throw std::runtime_error("not a reference");
    }

    std::vector<std::string> asStrings() const {
        if (my_type == TYPE::String) return {scalar.m_string};
        if (my_type != TYPE::Array) throw std::runtime_error("not a string list");
        std::vector<std::string> out;
        out.reserve(m_array.size());
        for (auto const& el : m_array) out.push_back(el.asString());
        return out;
    }

    bool isValueObject() const {
        switch (my_type) {
            case TYPE::Object:
            case TYPE::Array:
            case TYPE::Null:
            case TYPE::Reference:
                return false;
            default:
                return true;
        }
    }

    bool isMappedObject() const { return my_type == TYPE::Object; }
    bool isArrayObject() const { return my_type == TYPE::Array; }

    bool isDict() const { return isMappedObject(); }
    bool isList() const { return isArrayObject(); }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isNumber() const { return isInt() || isDouble(); }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }
    bool isTimestamp() const { return my_type == TYPE::Timestamp; }
    bool isDuration() const { return my_type == TYPE::Duration; }
    bool isReference() const { return my_type == TYPE::Reference; }

    // Comparison operators against primitive types for compatibility
    bool operator==(int rhs) const {
        if (my_type == TYPE::Integer) return scalar.m_int == rhs;
        if (my_type == TYPE::Double) return scalar.m_double == rhs;
        return false;
    }

    bool operator!=(int rhs) const { return not(*this == rhs); }

    bool operator==(double rhs) const {
        if (my_type == TYPE::Double) return scalar.m_double == rhs;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int) == rhs;
        return false;
    }

    bool operator!=(double rhs) const { return not(*this == rhs); }

    bool operator==(bool rhs) const {
        if (my_type == TYPE::Boolean) return scalar.m_bool == rhs;
        return false;
    }

    bool operator!=(bool rhs) const { return not(*this == rhs); }

    bool operator==(const char* rhs) const {
        return my_type == TYPE::String && scalar.m_string == rhs;
    }

    bool operator!=(const char* rhs) const { return not(*this == rhs); }

    bool operator==(const std::string& rhs) const {
        return my_type == TYPE::String && scalar.m_string == rhs;
    }

    bool operator!=(const std::string& rhs) const { return not(*this == rhs); }

    // JSON text. indent == 0 produces a single line.
    std::string dump(int indent = 0) const;

    Dictionary overrideEntries(const Dictionary& config) const;

    std::string to_string() const {
        switch (my_type) {
            case TYPE::Null:
                return "null";
            case TYPE::Boolean:
                return scalar.m_bool ? "true" : "false";
            case TYPE::Integer:
                return std::to_string(scalar.m_int);
            case TYPE::Double:
                return formatDouble(scalar.m_double);
            case TYPE::String:
                return scalar.m_string;
            case TYPE::Timestamp:
                return datetime::isoformat(scalar.m_timestamp);
            default:
                break;
        }
        return dump();
    }

    // Shortest text that reads back as the same double; always marked as a double.
    static std::string formatDouble(double x) {
        if (std::isnan(x)) return "NaN";
        if (std::isinf(x)) return x < 0 ? "-Infinity" : "Infinity";
        std::string text;
        for (int precision = 15; precision <= 17; ++precision) {
            std::ostringstream ss;
            ss << std::setprecision(precision) << x;
            text = ss.str();
            if (std::stod(text) == x) break;
        }
        if (text.find_first_of(".eE") == std::string::npos) text += ".0";
        return text;
    }
};

// Helper function to escape JSON strings
static inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream ss;
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c));
                    result += ss.str();
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

inline void Dictionary::writeJson(std::ostringstream& out, int indent, int level) const {
    auto newline = [&](int l) {
        if (indent <= 0) return;
        out << '\n' << std::string(static_cast<size_t>(l), ' ');
    };
    switch (my_type) {
        case TYPE::Null:
            out << "null";
            return;
        case TYPE::Boolean:
            out << (scalar.m_bool ? "true" : "false");
            return;
        case TYPE::Integer:
            out << scalar.m_int;
            return;
        case TYPE::Double:
            out << formatDouble(scalar.m_double);
            return;
        case TYPE::String:
            out << escape_json_string(scalar.m_string);
            return;
        case TYPE::Timestamp:
            out << escape_json_string(datetime::isoformat(scalar.m_timestamp));
            return;
        case TYPE::Duration:
            out << std::chrono::duration_cast<std::chrono::seconds>(scalar.m_duration).count();
            return;
        case TYPE::Reference:
            throw std::runtime_error("host object reference is not JSON serializable");
        case TYPE::Array: {
            if (m_array.empty()) {
                out << "[]";
                return;
            }
            out << '[';
            for (size_t i = 0; i < m_array.size(); ++i) {
                if (i) out << ',';
                newline(level + indent);
                m_array[i].writeJson(out, indent, level + indent);
            }
            newline(level);
            out << ']';
            return;
        }
        case TYPE::Object: {
            if (m_object.empty()) {
                out << "{}";
                return;
            }
            out << '{';
            for (size_t i = 0; i < m_object.size(); ++i) {
                if (i) out << ',';
                newline(level + indent);
                out << escape_json_string(m_object[i].first) << (indent > 0 ? ": " : ":");
                m_object[i].second.writeJson(out, indent, level + indent);
            }
            newline(level);
            out << '}';
            return;
        }
    }
}

inline std::string Dictionary::dump(int indent) const {
    std::ostringstream out;
    writeJson(out, indent, 0);
    return out.str();
}

inline Dictionary Dictionary::overrideEntries(const Dictionary& config) const {
    // config values overwrite or are added; nested objects are merged recursively
    Dictionary out = *this;
    if (config.my_type != TYPE::Object) return out;
    for (auto const& p : config.m_object) {
        Member* mine = out.findMember(p.first);
        if (mine != nullptr && mine->second.my_type == TYPE::Object &&
            p.second.my_type == TYPE::Object) {
            mine->second = mine->second.overrideEntries(p.second);
        } else {
            out[p.first] = p.second;
        }
    }
    return out;
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

}  // namespace ms
