#pragma once

#include <string>

#include <ms/dictionary.h>
#include <ms/schema.h>

namespace ms {

// Appends message to the list stored under key. A key already holding a nested
// error mapping receives the message under its schema error key.
void store_error(Dictionary& errors, const std::string& key, const std::string& message);

// Object(s) to representation(s), one pass per record.
class Marshaller {
  public:
    explicit Marshaller(const Schema& schema) : m_schema(schema) {}
    MarshalResult operator()(const Dictionary& obj) const;

  private:
    const Schema& m_schema;
};

// Representation(s) to object(s): preprocessors, field conversion, required
// checks, schema validators and the object factory.
class Unmarshaller {
  public:
    explicit Unmarshaller(const Schema& schema) : m_schema(schema) {}
    UnmarshalResult operator()(const Dictionary& data) const;

  private:
    const Schema& m_schema;
};

}  // namespace ms
