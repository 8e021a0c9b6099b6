#ifndef GRIDSTORE_STORE_DOCUMENT_HPP
#define GRIDSTORE_STORE_DOCUMENT_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "store/store_error.hpp"

namespace gridstore::store {

class Document;

using Binary = std::vector<uint8_t>;

// Ordered (field, direction) pairs, direction is 1 for ascending, -1 for descending
using FieldOrder = std::vector<std::pair<std::string, int>>;
using SortSpec = FieldOrder;
using IndexSpec = FieldOrder;

// A single field value of a document
class Value {
public:
  // Alternative order matches Type
  using Storage = std::variant<std::monostate, bool, int64_t, double, std::string,
                               Binary, std::shared_ptr<const Document>>;

  enum class Type {
    Null = 0,
    Bool,
    Int,
    Double,
    String,
    Binary,
    Document
  };

  // ---- CONSTRUCTORS ----
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool value) : data_(value) {}
  Value(int value) : data_(static_cast<int64_t>(value)) {}
  Value(int64_t value) : data_(value) {}
  Value(uint64_t value) : data_(static_cast<int64_t>(value)) {}
  Value(double value) : data_(value) {}
  Value(const char* value) : data_(std::string(value)) {}
  Value(std::string value) : data_(std::move(value)) {}
  Value(Binary value) : data_(std::move(value)) {}
  Value(const Document& value);


  // ---- ACCESSORS ----
  Type type() const { return static_cast<Type>(data_.index()); }
  bool is_null() const { return type() == Type::Null; }
  bool is_number() const { return type() == Type::Int || type() == Type::Double; }

  // Returns nullptr if the value holds a different alternative
  template <typename T>
  const T* get_if() const { return std::get_if<T>(&data_); }
  const Document* as_document() const;

  const Storage& storage() const { return data_; }

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

private:
  Storage data_;
};

class Document {
public:
  using Field = std::pair<std::string, Value>;

  // ---- CONSTRUCTOR ----
  Document() = default;
  Document(std::initializer_list<Field> fields);


  // ---- FIELD ACCESS ----
  // Sets a field, replacing an existing value in place
  Document& set(const std::string& name, Value value);
  // Removes a field, returns false if it was not present
  bool erase(const std::string& name);
  bool has(const std::string& name) const;
  // Returns nullptr if the field is missing
  const Value* find(const std::string& name) const;
  // Throws StoreError if the field is missing
  const Value& get(const std::string& name) const;

  // Typed accessors, throw StoreError on a missing field or a type mismatch
  const std::string& get_string(const std::string& name) const;
  int64_t get_int(const std::string& name) const;
  const Binary& get_binary(const std::string& name) const;
  const Document& get_document(const std::string& name) const;


  // ---- QUERY ----
  // True if every field of the selector is present here with an equal value
  bool matches(const Document& selector) const;

  bool empty() const { return fields_.empty(); }
  std::size_t size() const { return fields_.size(); }
  std::vector<Field>::const_iterator begin() const { return fields_.begin(); }
  std::vector<Field>::const_iterator end() const { return fields_.end(); }

  bool operator==(const Document& other) const;
  bool operator!=(const Document& other) const { return !(*this == other); }

private:
  std::vector<Field> fields_;
};

using Selector = Document;

// ---- VALUE HELPERS ----
// Total order over values: null < numbers < strings < binary < booleans < documents
int compare_values(const Value& lhs, const Value& rhs);
// Compares two documents field by field according to a sort specification
int compare_documents(const Document& lhs, const Document& rhs, const SortSpec& spec);
// Derives an index name, e.g. {files_id: 1, n: 1} -> "files_id_1_n_1"
std::string index_name(const IndexSpec& spec);

std::string to_string(const Value& value);
std::ostream& operator<<(std::ostream& os, const Value& value);
std::ostream& operator<<(std::ostream& os, const Document& document);

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_DOCUMENT_HPP
