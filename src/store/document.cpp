#include "store/document.hpp"
#include <algorithm>
#include <sstream>

namespace gridstore::store {

//==============================================
// VALUE
//==============================================

Value::Value(const Document& value) : data_(std::make_shared<const Document>(value)) {}

const Document* Value::as_document() const {
  auto doc = std::get_if<std::shared_ptr<const Document>>(&data_);
  return doc ? doc->get() : nullptr;
}

bool Value::operator==(const Value& other) const {
  return compare_values(*this, other) == 0;
}


//==============================================
// DOCUMENT
//==============================================

Document::Document(std::initializer_list<Field> fields) {
  for (const auto& field : fields) {
    set(field.first, field.second);
  }
}

Document& Document::set(const std::string& name, Value value) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
    [&name](const Field& field) { return field.first == name; });

  if (it != fields_.end()) {
    it->second = std::move(value);
  } else {
    fields_.emplace_back(name, std::move(value));
  }
  return *this;
}

bool Document::erase(const std::string& name) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
    [&name](const Field& field) { return field.first == name; });

  if (it == fields_.end()) {
    return false;
  }
  fields_.erase(it);
  return true;
}

bool Document::has(const std::string& name) const {
  return find(name) != nullptr;
}

const Value* Document::find(const std::string& name) const {
  for (const auto& field : fields_) {
    if (field.first == name) {
      return &field.second;
    }
  }
  return nullptr;
}

const Value& Document::get(const std::string& name) const {
  const Value* value = find(name);
  if (!value) {
    throw StoreError("Document: Missing field: " + name);
  }
  return *value;
}

const std::string& Document::get_string(const std::string& name) const {
  const std::string* value = get(name).get_if<std::string>();
  if (!value) {
    throw StoreError("Document: Field is not a string: " + name);
  }
  return *value;
}

int64_t Document::get_int(const std::string& name) const {
  const Value& value = get(name);
  if (const int64_t* number = value.get_if<int64_t>()) {
    return *number;
  }
  // Accept integral doubles, some stores report counts that way
  if (const double* number = value.get_if<double>()) {
    if (*number == static_cast<double>(static_cast<int64_t>(*number))) {
      return static_cast<int64_t>(*number);
    }
  }
  throw StoreError("Document: Field is not an integer: " + name);
}

const Binary& Document::get_binary(const std::string& name) const {
  const Binary* value = get(name).get_if<Binary>();
  if (!value) {
    throw StoreError("Document: Field is not binary: " + name);
  }
  return *value;
}

const Document& Document::get_document(const std::string& name) const {
  const Document* value = get(name).as_document();
  if (!value) {
    throw StoreError("Document: Field is not a document: " + name);
  }
  return *value;
}

bool Document::matches(const Document& selector) const {
  for (const auto& [name, expected] : selector) {
    const Value* actual = find(name);
    if (!actual) {
      // A null in the selector also matches a missing field
      if (expected.is_null()) {
        continue;
      }
      return false;
    }
    if (*actual != expected) {
      return false;
    }
  }
  return true;
}

bool Document::operator==(const Document& other) const {
  if (fields_.size() != other.fields_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].first != other.fields_[i].first ||
        fields_[i].second != other.fields_[i].second) {
      return false;
    }
  }
  return true;
}


//==============================================
// COMPARISON
//==============================================

namespace {

// Canonical rank of each type in the sort order
int type_rank(const Value& value) {
  switch (value.type()) {
    case Value::Type::Null:     return 0;
    case Value::Type::Int:
    case Value::Type::Double:   return 1;
    case Value::Type::String:   return 2;
    case Value::Type::Binary:   return 3;
    case Value::Type::Bool:     return 4;
    case Value::Type::Document: return 5;
  }
  return 6;
}

double as_double(const Value& value) {
  if (const int64_t* number = value.get_if<int64_t>()) {
    return static_cast<double>(*number);
  }
  return *value.get_if<double>();
}

template <typename T>
int three_way(const T& lhs, const T& rhs) {
  if (lhs < rhs) return -1;
  if (rhs < lhs) return 1;
  return 0;
}

int compare_fieldwise(const Document& lhs, const Document& rhs) {
  auto l = lhs.begin();
  auto r = rhs.begin();
  for (; l != lhs.end() && r != rhs.end(); ++l, ++r) {
    if (int cmp = three_way(l->first, r->first); cmp != 0) {
      return cmp;
    }
    if (int cmp = compare_values(l->second, r->second); cmp != 0) {
      return cmp;
    }
  }
  return three_way(lhs.size(), rhs.size());
}

} // namespace

int compare_values(const Value& lhs, const Value& rhs) {
  int lhs_rank = type_rank(lhs);
  int rhs_rank = type_rank(rhs);
  if (lhs_rank != rhs_rank) {
    return three_way(lhs_rank, rhs_rank);
  }

  switch (lhs.type()) {
    case Value::Type::Null:
      return 0;
    case Value::Type::Int:
    case Value::Type::Double:
      // Compare integers exactly when both sides are integral
      if (lhs.type() == Value::Type::Int && rhs.type() == Value::Type::Int) {
        return three_way(*lhs.get_if<int64_t>(), *rhs.get_if<int64_t>());
      }
      return three_way(as_double(lhs), as_double(rhs));
    case Value::Type::String:
      return three_way(*lhs.get_if<std::string>(), *rhs.get_if<std::string>());
    case Value::Type::Binary:
      return three_way(*lhs.get_if<Binary>(), *rhs.get_if<Binary>());
    case Value::Type::Bool:
      return three_way(*lhs.get_if<bool>(), *rhs.get_if<bool>());
    case Value::Type::Document:
      return compare_fieldwise(*lhs.as_document(), *rhs.as_document());
  }
  return 0;
}

int compare_documents(const Document& lhs, const Document& rhs, const SortSpec& spec) {
  static const Value null_value;

  for (const auto& [field, direction] : spec) {
    const Value* l = lhs.find(field);
    const Value* r = rhs.find(field);
    int cmp = compare_values(l ? *l : null_value, r ? *r : null_value);
    if (cmp != 0) {
      return direction < 0 ? -cmp : cmp;
    }
  }
  return 0;
}

std::string index_name(const IndexSpec& spec) {
  std::string name;
  for (const auto& [field, direction] : spec) {
    if (!name.empty()) {
      name += "_";
    }
    name += field + "_" + std::to_string(direction);
  }
  return name;
}


//==============================================
// FORMATTING
//==============================================

std::string to_string(const Value& value) {
  std::ostringstream ss;
  ss << value;
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  switch (value.type()) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << (*value.get_if<bool>() ? "true" : "false");
    case Value::Type::Int:
      return os << *value.get_if<int64_t>();
    case Value::Type::Double:
      return os << *value.get_if<double>();
    case Value::Type::String:
      return os << '"' << *value.get_if<std::string>() << '"';
    case Value::Type::Binary:
      return os << "<binary " << value.get_if<Binary>()->size() << " bytes>";
    case Value::Type::Document:
      return os << *value.as_document();
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, const Document& document) {
  os << "{";
  bool first = true;
  for (const auto& [name, value] : document) {
    os << (first ? " " : ", ") << name << ": " << value;
    first = false;
  }
  return os << (first ? "}" : " }");
}

} // namespace gridstore::store
