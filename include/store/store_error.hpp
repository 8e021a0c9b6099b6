#ifndef GRIDSTORE_STORE_ERROR_HPP
#define GRIDSTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gridstore::store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message)
    : std::runtime_error(message) {}
};

// Raised when an insert would violate a unique index
class DuplicateKeyError : public StoreError {
public:
  DuplicateKeyError(const std::string& collection, const std::string& index,
                    const std::string& key)
    : StoreError("Duplicate key error collection: " + collection +
                 " index: " + index + " dup key: " + key)
    , collection_(collection)
    , index_(index)
    , key_(key) {}

  const std::string& collection() const { return collection_; }
  const std::string& index() const { return index_; }
  const std::string& key() const { return key_; }

private:
  std::string collection_;
  std::string index_;
  std::string key_;
};

class CommandError : public StoreError {
public:
  explicit CommandError(const std::string& message)
    : StoreError("Command error: " + message) {}
};

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_ERROR_HPP
