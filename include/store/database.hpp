#ifndef GRIDSTORE_STORE_DATABASE_HPP
#define GRIDSTORE_STORE_DATABASE_HPP

#include <string>
#include "store/collection.hpp"
#include "store/document.hpp"
#include "store/write_concern.hpp"

namespace gridstore::store {

// Narrow interface over the backing document store
class Database {
public:
  virtual ~Database() = default;

  // Returns the named collection, creating it on first use. The reference
  // stays valid for the lifetime of the database.
  virtual Collection& collection(const std::string& name) = 0;
  Collection& operator[](const std::string& name) { return collection(name); }

  // Runs a server-side command, the command name is the first field of op.
  // Throws CommandError if the command is unknown or fails.
  virtual Document command(const Document& op) = 0;

  virtual const WriteConcern& write_concern() const = 0;
};

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_DATABASE_HPP
