#ifndef GRIDSTORE_STORE_OBJECT_ID_HPP
#define GRIDSTORE_STORE_OBJECT_ID_HPP

#include <string>

namespace gridstore::store {

// Generates a 12 byte identifier rendered as 24 lowercase hex characters:
// 4 byte timestamp, 5 random bytes fixed per process, 3 byte counter
std::string generate_object_id();

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_OBJECT_ID_HPP
