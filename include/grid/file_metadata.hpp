#ifndef GRIDSTORE_GRID_FILE_METADATA_HPP
#define GRIDSTORE_GRID_FILE_METADATA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "store/document.hpp"

namespace gridstore::grid {

// Describes a stored file apart from its bytes. Written once, never updated.
struct FileMetadata {
  // Collection suffix, the physical name is <prefix>.files
  static const std::string COLLECTION;

  store::Value id;
  std::string filename;
  int64_t length = 0;
  int64_t chunk_size = 0;
  // Milliseconds since the epoch
  int64_t upload_date = 0;
  // Declared content checksum, lowercase hex
  std::string md5;
  std::optional<std::string> content_type;
  std::vector<std::string> aliases;
  // Free-form user fields
  store::Document metadata;

  store::Document to_document() const;
  // Unknown fields are ignored. Throws StoreError if _id is missing or a
  // known field has the wrong type.
  static FileMetadata from_document(const store::Document& document);

  // Current time in milliseconds since the epoch
  static int64_t now();
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_FILE_METADATA_HPP
