#ifndef GRIDSTORE_GRID_FS_HPP
#define GRIDSTORE_GRID_FS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "grid/file.hpp"
#include "grid/file_metadata.hpp"
#include "grid/grid_error.hpp"
#include "store/database.hpp"
#include "store/write_concern.hpp"

namespace gridstore::grid {

struct FSOptions {
  static constexpr const char* DEFAULT_ROOT = "fs";

  // Prefix of the two collections, <fs_name>.files and <fs_name>.chunks
  std::string fs_name = DEFAULT_ROOT;
  // Overrides the database write concern when set
  std::optional<store::WriteConcern> write_concern;
};

struct FSInsertResult {
  store::Value file_id;
  std::size_t chunks_inserted = 0;
  // False when writes are unacknowledged and no integrity check ran
  bool validated = false;
};

struct FSRemoveResult {
  std::size_t files_removed = 0;
  std::size_t chunks_removed = 0;
};

// Stores files as one metadata record in <prefix>.files plus ordered chunk
// records in <prefix>.chunks.
//
// The two collections are written by separate, non-transactional requests.
// insert_one writes the metadata first and the chunks second, so a failure
// in between leaves a metadata record without chunks; remove_one deletes in
// the same order. Callers own the cleanup of such partial states (see
// Reconciler). The unique index on {files_id, n} is the only guarantee
// enforced by the backing store.
class FS {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Ensures the unique chunk index exists before any chunk can be written
  // and resolves whether inserts run the integrity check
  explicit FS(store::Database& database, const FSOptions& options = FSOptions());


  // ---- CORE OPERATIONS ----
  // Finds the first file whose metadata matches the selector, then reads its
  // chunks ordered by ordinal. Empty if no metadata matches. Completeness is
  // not re-validated here.
  std::optional<File> find_one(const store::Selector& selector = store::Selector());
  // Writes the metadata, then the chunk batch. With acknowledged writes the
  // stored chunks are checked against the file checksum afterwards and
  // InvalidFile is thrown on a mismatch; the written data stays in place.
  FSInsertResult insert_one(const File& file);
  // Removes the metadata record and every chunk of the file. Records that
  // are already gone are skipped without error.
  FSRemoveResult remove_one(const File& file);
  // Asks the store to recompute the checksum over the stored chunks of the
  // file and throws InvalidFile if it differs from file.md5()
  void validate(const File& file);


  // ---- QUERY OPERATIONS ----
  // Metadata of every matching file, no chunk reads
  std::vector<FileMetadata> find(const store::Selector& selector = store::Selector());


  // ---- GETTERS ----
  const std::string& prefix() const { return options_.fs_name; }
  std::string files_name() const;
  std::string chunks_name() const;
  bool validate_writes() const { return validate_writes_; }
  store::Database& database() { return database_; }
  store::Collection& files_collection() { return files_collection_; }
  store::Collection& chunks_collection() { return chunks_collection_; }

private:
  // ---- PARAMETERS ----
  store::Database& database_;
  FSOptions options_;
  store::Collection& files_collection_;
  store::Collection& chunks_collection_;
  // Resolved once from the write concern at construction
  bool validate_writes_;


  // ---- INSERT PHASES ----
  void insert_metadata(const File& file);
  std::size_t insert_chunks(const File& file);
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_FS_HPP
