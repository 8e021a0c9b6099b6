#ifndef GRIDSTORE_GRID_FILE_HPP
#define GRIDSTORE_GRID_FILE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "grid/chunk.hpp"
#include "grid/file_metadata.hpp"
#include "store/document.hpp"

namespace gridstore::grid {

// Optional attributes for a new file
struct FileOptions {
  size_t chunk_size = Chunk::DEFAULT_SIZE;
  // Generated when unset
  std::optional<store::Value> id;
  std::optional<std::string> content_type;
  std::vector<std::string> aliases;
  store::Document metadata;
};

// A file as the caller sees it: one metadata record plus chunks 0..N-1
class File {
public:
  // ---- CONSTRUCTORS ----
  // Creates a new file from raw bytes: assigns the id, splits the bytes and
  // computes the checksum
  File(const std::vector<uint8_t>& data, const std::string& filename,
       const FileOptions& options = FileOptions());
  File(const std::string& data, const std::string& filename,
       const FileOptions& options = FileOptions());
  // Rebuilds a stored file from its metadata and its chunk documents, which
  // must already be sorted by ordinal
  File(const std::vector<store::Document>& chunk_documents, const store::Document& metadata);


  // ---- GETTERS ----
  const store::Value& id() const { return metadata_.id; }
  const std::string& filename() const { return metadata_.filename; }
  int64_t length() const { return metadata_.length; }
  // Declared checksum taken from the metadata
  const std::string& md5() const { return metadata_.md5; }
  const FileMetadata& metadata() const { return metadata_; }
  const std::vector<Chunk>& chunks() const { return chunks_; }


  // ---- CONTENT ----
  // Chunk payloads concatenated in ordinal order
  std::vector<uint8_t> data() const;
  std::string data_string() const;
  // Checksum recomputed from the chunk payloads
  std::string compute_md5() const;
  // True if the chunks are exactly 0..N-1 and cover the declared length
  bool is_complete() const;

private:
  // ---- PARAMETERS ----
  FileMetadata metadata_;
  std::vector<Chunk> chunks_;

  void initialize(const std::vector<uint8_t>& data, const std::string& filename,
                  const FileOptions& options);
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_FILE_HPP
