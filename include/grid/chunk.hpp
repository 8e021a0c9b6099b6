#ifndef GRIDSTORE_GRID_CHUNK_HPP
#define GRIDSTORE_GRID_CHUNK_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "store/document.hpp"

namespace gridstore::grid {

// One ordinal-indexed fragment of a file's bytes
class Chunk {
public:
  // Collection suffix, the physical name is <prefix>.chunks
  static const std::string COLLECTION;
  static constexpr size_t DEFAULT_SIZE = 255 * 1024;

  // Document field names, these must match INDEX_SPEC exactly or the
  // uniqueness constraint will not apply to inserted chunks
  static const std::string ID_FIELD;
  static const std::string FILES_ID_FIELD;
  static const std::string N_FIELD;
  static const std::string DATA_FIELD;
  // {files_id: 1, n: 1}
  static const store::IndexSpec INDEX_SPEC;

  // ---- CONSTRUCTORS ----
  Chunk(store::Value files_id, int64_t n, std::vector<uint8_t> data);
  Chunk(store::Value id, store::Value files_id, int64_t n, std::vector<uint8_t> data);


  // ---- CONVERSION ----
  store::Document to_document() const;
  // Throws StoreError if a required field is missing or mistyped
  static Chunk from_document(const store::Document& document);


  // ---- SPLIT AND ASSEMBLE ----
  // Splits bytes into chunks 0..N-1 of chunk_size bytes, the last one may be
  // shorter. Empty input gives no chunks. Throws std::invalid_argument on a
  // zero chunk size.
  static std::vector<Chunk> split(const std::vector<uint8_t>& data, const store::Value& files_id,
                                  size_t chunk_size = DEFAULT_SIZE);
  // Concatenates payloads in the given order
  static std::vector<uint8_t> assemble(const std::vector<Chunk>& chunks);


  // ---- GETTERS ----
  const store::Value& id() const { return id_; }
  const store::Value& files_id() const { return files_id_; }
  int64_t n() const { return n_; }
  const std::vector<uint8_t>& data() const { return data_; }
  size_t size() const { return data_.size(); }

private:
  // ---- PARAMETERS ----
  store::Value id_;
  store::Value files_id_;
  int64_t n_;
  std::vector<uint8_t> data_;
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_CHUNK_HPP
