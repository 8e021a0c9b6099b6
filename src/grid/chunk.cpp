#include "grid/chunk.hpp"
#include "store/object_id.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

const std::string Chunk::COLLECTION = "chunks";
const std::string Chunk::ID_FIELD = "_id";
const std::string Chunk::FILES_ID_FIELD = "files_id";
const std::string Chunk::N_FIELD = "n";
const std::string Chunk::DATA_FIELD = "data";
const store::IndexSpec Chunk::INDEX_SPEC = {{Chunk::FILES_ID_FIELD, 1}, {Chunk::N_FIELD, 1}};

//==============================================
// CONSTRUCTORS
//==============================================

Chunk::Chunk(store::Value files_id, int64_t n, std::vector<uint8_t> data)
  : Chunk(store::generate_object_id(), std::move(files_id), n, std::move(data)) {}

Chunk::Chunk(store::Value id, store::Value files_id, int64_t n, std::vector<uint8_t> data)
  : id_(std::move(id))
  , files_id_(std::move(files_id))
  , n_(n)
  , data_(std::move(data)) {
  if (n_ < 0) {
    throw std::invalid_argument("Chunk: Negative ordinal " + std::to_string(n_));
  }
}


//==============================================
// CONVERSION
//==============================================

store::Document Chunk::to_document() const {
  store::Document document;
  document.set(ID_FIELD, id_);
  document.set(FILES_ID_FIELD, files_id_);
  document.set(N_FIELD, n_);
  document.set(DATA_FIELD, data_);
  return document;
}

Chunk Chunk::from_document(const store::Document& document) {
  const store::Value* id = document.find(ID_FIELD);
  return Chunk(id ? *id : store::Value(),
               document.get(FILES_ID_FIELD),
               document.get_int(N_FIELD),
               document.get_binary(DATA_FIELD));
}


//==============================================
// SPLIT AND ASSEMBLE
//==============================================

std::vector<Chunk> Chunk::split(const std::vector<uint8_t>& data, const store::Value& files_id,
                                size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunk: Chunk size must be positive");
  }

  std::vector<Chunk> chunks;
  chunks.reserve((data.size() + chunk_size - 1) / chunk_size);

  int64_t n = 0;
  for (size_t offset = 0; offset < data.size(); offset += chunk_size) {
    size_t length = std::min(chunk_size, data.size() - offset);
    chunks.emplace_back(files_id, n++,
                        std::vector<uint8_t>(data.begin() + offset, data.begin() + offset + length));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk: Split " << data.size() << " bytes into " << chunks.size()
                           << " chunks of up to " << chunk_size << " bytes";
  return chunks;
}

std::vector<uint8_t> Chunk::assemble(const std::vector<Chunk>& chunks) {
  size_t total = 0;
  for (const auto& chunk : chunks) {
    total += chunk.size();
  }

  std::vector<uint8_t> data;
  data.reserve(total);
  for (const auto& chunk : chunks) {
    data.insert(data.end(), chunk.data().begin(), chunk.data().end());
  }
  return data;
}

} // namespace gridstore::grid
