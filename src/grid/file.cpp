#include "grid/file.hpp"
#include "crypto/digest.hpp"
#include "store/object_id.hpp"
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

//==============================================
// CONSTRUCTORS
//==============================================

File::File(const std::vector<uint8_t>& data, const std::string& filename,
           const FileOptions& options) {
  initialize(data, filename, options);
}

File::File(const std::string& data, const std::string& filename, const FileOptions& options) {
  initialize(std::vector<uint8_t>(data.begin(), data.end()), filename, options);
}

File::File(const std::vector<store::Document>& chunk_documents, const store::Document& metadata)
  : metadata_(FileMetadata::from_document(metadata)) {
  chunks_.reserve(chunk_documents.size());
  for (const auto& document : chunk_documents) {
    chunks_.push_back(Chunk::from_document(document));
  }
  BOOST_LOG_TRIVIAL(debug) << "File: Loaded " << metadata_.filename << " with "
                           << chunks_.size() << " chunks";
}

void File::initialize(const std::vector<uint8_t>& data, const std::string& filename,
                      const FileOptions& options) {
  metadata_.id = options.id ? *options.id : store::Value(store::generate_object_id());
  metadata_.filename = filename;
  metadata_.length = static_cast<int64_t>(data.size());
  metadata_.chunk_size = static_cast<int64_t>(options.chunk_size);
  metadata_.upload_date = FileMetadata::now();
  metadata_.md5 = crypto::md5_hex(data);
  metadata_.content_type = options.content_type;
  metadata_.aliases = options.aliases;
  metadata_.metadata = options.metadata;

  chunks_ = Chunk::split(data, metadata_.id, options.chunk_size);
  BOOST_LOG_TRIVIAL(debug) << "File: Created " << filename << " (" << data.size()
                           << " bytes, md5 " << metadata_.md5 << ")";
}


//==============================================
// CONTENT
//==============================================

std::vector<uint8_t> File::data() const {
  return Chunk::assemble(chunks_);
}

std::string File::data_string() const {
  auto bytes = data();
  return std::string(bytes.begin(), bytes.end());
}

std::string File::compute_md5() const {
  crypto::Md5 md5;
  for (const auto& chunk : chunks_) {
    md5.update(chunk.data());
  }
  return md5.hex_digest();
}

bool File::is_complete() const {
  int64_t total = 0;
  for (size_t i = 0; i < chunks_.size(); ++i) {
    if (chunks_[i].n() != static_cast<int64_t>(i)) {
      return false;
    }
    total += static_cast<int64_t>(chunks_[i].size());
  }
  return total == metadata_.length;
}

} // namespace gridstore::grid
