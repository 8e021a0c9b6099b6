#include "grid/file_metadata.hpp"
#include <chrono>

namespace gridstore::grid {

const std::string FileMetadata::COLLECTION = "files";

store::Document FileMetadata::to_document() const {
  store::Document document;
  document.set("_id", id);
  document.set("filename", filename);
  document.set("length", length);
  document.set("chunkSize", chunk_size);
  document.set("uploadDate", upload_date);
  document.set("md5", md5);
  if (content_type) {
    document.set("contentType", *content_type);
  }
  if (!aliases.empty()) {
    // Arrays are stored the BSON way, as a document keyed "0", "1", ...
    store::Document list;
    for (size_t i = 0; i < aliases.size(); ++i) {
      list.set(std::to_string(i), aliases[i]);
    }
    document.set("aliases", list);
  }
  if (!metadata.empty()) {
    document.set("metadata", metadata);
  }
  return document;
}

FileMetadata FileMetadata::from_document(const store::Document& document) {
  FileMetadata result;
  result.id = document.get("_id");

  if (document.has("filename")) {
    result.filename = document.get_string("filename");
  }
  if (document.has("length")) {
    result.length = document.get_int("length");
  }
  if (document.has("chunkSize")) {
    result.chunk_size = document.get_int("chunkSize");
  }
  if (document.has("uploadDate")) {
    result.upload_date = document.get_int("uploadDate");
  }
  if (document.has("md5")) {
    result.md5 = document.get_string("md5");
  }
  if (document.has("contentType")) {
    result.content_type = document.get_string("contentType");
  }
  if (document.has("aliases")) {
    for (const auto& entry : document.get_document("aliases")) {
      const std::string* alias = entry.second.get_if<std::string>();
      if (!alias) {
        throw store::StoreError("File metadata: Alias is not a string: " + entry.first);
      }
      result.aliases.push_back(*alias);
    }
  }
  if (document.has("metadata")) {
    result.metadata = document.get_document("metadata");
  }
  return result;
}

int64_t FileMetadata::now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace gridstore::grid
