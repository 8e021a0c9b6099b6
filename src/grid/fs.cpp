#include "grid/fs.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

namespace {

const FSOptions& check_options(const FSOptions& options) {
  if (options.fs_name.empty()) {
    throw std::invalid_argument("FS: Prefix must not be empty");
  }
  return options;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

FS::FS(store::Database& database, const FSOptions& options)
  : database_(database)
  , options_(check_options(options))
  , files_collection_(database.collection(files_name()))
  , chunks_collection_(database.collection(chunks_name()))
  , validate_writes_(options.write_concern ? options.write_concern->get_last_error()
                                           : database.write_concern().get_last_error()) {
  BOOST_LOG_TRIVIAL(info) << "FS: Initializing FS with prefix: " << prefix();

  // Must exist before the first chunk insert, creating it again is a no-op
  std::string index = chunks_collection_.ensure_index(Chunk::INDEX_SPEC, true);

  BOOST_LOG_TRIVIAL(debug) << "FS: Unique index " << index << " verified on " << chunks_name()
                           << ", integrity checks " << (validate_writes_ ? "enabled" : "disabled");
}


//==============================================
// CORE OPERATIONS
//==============================================

std::optional<File> FS::find_one(const store::Selector& selector) {
  BOOST_LOG_TRIVIAL(info) << "FS: Finding file matching " << selector;

  auto metadata = files_collection_.find(selector).first();
  if (!metadata) {
    BOOST_LOG_TRIVIAL(debug) << "FS: No file matches " << selector;
    return std::nullopt;
  }

  auto chunks = chunks_collection_
    .find(store::Selector{{Chunk::FILES_ID_FIELD, metadata->get("_id")}})
    .sort(store::SortSpec{{Chunk::N_FIELD, 1}})
    .to_list();

  File file(chunks, *metadata);
  BOOST_LOG_TRIVIAL(info) << "FS: Found " << file.filename() << " with " << chunks.size()
                          << " chunks";
  return file;
}

FSInsertResult FS::insert_one(const File& file) {
  BOOST_LOG_TRIVIAL(info) << "FS: Inserting " << file.filename() << " (" << file.length()
                          << " bytes, " << file.chunks().size() << " chunks) into " << prefix();

  // Phase one, a failure after this leaves metadata without chunks
  insert_metadata(file);
  // Phase two
  FSInsertResult result;
  result.file_id = file.id();
  result.chunks_inserted = insert_chunks(file);

  if (validate_writes_) {
    validate(file);
    result.validated = true;
  }

  BOOST_LOG_TRIVIAL(info) << "FS: Inserted " << file.filename() << " with id " << file.id()
                          << (result.validated ? " (validated)" : " (unacknowledged)");
  return result;
}

FSRemoveResult FS::remove_one(const File& file) {
  BOOST_LOG_TRIVIAL(info) << "FS: Removing file with id " << file.id() << " from " << prefix();

  FSRemoveResult result;
  result.files_removed = files_collection_
    .find(store::Selector{{"_id", file.id()}})
    .remove_one().deleted_count;
  result.chunks_removed = chunks_collection_
    .find(store::Selector{{Chunk::FILES_ID_FIELD, file.id()}})
    .remove_many().deleted_count;

  BOOST_LOG_TRIVIAL(debug) << "FS: Removed " << result.files_removed << " metadata and "
                           << result.chunks_removed << " chunk records for " << file.id();
  return result;
}

void FS::validate(const File& file) {
  store::Document op;
  op.set("filemd5", file.id());
  op.set("root", prefix());

  store::Document reply = database_.command(op);
  const std::string& server_md5 = reply.get_string("md5");

  if (file.md5() != server_md5) {
    BOOST_LOG_TRIVIAL(error) << "FS: Checksum mismatch for " << file.id() << ": client "
                             << file.md5() << ", server " << server_md5;
    throw InvalidFile(file.md5(), server_md5);
  }

  BOOST_LOG_TRIVIAL(debug) << "FS: Checksum " << server_md5 << " verified for " << file.id();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<FileMetadata> FS::find(const store::Selector& selector) {
  std::vector<FileMetadata> files;
  for (const auto& document : files_collection_.find(selector).to_list()) {
    files.push_back(FileMetadata::from_document(document));
  }
  return files;
}

std::string FS::files_name() const {
  return prefix() + "." + FileMetadata::COLLECTION;
}

std::string FS::chunks_name() const {
  return prefix() + "." + Chunk::COLLECTION;
}


//==============================================
// INSERT PHASES
//==============================================

void FS::insert_metadata(const File& file) {
  files_collection_.insert_one(file.metadata().to_document());
  BOOST_LOG_TRIVIAL(debug) << "FS: Wrote metadata for " << file.id() << " to " << files_name();
}

std::size_t FS::insert_chunks(const File& file) {
  if (file.chunks().empty()) {
    return 0;
  }

  std::vector<store::Document> documents;
  documents.reserve(file.chunks().size());
  for (const auto& chunk : file.chunks()) {
    documents.push_back(chunk.to_document());
  }

  auto result = chunks_collection_.insert_many(documents);
  BOOST_LOG_TRIVIAL(debug) << "FS: Wrote " << result.inserted_count << " chunks for "
                           << file.id() << " to " << chunks_name();
  return result.inserted_count;
}

} // namespace gridstore::grid
