#include "store/memory_database.hpp"
#include "store/object_id.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <iterator>
#include <boost/log/trivial.hpp>

namespace gridstore::store {

namespace {

const std::string ID_FIELD = "_id";
const std::string ID_INDEX = "_id_";

} // namespace

//==============================================
// MEMORY COLLECTION
//==============================================

MemoryCollection::MemoryCollection(const std::string& name) : name_(name) {
  // Every collection carries the unique _id index
  indexes_.push_back(Index{ID_INDEX, IndexSpec{{ID_FIELD, 1}}, true});
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Created collection " << name_;
}

InsertResult MemoryCollection::insert_one(const Document& document) {
  std::lock_guard<std::mutex> lock(mutex_);

  InsertResult result;
  result.inserted_ids.push_back(insert_locked(document));
  result.inserted_count = 1;
  return result;
}

InsertResult MemoryCollection::insert_many(const std::vector<Document>& documents) {
  std::lock_guard<std::mutex> lock(mutex_);

  InsertResult result;
  for (const auto& document : documents) {
    // A failure here propagates and leaves the documents before it in place
    result.inserted_ids.push_back(insert_locked(document));
    ++result.inserted_count;
  }

  BOOST_LOG_TRIVIAL(trace) << "Memory store: Inserted " << result.inserted_count
                           << " documents into " << name_;
  return result;
}

std::string MemoryCollection::ensure_index(const IndexSpec& spec, bool unique) {
  if (spec.empty()) {
    throw StoreError("Memory store: Index specification must name at least one field");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto& index : indexes_) {
    if (index.spec == spec) {
      if (index.unique != unique) {
        throw StoreError("Memory store: Index " + index.name +
                         " already exists with different options");
      }
      BOOST_LOG_TRIVIAL(trace) << "Memory store: Index " << index.name
                               << " already exists on " << name_;
      return index.name;
    }
  }

  std::string name = index_name(spec);

  // Existing data must already satisfy a new unique index
  if (unique) {
    for (std::size_t i = 0; i < documents_.size(); ++i) {
      Document key = index_key(documents_[i], spec);
      for (std::size_t j = i + 1; j < documents_.size(); ++j) {
        if (index_key(documents_[j], spec) == key) {
          throw DuplicateKeyError(name_, name, to_string(Value(key)));
        }
      }
    }
  }

  indexes_.push_back(Index{name, spec, unique});
  BOOST_LOG_TRIVIAL(info) << "Memory store: Created " << (unique ? "unique " : "")
                          << "index " << name << " on " << name_;
  return name;
}

std::vector<std::string> MemoryCollection::index_names() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  for (const auto& index : indexes_) {
    names.push_back(index.name);
  }
  return names;
}

void MemoryCollection::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  documents_.clear();
  indexes_.erase(indexes_.begin() + 1, indexes_.end());
}

std::vector<Document> MemoryCollection::query(const Selector& selector, const SortSpec& sort,
                                              std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Document> matches;
  for (const auto& document : documents_) {
    if (document.matches(selector)) {
      matches.push_back(document);
    }
  }

  if (!sort.empty()) {
    // Stable so that equal keys keep insertion order
    std::stable_sort(matches.begin(), matches.end(),
      [&sort](const Document& lhs, const Document& rhs) {
        return compare_documents(lhs, rhs, sort) < 0;
      });
  }

  if (limit > 0 && matches.size() > limit) {
    matches.resize(limit);
  }
  return matches;
}

std::size_t MemoryCollection::count(const Selector& selector) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(documents_.begin(), documents_.end(),
    [&selector](const Document& document) { return document.matches(selector); }));
}

std::size_t MemoryCollection::remove(const Selector& selector, bool multi) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::size_t removed = 0;
  if (multi) {
    auto it = std::remove_if(documents_.begin(), documents_.end(),
      [&selector](const Document& document) { return document.matches(selector); });
    removed = static_cast<std::size_t>(std::distance(it, documents_.end()));
    documents_.erase(it, documents_.end());
  } else {
    auto it = std::find_if(documents_.begin(), documents_.end(),
      [&selector](const Document& document) { return document.matches(selector); });
    if (it != documents_.end()) {
      documents_.erase(it);
      removed = 1;
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Memory store: Removed " << removed << " documents from " << name_;
  return removed;
}

Value MemoryCollection::insert_locked(const Document& document) {
  Document candidate;
  if (document.has(ID_FIELD)) {
    candidate = document;
  } else {
    // Generated _id goes first, like a server-assigned one
    candidate.set(ID_FIELD, generate_object_id());
    for (const auto& [name, value] : document) {
      candidate.set(name, value);
    }
  }

  check_unique_locked(candidate);

  Value id = candidate.get(ID_FIELD);
  documents_.push_back(std::move(candidate));
  return id;
}

Document MemoryCollection::index_key(const Document& document, const IndexSpec& spec) {
  Document key;
  for (const auto& field : spec) {
    const Value* value = document.find(field.first);
    key.set(field.first, value ? *value : Value());
  }
  return key;
}

void MemoryCollection::check_unique_locked(const Document& candidate) const {
  for (const auto& index : indexes_) {
    if (!index.unique) {
      continue;
    }
    Document key = index_key(candidate, index.spec);
    for (const auto& existing : documents_) {
      if (index_key(existing, index.spec) == key) {
        BOOST_LOG_TRIVIAL(debug) << "Memory store: Rejected duplicate key " << key
                                 << " on " << name_ << "." << index.name;
        throw DuplicateKeyError(name_, index.name, to_string(Value(key)));
      }
    }
  }
}


//==============================================
// MEMORY DATABASE
//==============================================

MemoryDatabase::MemoryDatabase(const WriteConcern& write_concern)
  : write_concern_(write_concern) {
  BOOST_LOG_TRIVIAL(info) << "Memory store: Initializing database ("
                          << (write_concern_.acknowledged() ? "acknowledged" : "unacknowledged")
                          << " writes)";
}

Collection& MemoryDatabase::collection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = collections_.find(name);
  if (it == collections_.end()) {
    it = collections_.emplace(name, std::make_unique<MemoryCollection>(name)).first;
  }
  return *it->second;
}

Document MemoryDatabase::command(const Document& op) {
  if (op.empty()) {
    throw CommandError("Empty command document");
  }

  const std::string& name = op.begin()->first;
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Running command " << op;

  if (name == "filemd5") {
    return file_md5(op);
  }
  if (name == "ping") {
    return Document{{"ok", 1}};
  }

  BOOST_LOG_TRIVIAL(error) << "Memory store: Unknown command: " << name;
  throw CommandError("no such command: '" + name + "'");
}

std::vector<std::string> MemoryDatabase::list_collections() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  for (const auto& entry : collections_) {
    names.push_back(entry.first);
  }
  return names;
}

bool MemoryDatabase::drop(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = collections_.find(name);
  if (it == collections_.end()) {
    return false;
  }
  it->second->clear();
  BOOST_LOG_TRIVIAL(info) << "Memory store: Dropped collection " << name;
  return true;
}

Document MemoryDatabase::file_md5(const Document& op) {
  const Value& files_id = op.get("filemd5");
  std::string root = "fs";
  if (op.has("root")) {
    root = op.get_string("root");
  }

  auto chunks = collection(root + ".chunks")
    .find(Selector{{"files_id", files_id}})
    .sort(SortSpec{{"n", 1}})
    .to_list();

  crypto::Md5 md5;
  int64_t expected = 0;
  for (const auto& chunk : chunks) {
    if (chunk.get_int("n") != expected) {
      BOOST_LOG_TRIVIAL(error) << "Memory store: Chunk " << expected << " missing for file "
                               << files_id << " in " << root;
      throw CommandError("chunk " + std::to_string(expected) + " missing for file " +
                         to_string(files_id) + " in " + root + ".chunks");
    }
    md5.update(chunk.get_binary("data"));
    ++expected;
  }

  Document reply;
  reply.set("files_id", files_id);
  reply.set("numChunks", expected);
  reply.set("md5", md5.hex_digest());
  reply.set("ok", 1);
  return reply;
}

} // namespace gridstore::store
