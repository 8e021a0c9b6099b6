#ifndef GRIDSTORE_STORE_MEMORY_DATABASE_HPP
#define GRIDSTORE_STORE_MEMORY_DATABASE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "store/database.hpp"

namespace gridstore::store {

// In-process collection, every operation is serialized by the collection mutex
class MemoryCollection : public Collection {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryCollection(const std::string& name);
  ~MemoryCollection() override = default;

  const std::string& name() const override { return name_; }


  // ---- WRITE OPERATIONS ----
  InsertResult insert_one(const Document& document) override;
  InsertResult insert_many(const std::vector<Document>& documents) override;


  // ---- INDEX MANAGEMENT ----
  std::string ensure_index(const IndexSpec& spec, bool unique) override;
  std::vector<std::string> index_names() const override;


  // ---- MAINTENANCE ----
  // Removes every document and secondary index, the object itself stays valid
  void clear();

protected:
  std::vector<Document> query(const Selector& selector, const SortSpec& sort,
                              std::size_t limit) const override;
  std::size_t count(const Selector& selector) const override;
  std::size_t remove(const Selector& selector, bool multi) override;

private:
  struct Index {
    std::string name;
    IndexSpec spec;
    bool unique;
  };

  // ---- PARAMETERS ----
  std::string name_;
  mutable std::mutex mutex_;
  // Documents in insertion order
  std::vector<Document> documents_;
  std::vector<Index> indexes_;


  // ---- INTERNAL HELPERS (mutex held) ----
  // Inserts one document after checking every unique index, returns its _id
  Value insert_locked(const Document& document);
  // Builds the key tuple of a document for an index, missing fields are null
  static Document index_key(const Document& document, const IndexSpec& spec);
  // Throws DuplicateKeyError if the candidate collides on a unique index
  void check_unique_locked(const Document& candidate) const;
};

// Reference implementation of the backing store kept entirely in memory
class MemoryDatabase : public Database {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryDatabase(const WriteConcern& write_concern = WriteConcern());
  ~MemoryDatabase() override = default;


  // ---- DATABASE INTERFACE ----
  Collection& collection(const std::string& name) override;
  // Supports "filemd5" and "ping"
  Document command(const Document& op) override;
  const WriteConcern& write_concern() const override { return write_concern_; }


  // ---- MAINTENANCE ----
  std::vector<std::string> list_collections() const;
  // Empties a collection and its indexes, returns false if it did not exist.
  // References handed out by collection() stay valid.
  bool drop(const std::string& name);

private:
  // ---- PARAMETERS ----
  WriteConcern write_concern_;
  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<MemoryCollection>> collections_;


  // ---- COMMANDS ----
  // Recomputes the MD5 of a file from its chunks, sorted by ordinal
  Document file_md5(const Document& op);
};

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_MEMORY_DATABASE_HPP
