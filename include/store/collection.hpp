#ifndef GRIDSTORE_STORE_COLLECTION_HPP
#define GRIDSTORE_STORE_COLLECTION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "store/document.hpp"

namespace gridstore::store {

struct InsertResult {
  std::vector<Value> inserted_ids;
  std::size_t inserted_count = 0;
};

struct DeleteResult {
  std::size_t deleted_count = 0;
};

class View;

// Narrow interface over one collection of the backing document store
class Collection {
public:
  virtual ~Collection() = default;

  virtual const std::string& name() const = 0;


  // ---- QUERY OPERATIONS ----
  // Lazily describes the documents matching the selector, nothing is read
  // until the view is consumed
  View find(const Selector& selector = Selector());


  // ---- WRITE OPERATIONS ----
  // A document without an _id is assigned a generated one
  virtual InsertResult insert_one(const Document& document) = 0;
  // Ordered insert, the first failure stops the batch and earlier documents stay
  virtual InsertResult insert_many(const std::vector<Document>& documents) = 0;


  // ---- INDEX MANAGEMENT ----
  // Creates the index if it does not exist yet and returns its name
  virtual std::string ensure_index(const IndexSpec& spec, bool unique) = 0;
  virtual std::vector<std::string> index_names() const = 0;

protected:
  friend class View;

  virtual std::vector<Document> query(const Selector& selector, const SortSpec& sort,
                                      std::size_t limit) const = 0;
  virtual std::size_t count(const Selector& selector) const = 0;
  virtual std::size_t remove(const Selector& selector, bool multi) = 0;
};

// Result of Collection::find, refined by sort/limit and consumed by first,
// to_list, count or one of the remove operations
class View {
public:
  View(Collection& collection, Selector selector);

  // ---- REFINEMENT ----
  View sort(const SortSpec& spec) const;
  View limit(std::size_t count) const;


  // ---- CONSUMERS ----
  // Empty if no document matches
  std::optional<Document> first() const;
  std::vector<Document> to_list() const;
  std::size_t count() const;
  DeleteResult remove_one() const;
  DeleteResult remove_many() const;


  // ---- GETTERS ----
  const Selector& selector() const { return selector_; }
  const SortSpec& sort_spec() const { return sort_; }

private:
  // ---- PARAMETERS ----
  Collection* collection_;
  Selector selector_;
  SortSpec sort_;
  // 0 means unlimited
  std::size_t limit_ = 0;
};

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_COLLECTION_HPP
