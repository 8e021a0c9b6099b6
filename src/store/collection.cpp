#include "store/collection.hpp"
#include <boost/log/trivial.hpp>

namespace gridstore::store {

View Collection::find(const Selector& selector) {
  return View(*this, selector);
}

View::View(Collection& collection, Selector selector)
  : collection_(&collection)
  , selector_(std::move(selector)) {}

View View::sort(const SortSpec& spec) const {
  View view(*this);
  view.sort_ = spec;
  return view;
}

View View::limit(std::size_t count) const {
  View view(*this);
  view.limit_ = count;
  return view;
}

std::optional<Document> View::first() const {
  auto documents = collection_->query(selector_, sort_, 1);
  if (documents.empty()) {
    BOOST_LOG_TRIVIAL(trace) << "View: No document in " << collection_->name()
                             << " matches " << selector_;
    return std::nullopt;
  }
  return std::move(documents.front());
}

std::vector<Document> View::to_list() const {
  return collection_->query(selector_, sort_, limit_);
}

std::size_t View::count() const {
  if (limit_ == 0) {
    return collection_->count(selector_);
  }
  return collection_->query(selector_, sort_, limit_).size();
}

DeleteResult View::remove_one() const {
  return DeleteResult{collection_->remove(selector_, false)};
}

DeleteResult View::remove_many() const {
  return DeleteResult{collection_->remove(selector_, true)};
}

} // namespace gridstore::store
