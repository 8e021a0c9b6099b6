#ifndef GRIDSTORE_STORE_WRITE_CONCERN_HPP
#define GRIDSTORE_STORE_WRITE_CONCERN_HPP

namespace gridstore::store {

// Acknowledgement level requested from the backing store for writes
struct WriteConcern {
  // Number of acknowledgements, 0 means fire-and-forget
  int w = 1;
  // Wait for the write to reach the journal
  bool journal = false;

  bool acknowledged() const { return w > 0 || journal; }
  // Legacy name for acknowledged writes
  bool get_last_error() const { return acknowledged(); }

  static WriteConcern unacknowledged() { return WriteConcern{0, false}; }
};

} // namespace gridstore::store

#endif // GRIDSTORE_STORE_WRITE_CONCERN_HPP
