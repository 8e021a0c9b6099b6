#ifndef GRIDSTORE_GRID_RECONCILER_HPP
#define GRIDSTORE_GRID_RECONCILER_HPP

#include <cstddef>
#include <vector>
#include "grid/fs.hpp"
#include "store/document.hpp"

namespace gridstore::grid {

struct SweepResult {
  std::size_t files_removed = 0;
  std::size_t chunks_removed = 0;
};

// Maintenance pass over one FS namespace that finds and removes the partial
// states left behind by interrupted inserts and removes. Never run
// implicitly by FS.
class Reconciler {
public:
  explicit Reconciler(FS& fs);

  // Ids of metadata records that have no chunk. Zero-length files are
  // expected to have none and are not reported.
  std::vector<store::Value> orphaned_files();
  // Distinct files_id values of chunks that have no metadata record
  std::vector<store::Value> orphaned_chunks();
  // Removes both kinds of orphans
  SweepResult sweep();

private:
  FS& fs_;
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_RECONCILER_HPP
