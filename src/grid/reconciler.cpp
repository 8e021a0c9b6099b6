#include "grid/reconciler.hpp"
#include <boost/log/trivial.hpp>

namespace gridstore::grid {

Reconciler::Reconciler(FS& fs) : fs_(fs) {}

std::vector<store::Value> Reconciler::orphaned_files() {
  std::vector<store::Value> orphans;

  for (const auto& metadata : fs_.find()) {
    if (metadata.length == 0) {
      continue;
    }
    auto first_chunk = fs_.chunks_collection()
      .find(store::Selector{{Chunk::FILES_ID_FIELD, metadata.id}})
      .first();
    if (!first_chunk) {
      orphans.push_back(metadata.id);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Reconciler: Found " << orphans.size() << " metadata records without chunks in "
                           << fs_.prefix();
  return orphans;
}

std::vector<store::Value> Reconciler::orphaned_chunks() {
  std::vector<store::Value> orphans;

  auto chunks = fs_.chunks_collection()
    .find()
    .sort(store::SortSpec{{Chunk::FILES_ID_FIELD, 1}})
    .to_list();

  const store::Value* previous = nullptr;
  for (const auto& chunk : chunks) {
    const store::Value& files_id = chunk.get(Chunk::FILES_ID_FIELD);
    // Sorted by files_id, so repeats are adjacent
    if (previous && *previous == files_id) {
      continue;
    }
    previous = &files_id;
    auto metadata = fs_.files_collection()
      .find(store::Selector{{"_id", files_id}})
      .first();
    if (!metadata) {
      orphans.push_back(files_id);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Reconciler: Found chunks of " << orphans.size() << " unknown files in "
                           << fs_.prefix();
  return orphans;
}

SweepResult Reconciler::sweep() {
  BOOST_LOG_TRIVIAL(info) << "Reconciler: Sweeping " << fs_.prefix();

  SweepResult result;
  for (const auto& id : orphaned_files()) {
    result.files_removed += fs_.files_collection()
      .find(store::Selector{{"_id", id}})
      .remove_one().deleted_count;
  }
  for (const auto& files_id : orphaned_chunks()) {
    result.chunks_removed += fs_.chunks_collection()
      .find(store::Selector{{Chunk::FILES_ID_FIELD, files_id}})
      .remove_many().deleted_count;
  }

  BOOST_LOG_TRIVIAL(info) << "Reconciler: Removed " << result.files_removed << " metadata and "
                          << result.chunks_removed << " chunk records from " << fs_.prefix();
  return result;
}

} // namespace gridstore::grid
