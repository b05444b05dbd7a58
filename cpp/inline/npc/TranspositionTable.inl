#include "npc/TranspositionTable.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace npc {

template <concepts::Domain Domain>
inline auto TranspositionTable<Domain>::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("TranspositionTable options");
  desc.add_options()
    ("tt-prune-interval", po::value<int>(&prune_interval)->default_value(prune_interval),
     "number of inserts between sweeps of expired transposition-table entries");
  return desc;
}

template <concepts::Domain Domain>
TranspositionTable<Domain>::TranspositionTable() : TranspositionTable(Params{}) {}

template <concepts::Domain Domain>
TranspositionTable<Domain>::TranspositionTable(const Params& params) : params_(params) {
  CLEAN_ASSERT(params_.prune_interval > 0, "invalid prune-interval: {}", params_.prune_interval);
}

template <concepts::Domain Domain>
typename TranspositionTable<Domain>::sptr TranspositionTable<Domain>::lookup(
  const Node& node) const {
  size_t hash = node.hash();
  std::lock_guard<std::mutex> lock(mutex_);
  return lookup_helper(node, hash);
}

template <concepts::Domain Domain>
typename TranspositionTable<Domain>::sptr TranspositionTable<Domain>::insert_or_get(
  const sptr& node) {
  RELEASE_ASSERT(node != nullptr);
  size_t hash = node->hash();

  std::lock_guard<std::mutex> lock(mutex_);
  sptr existing = lookup_helper(*node, hash);
  if (existing) {
    LOG_TRACE("transposition hit for agent {} (hash={})", node->agent().id(), hash);
    return existing;
  }

  map_.emplace(hash, wptr(node));
  if (++inserts_since_prune_ >= params_.prune_interval) {
    prune_helper();
  }
  return node;
}

template <concepts::Domain Domain>
int TranspositionTable<Domain>::prune() {
  std::lock_guard<std::mutex> lock(mutex_);
  return prune_helper();
}

template <concepts::Domain Domain>
size_t TranspositionTable<Domain>::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return map_.size();
}

template <concepts::Domain Domain>
void TranspositionTable<Domain>::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  map_.clear();
  inserts_since_prune_ = 0;
}

template <concepts::Domain Domain>
size_t TranspositionTable<Domain>::memory_footprint(const task_size_func_t& task_size) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t bytes = 0;
  for (const auto& [hash, weak_node] : map_) {
    sptr node = weak_node.lock();
    if (node) bytes += node->size(task_size);
  }
  return bytes;
}

template <concepts::Domain Domain>
typename TranspositionTable<Domain>::sptr TranspositionTable<Domain>::lookup_helper(
  const Node& node, size_t hash) const {
  auto range = map_.equal_range(hash);
  for (auto it = range.first; it != range.second; ++it) {
    sptr candidate = it->second.lock();
    if (candidate && *candidate == node) return candidate;
  }
  return nullptr;
}

template <concepts::Domain Domain>
int TranspositionTable<Domain>::prune_helper() {
  int num_pruned = 0;
  for (auto it = map_.begin(); it != map_.end();) {
    if (it->second.expired()) {
      it = map_.erase(it);
      ++num_pruned;
    } else {
      ++it;
    }
  }
  inserts_since_prune_ = 0;
  LOG_DEBUG("TranspositionTable pruned {} entries, {} remain", num_pruned, map_.size());
  return num_pruned;
}

}  // namespace npc
