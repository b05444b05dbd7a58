#pragma once

#include "npc/Node.hpp"
#include "npc/concepts/DomainConcept.hpp"

#include <boost/program_options.hpp>

#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace npc {

/*
 * Content-addressed lookup of live nodes, used to detect transpositions: two action sequences that
 * lead to the same (agent, diff, tasks).
 *
 * Entries are weak handles, so the table never keeps a node alive. When a search driver drops the
 * last strong handle to a subtree, the corresponding entries expire. Expired entries are never
 * returned, and are swept out by prune(), which also runs automatically every
 * Params::prune_interval inserts.
 *
 * All methods are thread-safe.
 */
template <concepts::Domain Domain>
class TranspositionTable {
 public:
  using Node = npc::Node<Domain>;
  using sptr = Node::sptr;
  using wptr = Node::wptr;
  using task_size_func_t = Node::task_size_func_t;

  struct Params {
    int prune_interval = 4096;

    auto make_options_description();
  };

  TranspositionTable();
  explicit TranspositionTable(const Params& params);
  TranspositionTable(const TranspositionTable&) = delete;
  TranspositionTable& operator=(const TranspositionTable&) = delete;

  // Returns a live node equal to node, or nullptr if there is none.
  sptr lookup(const Node& node) const;

  /*
   * If a live node equal to *node is registered, returns it. Otherwise registers node and returns
   * it. Either way, the returned handle is the canonical node for that identity.
   */
  sptr insert_or_get(const sptr& node);

  // Removes expired entries. Returns the number removed.
  int prune();

  // Number of entries, including expired ones not yet pruned.
  size_t size() const;

  void clear();

  // Sum of Node::size(task_size) over all live entries.
  size_t memory_footprint(const task_size_func_t& task_size = Node::default_task_size) const;

 private:
  using map_t = std::unordered_multimap<size_t, wptr>;

  sptr lookup_helper(const Node& node, size_t hash) const;  // assumes mutex_ is held
  int prune_helper();                                       // assumes mutex_ is held

  const Params params_;
  map_t map_;
  int inserts_since_prune_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace npc

#include "inline/npc/TranspositionTable.inl"
