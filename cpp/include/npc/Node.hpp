#pragma once

#include "npc/BasicTypes.hpp"
#include "npc/StateDiffRef.hpp"
#include "npc/Task.hpp"
#include "npc/concepts/DomainConcept.hpp"
#include "util/AtomicSharedPtr.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace npc {

/*
 * One point of a search tree: the agent whose decision this is, the diff accumulated from the
 * initial state (not from the parent), the task proposed for each agent, and a cache of the
 * current value of every agent visible to the active agent.
 *
 * A Node is immutable once built, so any number of search threads may read it without locking.
 *
 * Nodes are only ever created through create(), which returns a shared handle:
 *
 * sptr:  strong handle. Anything that must keep the node alive holds one of these.
 * wptr:  weak handle, for back-references and lookup tables. lock() yields nullptr once the last
 *        strong handle is gone, which callers must read as "this branch was pruned".
 * asptr: an atomically loadable/storable strong handle, for edges that one thread may
 *        (re)assign while others follow them.
 *
 * Node identity (operator==, hash()) is (agent, diff, tasks). The cached current values are
 * derived data and do not take part.
 */
template <concepts::Domain Domain>
class Node {
 private:
  struct private_tag_t {
    explicit private_tag_t() = default;
  };

 public:
  using State = Domain::State;
  using Diff = Domain::Diff;
  using StateDiffRef = npc::StateDiffRef<Domain>;
  using Task = AbstractTask<Domain>;
  using TaskMap = npc::TaskMap<Domain>;
  using task_size_func_t = std::function<size_t(const Task&)>;

  using sptr = std::shared_ptr<const Node>;
  using wptr = std::weak_ptr<const Node>;
  using asptr = util::AtomicSharedPtr<const Node>;

  /*
   * Builds a node for active_agent from initial_state + diff.
   *
   * If tasks proposes a task for active_agent that is not valid under initial_state + diff, that
   * entry is dropped. All other entries are kept as-is.
   *
   * The current value of every agent visible to active_agent is computed and cached. Throws
   * util::ReleaseAssertionError if the domain does not report active_agent as visible to itself.
   *
   * initial_state is only borrowed for the duration of the call.
   */
  static sptr create(const State& initial_state, Diff diff, AgentId active_agent, TaskMap tasks);

  // Only callable from create(), via private_tag_t.
  Node(private_tag_t, const State& initial_state, Diff diff, AgentId active_agent, TaskMap tasks);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  AgentId agent() const { return active_agent_; }
  const Diff& diff() const { return diff_; }
  const TaskMap& tasks() const { return tasks_; }

  // Returns nullptr if no task is recorded for agent.
  const Task* task(AgentId agent) const;

  /*
   * Pairs initial_state with this node's diff. initial_state must be the state this node was
   * built from; that is not checked.
   */
  StateDiffRef state_diff_ref(const State& initial_state) const;

  // Throws util::ReleaseAssertionError if agent was not visible when the node was built.
  AgentValue current_value(AgentId agent) const;

  // Returns the cached value if present, otherwise asks the domain. Does not cache the result.
  AgentValue current_value_or_compute(AgentId agent, const State& initial_state) const;

  const AgentValueMap& current_values() const { return current_values_; }

  /*
   * Approximate footprint in bytes: the node itself, one map entry per cached value, and
   * task_size applied to each task. Advisory only.
   */
  size_t size(const task_size_func_t& task_size) const;
  size_t size() const { return size(default_task_size); }
  static size_t default_task_size(const Task& task) { return task.size(); }

  bool operator==(const Node& other) const;
  size_t hash() const;

  std::string to_string() const;

 private:
  static TaskMap drop_stale_task(const State& initial_state, const Diff& diff, AgentId agent,
                                 TaskMap tasks);
  static AgentValueMap compute_current_values(const State& initial_state, const Diff& diff,
                                              AgentId agent);

  const Diff diff_;
  const AgentId active_agent_;
  const TaskMap tasks_;
  const AgentValueMap current_values_;
};

}  // namespace npc

namespace std {

template <npc::concepts::Domain Domain>
struct hash<npc::Node<Domain>> {
  size_t operator()(const npc::Node<Domain>& node) const { return node.hash(); }
};

}  // namespace std

#include "inline/npc/Node.inl"
