#pragma once

#include "npc/BasicTypes.hpp"
#include "npc/StateDiffRef.hpp"
#include "npc/Task.hpp"

#include <string>
#include <vector>

namespace npc {

/*
 * A behavior groups the tasks an agent may consider in some situation. Behaviors form a tree: a
 * behavior that is valid contributes its own tasks, and then its dependent behaviors get a chance
 * to do the same.
 *
 * Behaviors are stateless and typically live for the duration of the program; the tree holds them
 * by raw pointer.
 */
template <typename Domain>
class AbstractBehavior {
 public:
  using StateDiffRef = npc::StateDiffRef<Domain>;
  using Task = AbstractTask<Domain>;
  using task_ptr_t = Task::task_ptr_t;
  using task_vec_t = std::vector<task_ptr_t>;
  using behavior_vec_t = std::vector<const AbstractBehavior*>;

  virtual ~AbstractBehavior() = default;

  virtual std::string name() const = 0;
  virtual bool is_valid(const StateDiffRef& view, AgentId agent) const = 0;

  // Appends the tasks this behavior proposes. Validity of each task is checked by the caller.
  virtual void add_own_tasks(const StateDiffRef&, AgentId, task_vec_t&) const {}

  virtual behavior_vec_t dependent_behaviors() const { return {}; }
};

/*
 * Walks the behavior trees rooted at behaviors, depth-first, and returns the tasks for agent that
 * are valid under view. An invalid behavior is skipped together with all of its dependents.
 */
template <typename Domain>
typename AbstractBehavior<Domain>::task_vec_t collect_tasks(
  const typename AbstractBehavior<Domain>::behavior_vec_t& behaviors,
  const StateDiffRef<Domain>& view, AgentId agent);

}  // namespace npc

#include "inline/npc/Behavior.inl"
