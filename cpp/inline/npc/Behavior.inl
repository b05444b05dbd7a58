#include "npc/Behavior.hpp"

#include "util/LoggingUtil.hpp"

namespace npc {

namespace detail {

template <typename Domain>
void collect_tasks_helper(const AbstractBehavior<Domain>* behavior,
                          const StateDiffRef<Domain>& view, AgentId agent,
                          typename AbstractBehavior<Domain>::task_vec_t& out) {
  if (!behavior->is_valid(view, agent)) {
    LOG_TRACE("behavior {} invalid for agent {}", behavior->name(), agent.id());
    return;
  }

  typename AbstractBehavior<Domain>::task_vec_t own_tasks;
  behavior->add_own_tasks(view, agent, own_tasks);
  for (auto& task : own_tasks) {
    if (task && task->is_valid(view, agent)) {
      out.push_back(std::move(task));
    }
  }

  for (const AbstractBehavior<Domain>* dependent : behavior->dependent_behaviors()) {
    collect_tasks_helper(dependent, view, agent, out);
  }
}

}  // namespace detail

template <typename Domain>
typename AbstractBehavior<Domain>::task_vec_t collect_tasks(
  const typename AbstractBehavior<Domain>::behavior_vec_t& behaviors,
  const StateDiffRef<Domain>& view, AgentId agent) {
  typename AbstractBehavior<Domain>::task_vec_t tasks;
  for (const AbstractBehavior<Domain>* behavior : behaviors) {
    detail::collect_tasks_helper(behavior, view, agent, tasks);
  }
  return tasks;
}

}  // namespace npc
