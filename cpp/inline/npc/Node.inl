#include "npc/Node.hpp"

#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <spdlog/fmt/fmt.h>

#include <sstream>
#include <utility>

namespace npc {

template <concepts::Domain Domain>
typename Node<Domain>::sptr Node<Domain>::create(const State& initial_state, Diff diff,
                                                 AgentId active_agent, TaskMap tasks) {
  return std::make_shared<Node>(private_tag_t{}, initial_state, std::move(diff), active_agent,
                                std::move(tasks));
}

template <concepts::Domain Domain>
Node<Domain>::Node(private_tag_t, const State& initial_state, Diff diff, AgentId active_agent,
                   TaskMap tasks)
    : diff_(std::move(diff)),
      active_agent_(active_agent),
      tasks_(drop_stale_task(initial_state, diff_, active_agent, std::move(tasks))),
      current_values_(compute_current_values(initial_state, diff_, active_agent)) {}

template <concepts::Domain Domain>
const typename Node<Domain>::Task* Node<Domain>::task(AgentId agent) const {
  auto it = tasks_.find(agent);
  if (it == tasks_.end()) return nullptr;
  return it->second.get();
}

template <concepts::Domain Domain>
typename Node<Domain>::StateDiffRef Node<Domain>::state_diff_ref(
  const State& initial_state) const {
  return StateDiffRef(initial_state, diff_);
}

template <concepts::Domain Domain>
AgentValue Node<Domain>::current_value(AgentId agent) const {
  auto it = current_values_.find(agent);
  RELEASE_ASSERT(it != current_values_.end(), "agent {} was not visible to agent {} at this node",
                 agent.id(), active_agent_.id());
  return it->second;
}

template <concepts::Domain Domain>
AgentValue Node<Domain>::current_value_or_compute(AgentId agent,
                                                  const State& initial_state) const {
  auto it = current_values_.find(agent);
  if (it != current_values_.end()) return it->second;
  return Domain::get_current_value(state_diff_ref(initial_state), agent);
}

template <concepts::Domain Domain>
size_t Node<Domain>::size(const task_size_func_t& task_size) const {
  size_t bytes = sizeof(Node);
  bytes += current_values_.size() * sizeof(typename AgentValueMap::value_type);

  for (const auto& [agent, task] : tasks_) {
    if (task) bytes += task_size(*task);
  }
  return bytes;
}

template <concepts::Domain Domain>
bool Node<Domain>::operator==(const Node& other) const {
  return active_agent_ == other.active_agent_ && diff_ == other.diff_ &&
         tasks_equal<Domain>(tasks_, other.tasks_);
}

template <concepts::Domain Domain>
size_t Node<Domain>::hash() const {
  size_t seed = 0;
  util::hash_combine(seed, active_agent_, diff_);
  boost::hash_combine(seed, tasks_hash<Domain>(tasks_));
  return seed;
}

template <concepts::Domain Domain>
std::string Node<Domain>::to_string() const {
  std::ostringstream ss;
  ss << "Node { agent: " << active_agent_ << ", diff: ";
  if constexpr (util::concepts::Printable<Diff>) {
    ss << diff_;
  } else {
    ss << "...";
  }

  ss << ", tasks: {";
  const char* delim = "";
  for (const auto& [agent, task] : tasks_) {
    ss << delim << agent << ": " << (task ? task->name() : "null");
    delim = ", ";
  }

  ss << "}, current_values: {";
  delim = "";
  for (const auto& [agent, value] : current_values_) {
    ss << delim << agent << ": " << value;
    delim = ", ";
  }
  ss << "} }";
  return ss.str();
}

template <concepts::Domain Domain>
typename Node<Domain>::TaskMap Node<Domain>::drop_stale_task(const State& initial_state,
                                                             const Diff& diff, AgentId agent,
                                                             TaskMap tasks) {
  auto it = tasks.find(agent);
  if (it == tasks.end()) return tasks;

  const auto& task = it->second;
  if (!task || !task->is_valid(StateDiffRef(initial_state, diff), agent)) {
    LOG_DEBUG("dropping stale task {} for agent {}", task ? task->name() : "null", agent.id());
    tasks.erase(it);
  }
  return tasks;
}

template <concepts::Domain Domain>
AgentValueMap Node<Domain>::compute_current_values(const State& initial_state, const Diff& diff,
                                                   AgentId agent) {
  StateDiffRef view(initial_state, diff);
  AgentSet agents = Domain::get_visible_agents(view, agent);
  RELEASE_ASSERT(agents.contains(agent), "domain does not report agent {} as visible to itself",
                 agent.id());

  AgentValueMap values;
  for (AgentId visible_agent : agents) {
    values.emplace(visible_agent, Domain::get_current_value(view, visible_agent));
  }
  return values;
}

}  // namespace npc
