#include "npc/Task.hpp"

#include "util/CppUtil.hpp"

#include <tuple>
#include <typeindex>
#include <typeinfo>

namespace npc {

template <typename Domain>
std::string AbstractTask<Domain>::name() const {
  return util::get_typename(*this);
}

template <typename Domain>
bool AbstractTask<Domain>::operator==(const AbstractTask& other) const {
  if (typeid(*this) != typeid(other)) return false;
  return equals_same_type(other);
}

template <typename Domain>
bool AbstractTask<Domain>::operator<(const AbstractTask& other) const {
  std::type_index lhs_type(typeid(*this));
  std::type_index rhs_type(typeid(other));
  if (lhs_type != rhs_type) return lhs_type < rhs_type;
  return less_same_type(other);
}

template <typename Derived, typename Domain>
size_t TaskBase<Derived, Domain>::hash() const {
  size_t seed = typeid(Derived).hash_code();
  std::apply([&seed](const auto&... fields) { util::hash_combine(seed, fields...); },
             derived().fields());
  return seed;
}

template <typename Derived, typename Domain>
typename TaskBase<Derived, Domain>::task_ptr_t TaskBase<Derived, Domain>::clone() const {
  return std::make_unique<Derived>(derived());
}

template <typename Derived, typename Domain>
bool TaskBase<Derived, Domain>::equals_same_type(const base_t& other) const {
  return derived().fields() == static_cast<const Derived&>(other).fields();
}

template <typename Derived, typename Domain>
bool TaskBase<Derived, Domain>::less_same_type(const base_t& other) const {
  return derived().fields() < static_cast<const Derived&>(other).fields();
}

template <typename Domain>
bool tasks_equal(const TaskMap<Domain>& a, const TaskMap<Domain>& b) {
  if (a.size() != b.size()) return false;
  auto it_a = a.begin();
  auto it_b = b.begin();
  for (; it_a != a.end(); ++it_a, ++it_b) {
    if (it_a->first != it_b->first) return false;
    const auto& task_a = it_a->second;
    const auto& task_b = it_b->second;
    if (!task_a || !task_b) {
      if (task_a || task_b) return false;
      continue;
    }
    if (!(*task_a == *task_b)) return false;
  }
  return true;
}

template <typename Domain>
size_t tasks_hash(const TaskMap<Domain>& tasks) {
  size_t seed = tasks.size();
  for (const auto& [agent, task] : tasks) {
    util::hash_combine(seed, agent);
    boost::hash_combine(seed, task ? task->hash() : 0);
  }
  return seed;
}

template <typename Domain>
TaskMap<Domain> clone_tasks(const TaskMap<Domain>& tasks) {
  TaskMap<Domain> out;
  for (const auto& [agent, task] : tasks) {
    out.emplace(agent, task ? task->clone() : nullptr);
  }
  return out;
}

}  // namespace npc
