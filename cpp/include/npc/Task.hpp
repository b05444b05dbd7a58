#pragma once

#include "npc/BasicTypes.hpp"
#include "npc/StateDiffRef.hpp"

#include <map>
#include <memory>
#include <string>

namespace npc {

/*
 * An action proposal for one agent. Each domain has its own space of task implementations; the
 * core holds them through std::unique_ptr<AbstractTask<Domain>> and never inspects them beyond
 * this interface.
 *
 * Tasks take part in node identity, so they must support equality, a strict weak ordering and a
 * hash that work across different concrete types. Concrete tasks normally get these by deriving
 * from npc::TaskBase (below) rather than by implementing the protected hooks by hand.
 */
template <typename Domain>
class AbstractTask {
 public:
  using StateDiffRef = npc::StateDiffRef<Domain>;
  using task_ptr_t = std::unique_ptr<AbstractTask>;
  using const_task_ptr_t = std::unique_ptr<const AbstractTask>;

  virtual ~AbstractTask() = default;

  // Whether agent can still perform this task in the state described by view.
  virtual bool is_valid(const StateDiffRef& view, AgentId agent) const = 0;

  // Relative likelihood of picking this task among an agent's valid tasks.
  virtual float weight(const StateDiffRef&, AgentId) const { return 1.0f; }

  virtual std::string name() const;

  // Approximate footprint in bytes, for memory budgeting.
  virtual size_t size() const = 0;

  virtual size_t hash() const = 0;
  virtual task_ptr_t clone() const = 0;

  bool operator==(const AbstractTask& other) const;
  bool operator<(const AbstractTask& other) const;

 protected:
  // other is guaranteed to have the same dynamic type as *this.
  virtual bool equals_same_type(const AbstractTask& other) const = 0;
  virtual bool less_same_type(const AbstractTask& other) const = 0;
};

/*
 * CRTP helper that implements the identity hooks of AbstractTask from a single fields() method.
 *
 * Usage:
 *
 * class Move : public npc::TaskBase<Move, MyDomain> {
 *  public:
 *   auto fields() const { return std::make_tuple(dx_, dy_); }
 *   bool is_valid(const StateDiffRef&, npc::AgentId) const override;
 *   ...
 * };
 *
 * Equality, ordering and hashing then all follow fields(), and clone() copy-constructs a Derived.
 */
template <typename Derived, typename Domain>
class TaskBase : public AbstractTask<Domain> {
 public:
  using base_t = AbstractTask<Domain>;
  using task_ptr_t = base_t::task_ptr_t;

  size_t size() const override { return sizeof(Derived); }
  size_t hash() const override;
  task_ptr_t clone() const override;

 protected:
  bool equals_same_type(const base_t& other) const override;
  bool less_same_type(const base_t& other) const override;

 private:
  const Derived& derived() const { return static_cast<const Derived&>(*this); }
};

/*
 * Tasks proposed for each agent, at most one per agent. Entries are held as pointers to const, so
 * a TaskMap frozen inside a Node cannot be used to modify its tasks.
 *
 * std::map's own operator== would compare the pointers, so the free functions below are what node
 * identity uses.
 */
template <typename Domain>
using TaskMap = std::map<AgentId, typename AbstractTask<Domain>::const_task_ptr_t>;

template <typename Domain>
bool tasks_equal(const TaskMap<Domain>& a, const TaskMap<Domain>& b);

template <typename Domain>
size_t tasks_hash(const TaskMap<Domain>& tasks);

// Deep copy, via AbstractTask::clone().
template <typename Domain>
TaskMap<Domain> clone_tasks(const TaskMap<Domain>& tasks);

}  // namespace npc

#include "inline/npc/Task.inl"
