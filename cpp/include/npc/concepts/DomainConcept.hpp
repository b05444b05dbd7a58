#pragma once

#include "npc/BasicTypes.hpp"
#include "npc/StateDiffRef.hpp"
#include "util/CppUtil.hpp"

#include <concepts>

namespace npc {
namespace concepts {

/*
 * All Domain classes D must satisfy npc::concepts::Domain<D>.
 *
 * D::State is a full world snapshot. It is owned by whoever drives the search and only ever
 * borrowed by the core.
 *
 * D::Diff is the change accumulated from that snapshot. It takes part in node identity, so it must
 * be equality-comparable and std::hash-able.
 *
 * The two static functions must be pure: identical views must produce identical results. Node
 * construction memoizes their output, and transposition detection compares nodes built from
 * independent calls.
 *
 * get_visible_agents(view, agent) must contain agent itself.
 */
template <class D>
concept Domain = requires(const StateDiffRef<D>& view, AgentId agent) {
  typename D::State;
  typename D::Diff;

  requires std::move_constructible<typename D::Diff>;
  requires util::concepts::UsableAsHashMapKey<typename D::Diff>;

  { D::get_visible_agents(view, agent) } -> std::same_as<AgentSet>;
  { D::get_current_value(view, agent) } -> std::same_as<AgentValue>;
};

}  // namespace concepts
}  // namespace npc
