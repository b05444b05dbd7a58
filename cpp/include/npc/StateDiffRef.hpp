#pragma once

namespace npc {

/*
 * Non-owning view of "initial state + accumulated diff". This is how every query against the
 * effective state of a node is expressed; the effective state itself is never materialized.
 *
 * Both referents are borrowed. The caller guarantees they outlive the view, which in practice
 * means the view is built on the stack for the duration of a single query.
 */
template <typename Domain>
class StateDiffRef {
 public:
  using State = Domain::State;
  using Diff = Domain::Diff;

  StateDiffRef(const State& initial_state, const Diff& diff)
      : initial_state_(&initial_state), diff_(&diff) {}

  const State& initial_state() const { return *initial_state_; }
  const Diff& diff() const { return *diff_; }

 private:
  const State* initial_state_;
  const Diff* diff_;
};

}  // namespace npc
