#include "npc/BasicTypes.hpp"
#include "npc/Behavior.hpp"
#include "npc/Node.hpp"
#include "npc/Task.hpp"
#include "npc/TranspositionTable.hpp"
#include "npc/tests/GridDomain.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

using npc::AgentId;
using npc::AgentValue;
using npc::tests::GridDomain;
using npc::tests::Move;
using npc::tests::Position;
using npc::tests::Wait;

using Node = npc::Node<GridDomain>;
using State = GridDomain::State;
using Diff = GridDomain::Diff;
using TaskMap = Node::TaskMap;
using TranspositionTable = npc::TranspositionTable<GridDomain>;

constexpr AgentId kAlice = GridDomain::kAlice;
constexpr AgentId kBob = GridDomain::kBob;
constexpr AgentId kCarol = GridDomain::kCarol;

namespace {

State make_state() {
  State state;
  state.width = 4;
  state.height = 4;
  state.positions[kAlice] = Position{1, 1};
  state.positions[kBob] = Position{2, 2};
  state.positions[kCarol] = Position{3, 0};
  state.base_values[kAlice] = 10;
  state.base_values[kBob] = 20;
  state.base_values[kCarol] = 30;
  return state;
}

Diff make_diff(bool bob_visible) {
  Diff diff;
  diff.bob_visible = bob_visible;
  return diff;
}

TaskMap make_tasks(npc::AbstractTask<GridDomain>::task_ptr_t alice_task,
                   npc::AbstractTask<GridDomain>::task_ptr_t bob_task = nullptr) {
  TaskMap tasks;
  if (alice_task) tasks.emplace(kAlice, std::move(alice_task));
  if (bob_task) tasks.emplace(kBob, std::move(bob_task));
  return tasks;
}

// Violates the domain contract: an agent never sees itself.
struct BlindDomain {
  using State = GridDomain::State;
  using Diff = GridDomain::Diff;
  using StateDiffRef = npc::StateDiffRef<BlindDomain>;

  static npc::AgentSet get_visible_agents(const StateDiffRef&, AgentId) { return {}; }
  static AgentValue get_current_value(const StateDiffRef&, AgentId) { return AgentValue(0); }
};

static_assert(npc::concepts::Domain<BlindDomain>);

// Nodes can only be built through create(): the passkey cannot be conjured from an empty brace.
template <typename NodeT>
concept ConstructibleWithoutCreate = requires(const typename NodeT::State& state,
                                              typename NodeT::Diff diff,
                                              typename NodeT::TaskMap tasks) {
  NodeT({}, state, std::move(diff), AgentId{}, std::move(tasks));
};

static_assert(!ConstructibleWithoutCreate<Node>);

// Tasks held by a node are read-only.
using stored_task_t = decltype(*std::declval<const TaskMap&>().begin()->second);
static_assert(std::is_const_v<std::remove_reference_t<stored_task_t>>);

}  // namespace

TEST(AgentValue, ordering) {
  AgentValue a(1.0f);
  AgentValue b(2.5f);

  EXPECT_LT(a, b);
  EXPECT_GT(b, a);
  EXPECT_EQ(a, AgentValue(1.0f));
  EXPECT_EQ(a + b, AgentValue(3.5f));
  EXPECT_EQ(b - a, AgentValue(1.5f));
  EXPECT_EQ(a * 4.0f, AgentValue(4.0f));
  EXPECT_FLOAT_EQ(static_cast<float>(b), 2.5f);
  EXPECT_EQ(b.to_string(), "2.500");
}

TEST(AgentValue, rejects_nan) {
  EXPECT_THROW(AgentValue(std::numeric_limits<float>::quiet_NaN()), util::ReleaseAssertionError);
}

TEST(AgentValue, arithmetic_producing_nan_throws) {
  AgentValue inf(std::numeric_limits<float>::infinity());

  EXPECT_EQ(inf + AgentValue(1.0f), inf);
  EXPECT_THROW(inf - inf, util::ReleaseAssertionError);
  EXPECT_THROW(inf * 0.0f, util::ReleaseAssertionError);
  EXPECT_THROW(inf + AgentValue(-std::numeric_limits<float>::infinity()),
               util::ReleaseAssertionError);
}

TEST(AgentId, ordering) {
  EXPECT_LT(kAlice, kBob);
  EXPECT_NE(kAlice, kBob);
  EXPECT_EQ(AgentId(7).id(), 7u);
  EXPECT_EQ(kBob.to_string(), "A1");
}

TEST(Task, identity_across_types) {
  Move right(1, 0);
  Move up(0, 1);
  Wait wait;

  EXPECT_TRUE(right == Move(1, 0));
  EXPECT_FALSE(right == up);
  EXPECT_FALSE(right == wait);
  EXPECT_TRUE(wait == Wait());

  // exactly one of a<b, b<a for distinct tasks
  EXPECT_NE(right < up, up < right);
  EXPECT_NE(right < wait, wait < right);
  EXPECT_FALSE(right < Move(1, 0));

  EXPECT_EQ(right.hash(), Move(1, 0).hash());
  EXPECT_NE(right.hash(), up.hash());

  auto copy = right.clone();
  EXPECT_TRUE(*copy == right);
  EXPECT_EQ(copy->name(), "Move(1,0)");
  EXPECT_EQ(copy->size(), sizeof(Move));
}

TEST(Task, clone_tasks_is_deep) {
  TaskMap tasks = make_tasks(std::make_unique<Move>(1, 0), std::make_unique<Wait>());
  TaskMap copy = npc::clone_tasks<GridDomain>(tasks);

  EXPECT_TRUE(npc::tasks_equal<GridDomain>(tasks, copy));
  EXPECT_EQ(npc::tasks_hash<GridDomain>(tasks), npc::tasks_hash<GridDomain>(copy));
  EXPECT_NE(tasks.at(kAlice).get(), copy.at(kAlice).get());

  copy.erase(kBob);
  EXPECT_FALSE(npc::tasks_equal<GridDomain>(tasks, copy));
}

TEST(Behavior, collect_tasks) {
  State state = make_state();
  Diff diff;
  diff.positions[kAlice] = Position{0, 0};
  npc::StateDiffRef<GridDomain> view(state, diff);

  npc::tests::Idle idle;
  npc::tests::Roam roam(&idle);
  npc::AbstractBehavior<GridDomain>::behavior_vec_t behaviors = {&roam};

  auto tasks = npc::collect_tasks(behaviors, view, kAlice);
  ASSERT_EQ(tasks.size(), 3u);
  EXPECT_TRUE(*tasks[0] == Move(1, 0));
  EXPECT_TRUE(*tasks[1] == Move(0, 1));
  EXPECT_TRUE(*tasks[2] == Wait());
  EXPECT_FLOAT_EQ(tasks[2]->weight(view, kAlice), 0.5f);
}

TEST(Behavior, invalid_behavior_skips_dependents) {
  State state = make_state();
  Diff diff;
  diff.positions[kAlice] = Position{-3, 0};
  npc::StateDiffRef<GridDomain> view(state, diff);

  npc::tests::Idle idle;
  npc::tests::Roam roam(&idle);

  auto tasks = npc::collect_tasks({&roam}, view, kAlice);
  EXPECT_TRUE(tasks.empty());
}

TEST(Node, current_values_follow_visibility) {
  State state = make_state();

  Node::sptr hidden = Node::create(state, make_diff(false), kAlice, TaskMap{});
  ASSERT_EQ(hidden->current_values().size(), 1u);
  EXPECT_TRUE(hidden->current_values().contains(kAlice));
  EXPECT_EQ(hidden->current_value(kAlice), AgentValue(11));
  EXPECT_THROW(hidden->current_value(kBob), util::ReleaseAssertionError);

  Node::sptr visible = Node::create(state, make_diff(true), kAlice, TaskMap{});
  ASSERT_EQ(visible->current_values().size(), 2u);
  EXPECT_EQ(visible->current_value(kAlice), AgentValue(11));
  EXPECT_EQ(visible->current_value(kBob), AgentValue(22));
}

TEST(Node, active_agent_always_cached) {
  State state = make_state();
  for (AgentId agent : {kAlice, kBob, kCarol}) {
    for (bool flag : {false, true}) {
      Node::sptr node = Node::create(state, make_diff(flag), agent, TaskMap{});
      EXPECT_EQ(node->agent(), agent);
      EXPECT_TRUE(node->current_values().contains(agent));
    }
  }
}

TEST(Node, construction_queries_domain_once_per_visible_agent) {
  State state = make_state();
  GridDomain::reset_call_counts();

  Node::sptr node = Node::create(state, make_diff(true), kAlice, TaskMap{});

  auto counts = GridDomain::call_counts();
  EXPECT_EQ(counts.visible_agents[kAlice], 1);
  EXPECT_EQ(counts.current_value[kAlice], 1);
  EXPECT_EQ(counts.current_value[kBob], 1);
  EXPECT_EQ(counts.current_value[kCarol], 0);
}

TEST(Node, drops_stale_task_for_active_agent) {
  State state = make_state();
  Diff diff;
  diff.positions[kAlice] = Position{7, 1};  // off the 4x4 grid

  TaskMap tasks = make_tasks(std::make_unique<Move>(1, 0), std::make_unique<Wait>());
  Node::sptr node = Node::create(state, diff, kAlice, std::move(tasks));

  EXPECT_EQ(node->tasks().size(), 1u);
  EXPECT_EQ(node->task(kAlice), nullptr);
  ASSERT_NE(node->task(kBob), nullptr);
  EXPECT_TRUE(*node->task(kBob) == Wait());
}

TEST(Node, keeps_valid_task_for_active_agent) {
  State state = make_state();

  Node::sptr node = Node::create(state, make_diff(false), kAlice,
                                 make_tasks(std::make_unique<Move>(1, 0)));

  ASSERT_NE(node->task(kAlice), nullptr);
  EXPECT_TRUE(*node->task(kAlice) == Move(1, 0));
}

TEST(Node, only_active_agent_task_is_validated) {
  State state = make_state();
  Diff diff;
  diff.positions[kBob] = Position{3, 3};

  // Bob's move would leave the grid, but Bob is not the active agent.
  TaskMap tasks = make_tasks(std::make_unique<Wait>(), std::make_unique<Move>(1, 0));
  Node::sptr node = Node::create(state, diff, kAlice, std::move(tasks));

  EXPECT_EQ(node->tasks().size(), 2u);
  ASSERT_NE(node->task(kBob), nullptr);
  EXPECT_TRUE(*node->task(kBob) == Move(1, 0));
}

TEST(Node, blind_domain_is_fatal) {
  State state = make_state();
  EXPECT_THROW(npc::Node<BlindDomain>::create(state, Diff{}, kAlice, {}),
               util::ReleaseAssertionError);
}

TEST(Node, equality_and_hash) {
  State state = make_state();
  Diff diff = make_diff(true);
  diff.positions[kAlice] = Position{2, 1};

  Node::sptr n1 = Node::create(state, diff, kAlice, make_tasks(std::make_unique<Move>(0, 1)));
  Node::sptr n2 = Node::create(state, diff, kAlice, make_tasks(std::make_unique<Move>(0, 1)));

  EXPECT_NE(n1.get(), n2.get());
  EXPECT_TRUE(*n1 == *n2);
  EXPECT_EQ(n1->hash(), n2->hash());
  EXPECT_EQ(std::hash<Node>{}(*n1), n1->hash());

  Node::sptr other_agent =
    Node::create(state, diff, kBob, make_tasks(std::make_unique<Move>(0, 1)));
  EXPECT_FALSE(*n1 == *other_agent);

  Node::sptr other_diff =
    Node::create(state, make_diff(true), kAlice, make_tasks(std::make_unique<Move>(0, 1)));
  EXPECT_FALSE(*n1 == *other_diff);

  Node::sptr other_tasks = Node::create(state, diff, kAlice, make_tasks(std::make_unique<Wait>()));
  EXPECT_FALSE(*n1 == *other_tasks);
}

TEST(Node, identity_ignores_cached_values) {
  State state = make_state();
  State richer = make_state();
  richer.base_values[kAlice] = 100;

  Node::sptr n1 = Node::create(state, make_diff(false), kAlice, TaskMap{});
  Node::sptr n2 = Node::create(richer, make_diff(false), kAlice, TaskMap{});

  EXPECT_NE(n1->current_value(kAlice), n2->current_value(kAlice));
  EXPECT_TRUE(*n1 == *n2);
  EXPECT_EQ(n1->hash(), n2->hash());
}

TEST(Node, current_value_or_compute_uses_cache) {
  State state = make_state();
  Node::sptr node = Node::create(state, make_diff(true), kAlice, TaskMap{});

  GridDomain::reset_call_counts();
  EXPECT_EQ(node->current_value_or_compute(kAlice, state), AgentValue(11));
  EXPECT_EQ(node->current_value_or_compute(kBob, state), AgentValue(22));

  auto counts = GridDomain::call_counts();
  EXPECT_EQ(counts.current_value[kAlice], 0);
  EXPECT_EQ(counts.current_value[kBob], 0);
}

TEST(Node, current_value_or_compute_falls_back_to_domain) {
  State state = make_state();
  Diff diff = make_diff(false);
  diff.positions[kBob] = Position{0, 3};
  Node::sptr node = Node::create(state, diff, kAlice, TaskMap{});

  AgentValue expected = GridDomain::get_current_value(node->state_diff_ref(state), kBob);

  GridDomain::reset_call_counts();
  EXPECT_EQ(node->current_value_or_compute(kBob, state), expected);
  EXPECT_EQ(expected, AgentValue(20));
  EXPECT_EQ(GridDomain::call_counts().current_value[kBob], 1);

  // not cached
  EXPECT_FALSE(node->current_values().contains(kBob));
}

TEST(Node, state_diff_ref_pairs_node_diff) {
  State state = make_state();
  Diff diff = make_diff(true);
  Node::sptr node = Node::create(state, diff, kAlice, TaskMap{});

  auto view = node->state_diff_ref(state);
  EXPECT_EQ(&view.initial_state(), &state);
  EXPECT_EQ(&view.diff(), &node->diff());
  EXPECT_EQ(view.diff(), diff);
}

TEST(Node, size) {
  State state = make_state();
  TaskMap tasks = make_tasks(std::make_unique<Move>(1, 0), std::make_unique<Wait>());
  Node::sptr node = Node::create(state, make_diff(true), kAlice, std::move(tasks));

  size_t base = sizeof(Node) + 2 * sizeof(npc::AgentValueMap::value_type);
  EXPECT_EQ(node->size([](const Node::Task&) { return size_t(100); }), base + 200);
  EXPECT_EQ(node->size(), base + sizeof(Move) + sizeof(Wait));
}

TEST(Node, to_string) {
  State state = make_state();
  Node::sptr node = Node::create(state, make_diff(false), kAlice,
                                 make_tasks(std::make_unique<Move>(1, 0)));

  std::string s = node->to_string();
  EXPECT_NE(s.find("agent: A0"), std::string::npos);
  EXPECT_NE(s.find("A0: Move(1,0)"), std::string::npos);
  EXPECT_NE(s.find("A0: 11.000"), std::string::npos);
  EXPECT_NE(s.find("bob_visible=0"), std::string::npos);
}

TEST(Node, weak_handle_upgrade) {
  State state = make_state();
  Node::sptr node = Node::create(state, make_diff(false), kAlice, TaskMap{});
  Node::sptr copy = node;
  Node::wptr weak = node;

  EXPECT_EQ(weak.lock(), node);
  node.reset();
  EXPECT_EQ(weak.lock(), copy);
  copy.reset();
  EXPECT_EQ(weak.lock(), nullptr);
  EXPECT_TRUE(weak.expired());
}

TEST(Node, concurrent_reads) {
  State state = make_state();
  Node::sptr node = Node::create(state, make_diff(true), kAlice,
                                 make_tasks(std::make_unique<Move>(1, 0)));
  size_t expected_hash = node->hash();

  constexpr int kNumThreads = 8;
  std::atomic<int> mismatches = 0;
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([&, node]() {
      for (int i = 0; i < 1000; ++i) {
        if (node->hash() != expected_hash) mismatches++;
        if (node->current_value(kBob) != AgentValue(22)) mismatches++;
        if (node->current_value_or_compute(kCarol, state) != AgentValue(33)) mismatches++;
      }
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(mismatches.load(), 0);
}

TEST(Node, atomic_edge_has_single_winner) {
  State state = make_state();
  Node::asptr edge;
  EXPECT_FALSE(edge);

  constexpr int kNumThreads = 8;
  std::vector<Node::sptr> results(kNumThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([&, t]() {
      Node::sptr child = Node::create(state, make_diff(t % 2 == 0), kAlice, TaskMap{});
      results[t] = edge.install_if_empty(child);
    });
  }
  for (auto& thread : threads) thread.join();

  Node::sptr winner = edge.lock();
  ASSERT_NE(winner, nullptr);
  for (const auto& result : results) {
    EXPECT_EQ(result, winner);
  }

  Node::wptr weak = edge.observe();
  results.clear();
  winner.reset();
  EXPECT_FALSE(weak.expired());
  edge.reset();
  EXPECT_TRUE(weak.expired());
}

TEST(TranspositionTable, insert_or_get_returns_canonical_node) {
  State state = make_state();
  TranspositionTable table;

  Node::sptr n1 = Node::create(state, make_diff(true), kAlice, TaskMap{});
  Node::sptr n2 = Node::create(state, make_diff(true), kAlice, TaskMap{});
  Node::sptr n3 = Node::create(state, make_diff(false), kAlice, TaskMap{});

  EXPECT_EQ(table.lookup(*n1), nullptr);
  EXPECT_EQ(table.insert_or_get(n1), n1);
  EXPECT_EQ(table.insert_or_get(n2), n1);
  EXPECT_EQ(table.lookup(*n2), n1);
  EXPECT_EQ(table.insert_or_get(n3), n3);
  EXPECT_EQ(table.size(), 2u);
}

TEST(TranspositionTable, does_not_retain_nodes) {
  State state = make_state();
  TranspositionTable table;

  Node::sptr node = Node::create(state, make_diff(true), kAlice, TaskMap{});
  Node::wptr weak = node;
  table.insert_or_get(node);
  EXPECT_EQ(table.memory_footprint(), node->size());

  Node::sptr probe = Node::create(state, make_diff(true), kAlice, TaskMap{});
  node.reset();
  EXPECT_TRUE(weak.expired());
  EXPECT_EQ(table.lookup(*probe), nullptr);
  EXPECT_EQ(table.memory_footprint(), 0u);

  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.prune(), 1);
  EXPECT_EQ(table.size(), 0u);

  // An equal node inserted after the original expired becomes the new canonical node.
  EXPECT_EQ(table.insert_or_get(probe), probe);
}

TEST(TranspositionTable, automatic_prune) {
  State state = make_state();
  TranspositionTable::Params params;
  params.prune_interval = 2;
  TranspositionTable table(params);

  table.insert_or_get(Node::create(state, make_diff(false), kAlice, TaskMap{}));
  EXPECT_EQ(table.size(), 1u);

  // The second insert triggers a sweep, which removes the (already expired) first entry.
  Node::sptr kept = Node::create(state, make_diff(true), kAlice, TaskMap{});
  table.insert_or_get(kept);
  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.lookup(*kept), kept);

  table.clear();
  EXPECT_EQ(table.size(), 0u);
}

TEST(TranspositionTable, params) {
  TranspositionTable::Params params;
  auto desc = params.make_options_description();

  const char* argv[] = {"prog", "--tt-prune-interval", "17"};
  namespace po = boost::program_options;
  po::variables_map vm;
  po::store(po::parse_command_line(3, argv, desc), vm);
  po::notify(vm);
  EXPECT_EQ(params.prune_interval, 17);

  params.prune_interval = 0;
  EXPECT_THROW(TranspositionTable{params}, util::CleanAssertionError);
}

TEST(TranspositionTable, concurrent_insert_or_get) {
  State state = make_state();
  TranspositionTable table;

  constexpr int kNumThreads = 8;
  std::vector<Node::sptr> results(kNumThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([&, t]() {
      Node::sptr node = Node::create(state, make_diff(true), kBob,
                                     make_tasks(nullptr, std::make_unique<Move>(0, 1)));
      results[t] = table.insert_or_get(node);
    });
  }
  for (auto& thread : threads) thread.join();

  for (const auto& result : results) {
    EXPECT_EQ(result, results[0]);
  }
  EXPECT_EQ(table.size(), 1u);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
