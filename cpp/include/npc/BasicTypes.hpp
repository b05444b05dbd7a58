#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <set>
#include <string>

namespace npc {

/*
 * Opaque identifier of a participant in the domain. Totally ordered so that it can key ordered
 * containers; node hashing iterates those containers, which keeps hashes stable across runs.
 */
class AgentId {
 public:
  using raw_t = uint32_t;

  constexpr AgentId() = default;
  constexpr explicit AgentId(raw_t id) : id_(id) {}

  constexpr raw_t id() const { return id_; }

  auto operator<=>(const AgentId&) const = default;

  std::string to_string() const;
  friend std::ostream& operator<<(std::ostream& os, const AgentId& agent) {
    return os << agent.to_string();
  }

 private:
  raw_t id_ = 0;
};

/*
 * Utility of one agent at one node.
 *
 * Wraps a float. NaN is rejected at construction, which makes the ordering total.
 */
class AgentValue {
 public:
  AgentValue() = default;
  explicit AgentValue(float value);

  float value() const { return value_; }
  explicit operator float() const { return value_; }

  bool operator==(const AgentValue& other) const { return value_ == other.value_; }
  std::strong_ordering operator<=>(const AgentValue& other) const;

  // The arithmetic operators throw util::ReleaseAssertionError if the result is NaN
  // (e.g. inf - inf, or inf * 0).
  AgentValue operator+(const AgentValue& other) const { return AgentValue(value_ + other.value_); }
  AgentValue operator-(const AgentValue& other) const { return AgentValue(value_ - other.value_); }
  AgentValue operator*(float scale) const { return AgentValue(value_ * scale); }
  AgentValue& operator+=(const AgentValue& other);

  std::string to_string() const;
  friend std::ostream& operator<<(std::ostream& os, const AgentValue& value) {
    return os << value.to_string();
  }

 private:
  float value_ = 0;
};

using AgentSet = std::set<AgentId>;
using AgentValueMap = std::map<AgentId, AgentValue>;

}  // namespace npc

namespace std {

template <>
struct hash<npc::AgentId> {
  size_t operator()(const npc::AgentId& agent) const { return std::hash<uint32_t>{}(agent.id()); }
};

template <>
struct hash<npc::AgentValue> {
  size_t operator()(const npc::AgentValue& v) const { return std::hash<float>{}(v.value()); }
};

}  // namespace std
