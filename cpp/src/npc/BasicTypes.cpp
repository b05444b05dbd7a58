#include "npc/BasicTypes.hpp"

#include "util/Asserts.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace npc {

std::string AgentId::to_string() const { return fmt::format("A{}", id_); }

AgentValue::AgentValue(float value) : value_(value) {
  RELEASE_ASSERT(!std::isnan(value), "AgentValue cannot be NaN");
}

std::strong_ordering AgentValue::operator<=>(const AgentValue& other) const {
  if (value_ < other.value_) return std::strong_ordering::less;
  if (value_ > other.value_) return std::strong_ordering::greater;
  return std::strong_ordering::equal;
}

AgentValue& AgentValue::operator+=(const AgentValue& other) {
  *this = *this + other;
  return *this;
}

std::string AgentValue::to_string() const { return fmt::format("{:.3f}", value_); }

}  // namespace npc
