#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <typeinfo>
#include <type_traits>

#include <boost/core/demangle.hpp>
#include <boost/functional/hash.hpp>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Useful macro for constexpr-detection of whether a macro is assigned to 1. This is useful given
 * the behavior of the -D option in CMake.
 *
 * #define FOO 1
 * // #define BAR
 *
 * static_assert(IS_MACRO_ENABLED(FOO))
 * static_assert(!IS_MACRO_ENABLED(BAR))
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

// Alias used by the assertion macros: IS_DEFINED(DEBUG_BUILD) is true iff -DDEBUG_BUILD=1.
#define IS_DEFINED(macro) IS_MACRO_ENABLED(macro)

/*
 * Marks the arguments as used without evaluating them. This lets logging macros that compile out
 * at a given level avoid unused-variable warnings at the call site.
 */
#define USE_UNEVALUATED(...) static_cast<void>(sizeof((__VA_ARGS__, 0)))

namespace util {

template <typename T>
size_t hash(const T& t) {
  return std::hash<T>{}(t);
}

/*
 * Folds the std::hash of each argument into seed, in order. Uses boost::hash_combine mixing so that
 * permuting the arguments changes the result.
 */
template <typename... Ts>
void hash_combine(size_t& seed, const Ts&... ts) {
  (boost::hash_combine(seed, util::hash(ts)), ...);
}

template <typename T>
std::string get_typename() {
  return boost::core::demangle(typeid(T).name());
}

template <typename T>
std::string get_typename(const T& t) {
  return boost::core::demangle(typeid(t).name());
}

namespace concepts {

template <typename T>
concept UsableAsHashMapKey = requires(const T& a, const T& b) {
  { std::hash<T>{}(a) } -> std::convertible_to<size_t>;
  { a == b } -> std::convertible_to<bool>;
};

// Satisfied by types that can be streamed to an std::ostream.
template <typename T>
concept Printable = requires(std::ostream& os, const T& t) {
  { os << t } -> std::same_as<std::ostream&>;
};

}  // namespace concepts

}  // namespace util
