#pragma once

#include <atomic>
#include <memory>

namespace util {

/*
 * Same as std::atomic<std::shared_ptr<T>>, but with convenience methods that make it usable as a
 * tree edge: a slot that one thread can fill or clear while other threads follow it.
 *
 * Every read goes through lock(), which returns a std::shared_ptr copy. The copy keeps the target
 * alive for the caller even if the slot is cleared or overwritten immediately afterwards.
 */
template <typename T>
class AtomicSharedPtr : public std::atomic<std::shared_ptr<T>> {
 public:
  using base_t = std::atomic<std::shared_ptr<T>>;
  using sptr = std::shared_ptr<T>;
  using wptr = std::weak_ptr<T>;

  AtomicSharedPtr() = default;
  AtomicSharedPtr(sptr ptr) : base_t(std::move(ptr)) {}

  AtomicSharedPtr(const AtomicSharedPtr& ptr) : base_t(ptr.load()) {}

  AtomicSharedPtr& operator=(const AtomicSharedPtr& ptr) {
    this->store(ptr.load());
    return *this;
  }

  AtomicSharedPtr& operator=(sptr ptr) {
    this->store(std::move(ptr));
    return *this;
  }

  sptr lock() const { return this->load(); }
  wptr observe() const { return wptr(this->load()); }
  void reset() { this->store(nullptr); }

  /*
   * Stores ptr if the slot is currently empty. Returns whichever pointer occupies the slot
   * afterwards, so that racing writers all agree on a single winner.
   */
  sptr install_if_empty(sptr ptr);

  explicit operator bool() const { return this->load() != nullptr; }
};

template <typename T>
typename AtomicSharedPtr<T>::sptr AtomicSharedPtr<T>::install_if_empty(sptr ptr) {
  sptr expected;
  if (this->compare_exchange_strong(expected, ptr)) {
    return ptr;
  }
  return expected;
}

}  // namespace util
