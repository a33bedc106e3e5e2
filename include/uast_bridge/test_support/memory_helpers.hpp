// uast_bridge/test_support/memory_helpers.hpp - allocation failure injection for unit tests
#pragma once

#include <cstddef>
#include <memory_resource>
#include <new>

namespace uast_bridge::test_support
{

/**
 * Memory resource that serves the first `budget` allocations from
 * new/delete and throws std::bad_alloc for every one after that.
 */
class LimitedResource : public std::pmr::memory_resource
{
public:
  explicit LimitedResource(int budget) : budget_(budget) {}

  [[nodiscard]] int allocations() const noexcept { return allocations_; }

private:
  void * do_allocate(size_t bytes, size_t alignment) override
  {
    if (allocations_ >= budget_) throw std::bad_alloc();
    ++allocations_;
    return std::pmr::new_delete_resource()->allocate(bytes, alignment);
  }

  void do_deallocate(void * p, size_t bytes, size_t alignment) override
  {
    std::pmr::new_delete_resource()->deallocate(p, bytes, alignment);
  }

  [[nodiscard]] bool do_is_equal(const std::pmr::memory_resource & other) const noexcept override
  {
    return this == &other;
  }

  int budget_;
  int allocations_ = 0;
};

/// Installs resource as the default pmr resource until destroyed.
class DefaultResourceGuard
{
public:
  explicit DefaultResourceGuard(std::pmr::memory_resource * resource)
  : previous_(std::pmr::set_default_resource(resource))
  {
  }
  ~DefaultResourceGuard() { std::pmr::set_default_resource(previous_); }

  DefaultResourceGuard(const DefaultResourceGuard &) = delete;
  DefaultResourceGuard & operator=(const DefaultResourceGuard &) = delete;

private:
  std::pmr::memory_resource * previous_;
};

}  // namespace uast_bridge::test_support
