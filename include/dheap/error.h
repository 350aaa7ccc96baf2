#ifndef DHEAP_ERROR_H_
#define DHEAP_ERROR_H_

#include <stdexcept>
#include <string>

namespace dheap {

/**
 * @brief Thrown by peek_min() or extract_min() on an empty heap.
 */
class EmptyContainer : public std::out_of_range {
 public:
  explicit EmptyContainer(const std::string &what = "dheap: heap is empty")
      : std::out_of_range(what) {}
};

/**
 * @brief Thrown when an element that is already tracked by an IndexedHeap is
 * inserted again.
 */
class DuplicateElement : public std::invalid_argument {
 public:
  explicit DuplicateElement(
      const std::string &what = "dheap: duplicate element")
      : std::invalid_argument(what) {}
};

/**
 * @brief Thrown by a traversal handle that observes a mutation of the heap
 * after it was created.
 */
class ConcurrentModification : public std::logic_error {
 public:
  explicit ConcurrentModification(
      const std::string &what = "dheap: heap was modified during traversal")
      : std::logic_error(what) {}
};

}  // namespace dheap

#endif
