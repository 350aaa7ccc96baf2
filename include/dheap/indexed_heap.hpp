#ifndef DHEAP_INDEXED_HEAP_HPP_
#define DHEAP_INDEXED_HEAP_HPP_

#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "dheap/error.h"
#include "dheap/heap_store.hpp"
#include "dheap/log.h"

namespace dheap {

/**
 * @brief Index policy of a HeapStore that maps every element to its slot.
 */
template <typename Element, typename Hash = std::hash<Element>,
          typename KeyEqual = std::equal_to<Element>>
class HashIndex {
 public:
  using size_type = size_t;

  HashIndex(const Hash &hash = Hash(), const KeyEqual &equal = KeyEqual())
      : positions_(0, hash, equal) {}

  void place(const Element &element, size_type slot) {
    positions_.insert_or_assign(element, slot);
  }

  void forget(const Element &element) { positions_.erase(element); }

  void reserve(size_type n) { positions_.reserve(n); }

  void clear() { positions_.clear(); }

  std::optional<size_type> find(const Element &element) const {
    if (auto it = positions_.find(element); it != positions_.end())
      return it->second;
    return std::nullopt;
  }

  bool contains(const Element &element) const {
    return positions_.find(element) != positions_.end();
  }

  size_type size() const { return positions_.size(); }

  Hash hash_function() const { return positions_.hash_function(); }

  KeyEqual key_eq() const { return positions_.key_eq(); }

 protected:
  /**
   * @brief Element to the slot of heap
   */
  std::unordered_map<Element, size_type, Hash, KeyEqual> positions_;
};

/**
 * @brief A d-ary min-heap that tracks the slot of every element, so that an
 * element can be removed or have its priority changed in O(log n). Elements
 * are unique under Hash and KeyEqual.
 */
template <typename Element, typename Priority,
          typename Compare = std::less<Priority>, size_t Arity = 4,
          typename Hash = std::hash<Element>,
          typename KeyEqual = std::equal_to<Element>>
class IndexedHeap
    : protected HeapStore<Element, Priority, Compare, Arity,
                          HashIndex<Element, Hash, KeyEqual>> {
  using Index = HashIndex<Element, Hash, KeyEqual>;
  using Base = HeapStore<Element, Priority, Compare, Arity, Index>;

 public:
  using typename Base::const_iterator;
  using typename Base::element_type;
  using typename Base::priority_type;
  using typename Base::size_type;
  using typename Base::value_type;

  using Base::arity;
  using Base::default_capacity;

  IndexedHeap(const Compare &compare = Compare(), const Hash &hash = Hash(),
              const KeyEqual &equal = KeyEqual())
      : Base(0, compare, Index(hash, equal)) {}

  explicit IndexedHeap(size_type initial_capacity,
                       const Compare &compare = Compare(),
                       const Hash &hash = Hash(),
                       const KeyEqual &equal = KeyEqual())
      : Base(initial_capacity, compare, Index(hash, equal)) {}

  /**
   * @throw DuplicateElement If an element appears twice in the range.
   */
  template <typename InputIt, typename = typename std::iterator_traits<
                                  InputIt>::iterator_category>
  IndexedHeap(InputIt first, InputIt last, const Compare &compare = Compare(),
              const Hash &hash = Hash(), const KeyEqual &equal = KeyEqual())
      : IndexedHeap(compare, hash, equal) {
    bulk_load(first, last);
  }

  IndexedHeap(std::initializer_list<value_type> list,
              const Compare &compare = Compare(), const Hash &hash = Hash(),
              const KeyEqual &equal = KeyEqual())
      : IndexedHeap(list.begin(), list.end(), compare, hash, equal) {}

  using Base::begin;
  using Base::capacity;
  using Base::clear;
  using Base::comparator;
  using Base::empty;
  using Base::end;
  using Base::extract_min;
  using Base::peek_min;
  using Base::size;
  using Base::trim_excess;
  using Base::try_extract_min;
  using Base::try_peek_min;
  using Base::version;

  bool contains(const Element &element) const {
    return this->index_.contains(element);
  }

  /**
   * @brief The current priority of element.
   */
  std::optional<Priority> priority_of(const Element &element) const {
    if (auto slot = this->index_.find(element)) return this->priorities_[*slot];
    return std::nullopt;
  }

  /**
   * @throw DuplicateElement If element is already in the heap.
   */
  void insert(Element element, Priority priority) {
    if (contains(element)) reject_duplicate("insert");
    Base::insert(std::move(element), std::move(priority));
  }

  /**
   * @brief Same as HeapStore::replace_min.
   * @throw DuplicateElement If element is already in the heap, even when the
   * heap would be left untouched.
   */
  value_type replace_min(Element element, Priority priority) {
    if (contains(element)) reject_duplicate("replace_min");
    return Base::replace_min(std::move(element), std::move(priority));
  }

  /**
   * @brief Same as HeapStore::bulk_load, the whole range is checked before
   * the heap is modified.
   * @throw DuplicateElement If an element of the range is already in the heap
   * or appears twice in the range.
   */
  template <typename InputIt>
  void bulk_load(InputIt first, InputIt last) {
    std::vector<value_type> batch;
    for (; first != last; ++first) {
      const auto &[element, priority] = *first;
      batch.emplace_back(element, priority);
    }

    std::unordered_set<Element, Hash, KeyEqual> seen(
        batch.size(), this->index_.hash_function(), this->index_.key_eq());
    for (const auto &pair : batch) {
      if (contains(pair.first) || !seen.insert(pair.first).second)
        reject_duplicate("bulk_load");
    }
    Base::bulk_load(std::make_move_iterator(batch.begin()),
                    std::make_move_iterator(batch.end()));
  }

  /**
   * @return Return false if element is not in the heap.
   */
  bool try_remove(const Element &element) {
    auto slot = this->index_.find(element);
    if (!slot) return false;
    this->remove_at(*slot);
    return true;
  }

  /**
   * @brief Change the priority of element. A decreased priority sifts up, an
   * increased one sifts down.
   * @return Return false if element is not in the heap.
   */
  bool try_update(const Element &element, Priority priority) {
    auto slot = this->index_.find(element);
    if (!slot) return false;
    this->update_at(*slot, std::move(priority));
    return true;
  }

  /**
   * @brief Insert element, or update its priority if it is in the heap.
   */
  void enqueue_or_update(Element element, Priority priority) {
    if (auto slot = this->index_.find(element))
      this->update_at(*slot, std::move(priority));
    else
      Base::insert(std::move(element), std::move(priority));
  }

  /**
   * @brief Check the heap property and that the index is the inverse of the
   * valid slots.
   * @throw std::logic_error The first violation found.
   */
  void validate() const {
    Base::validate();
    if (this->index_.size() != this->count_)
      throw std::logic_error("dheap: index tracks " +
                             std::to_string(this->index_.size()) +
                             " elements, heap holds " +
                             std::to_string(this->count_));
    for (size_type i = 0; i < this->count_; ++i) {
      auto slot = this->index_.find(this->elements_[i]);
      if (!slot)
        throw std::logic_error("dheap: element of slot " + std::to_string(i) +
                               " is not indexed");
      if (*slot != i)
        throw std::logic_error("dheap: element of slot " + std::to_string(i) +
                               " is indexed at slot " + std::to_string(*slot));
    }
  }

 protected:
  static void reject_duplicate(const char *operation) {
    Logger::get_instance().warn(std::string("rejected duplicate element in ") +
                                operation + "()");
    throw DuplicateElement(std::string("dheap: ") + operation +
                           "() of an element already in the heap");
  }
};

}  // namespace dheap

#endif
