#ifndef DHEAP_HEAP_STORE_HPP_
#define DHEAP_HEAP_STORE_HPP_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "dheap/error.h"
#include "dheap/log.h"

namespace dheap {

/**
 * @brief Index policy of a HeapStore that doesn't track element positions.
 */
template <typename Element>
struct NoIndex {
  void place(const Element &, size_t) {}
  void forget(const Element &) {}
  void reserve(size_t) {}
  void clear() {}
};

/**
 * @brief An array based d-ary min-heap of (element, priority) pairs. Different
 * to std::priority_queue, the elements and the priorities live in two parallel
 * arrays and the sift algorithms move a held-out pair instead of swapping.
 * @tparam Compare Strict weak order of priorities, the smallest priority is
 * extracted first.
 * @tparam Arity The number of children of every node.
 * @tparam Index Policy notified of every slot an element is written to, see
 * NoIndex.
 */
template <typename Element, typename Priority,
          typename Compare = std::less<Priority>, size_t Arity = 4,
          typename Index = NoIndex<Element>>
class HeapStore {
  static_assert(Arity >= 2, "HeapStore: a d-ary heap requires Arity >= 2");

 public:
  using element_type = Element;
  using priority_type = Priority;
  using size_type = size_t;
  using value_type = std::pair<Element, Priority>;

  static constexpr size_type arity = Arity;

  /**
   * @brief The capacity of the first allocation of an empty heap.
   */
  static constexpr size_type default_capacity = 4;

  /**
   * @brief Traversal of the valid slots in array order, not in priority order.
   * The iterator fails with ConcurrentModification once the heap is mutated.
   */
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = HeapStore::value_type;
    using difference_type = std::ptrdiff_t;
    using reference = std::pair<const Element &, const Priority &>;
    using pointer = void;

    const_iterator() = default;

    reference operator*() const {
      check();
      return {store_->elements_[slot_], store_->priorities_[slot_]};
    }

    const_iterator &operator++() {
      check();
      ++slot_;
      return *this;
    }

    const_iterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    bool operator==(const const_iterator &other) const {
      return store_ == other.store_ && slot_ == other.slot_;
    }

    size_type slot() const { return slot_; }

   private:
    friend class HeapStore;

    const_iterator(const HeapStore *store, size_type slot)
        : store_(store), slot_(slot), version_(store->version_) {}

    void check() const {
      if (store_->version_ != version_) throw ConcurrentModification();
    }

    const HeapStore *store_ = nullptr;
    size_type slot_ = 0;
    uint64_t version_ = 0;
  };

  HeapStore(const Compare &compare = Compare()) : cmp_(compare) {}

  explicit HeapStore(size_type initial_capacity,
                     const Compare &compare = Compare())
      : cmp_(compare) {
    reallocate(initial_capacity);
  }

  template <typename InputIt, typename = typename std::iterator_traits<
                                  InputIt>::iterator_category>
  HeapStore(InputIt first, InputIt last, const Compare &compare = Compare())
      : HeapStore(compare) {
    bulk_load(first, last);
  }

  HeapStore(std::initializer_list<value_type> list,
            const Compare &compare = Compare())
      : HeapStore(list.begin(), list.end(), compare) {}

  ~HeapStore() = default;

  size_type size() const { return count_; }

  bool empty() const { return count_ == 0; }

  size_type capacity() const { return priorities_.size(); }

  /**
   * @brief A counter incremented by every mutation.
   */
  uint64_t version() const { return version_; }

  const Compare &comparator() const { return cmp_; }

  const_iterator begin() const { return const_iterator(this, 0); }

  const_iterator end() const { return const_iterator(this, count_); }

  /**
   * @brief Append the pair and sift it up. The capacity doubles when the heap
   * is full.
   */
  void insert(Element element, Priority priority) {
    ensure_capacity(count_ + 1);
    ++version_;
    sift_up(count_++, std::move(element), std::move(priority));
  }

  /**
   * @note Return const references to avoid being modified by callers.
   * @throw EmptyContainer
   */
  std::pair<const Element &, const Priority &> peek_min() const {
    if (count_ == 0) throw EmptyContainer("dheap: peek_min() on an empty heap");
    return {elements_[0], priorities_[0]};
  }

  std::optional<value_type> try_peek_min() const {
    if (count_ == 0) return std::nullopt;
    return value_type(elements_[0], priorities_[0]);
  }

  /**
   * @throw EmptyContainer
   */
  value_type extract_min() {
    if (count_ == 0)
      throw EmptyContainer("dheap: extract_min() on an empty heap");
    return remove_at(0);
  }

  std::optional<value_type> try_extract_min() {
    if (count_ == 0) return std::nullopt;
    return remove_at(0);
  }

  /**
   * @brief Extract the minimum and insert the pair with a single sift-down.
   * @return The old minimum. If the heap is empty or priority is not greater
   * than the minimum, the given pair is returned and the heap is untouched.
   */
  value_type replace_min(Element element, Priority priority) {
    if (count_ == 0 || !cmp_(priorities_[0], priority))
      return {std::move(element), std::move(priority)};

    ++version_;
    value_type min(std::move(elements_[0]), std::move(priorities_[0]));
    index_.forget(min.first);
    sift_down(0, std::move(element), std::move(priority));
    return min;
  }

  /**
   * @brief Add a range of pairs. An empty heap appends them unordered and
   * heapifies once in O(n), otherwise each pair is sifted up.
   * @note The range is read once. Pairs are moved out of rvalue references, so
   * std::move_iterator moves them.
   */
  template <typename InputIt>
  void bulk_load(InputIt first, InputIt last) {
    if (first == last) return;
    if constexpr (std::is_base_of_v<std::forward_iterator_tag,
                                    typename std::iterator_traits<
                                        InputIt>::iterator_category>) {
      ensure_capacity(count_ + std::distance(first, last));
    }

    ++version_;
    if (count_ == 0) {
      for (; first != last; ++first) {
        auto &&pair = *first;
        append(std::get<0>(std::forward<decltype(pair)>(pair)),
               std::get<1>(std::forward<decltype(pair)>(pair)));
      }
      heapify();
    } else {
      for (; first != last; ++first) {
        auto &&pair = *first;
        ensure_capacity(count_ + 1);
        sift_up(count_++, std::get<0>(std::forward<decltype(pair)>(pair)),
                std::get<1>(std::forward<decltype(pair)>(pair)));
      }
    }
  }

  /**
   * @brief Remove all the pairs. The used slots are reset to release the
   * resources the pairs own, the capacity is kept.
   */
  void clear() {
    ++version_;
    for (size_type i = 0; i < count_; ++i) {
      elements_[i] = Element{};
      priorities_[i] = Priority{};
    }
    count_ = 0;
    index_.clear();
  }

  /**
   * @brief Shrink the capacity to the size if less than 90% of it is used.
   */
  void trim_excess() {
    const auto threshold = static_cast<size_type>(capacity() * 0.9);
    if (count_ < threshold) reallocate(count_);
  }

  /**
   * @brief Check the heap property of every valid slot.
   * @throw std::logic_error The first violation found.
   */
  void validate() const {
    if (priorities_.size() != elements_.size())
      throw std::logic_error(
          "dheap: priorities and elements have different capacity");
    if (count_ > priorities_.size())
      throw std::logic_error("dheap: size " + std::to_string(count_) +
                             " exceeds capacity " +
                             std::to_string(priorities_.size()));
    for (size_type i = 1; i < count_; ++i) {
      if (cmp_(priorities_[i], priorities_[parent(i)]))
        throw std::logic_error("dheap: slot " + std::to_string(i) +
                               " precedes its parent " +
                               std::to_string(parent(i)));
    }
  }

 protected:
  HeapStore(size_type initial_capacity, const Compare &compare, Index index)
      : cmp_(compare), index_(std::move(index)) {
    reallocate(initial_capacity);
  }

  static constexpr size_type parent(size_type i) { return (i - 1) / Arity; }

  static constexpr size_type first_child(size_type i) { return Arity * i + 1; }

  /**
   * @brief Write the pair into slot and tell the index about it.
   */
  void put(size_type slot, Element &&element, Priority &&priority) {
    priorities_[slot] = std::move(priority);
    elements_[slot] = std::move(element);
    index_.place(elements_[slot], slot);
  }

  /**
   * @brief Move the pair of slot from into slot to.
   */
  void move_slot(size_type from, size_type to) {
    priorities_[to] = std::move(priorities_[from]);
    elements_[to] = std::move(elements_[from]);
    index_.place(elements_[to], to);
  }

  /**
   * @brief Place the held-out pair at index or above it, moving the parents
   * that are greater than priority down.
   */
  void sift_up(size_type index, Element element, Priority priority) {
    while (index > 0) {
      auto p = parent(index);
      // parent <= priority, heap property is satisfied
      if (!cmp_(priority, priorities_[p])) break;
      move_slot(p, index);
      index = p;
    }
    put(index, std::move(element), std::move(priority));
  }

  /**
   * @brief Place the held-out pair at index or below it, moving the smallest
   * child up while it is less than priority. Among equal children the one
   * with the lowest slot wins.
   */
  void sift_down(size_type index, Element element, Priority priority) {
    for (auto child = first_child(index); child < count_;
         child = first_child(index)) {
      auto min_child = child;
      const auto bound = std::min(count_, child + Arity);
      for (++child; child < bound; ++child) {
        if (cmp_(priorities_[child], priorities_[min_child])) min_child = child;
      }
      // priority <= min child, heap property is satisfied
      if (!cmp_(priorities_[min_child], priority)) break;
      move_slot(min_child, index);
      index = min_child;
    }
    put(index, std::move(element), std::move(priority));
  }

  /**
   * @brief Sift down every internal node, from the last one to the root.
   */
  void heapify() {
    if (count_ < 2) return;
    for (auto i = parent(count_ - 1) + 1; i-- > 0;) {
      Element element = std::move(elements_[i]);
      Priority priority = std::move(priorities_[i]);
      sift_down(i, std::move(element), std::move(priority));
    }
  }

  /**
   * @brief Write the pair behind the last valid slot without ordering it.
   */
  void append(Element element, Priority priority) {
    ensure_capacity(count_ + 1);
    put(count_++, std::move(element), std::move(priority));
  }

  /**
   * @brief Remove the pair of a valid slot. The last pair fills the hole and
   * is sifted up or down, whichever restores the heap property.
   */
  value_type remove_at(size_type index) {
    ++version_;
    value_type removed(std::move(elements_[index]),
                       std::move(priorities_[index]));
    index_.forget(removed.first);

    const auto last = --count_;
    Element element = std::exchange(elements_[last], Element{});
    Priority priority = std::exchange(priorities_[last], Priority{});
    if (index != last) {
      if (index > 0 && cmp_(priority, priorities_[parent(index)]))
        sift_up(index, std::move(element), std::move(priority));
      else
        sift_down(index, std::move(element), std::move(priority));
    }
    return removed;
  }

  /**
   * @brief Change the priority of a valid slot, a smaller one sifts up and a
   * greater one sifts down. An equal priority is a no-op.
   */
  void update_at(size_type index, Priority priority) {
    if (cmp_(priority, priorities_[index])) {
      ++version_;
      Element element = std::move(elements_[index]);
      sift_up(index, std::move(element), std::move(priority));
    } else if (cmp_(priorities_[index], priority)) {
      ++version_;
      Element element = std::move(elements_[index]);
      sift_down(index, std::move(element), std::move(priority));
    }
  }

  /**
   * @brief Double the capacity, starting from default_capacity, until it
   * holds needed slots.
   * @throw std::length_error
   */
  void ensure_capacity(size_type needed) {
    const auto current = capacity();
    if (needed <= current) return;
    const auto max = std::min(priorities_.max_size(), elements_.max_size());
    if (needed > max) throw std::length_error("dheap: heap capacity overflow");

    auto new_capacity = current == 0 ? default_capacity : current;
    while (new_capacity < needed)
      new_capacity = new_capacity > max / 2 ? max : new_capacity * 2;
    reallocate(new_capacity);
  }

  void reallocate(size_type new_capacity) {
    const auto old_capacity = capacity();
    if (new_capacity == old_capacity) return;

    priorities_.resize(new_capacity);
    try {
      elements_.resize(new_capacity);
    } catch (...) {
      priorities_.resize(old_capacity);
      throw;
    }
    if (new_capacity < old_capacity) {
      priorities_.shrink_to_fit();
      elements_.shrink_to_fit();
    }
    index_.reserve(new_capacity);

    auto &logger = Logger::get_instance();
    if (logger.enabled(Logger::Level::DEBUG))
      logger.debug("heap capacity " + std::to_string(old_capacity) + " -> " +
                   std::to_string(new_capacity) + " with " +
                   std::to_string(count_) + " elements");
  }

  Compare cmp_;

  /**
   * @brief Positions of the elements, kept in sync by put() and move_slot().
   */
  Index index_;

  /**
   * @brief Priorities of the slots, its size is the capacity.
   */
  std::vector<Priority> priorities_;

  /**
   * @brief Elements of the slots, parallel to priorities_.
   */
  std::vector<Element> elements_;

  /**
   * @brief The number of valid slots, [0, count_) is a heap.
   */
  size_type count_ = 0;

  uint64_t version_ = 0;
};

}  // namespace dheap

#endif
