#include <algorithm>
#include <cassert>
#include <cctype>
#include <functional>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "dheap/error.h"
#include "dheap/indexed_heap.hpp"

using namespace std;
using dheap::ConcurrentModification;
using dheap::DuplicateElement;
using dheap::IndexedHeap;

/**
 * @brief Distinct numbers in random order.
 */
static vector<int> shuffled(int n, unsigned seed) {
  vector<int> ret(n);
  iota(ret.begin(), ret.end(), -n / 2);
  shuffle(ret.begin(), ret.end(), mt19937(seed));
  return ret;
}

template <typename Heap>
static vector<int> drain(Heap &heap) {
  vector<int> ret;
  while (!heap.empty()) {
    auto [element, priority] = heap.extract_min();
    assert(!heap.contains(element));
    ret.push_back(priority);
    heap.validate();
  }
  return ret;
}

static void test_beatles() {
  IndexedHeap<string, int> heap;
  heap.insert("John", 1940);
  heap.insert("Paul", 1942);
  heap.insert("George", 1943);
  heap.insert("Ringo", 1940);
  heap.validate();
  assert(heap.contains("Ringo") && !heap.contains("Yoko"));

  auto first = heap.extract_min().first;
  auto second = heap.extract_min().first;
  assert((first == "John" && second == "Ringo") ||
         (first == "Ringo" && second == "John"));
  assert(heap.extract_min().first == "Paul");
  assert(heap.extract_min().first == "George");
  assert(heap.empty());
}

static void test_duplicate() {
  IndexedHeap<string, int> heap = {{"a", 1}, {"b", 2}};
  auto version = heap.version();

  bool thrown = false;
  try {
    heap.insert("a", 0);
  } catch (const DuplicateElement &) {
    thrown = true;
  }
  assert(thrown);
  assert(heap.size() == 2 && heap.version() == version);
  assert(heap.priority_of("a") == 1);

  thrown = false;
  try {
    heap.replace_min("b", 5);
  } catch (const DuplicateElement &) {
    thrown = true;
  }
  assert(thrown);

  // a repeated element in the range, the heap is left untouched
  vector<pair<string, int>> batch = {{"c", 3}, {"d", 4}, {"c", 5}};
  thrown = false;
  try {
    heap.bulk_load(batch.begin(), batch.end());
  } catch (const DuplicateElement &) {
    thrown = true;
  }
  assert(thrown);
  assert(heap.size() == 2 && !heap.contains("c"));

  batch = {{"e", 3}, {"b", 4}};
  thrown = false;
  try {
    heap.bulk_load(batch.begin(), batch.end());
  } catch (const DuplicateElement &) {
    thrown = true;
  }
  assert(thrown);
  assert(heap.size() == 2 && !heap.contains("e"));
  assert(heap.version() == version);
  heap.validate();

  thrown = false;
  try {
    IndexedHeap<int, int> dup = {{1, 1}, {1, 2}};
  } catch (const DuplicateElement &) {
    thrown = true;
  }
  assert(thrown);
}

static void test_heap_sort() {
  for (int n = 0; n <= 150; ++n) {
    auto inputs = shuffled(n, n);

    IndexedHeap<int, int> heap;
    heap.validate();
    for (auto input : inputs) {
      heap.insert(input, input);
      heap.validate();
    }
    assert(heap.size() == inputs.size());

    vector<pair<int, int>> pairs;
    for (auto input : inputs) pairs.emplace_back(input, input);
    IndexedHeap<int, int> loaded(pairs.begin(), pairs.end());
    loaded.validate();
    assert(loaded.size() == inputs.size());

    sort(inputs.begin(), inputs.end());
    assert(drain(heap) == inputs);
    assert(drain(loaded) == inputs);
  }
}

static void test_remove() {
  for (int n = 0; n <= 150; ++n) {
    auto inputs = shuffled(n, 1000 + n);
    vector<pair<int, int>> pairs;
    for (auto input : inputs) pairs.emplace_back(input, input);
    IndexedHeap<int, int> heap(pairs.begin(), pairs.end());

    // remove in another random order
    shuffle(inputs.begin(), inputs.end(), mt19937(n));
    for (size_t i = 0; i < inputs.size(); ++i) {
      assert(heap.try_remove(inputs[i]));
      assert(!heap.contains(inputs[i]));
      assert(heap.size() == inputs.size() - i - 1);
      heap.validate();
    }
    assert(heap.empty());
    assert(!heap.try_remove(0));
  }
}

static void test_remove_sifts_up() {
  // slot i holds element i, the heap property already holds
  vector<int> priorities = {0, 10, 1, 1, 1, 11, 11, 11, 11, 2, 2, 2, 2};
  vector<pair<int, int>> pairs;
  for (size_t i = 0; i < priorities.size(); ++i)
    pairs.emplace_back(static_cast<int>(i), priorities[i]);
  IndexedHeap<int, int> heap(pairs.begin(), pairs.end());

  // the last element fills slot 5 and is less than its parent at slot 1
  assert(heap.try_remove(5));
  heap.validate();
  auto it = heap.begin();
  ++it;
  assert((*it).first == 12 && (*it).second == 2);
  assert(heap.priority_of(1) == 10);

  sort(priorities.begin(), priorities.end());
  priorities.erase(find(priorities.begin(), priorities.end(), 11));
  assert(drain(heap) == priorities);
}

static void test_update() {
  for (int n = 0; n <= 150; ++n) {
    auto inputs = shuffled(n, 2000 + n);
    vector<pair<int, int>> pairs;
    for (auto input : inputs) pairs.emplace_back(input, 0);
    IndexedHeap<int, int> heap(pairs.begin(), pairs.end());
    heap.validate();

    for (auto input : inputs) {
      assert(heap.try_update(input, input));
      assert(heap.size() == inputs.size());
      heap.validate();
    }
    // increase the keys of the smaller half, they now come last
    for (auto input : inputs) {
      if (input < 0) assert(heap.try_update(input, input + 10 * n));
      heap.validate();
    }

    vector<int> expected;
    for (auto input : inputs)
      expected.push_back(input < 0 ? input + 10 * n : input);
    sort(expected.begin(), expected.end());
    assert(drain(heap) == expected);
  }

  IndexedHeap<string, int> heap = {{"a", 1}, {"b", 2}};
  assert(!heap.try_update("c", 0));
  auto version = heap.version();
  assert(heap.try_update("a", 1));
  assert(heap.version() == version);
  assert(heap.try_update("b", 0));
  assert(heap.peek_min().first == "b");
}

static void test_enqueue_or_update() {
  IndexedHeap<string, int> heap;
  heap.enqueue_or_update("a", 5);
  heap.enqueue_or_update("b", 3);
  heap.enqueue_or_update("a", 1);
  heap.validate();
  assert(heap.size() == 2);
  assert(heap.priority_of("a") == 1);
  assert(!heap.priority_of("c"));
  assert(heap.extract_min() == make_pair(string("a"), 1));
  heap.enqueue_or_update("b", 7);
  assert(heap.extract_min() == make_pair(string("b"), 7));
}

static void test_replace_min() {
  IndexedHeap<string, int> heap = {{"a", 1}, {"b", 3}, {"c", 5}};
  auto ret = heap.replace_min("d", 0);
  assert(ret == make_pair(string("d"), 0));
  assert(!heap.contains("d"));

  ret = heap.replace_min("d", 4);
  assert(ret == make_pair(string("a"), 1));
  assert(!heap.contains("a") && heap.contains("d"));
  assert(heap.size() == 3);
  heap.validate();
  assert(drain(heap) == vector<int>({3, 4, 5}));
}

static void test_clear() {
  IndexedHeap<int, int> heap;
  for (int i = 0; i < 100; ++i) heap.insert(i, 100 - i);
  auto capacity = heap.capacity();
  heap.clear();
  heap.validate();
  assert(heap.empty() && !heap.contains(0) && heap.capacity() == capacity);
  heap.insert(0, 1);
  assert(heap.contains(0));
  heap.trim_excess();
  assert(heap.capacity() == 1);
  heap.validate();
}

static void test_iteration() {
  IndexedHeap<int, int> heap = {{1, 10}, {2, 20}, {3, 30}};
  vector<int> seen;
  for (auto [element, priority] : heap) seen.push_back(element);
  sort(seen.begin(), seen.end());
  assert(seen == vector<int>({1, 2, 3}));

  auto it = heap.begin();
  assert(!heap.try_update(4, 0));
  assert(!heap.try_remove(4));
  // lookups of absent elements don't invalidate it
  assert((*it).first == heap.peek_min().first);

  bool thrown = false;
  try {
    for (auto iter = heap.begin(); iter != heap.end(); ++iter)
      heap.try_update(3, 0);
  } catch (const ConcurrentModification &) {
    thrown = true;
  }
  assert(thrown);
}

struct CaseInsensitiveHash {
  size_t operator()(const string &str) const {
    string lower(str);
    transform(lower.begin(), lower.end(), lower.begin(),
              [](unsigned char c) { return tolower(c); });
    return hash<string>()(lower);
  }
};

struct CaseInsensitiveEqual {
  bool operator()(const string &lhs, const string &rhs) const {
    return lhs.size() == rhs.size() &&
           equal(lhs.begin(), lhs.end(), rhs.begin(),
                 [](unsigned char a, unsigned char b) {
                   return tolower(a) == tolower(b);
                 });
  }
};

static void test_custom_identity() {
  IndexedHeap<string, int, less<int>, 4, CaseInsensitiveHash,
              CaseInsensitiveEqual>
      heap;
  heap.insert("Foo", 2);
  heap.insert("bar", 1);
  assert(heap.contains("FOO") && heap.contains("BAR"));

  bool thrown = false;
  try {
    heap.insert("fOO", 3);
  } catch (const DuplicateElement &) {
    thrown = true;
  }
  assert(thrown);

  assert(heap.try_update("foo", 0));
  assert(heap.peek_min().first == "Foo");
  assert(heap.try_remove("FOO"));
  heap.validate();
  assert(heap.size() == 1);
}

static void test_max_heap() {
  IndexedHeap<int, int, greater<int>, 2> heap(greater<int>{});
  for (auto input : shuffled(64, 3)) heap.insert(input, input);
  heap.validate();
  assert(heap.try_update(-32, 1000));
  assert(heap.extract_min().first == -32);
  assert(heap.extract_min().first == 31);
}

int main() {
  test_beatles();
  test_duplicate();
  test_heap_sort();
  test_remove();
  test_remove_sifts_up();
  test_update();
  test_enqueue_or_update();
  test_replace_min();
  test_clear();
  test_iteration();
  test_custom_identity();
  test_max_heap();
  cout << "test_indexed_heap: all passed" << endl;
  return 0;
}
