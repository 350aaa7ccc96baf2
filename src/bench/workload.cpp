#include "./workload.hpp"

#include <chrono>
#include <limits>
#include <random>
#include <stdexcept>
#include <utility>

#include "dheap/heap_store.hpp"
#include "dheap/indexed_heap.hpp"
#include "dheap/log.h"

namespace dheap::bench {

std::vector<int> random_priorities(size_t n, uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, std::numeric_limits<int>::max());
  std::vector<int> ret(n);
  for (auto &priority : ret) priority = dist(gen);
  return ret;
}

/**
 * @brief Extract all the pairs, checking the priorities never decrease.
 */
template <typename Heap>
static bool drain_in_order(Heap &heap) {
  bool ordered = true;
  auto last = std::numeric_limits<int>::min();
  while (auto pair = heap.try_extract_min()) {
    if (pair->second < last) ordered = false;
    last = pair->second;
  }
  return ordered;
}

bool heapsort_store(const std::vector<int> &priorities, size_t capacity) {
  HeapStore<int, int> heap(capacity);
  for (size_t i = 0; i < priorities.size(); ++i)
    heap.insert(static_cast<int>(i), priorities[i]);
  return drain_in_order(heap);
}

bool heapsort_indexed(const std::vector<int> &priorities, size_t capacity) {
  IndexedHeap<int, int> heap(capacity);
  for (size_t i = 0; i < priorities.size(); ++i)
    heap.insert(static_cast<int>(i), priorities[i]);
  return drain_in_order(heap);
}

static std::vector<std::pair<int, int>> numbered(
    const std::vector<int> &priorities) {
  std::vector<std::pair<int, int>> pairs;
  pairs.reserve(priorities.size());
  for (size_t i = 0; i < priorities.size(); ++i)
    pairs.emplace_back(static_cast<int>(i), priorities[i]);
  return pairs;
}

bool bulkload_store(const std::vector<int> &priorities, size_t capacity) {
  auto pairs = numbered(priorities);
  HeapStore<int, int> heap(capacity);
  heap.bulk_load(pairs.begin(), pairs.end());
  return drain_in_order(heap);
}

bool bulkload_indexed(const std::vector<int> &priorities, size_t capacity) {
  auto pairs = numbered(priorities);
  IndexedHeap<int, int> heap(capacity);
  heap.bulk_load(pairs.begin(), pairs.end());
  return drain_in_order(heap);
}

bool update_indexed(const std::vector<int> &priorities, size_t capacity) {
  IndexedHeap<int, int> heap(capacity);
  for (size_t i = 0; i < priorities.size(); ++i)
    heap.insert(static_cast<int>(i), priorities[i]);
  for (size_t i = 0; i < priorities.size(); ++i) {
    if (!heap.try_update(static_cast<int>(i), -priorities[i])) return false;
  }
  return drain_in_order(heap);
}

bool replace_store(const std::vector<int> &priorities, size_t capacity) {
  HeapStore<int, int> heap(capacity);
  const auto half = priorities.size() / 2;
  for (size_t i = 0; i < half; ++i)
    heap.insert(static_cast<int>(i), priorities[i]);
  bool ordered = true;
  for (size_t i = half; i < priorities.size(); ++i) {
    auto replaced = heap.replace_min(static_cast<int>(i), priorities[i]);
    // the returned pair never follows the remaining minimum
    if (!heap.empty() && heap.peek_min().second < replaced.second)
      ordered = false;
  }
  return drain_in_order(heap) && ordered;
}

std::vector<std::pair<std::string, Workload>> variants(
    const std::string &workload) {
  if (workload == "heapsort")
    return {{"heapsort/store", heapsort_store},
            {"heapsort/indexed", heapsort_indexed}};
  if (workload == "bulkload")
    return {{"bulkload/store", bulkload_store},
            {"bulkload/indexed", bulkload_indexed}};
  if (workload == "update") return {{"update/indexed", update_indexed}};
  if (workload == "replace") return {{"replace/store", replace_store}};
  throw std::invalid_argument("bench: unknown workload \"" + workload + "\"");
}

std::vector<Result> run(const std::string &workload, size_t size,
                        const Options &opts) {
  using clock = std::chrono::steady_clock;
  auto &logger = Logger::get_instance();
  const auto priorities = random_priorities(size, opts.seed);

  std::vector<Result> results;
  for (auto &[name, fn] : variants(workload)) {
    Result result{name, size, 0, true};
    clock::duration total = clock::duration::zero();
    for (size_t round = 0; round < opts.rounds; ++round) {
      auto start = clock::now();
      result.ordered = fn(priorities, opts.initial_capacity) && result.ordered;
      total += clock::now() - start;
    }
    result.mean_us =
        std::chrono::duration<double, std::micro>(total).count() / opts.rounds;
    logger.debug(name + " size " + std::to_string(size) + ": " +
                 std::to_string(result.mean_us) + " us");
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace dheap::bench
