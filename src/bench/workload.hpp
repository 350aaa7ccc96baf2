#ifndef DHEAP_BENCH_WORKLOAD_H_
#define DHEAP_BENCH_WORKLOAD_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "dheap/options.h"

namespace dheap::bench {

/**
 * @brief One run of a workload over the priorities.
 * @return Return false if the heap yielded the pairs out of order.
 */
using Workload =
    std::function<bool(const std::vector<int> &priorities, size_t capacity)>;

struct Result {
  std::string name;
  size_t size;
  /**
   * @brief Mean time of a run in microseconds.
   */
  double mean_us;
  bool ordered;
};

/**
 * @brief Pseudo-random non-negative priorities, the same for the same seed.
 */
std::vector<int> random_priorities(size_t n, uint32_t seed);

bool heapsort_store(const std::vector<int> &priorities, size_t capacity);

bool heapsort_indexed(const std::vector<int> &priorities, size_t capacity);

bool bulkload_store(const std::vector<int> &priorities, size_t capacity);

bool bulkload_indexed(const std::vector<int> &priorities, size_t capacity);

bool update_indexed(const std::vector<int> &priorities, size_t capacity);

bool replace_store(const std::vector<int> &priorities, size_t capacity);

/**
 * @brief The named variants of a workload of Options::workloads.
 * @throw std::invalid_argument If the workload is unknown.
 */
std::vector<std::pair<std::string, Workload>> variants(
    const std::string &workload);

/**
 * @brief Run every variant of workload opts.rounds times on size priorities.
 */
std::vector<Result> run(const std::string &workload, size_t size,
                        const Options &opts);

}  // namespace dheap::bench

#endif
