#ifndef DHEAP_OPTIONS_H_
#define DHEAP_OPTIONS_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dheap/ini.h"
#include "dheap/log.h"

namespace dheap {

/**
 * @brief Settings of dheap_bench, read from the [heap], [log] and [bench]
 * sections of an INI document. Missing keys keep their default value.
 */
struct Options {
  /**
   * @brief Capacity of the heaps before the first insertion.
   */
  size_t initial_capacity = 0;

  Logger::Level log_level = Logger::Level::INFO;

  std::string log_file = "dheap_bench.log";

  /**
   * @brief The number of logs written by the writer thread at one time.
   */
  size_t log_write_size = 8;

  /**
   * @brief The numbers of elements to run every workload with.
   */
  std::vector<size_t> sizes = {30, 300, 3000, 30000};

  uint32_t seed = 42;

  std::vector<std::string> workloads = {"heapsort", "bulkload", "update",
                                        "replace"};

  /**
   * @brief The number of runs of a workload, the mean time is reported.
   */
  size_t rounds = 3;

  /**
   * @throw std::invalid_argument If a value is malformed or out of range.
   */
  static Options from_ini(const INI &ini);

  /**
   * @brief Convert the options back into an INI object.
   */
  INI to_ini() const;
};

}  // namespace dheap

#endif
