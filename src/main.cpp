#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "./bench/workload.hpp"
#include "dheap/ini.h"
#include "dheap/log.h"
#include "dheap/options.h"

using dheap::INI;
using dheap::Logger;
using dheap::Options;

static Options read_config(const std::string &filename, bool &found) {
  found = true;
  INI ini;
  try {
    ini = INI::load(filename);
  } catch (const std::runtime_error &) {
    found = false;
  }
  return Options::from_ini(ini);
}

int main(int argc, char *argv[]) {
  const std::string config = argc > 1 ? argv[1] : "./config.ini";

  Options opts;
  bool found = false;
  try {
    opts = read_config(config, found);
  } catch (const std::exception &e) {
    std::cerr << "Can't parse config file " << config << ": " << e.what()
              << std::endl;
    return EXIT_FAILURE;
  }

  auto &logger = Logger::get_instance();
  logger.set(opts.log_level);
  logger.set(opts.log_write_size);
  if (!logger.open(opts.log_file) || !logger.start()) {
    std::cerr << "Can't open log file " << opts.log_file << std::endl;
    return EXIT_FAILURE;
  }
  if (!found) logger.warn("no config file " + config + ", using defaults");
  logger.info("options:\n" + std::string(opts.to_ini()));

  bool ordered = true;
  std::cout << std::left << std::setw(20) << "workload" << std::right
            << std::setw(10) << "size" << std::setw(16) << "mean (us)"
            << "\n";
  try {
    for (const auto &workload : opts.workloads) {
      for (auto size : opts.sizes) {
        for (const auto &result : dheap::bench::run(workload, size, opts)) {
          std::cout << std::left << std::setw(20) << result.name << std::right
                    << std::setw(10) << result.size << std::setw(16)
                    << std::fixed << std::setprecision(2) << result.mean_us
                    << "\n";
          logger.info(result.name + " size " + std::to_string(result.size) +
                      " mean " + std::to_string(result.mean_us) + " us");
          if (!result.ordered) {
            logger.error(result.name + " size " +
                         std::to_string(result.size) +
                         " extracted priorities out of order");
            ordered = false;
          }
        }
      }
    }
  } catch (const std::exception &e) {
    logger.fatal(e.what());
    logger.flush();
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  logger.flush();
  return ordered ? EXIT_SUCCESS : EXIT_FAILURE;
}
