#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dheap/ini.h"
#include "dheap/log.h"
#include "dheap/options.h"

using namespace std;
using dheap::INI;
using dheap::Logger;
using dheap::Options;

static bool rejected(const string &content) {
  try {
    Options::from_ini(INI::parse(content));
  } catch (const invalid_argument &) {
    return true;
  }
  return false;
}

static void test_defaults() {
  auto opts = Options::from_ini(INI());
  assert(opts.initial_capacity == 0);
  assert(opts.log_level == Logger::Level::INFO);
  assert(opts.log_file == "dheap_bench.log");
  assert(opts.log_write_size == 8);
  assert(opts.sizes == vector<size_t>({30, 300, 3000, 30000}));
  assert(opts.seed == 42);
  assert(opts.workloads.size() == 4);
  assert(opts.rounds == 3);
}

static void test_parse() {
  auto opts = Options::from_ini(
      INI::parse("[heap]\n"
                 "initial_capacity = 64\n"
                 "[log]\n"
                 "level = Debug\n"
                 "file = /tmp/bench.log\n"
                 "[bench]\n"
                 "sizes = 10, ,20\n"
                 "seed = 7\n"
                 "workloads = Update, heapsort\n"
                 "rounds = 1\n"));
  assert(opts.initial_capacity == 64);
  assert(opts.log_level == Logger::Level::DEBUG);
  assert(opts.log_file == "/tmp/bench.log");
  assert(opts.log_write_size == 8);
  assert(opts.sizes == vector<size_t>({10, 20}));
  assert(opts.seed == 7);
  assert(opts.workloads == vector<string>({"update", "heapsort"}));
  assert(opts.rounds == 1);
}

static void test_rejected() {
  assert(rejected("[log]\nlevel = verbose\n"));
  assert(rejected("[log]\nfile =\n"));
  assert(rejected("[log]\nwrite_size = 0\n"));
  assert(rejected("[heap]\ninitial_capacity = -1\n"));
  assert(rejected("[heap]\ninitial_capacity = 12kb\n"));
  assert(rejected("[bench]\nsizes = 10,x\n"));
  assert(rejected("[bench]\nseed = 99999999999\n"));
  assert(rejected("[bench]\nworkloads = heapsort, shuffle\n"));
  assert(rejected("[bench]\nrounds = 0\n"));
  assert(!rejected("[other]\nkey = value\n"));
}

static void test_to_ini() {
  Options opts;
  opts.initial_capacity = 5;
  opts.log_level = Logger::Level::WARN;
  opts.sizes = {1, 2};
  opts.workloads = {"replace"};
  auto ini = opts.to_ini();
  assert(ini.get("log", "level") == "warn");
  assert(ini.get("bench", "sizes") == "1,2");

  auto parsed = Options::from_ini(INI::parse(string(ini)));
  assert(parsed.initial_capacity == 5);
  assert(parsed.log_level == Logger::Level::WARN);
  assert(parsed.sizes == opts.sizes);
  assert(parsed.workloads == opts.workloads);
  assert(parsed.seed == opts.seed && parsed.rounds == opts.rounds);
}

int main() {
  test_defaults();
  test_parse();
  test_rejected();
  test_to_ini();
  cout << "test_options: all passed" << endl;
  return 0;
}
