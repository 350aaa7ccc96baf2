#include "dheap/options.h"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <type_traits>

#include "dheap/utils/string.h"

namespace dheap {

static const std::vector<std::string> known_workloads = {
    "heapsort", "bulkload", "update", "replace"};

/**
 * @brief Parse the whole str as an unsigned integer.
 */
template <typename T>
static T parse_unsigned(const std::string &section, const std::string &key,
                        const std::string &str) {
  T value{};
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (str.empty() || ec != std::errc() || ptr != str.data() + str.size())
    throw std::invalid_argument("Options: [" + section + "] " + key + " = \"" +
                                str + "\" is not an unsigned integer");
  return value;
}

template <typename T>
static std::string join(const std::vector<T> &values) {
  std::string ret;
  for (const auto &value : values) {
    if (!ret.empty()) ret += ',';
    if constexpr (std::is_arithmetic_v<T>)
      ret += std::to_string(value);
    else
      ret += value;
  }
  return ret;
}

Options Options::from_ini(const INI &ini) {
  Options opts;

  if (ini.has("heap", "initial_capacity"))
    opts.initial_capacity = parse_unsigned<size_t>(
        "heap", "initial_capacity", ini.get("heap", "initial_capacity"));

  if (ini.has("log", "level")) {
    auto level = ini.get("log", "level");
    if (!Logger::parse(level, opts.log_level))
      throw std::invalid_argument("Options: [log] level = \"" + level +
                                  "\" is not a log level");
  }
  opts.log_file = ini.get("log", "file", opts.log_file);
  if (opts.log_file.empty())
    throw std::invalid_argument("Options: [log] file is empty");
  if (ini.has("log", "write_size")) {
    opts.log_write_size = parse_unsigned<size_t>(
        "log", "write_size", ini.get("log", "write_size"));
    if (opts.log_write_size == 0)
      throw std::invalid_argument("Options: [log] write_size must be positive");
  }

  if (ini.has("bench", "sizes")) {
    opts.sizes.clear();
    for (const auto &size : utils::split(ini.get("bench", "sizes"), ','))
      opts.sizes.push_back(parse_unsigned<size_t>("bench", "sizes", size));
  }
  if (ini.has("bench", "seed"))
    opts.seed =
        parse_unsigned<uint32_t>("bench", "seed", ini.get("bench", "seed"));
  if (ini.has("bench", "workloads")) {
    opts.workloads.clear();
    for (auto &name : utils::split(ini.get("bench", "workloads"), ',')) {
      utils::tolower(name);
      if (std::find(known_workloads.begin(), known_workloads.end(), name) ==
          known_workloads.end())
        throw std::invalid_argument("Options: [bench] workloads: unknown \"" +
                                    name + "\"");
      opts.workloads.push_back(std::move(name));
    }
  }
  if (ini.has("bench", "rounds")) {
    opts.rounds =
        parse_unsigned<size_t>("bench", "rounds", ini.get("bench", "rounds"));
    if (opts.rounds == 0)
      throw std::invalid_argument("Options: [bench] rounds must be positive");
  }
  return opts;
}

INI Options::to_ini() const {
  INI ini;
  ini.set("heap", "initial_capacity", std::to_string(initial_capacity));
  ini.set("log", "level", utils::tolower(Logger::to_string(log_level)));
  ini.set("log", "file", log_file);
  ini.set("log", "write_size", std::to_string(log_write_size));
  ini.set("bench", "sizes", join(sizes));
  ini.set("bench", "seed", std::to_string(seed));
  ini.set("bench", "workloads", join(workloads));
  ini.set("bench", "rounds", std::to_string(rounds));
  return ini;
}

}  // namespace dheap
