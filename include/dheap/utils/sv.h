#ifndef DHEAP_UTILS_SV_H_
#define DHEAP_UTILS_SV_H_

#include <algorithm>
#include <cctype>
#include <string_view>

namespace dheap::utils {

inline std::string_view ltrim(std::string_view str) {
  auto it = std::find_if(str.begin(), str.end(),
                         [](unsigned char ch) { return !std::isspace(ch); });
  return str.substr(it - str.begin());
}

inline std::string_view rtrim(std::string_view str) {
  auto riter = std::find_if(str.rbegin(), str.rend(),
                            [](unsigned char ch) { return !std::isspace(ch); });
  return str.substr(0, str.rend() - riter);
}

inline std::string_view trim(std::string_view str) { return rtrim(ltrim(str)); }

/**
 * @brief Cut the text before the first delim out of input.
 * @note input becomes empty after its last piece has been taken.
 */
inline std::string_view &getline(std::string_view &input, std::string_view &str,
                                 char delim) {
  auto pos = input.find(delim);
  str = input.substr(0, pos);
  if (pos == std::string_view::npos)
    input = {};
  else
    input.remove_prefix(pos + 1);
  return input;
}

}  // namespace dheap::utils

#endif
