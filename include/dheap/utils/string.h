#ifndef DHEAP_UTILS_STRING_H_
#define DHEAP_UTILS_STRING_H_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "dheap/utils/sv.h"

namespace dheap::utils {

inline std::string& tolower(std::string& str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

inline std::string tolower(const std::string& str) {
  auto ret = str;
  return tolower(ret);
}

inline std::string tolower(std::string&& str) {
  auto ret = std::move(str);
  return tolower(ret);
}

/**
 * @brief Split str by delim, trim every piece and skip the empty ones.
 * @example split(" 1, 2,,3 ", ',') returns {"1", "2", "3"}
 */
inline std::vector<std::string> split(std::string_view str, char delim) {
  std::vector<std::string> ret;
  for (std::string_view piece; !str.empty();) {
    getline(str, piece, delim);
    if (piece = trim(piece); !piece.empty()) ret.emplace_back(piece);
  }
  return ret;
}

}  // namespace dheap::utils

#endif
