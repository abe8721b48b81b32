#pragma once

#include <set>
#include <string>

namespace localrun::util {

// Comma separated, in set order.
inline std::string Join(const std::set<std::string>& names) {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += name;
  }
  return joined;
}

} // namespace localrun::util
