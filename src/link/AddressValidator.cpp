#include "AddressValidator.hpp"

namespace scanlink {
bool validateAddress(const string& input) {
  if (input.empty()) {
    return false;
  }
  // A trailing dot would be swallowed by split() below
  if (input.back() == '.') {
    return false;
  }
  auto groups = split(input, '.');
  if (groups.size() != 4) {
    return false;
  }
  for (const auto& group : groups) {
    if (group.empty() || group.length() > 3) {
      return false;
    }
    for (char c : group) {
      if (c < '0' || c > '9') {
        return false;
      }
    }
    if (stoi(group) > 255) {
      return false;
    }
  }
  return true;
}

bool validateToken(const string& input) { return !trim(input).empty(); }
}  // namespace scanlink
