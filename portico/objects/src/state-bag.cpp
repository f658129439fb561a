#include "portico/state-bag.hpp"

#include <string_view>

namespace portico {

bool StateBag::erase(std::string_view key) {
  auto it = _values.find(key);
  if (it == _values.end()) {
    return false;
  }
  _values.erase(it);
  return true;
}

}  // namespace portico
