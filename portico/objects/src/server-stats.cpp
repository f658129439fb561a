#include "portico/server-stats.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace portico {

std::string ServerStats::json_str() const {
  std::string out;
  out.reserve(384UL);
  out.push_back('{');
  bool first = true;
  for_each_field([&out, &first](std::string_view name, uint64_t value) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    fmt::format_to(std::back_inserter(out), "\"{}\":{}", name, value);
  });
  out.push_back('}');
  return out;
}

}  // namespace portico
