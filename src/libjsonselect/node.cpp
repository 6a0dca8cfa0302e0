#include "libjsonselect/node.hpp"
#include "libjsonselect/utils.hpp" // libjsonselect::quote_name
#include <variant>                 // std::visit

namespace libjsonselect {

namespace {
struct LocationElementToStringVisitor {
  std::string operator()(const std::string& name) const {
    return "[" + quote_name(name) + "]";
  }

  std::string operator()(std::int64_t index) const {
    return "[" + std::to_string(index) + "]";
  }
};
} // namespace

std::string to_normalized_path(const location_t& location) {
  std::string rv{"$"};
  for (const auto& element : location) {
    rv += std::visit(LocationElementToStringVisitor(), element);
  }
  return rv;
}

} // namespace libjsonselect
