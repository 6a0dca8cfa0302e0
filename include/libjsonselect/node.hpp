#ifndef LIBJSONSELECT_NODE_H
#define LIBJSONSELECT_NODE_H

#include <cstdint>      // std::int64_t
#include <json/json.h>  // Json::Value
#include <string>       // std::string
#include <variant>      // std::variant
#include <vector>       // std::vector

namespace libjsonselect {

// One step from a value to one of its children, either an object member
// name or an array index.
using location_element_t = std::variant<std::string, std::int64_t>;

// The steps from the document root to a node.
using location_t = std::vector<location_element_t>;

// A JSON value found in a document, and where it was found. _value_ points
// into the document passed to the evaluator, which must outlive the node.
struct Node {
  const Json::Value* value{};
  location_t location{};
};

// An ordered list of nodes. Each selector in a path consumes one node list
// and produces the next.
using nodes_t = std::vector<Node>;

// Return the normalized path for _location_, like `$['store'][0]`.
std::string to_normalized_path(const location_t& location);

} // namespace libjsonselect

#endif // LIBJSONSELECT_NODE_H
