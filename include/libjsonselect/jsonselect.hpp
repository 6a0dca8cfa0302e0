#ifndef LIBJSONSELECT_JSONSELECT_H
#define LIBJSONSELECT_JSONSELECT_H

#include "libjsonselect/config.hpp"
#include "libjsonselect/node.hpp"
#include "libjsonselect/parse.hpp"
#include "libjsonselect/selectors.hpp"
#include <json/json.h> // Json::Value
#include <string>
#include <string_view>

namespace libjsonselect {

// libjsonselect version number.
inline constexpr std::string_view VERSION{LIBJSONSELECT_VERSION};

// Return the sequence of selectors making up path _s_. The first selector is
// always a RootSelector. Throws a SyntaxError if _s_ is not a valid path.
//
// Selectors hold tokens viewing _s_, so _s_ must outlive the result if those
// tokens are to be inspected.
//
// See libjsonselect::selectors.hpp for selector definitions.
selectors_t parse(std::string_view s);

// Return a canonical string representation of a sequence of selectors.
std::string to_string(const selectors_t& path);

// Return the nodes in _document_ matched by _path_, in order.
nodes_t query(const selectors_t& path, const Json::Value& document);

// Parse _path_ and return the nodes it matches in _document_. Throws a
// SyntaxError if _path_ is not a valid path.
nodes_t query(std::string_view path, const Json::Value& document);

// Parse _path_ and return a copy of each value it matches in _document_, as
// a JSON array.
Json::Value find(std::string_view path, const Json::Value& document);

// A _union_element_t_ visitor returning the canonical representation of a
// name, index or slice.
struct UnionElementToStringVisitor {
  std::string operator()(const NameElement& element) const;
  std::string operator()(const IndexElement& element) const;
  std::string operator()(const SliceElement& element) const;
};

// A _selector_t_ visitor returning a string representation of the selector
// held by the variant. Shorthand selectors are replaced with their bracketed
// equivalents.
struct SelectorToStringVisitor {
  std::string operator()(const RootSelector& selector) const;
  std::string operator()(const ChildNameSelector& selector) const;
  std::string operator()(const WildChildSelector& selector) const;
  std::string operator()(const WildIndexSelector& selector) const;
  std::string operator()(const UnionSelector& selector) const;
  std::string operator()(const DescendantSelector& selector) const;
};

} // namespace libjsonselect

#endif // LIBJSONSELECT_JSONSELECT_H
