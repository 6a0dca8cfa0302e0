#ifndef LIBJSONSELECT_SELECTORS_H
#define LIBJSONSELECT_SELECTORS_H

#include "libjsonselect/tokens.hpp" // Token
#include <cstdint>                  // std::int64_t
#include <optional>                 // std::optional
#include <string>                   // std::string
#include <variant>                  // std::variant
#include <vector>                   // std::vector

namespace libjsonselect {

// The mandatory leading `$`. Selects the document itself.
struct RootSelector {
  Token token{};
};

// A dot-accessed member name, like `.thing`.
struct ChildNameSelector {
  Token token{};
  std::string name{};
};

// `.*`, every member value of an object or every element of an array.
struct WildChildSelector {
  Token token{};
};

// `[*]`, same as WildChildSelector.
struct WildIndexSelector {
  Token token{};
};

// A quoted name inside a union, with escape sequences decoded.
struct NameElement {
  Token token{};
  std::string name{};
};

struct IndexElement {
  Token token{};
  std::int64_t index{};
};

struct SliceElement {
  Token token{};
  std::optional<std::int64_t> start{};
  std::optional<std::int64_t> stop{};
  std::optional<std::int64_t> step{};
};

using union_element_t = std::variant<NameElement, IndexElement, SliceElement>;

// A bracketed, comma separated list of names, indices and slices.
struct UnionSelector {
  Token token{};
  std::vector<union_element_t> elements{};
};

using descendant_target_t = std::variant<ChildNameSelector, WildChildSelector,
    WildIndexSelector, UnionSelector>;

// `..` followed by a child name, a wildcard or a union. The target is applied
// to every node in the subtree rooted at each input node, itself included.
struct DescendantSelector {
  Token token{};
  descendant_target_t target{};
};

using selector_t = std::variant<RootSelector, ChildNameSelector,
    WildChildSelector, WildIndexSelector, UnionSelector, DescendantSelector>;

// A parsed path. The first selector is always a RootSelector.
using selectors_t = std::vector<selector_t>;

} // namespace libjsonselect

#endif // LIBJSONSELECT_SELECTORS_H
