#ifndef LIBJSONSELECT_EVALUATE_H
#define LIBJSONSELECT_EVALUATE_H

#include "libjsonselect/node.hpp"
#include "libjsonselect/selectors.hpp"
#include <json/json.h> // Json::Value

namespace libjsonselect {

// Apply each selector in _selectors_ in turn, starting from _document_, and
// return the nodes selected by the last one. Evaluation never fails. A
// selector that does not apply to a node, like an index applied to an object,
// or an index that is out of range, selects nothing from that node.
nodes_t evaluate(const selectors_t& selectors, const Json::Value& document);

// A _union_element_t_ visitor appending nodes selected from a single node.
struct UnionElementVisitor {
  const Node& m_node;
  nodes_t& m_out;

  void operator()(const NameElement& element) const;
  void operator()(const IndexElement& element) const;
  void operator()(const SliceElement& element) const;
};

// A _descendant_target_t_ visitor appending nodes selected from a single node.
// Also used for the same selectors outside of a descendant segment.
struct NodeSelectorVisitor {
  const Node& m_node;
  nodes_t& m_out;

  void operator()(const ChildNameSelector& selector) const;
  void operator()(const WildChildSelector& selector) const;
  void operator()(const WildIndexSelector& selector) const;
  void operator()(const UnionSelector& selector) const;
};

// A _selector_t_ visitor returning the nodes selected from every node in
// _m_nodes_, in order.
struct SelectorVisitor {
  const Json::Value& m_document;
  const nodes_t& m_nodes;

  nodes_t operator()(const RootSelector& selector) const;
  nodes_t operator()(const ChildNameSelector& selector) const;
  nodes_t operator()(const WildChildSelector& selector) const;
  nodes_t operator()(const WildIndexSelector& selector) const;
  nodes_t operator()(const UnionSelector& selector) const;
  nodes_t operator()(const DescendantSelector& selector) const;

private:
  template <typename T> nodes_t select_each(const T& selector) const {
    nodes_t rv{};
    for (const auto& node : m_nodes) {
      NodeSelectorVisitor{node, rv}(selector);
    }
    return rv;
  }
};

} // namespace libjsonselect

#endif // LIBJSONSELECT_EVALUATE_H
