#include "libjsonselect/evaluate.hpp"
#include <algorithm> // std::clamp
#include <cstdint>   // std::int64_t
#include <utility>   // std::move
#include <variant>   // std::visit

namespace libjsonselect {

namespace {

Node child_node(
    const Node& parent, const Json::Value& value, location_element_t step) {
  Node node{&value, parent.location};
  node.location.push_back(std::move(step));
  return node;
}

// Append every element of an array node, or every member value of an object
// node. Object members come in the order the document model stores them.
void select_children(const Node& node, nodes_t& out) {
  const auto& value{*node.value};

  if (value.isArray()) {
    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
      out.push_back(child_node(node, value[i], static_cast<std::int64_t>(i)));
    }
  } else if (value.isObject()) {
    for (auto it = value.begin(); it != value.end(); it++) {
      out.push_back(child_node(node, *it, it.name()));
    }
  }
}

void select_name(const Node& node, const std::string& name, nodes_t& out) {
  if (!node.value->isObject()) {
    return;
  }

  const auto* member{node.value->find(name.data(), name.data() + name.size())};
  if (member) {
    out.push_back(child_node(node, *member, name));
  }
}

void select_index(const Node& node, std::int64_t index, nodes_t& out) {
  if (!node.value->isArray()) {
    return;
  }

  const auto length{static_cast<std::int64_t>(node.value->size())};
  const auto normalized{index >= 0 ? index : length + index};

  if (normalized >= 0 && normalized < length) {
    out.push_back(child_node(node,
        (*node.value)[static_cast<Json::ArrayIndex>(normalized)], normalized));
  }
}

void select_slice(const Node& node, const SliceElement& slice, nodes_t& out) {
  if (!node.value->isArray()) {
    return;
  }

  const auto step{slice.step.value_or(1)};
  if (step == 0) {
    return;
  }

  const auto& array{*node.value};
  const auto length{static_cast<std::int64_t>(array.size())};
  const auto normalize = [length](std::int64_t i) {
    return i >= 0 ? i : length + i;
  };

  if (step > 0) {
    const auto lower{slice.start ? std::clamp<std::int64_t>(
                                       normalize(*slice.start), 0, length)
                                 : std::int64_t{0}};
    const auto upper{slice.stop ? std::clamp<std::int64_t>(
                                      normalize(*slice.stop), 0, length)
                                : length};

    for (auto i{lower}; i < upper; i += step) {
      out.push_back(
          child_node(node, array[static_cast<Json::ArrayIndex>(i)], i));
      if (step >= upper - i) {
        break;
      }
    }
  } else {
    const auto upper{slice.start ? std::clamp<std::int64_t>(
                                       normalize(*slice.start), -1, length - 1)
                                 : length - 1};
    const auto lower{slice.stop ? std::clamp<std::int64_t>(
                                      normalize(*slice.stop), -1, length - 1)
                                : std::int64_t{-1}};

    // i is never negative inside the loop, so i + step can not overflow.
    for (auto i{upper}; i > lower; i += step) {
      out.push_back(
          child_node(node, array[static_cast<Json::ArrayIndex>(i)], i));
      if (i + step <= lower) {
        break;
      }
    }
  }
}

// Apply _target_ to _node_ and then to each of its descendants, depth first,
// visiting object members and array elements in order.
void descend(const Node& node, const descendant_target_t& target, nodes_t& out) {
  std::visit(NodeSelectorVisitor{node, out}, target);

  nodes_t children{};
  select_children(node, children);
  for (const auto& child : children) {
    descend(child, target, out);
  }
}

} // namespace

nodes_t evaluate(const selectors_t& selectors, const Json::Value& document) {
  nodes_t nodes{};
  for (const auto& selector : selectors) {
    nodes = std::visit(SelectorVisitor{document, nodes}, selector);
  }
  return nodes;
}

void UnionElementVisitor::operator()(const NameElement& element) const {
  select_name(m_node, element.name, m_out);
}

void UnionElementVisitor::operator()(const IndexElement& element) const {
  select_index(m_node, element.index, m_out);
}

void UnionElementVisitor::operator()(const SliceElement& element) const {
  select_slice(m_node, element, m_out);
}

void NodeSelectorVisitor::operator()(const ChildNameSelector& selector) const {
  select_name(m_node, selector.name, m_out);
}

void NodeSelectorVisitor::operator()(const WildChildSelector&) const {
  select_children(m_node, m_out);
}

void NodeSelectorVisitor::operator()(const WildIndexSelector&) const {
  select_children(m_node, m_out);
}

void NodeSelectorVisitor::operator()(const UnionSelector& selector) const {
  for (const auto& element : selector.elements) {
    std::visit(UnionElementVisitor{m_node, m_out}, element);
  }
}

nodes_t SelectorVisitor::operator()(const RootSelector&) const {
  return nodes_t{Node{&m_document, {}}};
}

nodes_t SelectorVisitor::operator()(const ChildNameSelector& selector) const {
  return select_each(selector);
}

nodes_t SelectorVisitor::operator()(const WildChildSelector& selector) const {
  return select_each(selector);
}

nodes_t SelectorVisitor::operator()(const WildIndexSelector& selector) const {
  return select_each(selector);
}

nodes_t SelectorVisitor::operator()(const UnionSelector& selector) const {
  return select_each(selector);
}

nodes_t SelectorVisitor::operator()(const DescendantSelector& selector) const {
  nodes_t rv{};
  for (const auto& node : m_nodes) {
    descend(node, selector.target, rv);
  }
  return rv;
}

} // namespace libjsonselect
