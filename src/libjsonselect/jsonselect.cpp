#include "libjsonselect/jsonselect.hpp"
#include "libjsonselect/evaluate.hpp" // libjsonselect::evaluate
#include "libjsonselect/parse.hpp"    // libjsonselect::Parser
#include "libjsonselect/utils.hpp"    // libjsonselect::quote_name
#include <string>                     // std::string
#include <variant>                    // std::visit

namespace libjsonselect {

selectors_t parse(std::string_view s) {
  Parser parser{};
  return parser.parse(s);
}

std::string to_string(const selectors_t& path) {
  std::string rv{};
  for (const auto& selector : path) {
    rv += std::visit(SelectorToStringVisitor(), selector);
  }
  return rv;
}

nodes_t query(const selectors_t& path, const Json::Value& document) {
  return evaluate(path, document);
}

nodes_t query(std::string_view path, const Json::Value& document) {
  return evaluate(parse(path), document);
}

Json::Value find(std::string_view path, const Json::Value& document) {
  Json::Value rv{Json::arrayValue};
  for (const auto& node : query(path, document)) {
    rv.append(*node.value);
  }
  return rv;
}

std::string UnionElementToStringVisitor::operator()(
    const NameElement& element) const {
  return quote_name(element.name);
}

std::string UnionElementToStringVisitor::operator()(
    const IndexElement& element) const {
  return std::to_string(element.index);
}

std::string UnionElementToStringVisitor::operator()(
    const SliceElement& element) const {
  return (element.start ? std::to_string(element.start.value()) : "") + ":" +
         (element.stop ? std::to_string(element.stop.value()) : "") + ":" +
         (element.step ? std::to_string(element.step.value()) : "1");
}

std::string SelectorToStringVisitor::operator()(const RootSelector&) const {
  return "$";
}

std::string SelectorToStringVisitor::operator()(
    const ChildNameSelector& selector) const {
  return "[" + quote_name(selector.name) + "]";
}

std::string SelectorToStringVisitor::operator()(
    const WildChildSelector&) const {
  return "[*]";
}

std::string SelectorToStringVisitor::operator()(
    const WildIndexSelector&) const {
  return "[*]";
}

std::string SelectorToStringVisitor::operator()(
    const UnionSelector& selector) const {
  std::string rv{"["};
  for (const auto& element : selector.elements) {
    rv += std::visit(UnionElementToStringVisitor(), element);
    rv += ", ";
  }
  rv.erase(rv.end() - 2, rv.end()); // remove the trailing comma and space
  rv += "]";
  return rv;
}

std::string SelectorToStringVisitor::operator()(
    const DescendantSelector& selector) const {
  return ".." + std::visit(SelectorToStringVisitor(), selector.target);
}

} // namespace libjsonselect
