#include "libjsonselect/exceptions.hpp"
#include "libjsonselect/jsonselect.hpp"
#include <fstream>
#include <iostream>
#include <json/json.h>
#include <string>

namespace {

// Read a JSON document from _filename_, or from standard input if _filename_
// is "-".
bool read_document(
    const std::string& filename, Json::Value& document, std::string& errors) {
  Json::CharReaderBuilder builder{};

  if (filename == "-") {
    return Json::parseFromStream(builder, std::cin, &document, &errors);
  }

  std::ifstream stream{filename};
  if (!stream) {
    errors = "can't open '" + filename + "'";
    return false;
  }

  return Json::parseFromStream(builder, stream, &document, &errors);
}

} // namespace

int main(int argc, const char* argv[]) {
  if (argc < 2 || argc > 3) {
    std::cout << argv[0] << " Version " << libjsonselect::VERSION << std::endl;
    std::cout << "Usage: " << argv[0] << " <path> [<file.json> | -]"
              << std::endl;
    return 1;
  }

  const std::string path{argv[1]};
  libjsonselect::selectors_t selectors{};

  try {
    selectors = libjsonselect::parse(path);
  } catch (const libjsonselect::SyntaxError& e) {
    std::cerr << "syntax error: " << e.what() << std::endl;
    return 2;
  }

  std::cout << libjsonselect::to_string(selectors) << std::endl;

  if (argc == 2) {
    return 0;
  }

  Json::Value document{};
  std::string errors{};
  if (!read_document(argv[2], document, errors)) {
    std::cerr << "invalid JSON document: " << errors << std::endl;
    return 3;
  }

  Json::StreamWriterBuilder writer{};
  writer["indentation"] = "";

  for (const auto& node : libjsonselect::query(selectors, document)) {
    std::cout << libjsonselect::to_normalized_path(node.location) << " "
              << Json::writeString(writer, *node.value) << std::endl;
  }

  return 0;
}
