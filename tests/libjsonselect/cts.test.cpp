#include "libjsonselect/exceptions.hpp" // libjsonselect::SyntaxError
#include "libjsonselect/jsonselect.hpp" // libjsonselect::parse libjsonselect::find
#include <fstream>                      // std::ifstream
#include <gtest/gtest.h>                // EXPEXT_* TEST_F testing::Test
#include <json/json.h>                  // Json::Value Json::parseFromStream
#include <string>                       // std::string

#ifndef CTS_PATH
#define CTS_PATH "tests/cts.json"
#endif

// Runs every case in the compliance suite. A suite with one or more cases
// marked "focus" runs only those cases, then fails, so a focused suite can't
// pass unnoticed.
class ComplianceTest : public testing::Test {
protected:
  static void SetUpTestSuite() {
    std::ifstream stream{CTS_PATH};
    ASSERT_TRUE(stream.is_open()) << "can't open " << CTS_PATH;

    Json::CharReaderBuilder builder{};
    std::string errors{};
    ASSERT_TRUE(Json::parseFromStream(builder, stream, &s_suite, &errors))
        << errors;
  }

  static bool is_focused(const Json::Value& test_case) {
    return test_case.get("focus", false).asBool();
  }

  static bool has_focused(const Json::Value& tests) {
    for (const auto& test_case : tests) {
      if (is_focused(test_case)) {
        return true;
      }
    }
    return false;
  }

  void run_case(const Json::Value& test_case) {
    const auto name{test_case["name"].asString()};
    const auto selector{test_case["selector"].asString()};
    SCOPED_TRACE(name);

    if (test_case.get("invalid_selector", false).asBool()) {
      EXPECT_THROW(libjsonselect::parse(selector), libjsonselect::SyntaxError)
          << selector << " should have failed to parse";
      return;
    }

    Json::Value result{};
    try {
      result = libjsonselect::find(selector, test_case["document"]);
    } catch (const libjsonselect::SyntaxError& e) {
      ADD_FAILURE() << selector << " should have parsed: " << e.what();
      return;
    }

    EXPECT_EQ(result, test_case["result"]) << selector;
  }

  static inline Json::Value s_suite{};
};

TEST_F(ComplianceTest, Suite) {
  const auto& tests{s_suite["tests"]};
  ASSERT_TRUE(tests.isArray());
  ASSERT_GT(tests.size(), 0u);

  const auto focused{has_focused(tests)};
  for (const auto& test_case : tests) {
    if (focused && !is_focused(test_case)) {
      continue;
    }
    run_case(test_case);
  }

  EXPECT_FALSE(focused) << "test case(s) still focused";
}

TEST_F(ComplianceTest, FocusDetection) {
  Json::Value tests{Json::arrayValue};
  tests.append(Json::Value{Json::objectValue});
  EXPECT_FALSE(has_focused(tests));

  Json::Value focused_case{Json::objectValue};
  focused_case["focus"] = true;
  tests.append(focused_case);
  EXPECT_TRUE(has_focused(tests));
}
