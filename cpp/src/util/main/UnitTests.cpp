#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

TEST(BoostUtil, pretty_print) {
  boost::json::value jv = boost::json::parse(R"({"b": [1, 2], "a": {"x": null, "y": []}})");

  std::ostringstream ss;
  boost_util::pretty_print(ss, jv);

  std::string expected =
    "{\n"
    "  \"a\": {\n"
    "    \"x\": null,\n"
    "    \"y\": []\n"
    "  },\n"
    "  \"b\": [1, 2]\n"
    "}";
  EXPECT_EQ(ss.str(), expected);
}

TEST(BoostUtil, pretty_print_nested_array) {
  boost::json::value jv = boost::json::parse(R"([{"take": "Any"}, {}])");

  std::ostringstream ss;
  boost_util::pretty_print(ss, jv);

  std::string expected =
    "[\n"
    "  {\n"
    "    \"take\": \"Any\"\n"
    "  },\n"
    "  {}\n"
    "]";
  EXPECT_EQ(ss.str(), expected);
}

TEST(BoostUtil, read_json_file_missing) {
  EXPECT_THROW(boost_util::read_json_file("/nonexistent/rules.json"), util::CleanException);
}

TEST(BoostUtil, parse_args) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int height = 0;
  bool verbose = false;
  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"height", 'H'>(po::value<int>(&height), "height")
                .template add_flag<"verbose", "quiet">(&verbose, "verbose", "quiet");

  std::vector<std::string> args = {"--height", "7", "--verbose"};
  po2::parse_args(desc, args);
  EXPECT_EQ(height, 7);
  EXPECT_TRUE(verbose);

  std::vector<std::string> bad_args = {"--no-such-option"};
  EXPECT_THROW(po2::parse_args(desc, bad_args), util::CleanException);
}

TEST(Logging, params) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params params;
  std::vector<std::string> args = {"--log-level", "debug", "--omit-timestamps"};
  po2::parse_args(params.make_options_description(), args);
  EXPECT_EQ(params.log_level, "debug");
  EXPECT_TRUE(params.omit_timestamps);
  EXPECT_TRUE(params.log_filename.empty());
  EXPECT_NO_THROW(util::Logging::init(params));

  params.log_level = "loud";
  EXPECT_THROW(util::Logging::init(params), util::CleanException);
}

TEST(StringUtil, split) {
  std::vector<std::string> result1 = util::split("a,b,c", ",");
  std::vector<std::string> result2 = util::split(" a \tb   c ");

  EXPECT_EQ(result1.size(), 3);
  EXPECT_EQ(result1[0], "a");
  EXPECT_EQ(result1[1], "b");
  EXPECT_EQ(result1[2], "c");

  EXPECT_EQ(result2.size(), 3);
  EXPECT_EQ(result2[0], "a");
  EXPECT_EQ(result2[1], "b");
  EXPECT_EQ(result2[2], "c");

  std::vector<std::string> result3;
  int n3;
  n3 = util::split(result3, "a,bb,ccc", ",");

  EXPECT_EQ(n3, 3);
  EXPECT_EQ(result3.size(), 3);
  EXPECT_EQ(result3[0], "a");
  EXPECT_EQ(result3[1], "bb");
  EXPECT_EQ(result3[2], "ccc");

  n3 = util::split(result3, "\t\taa  b\n");

  // vector reuse - leave 3rd element unchanged!
  EXPECT_EQ(n3, 2);
  EXPECT_EQ(result3.size(), 3);
  EXPECT_EQ(result3[0], "aa");
  EXPECT_EQ(result3[1], "b");
  EXPECT_EQ(result3[2], "ccc");
}

TEST(StringUtil, atou64_safe) {
  EXPECT_EQ(util::atou64_safe("0"), 0);
  EXPECT_EQ(util::atou64_safe("42"), 42);
  EXPECT_EQ(util::atou64_safe("18446744073709551615"), UINT64_MAX);

  EXPECT_THROW(util::atou64_safe(""), util::CleanException);
  EXPECT_THROW(util::atou64_safe("-1"), util::CleanException);
  EXPECT_THROW(util::atou64_safe("3x"), util::CleanException);
  EXPECT_THROW(util::atou64_safe("18446744073709551616"), util::CleanException);
}

TEST(StringUtil, parse_uint64_list) {
  EXPECT_EQ(util::parse_uint64_list("1,2, 3"), (std::vector<uint64_t>{1, 2, 3}));
  EXPECT_EQ(util::parse_uint64_list("4 5"), (std::vector<uint64_t>{4, 5}));
  EXPECT_EQ(util::parse_uint64_list(",,7,"), (std::vector<uint64_t>{7}));
  EXPECT_TRUE(util::parse_uint64_list("").empty());

  EXPECT_THROW(util::parse_uint64_list("1,a"), util::CleanException);
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    RELEASE_ASSERT(false, "height={}", 5);
    FAIL() << "RELEASE_ASSERT did not throw";
  } catch (const util::ReleaseAssertionError& e) {
    EXPECT_NE(std::string(e.what()).find("height=5"), std::string::npos);
  }
}

TEST(Asserts, clean_assert) {
  // CleanAssertionError is caught by the main() handlers for CleanException.
  EXPECT_THROW(CLEAN_ASSERT(false, "bad input {}", "x"), util::CleanException);
}

TEST(Exceptions, format) {
  util::Exception e("{} + {} = {}", 1, 2, 3);
  EXPECT_STREQ(e.what(), "1 + 2 = 3");
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
