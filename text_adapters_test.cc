// Tests for the textual parse and format transformers.

#include "text_adapters.h"

#include <cstdint>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "step.h"
#include "transformers.h"
#include "traversal.h"

namespace bistream {
namespace {

using std::vector;

TEST(ParseTextTest, AcceptsOnlyWholeValues) {
  int32_t i = 0;
  EXPECT_TRUE(ParseText("42", &i));
  EXPECT_EQ(i, 42);
  EXPECT_TRUE(ParseText(" -7", &i));
  EXPECT_EQ(i, -7);
  EXPECT_FALSE(ParseText("-7 ", &i));
  EXPECT_FALSE(ParseText("7\n", &i));
  EXPECT_FALSE(ParseText("42x", &i));
  EXPECT_FALSE(ParseText("", &i));
  EXPECT_FALSE(ParseText("99999999999", &i));

  uint64_t u = 0;
  EXPECT_TRUE(ParseText("18446744073709551615", &u));
  EXPECT_EQ(u, UINT64_MAX);
  EXPECT_FALSE(ParseText("-1", &u));

  double d = 0;
  EXPECT_TRUE(ParseText("2.5", &d));
  EXPECT_EQ(d, 2.5);
  EXPECT_FALSE(ParseText("2.5.1", &d));
  EXPECT_FALSE(ParseText("2.5\t", &d));

  bool b = false;
  EXPECT_TRUE(ParseText("true", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseText("0", &b));
  EXPECT_FALSE(b);
  EXPECT_FALSE(ParseText("maybe", &b));
  EXPECT_FALSE(ParseText("true ", &b));

  std::string s;
  EXPECT_TRUE(ParseText(" as is ", &s));
  EXPECT_EQ(s, " as is ");
}

TEST(FormatTextTest, FormatsScalars) {
  EXPECT_EQ(FormatText(42), "42");
  EXPECT_EQ(FormatText(-1.5), "-1.5");
  EXPECT_EQ(FormatText(true), "true");
  EXPECT_EQ(FormatText(false), "false");
  EXPECT_EQ(FormatText(std::string("text")), "text");
}

TEST(ReadTest, DropsValuesThatDoNotParse) {
  Source<std::string, Unit> lines =
      Each<std::string>({"1", "two", "3", "", "4.0", "5"});
  EXPECT_EQ(ToList(lines | Read<int32_t>()), (vector<int32_t>{1, 3, 5}));
  EXPECT_EQ(ToList(lines | Read<double>()),
            (vector<double>{1.0, 3.0, 4.0, 5.0}));
}

TEST(ReadTest, DropsValuesWithTrailingText) {
  Source<std::string, Unit> lines =
      Each<std::string>({"5 ", " 6", "7\n", "8x"});
  EXPECT_EQ(ToList(lines | Read<int32_t>()), (vector<int32_t>{6}));
}

TEST(ShowTest, FormatsEveryValue) {
  EXPECT_EQ(ToList(Each<int>({1, -2}) | Show<int>()),
            (vector<std::string>{"1", "-2"}));
  EXPECT_EQ(ToList(Each<bool>({true, false}) | Show<bool>()),
            (vector<std::string>{"true", "false"}));
}

TEST(ShowTest, ReadUndoesShow) {
  vector<int64_t> values = {0, -5, 1234567890123};
  EXPECT_EQ(ToList(Each(values) | Show<int64_t>() | Read<int64_t>()), values);
}

}  // namespace
}  // namespace bistream

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
