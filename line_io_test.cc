// Tests for the line-oriented sources and sinks.

#include "line_io.h"

#include <unistd.h>

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "gtest/gtest.h"
#include "step.h"
#include "transformers.h"
#include "traversal.h"

namespace bistream {
namespace {

using std::vector;

class LineIoTest : public ::testing::Test {
 protected:
  void SetUp() override {
    file_ = std::tmpfile();
    ASSERT_NE(file_, nullptr);
  }

  void TearDown() override {
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  void Fill(const std::string& contents) {
    ASSERT_EQ(std::fwrite(contents.data(), 1, contents.size(), file_),
              contents.size());
    std::rewind(file_);
  }

  std::string Contents() {
    std::fflush(file_);
    std::rewind(file_);
    std::string contents;
    int c;
    while ((c = std::fgetc(file_)) != EOF) {
      contents.push_back(static_cast<char>(c));
    }
    return contents;
  }

  std::FILE* file_ = nullptr;
};

TEST_F(LineIoTest, ReadsEachLineWithoutItsDelimiter) {
  Fill("a\nb\n");
  std::pair<vector<std::string>, absl::Status> out =
      ToListWithResult(FromHandle(file_));
  EXPECT_EQ(out.first, (vector<std::string>{"a", "b"}));
  EXPECT_TRUE(out.second.ok());
}

TEST_F(LineIoTest, ReadsAnUnterminatedLastLine) {
  Fill("first\n\nlast");
  std::pair<vector<std::string>, absl::Status> out =
      ToListWithResult(FromHandle(file_));
  EXPECT_EQ(out.first, (vector<std::string>{"first", "", "last"}));
  EXPECT_TRUE(out.second.ok());
}

TEST_F(LineIoTest, ReadsNothingFromAnEmptyHandle) {
  std::pair<vector<std::string>, absl::Status> out =
      ToListWithResult(FromHandle(file_));
  EXPECT_TRUE(out.first.empty());
  EXPECT_TRUE(out.second.ok());
}

TEST_F(LineIoTest, HonorsTheDelimiterOption) {
  Fill("x,y,z");
  LineIoOptions options;
  options.delimiter = ',';
  EXPECT_EQ(ToList(FromHandle(file_, options)),
            (vector<std::string>{"x", "y", "z"}));
}

TEST_F(LineIoTest, ReadsOnlyAsFarAsDownstreamPulls) {
  Fill("1\n2\n3\n");
  EXPECT_EQ(Head(FromHandle(file_)), absl::optional<std::string>("1"));
  EXPECT_EQ(ToList(FromHandle(file_)), (vector<std::string>{"2", "3"}));
}

TEST_F(LineIoTest, WritesEachValueFollowedByTheDelimiter) {
  absl::Status status = RunEffect(
      MapResult(Each<std::string>({"a", "b"}), [](Unit) {
        return absl::OkStatus();
      }) |
      ToHandle(file_));
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(Contents(), "a\nb\n");
}

TEST_F(LineIoTest, CopiesLinesFromOneHandleToAnother) {
  Fill("one\ntwo\n");
  std::FILE* out = std::tmpfile();
  ASSERT_NE(out, nullptr);
  LineIoOptions options;
  options.flush_each_line = false;
  EXPECT_TRUE(RunEffect(FromHandle(file_) | ToHandle(out, options)).ok());
  std::fclose(file_);
  file_ = out;
  EXPECT_EQ(Contents(), "one\ntwo\n");
}

TEST(StandardStreamsTest, ReadLnDoesNotTouchStdinUntilRun) {
  Source<int32_t, absl::Status> numbers = ReadLn<int32_t>();
  EXPECT_EQ(numbers.kind(), (Source<int32_t, absl::Status>::Kind::kEffect));
}

TEST(StandardStreamsTest, PrintWritesToStdout) {
  absl::Status status = RunEffect(
      MapResult(Each<int32_t>({1, 2}), [](Unit) { return absl::OkStatus(); }) |
      Print<int32_t>());
  EXPECT_TRUE(status.ok()) << status;
}

TEST(LineIoWriteErrorTest, AReaderGoingAwayEndsTheSinkQuietly) {
  std::signal(SIGPIPE, SIG_IGN);
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  ASSERT_EQ(close(fds[0]), 0);
  std::FILE* writer = fdopen(fds[1], "w");
  ASSERT_NE(writer, nullptr);

  absl::Status status = RunEffect(
      MapResult(RepeatM<std::string>([] { return std::string("y"); }),
                [](Unit) { return absl::OkStatus(); }) |
      ToHandle(writer));
  EXPECT_TRUE(status.ok()) << status;
  std::fclose(writer);
}

TEST(LineIoWriteErrorTest, OtherWriteErrorsAreReported) {
  std::FILE* read_only = std::fopen("/dev/null", "r");
  ASSERT_NE(read_only, nullptr);
  absl::Status status = RunEffect(
      MapResult(Each<std::string>({"lost"}),
                [](Unit) { return absl::OkStatus(); }) |
      ToHandle(read_only));
  EXPECT_FALSE(status.ok());
  std::fclose(read_only);
}

}  // namespace
}  // namespace bistream

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
