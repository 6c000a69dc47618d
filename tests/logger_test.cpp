#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

#include "TempDir.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using namespace stepwise::core;
using stepwise::io::FileLogger;
using stepwise::test::TempDir;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {
  std::string readAll(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
} // namespace

TEST(log_level, parses_names_case_insensitively) {
  EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
  EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
  EXPECT_STREQ(toString(LogLevel::Error), "error");
}

TEST(logger, drops_messages_below_level) {
  std::ostringstream out;
  Logger logger(LogLevel::Warn, &out);

  logger.debug("snapshot taken");
  logger.info("Running step");
  logger.warn("Previous run resulted in an error");
  logger.error("Step failed");

  EXPECT_EQ(out.str(), "[warn] Previous run resulted in an error\n[error] Step failed\n");
}

TEST(logger, off_silences_everything) {
  std::ostringstream out;
  Logger logger(LogLevel::Off, &out);
  logger.error("nope");
  EXPECT_TRUE(out.str().empty());
  EXPECT_FALSE(logger.enabled(LogLevel::Off));
}

TEST(logger, appends_to_attached_file) {
  TempDir dir;
  auto path = dir / "run.log";
  {
    Logger first(LogLevel::Info, nullptr);
    ASSERT_TRUE(first.attachFile(path.string()));
    first.info("Running step: first");
  }
  {
    Logger second(LogLevel::Info, nullptr);
    ASSERT_TRUE(second.attachFile(path.string()));
    second.debug("hidden");
    second.info("Finished successfully");
  }

  const auto text = readAll(path);
  EXPECT_EQ(text, "[info] Running step: first\n[info] Finished successfully\n");
  EXPECT_THAT(text, Not(HasSubstr("hidden")));
}

TEST(file_logger, buffers_until_flush_and_survives_move) {
  TempDir dir;
  auto path = dir / "buffered.log";

  FileLogger log;
  ASSERT_TRUE(log.open(path.string()));
  log.write("one\n");
  EXPECT_EQ(readAll(path), "");

  FileLogger moved = std::move(log);
  EXPECT_FALSE(log.isOpen());
  ASSERT_TRUE(moved.isOpen());
  moved.write("two\n");
  EXPECT_TRUE(moved.flush());
  EXPECT_EQ(readAll(path), "one\ntwo\n");

  moved.close();
  EXPECT_FALSE(moved.flush());
}

TEST(file_logger, open_fails_for_missing_directory) {
  TempDir dir;
  FileLogger log;
  EXPECT_FALSE(log.open((dir / "nope" / "x.log").string()));
  log.write("ignored\n");
  EXPECT_FALSE(log.isOpen());
}
