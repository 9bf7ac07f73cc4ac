#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "Script/ScriptRunner.h"
#include "Text/Text.h"
#include "Utils/Debug.h"
#include "Utils/TestUtils.h"

using namespace std;

// Built into simpleeditor_debug_tests, where SIMPLEEDITOR_DEBUG is defined.

class DebugLogTest : public ::testing::Test {
protected:
  void SetUp() override { clear_debug_output(); }
  void TearDown() override { clear_debug_output(); }
};

TEST_F(DebugLogTest, Enabled) {
  EXPECT_TRUE(DEBUG_ENABLED);
}

TEST_F(DebugLogTest, JoinsArgumentsWithSpaces) {
  debug("a", 1, 'c', 2.5);
  EXPECT_EQ(get_debug_output(), "a 1 c 2.5\n");
}

TEST_F(DebugLogTest, EngineLogsSkippedOps) {
  ostringstream out;
  Text text("ab", 3);
  text.apply({Operation::del(5), Operation::print(9), Operation::undo()}, out);

  string log = get_debug_output();
  EXPECT_NE(log.find("skip Delete(5) buffer length 2"), string::npos) << log;
  EXPECT_NE(log.find("skip Print 9 buffer length 2"), string::npos) << log;
  EXPECT_NE(log.find("skip Undo: history empty"), string::npos) << log;
}

TEST_F(DebugLogTest, RunnerLogsDroppedLines) {
  ostringstream out;
  EXPECT_EQ(runScript(TestFiles::load("invalid_lines.txt"), out), RunStatus::Ok);
  EXPECT_NE(get_debug_output().find("runScript: 2 invalid lines dropped"), string::npos)
      << get_debug_output();
}

TEST_F(DebugLogTest, TruncatesPastLineLimit) {
  for (size_t i = 0; i < DEBUG_MAX_LINES + 50; i++) {
    debug("line", i);
  }
  vector<string> lines = outputLines(get_debug_output());
  ASSERT_EQ(lines.size(), DEBUG_MAX_LINES + 1);
  EXPECT_EQ(lines.front(), "line 0");
  EXPECT_EQ(lines[DEBUG_MAX_LINES - 1], "line " + to_string(DEBUG_MAX_LINES - 1));
  EXPECT_EQ(lines.back(), DEBUG_TRUNCATED_MARKER);
}

TEST_F(DebugLogTest, TakeClearsAndResetsLimit) {
  for (size_t i = 0; i < DEBUG_MAX_LINES + 1; i++) {
    debug("x");
  }
  EXPECT_FALSE(take_debug_output().empty());
  EXPECT_EQ(get_debug_output(), "");

  debug("after");
  EXPECT_EQ(get_debug_output(), "after\n");
}
