#include <gtest/gtest.h>
#include <string>

#include "ffi_exports.h"
#include "Text/EngineLimits.h"
#include "Utils/Debug.h"

using namespace std;

TEST(FfiTest, RunReturnsCliOutput) {
  EXPECT_EQ(string(simpleeditor_run("4\n1 abc\n2 1\n2 1\n1 p me!\n")), "help me!\n");
  EXPECT_EQ(string(simpleeditor_run("2\n1 hi\n3 1\n")), "h\nhi\n");
}

TEST(FfiTest, MalformedHeaderGivesEmptyString) {
  EXPECT_EQ(string(simpleeditor_run("nope\n1 abc\n")), "");
}

TEST(FfiTest, FatalErrorGivesErrorString) {
  string res = simpleeditor_run("2\n1 abc\n3 1\n4\n");
  EXPECT_EQ(res.rfind("error: ", 0), 0u) << res;
}

TEST(FfiTest, NullScript) {
  EXPECT_EQ(string(simpleeditor_run(nullptr)), "error: null script");
}

TEST(FfiTest, ExportedLimits) {
  EXPECT_EQ(SIMPLEEDITOR_MAX_OPS, EngineLimits::DEFAULT_MAX_OPS);
  EXPECT_EQ(SIMPLEEDITOR_MAX_DELETED_CHARS, EngineLimits::DEFAULT_MAX_DELETED_CHARS);
}

TEST(FfiTest, KeepsPrintsBeforeFatalError) {
  // One character past the deletion ceiling, deleted after a print ran.
  const size_t n = EngineLimits::DEFAULT_MAX_DELETED_CHARS + 1;
  string script = "3\n1 " + string(n, 'a') + "\n3 1\n2 " + to_string(n) + "\n";

  string res = simpleeditor_run(script.c_str());
  EXPECT_EQ(res.rfind("a\nerror: ", 0), 0u) << res.substr(0, 80);
  EXPECT_NE(res.find("max number of characters"), string::npos) << res.substr(0, 80);
}

TEST(FfiTest, DebugOutputClearsOnRead) {
  simpleeditor_get_debug();
  simpleeditor_run("2\n1 a\n3 5\n");

  string log = simpleeditor_get_debug();
  if constexpr (DEBUG_ENABLED) {
    EXPECT_NE(log.find("parseScript: declared 2"), string::npos) << log;
    EXPECT_NE(log.find("skip Print 5"), string::npos) << log;
  } else {
    EXPECT_EQ(log, "");
  }
  EXPECT_EQ(string(simpleeditor_get_debug()), "");
}
