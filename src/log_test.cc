// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "log.hh"

#include <include/core/SkRect.h>

#include "gtest.hh"
#include "log_skia.hh"
#include "math.hh"

using namespace drops;
using namespace testing;

class LogTest : public Test {
 protected:
  Vec<Str> messages;
  Vec<LogLevel> levels;

  void SetUp() override {
    ClearLoggers();
    AddLogger([this](const LogEntry& e) {
      messages.push_back(e.buffer);
      levels.push_back(e.log_level);
    });
  }
  void TearDown() override { RestoreDefaultLoggers(); }
};

TEST_F(LogTest, Numbers) {
  LOG << "int " << 42 << " float " << 2.5f << " double " << 0.25;
  EXPECT_THAT(messages, ElementsAre("int 42 float 2.5 double 0.25"));
  EXPECT_THAT(levels, ElementsAre(LogLevel::Info));
}

TEST_F(LogTest, Errors) {
  ERROR << "broken";
  EXPECT_THAT(messages, ElementsAre("broken"));
  EXPECT_THAT(levels, ElementsAre(LogLevel::Error));
}

TEST_F(LogTest, ObjectsWithToStr) {
  LOG << Vec2(1, 2);
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0], Vec2(1, 2).ToStr());
}

TEST_F(LogTest, Indentation) {
  LOG << "a";
  LOG_Indent();
  LOG << "b";
  LOG_Unindent();
  LOG << "c";
  EXPECT_THAT(messages, ElementsAre("a", "  b", "c"));
}

TEST_F(LogTest, SkiaTypes) {
  LOG << SkRect::MakeXYWH(1, 2, 3, 4);
  EXPECT_THAT(messages, ElementsAre("3x4+1+2"));
}

TEST(LogDeathTest, FatalAborts) {
  EXPECT_DEATH(FATAL << "the end", "");
}
