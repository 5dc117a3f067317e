#include <gtest/gtest.h>

#include <climits>
#include <string>

#include "kernel/edit_session.hpp"
#include "stub_host.hpp"

using ie::EditorExitError;
using ie::EditorInvocation;
using ie::EditEventService;
using ie::InteractiveEditSession;
using ie::IoError;
using ie::stubs::StubEnvironment;
using ie::stubs::StubFileSystem;
using ie::stubs::StubLauncher;

namespace {

class EditSessionTest : public ::testing::Test {
 protected:
  StubFileSystem fs;
  StubEnvironment env;
  StubLauncher launcher;
  EditEventService events;
};

}  // namespace

TEST_F(EditSessionTest, ContentIsStoredVerbatim) {
  using namespace std::string_literals;
  const std::string text = "  line one\r\n\tline two\n\0tail"s;
  InteractiveEditSession session(text, fs, env, launcher);
  EXPECT_EQ(session.content(), text);
  EXPECT_EQ(fs.create_calls, 0);
}

TEST_F(EditSessionTest, NameKeepsOnlyAllowedCharacters) {
  InteractiveEditSession session("", fs, env, launcher);
  session.set_name("a/b c!.txt");
  EXPECT_EQ(session.name(), "abc.txt");

  session.set_name("../../etc/passwd");
  EXPECT_EQ(session.name(), "....etcpasswd");

  session.set_name("commit-msg_v2.md");
  EXPECT_EQ(session.name(), "commit-msg_v2.md");
}

TEST_F(EditSessionTest, EmptyOrStrippedNameIsUntitled) {
  InteractiveEditSession session("", fs, env, launcher);
  EXPECT_EQ(session.name(), "untitled");
  session.set_name("/// !!");
  EXPECT_EQ(session.name(), "untitled");
  session.set_name("..");
  EXPECT_EQ(session.name(), "untitled");
  session.set_name("./");
  EXPECT_EQ(session.name(), "untitled");
}

TEST_F(EditSessionTest, SetNameIsIdempotent) {
  InteractiveEditSession once("", fs, env, launcher);
  InteractiveEditSession twice("", fs, env, launcher);
  once.set_name("my list;rm -rf ~.txt");
  twice.set_name("my list;rm -rf ~.txt").set_name("my list;rm -rf ~.txt");
  EXPECT_EQ(once.name(), twice.name());
  EXPECT_EQ(once.name(), "mylistrm-rf.txt");
}

TEST_F(EditSessionTest, LineOffsetAcceptsIntegersAndNumericStrings) {
  InteractiveEditSession session("", fs, env, launcher);
  EXPECT_EQ(session.line_offset(), 0);
  session.set_line_offset(15);
  EXPECT_EQ(session.line_offset(), 15);
  session.set_line_offset(std::string("42"));
  EXPECT_EQ(session.line_offset(), 42);
  session.set_line_offset(std::string("  7 lines"));
  EXPECT_EQ(session.line_offset(), 7);
  session.set_line_offset(std::string("-3"));
  EXPECT_EQ(session.line_offset(), -3);
  session.set_line_offset(std::string("abc"));
  EXPECT_EQ(session.line_offset(), 0);
  session.set_line_offset(std::string("99999999999999"));
  EXPECT_EQ(session.line_offset(), INT_MAX);
}

TEST_F(EditSessionTest, EditorVariableWins) {
  env.vars["EDITOR"] = "vim";
  env.executables.insert("editor");
  InteractiveEditSession session("", fs, env, launcher);
  session.set_fallback_editor("emacs");
  EXPECT_EQ(session.resolve_editor_command(), "vim");
}

TEST_F(EditSessionTest, EmptyEditorVariableIsIgnored) {
  env.vars["EDITOR"] = "";
  env.executables.insert("editor");
  InteractiveEditSession session("", fs, env, launcher);
  EXPECT_EQ(session.resolve_editor_command(), "editor");
}

TEST_F(EditSessionTest, FallsBackWhenNothingResolves) {
  InteractiveEditSession session("", fs, env, launcher);
  EXPECT_EQ(session.resolve_editor_command(), "nano");
  session.set_fallback_editor("vi");
  EXPECT_EQ(session.resolve_editor_command(), "vi");
}

TEST_F(EditSessionTest, ResolutionIsNotCached) {
  InteractiveEditSession session("", fs, env, launcher);
  EXPECT_EQ(session.resolve_editor_command(), "nano");
  env.vars["EDITOR"] = "kak";
  EXPECT_EQ(session.resolve_editor_command(), "kak");
}

TEST_F(EditSessionTest, HappyPathReturnsEditedContent) {
  env.vars["EDITOR"] = "vim";
  launcher.behavior = [this](const EditorInvocation& inv) {
    fs.files[inv.args.back()] += "world\n";
    return 0;
  };
  InteractiveEditSession session("hello\n", fs, env, launcher, &events);
  session.set_name("notes.txt").set_line_offset(3);

  EXPECT_EQ(session.edit_interactively(), "hello\nworld\n");
  EXPECT_EQ(session.content(), "hello\nworld\n");

  ASSERT_TRUE(launcher.last.has_value());
  EXPECT_EQ(launcher.last->program, "vim");
  ASSERT_EQ(launcher.last->args.size(), 2u);
  EXPECT_EQ(launcher.last->args[0], "+3");
  EXPECT_EQ(launcher.last->args[1], "/stub/edit.1/notes.txt");

  EXPECT_FALSE(fs.exists("/stub/edit.1"));
  EXPECT_TRUE(fs.files.empty());
  EXPECT_EQ(fs.remove_calls, 1);

  auto log = events.drain();
  ASSERT_EQ(log.size(), 3u);
  EXPECT_EQ(log[0].kind, EditEventService::Kind::TempDirCreated);
  EXPECT_EQ(log[1].kind, EditEventService::Kind::EditorLaunched);
  EXPECT_EQ(log[2].kind, EditEventService::Kind::EditorExited);
  EXPECT_EQ(log[2].detail, "0");
}

TEST_F(EditSessionTest, EditorFailureKeepsContentAndCleansUp) {
  launcher.behavior = [this](const EditorInvocation& inv) {
    fs.files[inv.args.back()] = "half-edited";
    return 1;
  };
  InteractiveEditSession session("hello\n", fs, env, launcher);

  try {
    session.edit_interactively();
    FAIL() << "expected EditorExitError";
  } catch (const EditorExitError& e) {
    EXPECT_EQ(e.exit_code(), 1);
    EXPECT_EQ(e.code(), ie::EditErrc::EditorExit);
  }
  EXPECT_EQ(session.content(), "hello\n");
  EXPECT_EQ(fs.read_calls, 0);
  EXPECT_TRUE(fs.dirs.empty());
  EXPECT_EQ(fs.remove_calls, 1);
}

TEST_F(EditSessionTest, WriteFailureSkipsEditor) {
  fs.fail_write = true;
  InteractiveEditSession session("hello\n", fs, env, launcher);

  EXPECT_THROW(session.edit_interactively(), IoError);
  EXPECT_EQ(launcher.calls, 0);
  EXPECT_EQ(fs.remove_calls, 1);
  ASSERT_EQ(fs.removed.size(), 1u);
  EXPECT_EQ(fs.removed[0], ie::fs::path("/stub/edit.1"));
  EXPECT_EQ(session.content(), "hello\n");
}

TEST_F(EditSessionTest, ReadFailureCleansUp) {
  fs.fail_read = true;
  InteractiveEditSession session("hello\n", fs, env, launcher);

  EXPECT_THROW(session.edit_interactively(), IoError);
  EXPECT_EQ(launcher.calls, 1);
  EXPECT_TRUE(fs.dirs.empty());
  EXPECT_EQ(fs.remove_calls, 1);
  EXPECT_EQ(session.content(), "hello\n");
}

TEST_F(EditSessionTest, CreateFailureSpawnsNothing) {
  fs.fail_create = true;
  InteractiveEditSession session("hello\n", fs, env, launcher);

  EXPECT_THROW(session.edit_interactively(), IoError);
  EXPECT_EQ(fs.write_calls, 0);
  EXPECT_EQ(fs.remove_calls, 0);
  EXPECT_EQ(launcher.calls, 0);
}

TEST_F(EditSessionTest, CleanupFailureDoesNotMaskEditorError) {
  fs.fail_remove = true;
  launcher.behavior = [](const EditorInvocation&) { return 2; };
  InteractiveEditSession session("hello\n", fs, env, launcher, &events);

  try {
    session.edit_interactively();
    FAIL() << "expected EditorExitError";
  } catch (const EditorExitError& e) {
    EXPECT_EQ(e.exit_code(), 2);
  }
  auto log = events.drain();
  ASSERT_FALSE(log.empty());
  EXPECT_EQ(log.back().kind, EditEventService::Kind::CleanupFailed);
  EXPECT_NE(log.back().detail.find("busy"), std::string::npos);
}

TEST_F(EditSessionTest, CleanupFailureOnSuccessStillReturnsResult) {
  fs.fail_remove = true;
  launcher.behavior = [this](const EditorInvocation& inv) {
    fs.files[inv.args.back()] = "new";
    return 0;
  };
  InteractiveEditSession session("old", fs, env, launcher);

  EXPECT_EQ(session.edit_interactively(), "new");
  auto log = session.events().drain();
  ASSERT_FALSE(log.empty());
  EXPECT_EQ(log.back().kind, EditEventService::Kind::CleanupFailed);
}

TEST_F(EditSessionTest, EachEditUsesItsOwnDirectory) {
  launcher.behavior = [this](const EditorInvocation& inv) {
    fs.files[inv.args.back()] += "+";
    return 0;
  };
  InteractiveEditSession session("x", fs, env, launcher);
  session.set_temp_prefix("commit.");

  session.edit_interactively();
  EXPECT_EQ(launcher.last->args.back(), "/stub/commit.1/untitled");
  session.edit_interactively();
  EXPECT_EQ(launcher.last->args.back(), "/stub/commit.2/untitled");
  EXPECT_EQ(session.content(), "x++");
  EXPECT_TRUE(fs.dirs.empty());
}

TEST_F(EditSessionTest, MateGetsLineFlag) {
  env.vars["EDITOR"] = "mate -w";
  InteractiveEditSession session("", fs, env, launcher);
  session.set_line_offset(9);

  session.edit_interactively();
  ASSERT_TRUE(launcher.last.has_value());
  EXPECT_EQ(launcher.last->program, "mate");
  std::vector<std::string> expected{"-w", "-l", "9", "/stub/edit.1/untitled"};
  EXPECT_EQ(launcher.last->args, expected);
}
