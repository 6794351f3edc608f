//! # Command-Line Tests
//!
//! Argument parsing and the exit codes of the format command.

#include "../test_helpers.hpp"
#include "cli/commands/cmd_format.hpp"
#include "cli/options.hpp"
#include "format/engine.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace srcfmt;
using namespace srcfmt::cli;
using srcfmt::test::FakeFormatter;
using srcfmt::test::read_bytes;
using srcfmt::test::write_bytes;

/// Owns argv storage for parse_args().
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() {
        return static_cast<int>(pointers_.size());
    }

    char** argv() {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

// ============================================================================
// parse_args
// ============================================================================

TEST(ParseArgsTest, AllConfigurationFlags) {
    Args args{"srcfmt", "-c",      "p.yml", "--level=17", "-H", "HEADER", "--encoding",
              "latin1", "-s",      "crlf",  "-j",         "4",  "--check", "src"};
    auto parsed = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(is_ok(parsed));
    const auto& options = unwrap(parsed);

    EXPECT_EQ(options.config.conf.value_or(""), "p.yml");
    EXPECT_EQ(options.config.level.value_or(""), "17");
    EXPECT_EQ(options.config.header_file.value_or(""), "HEADER");
    EXPECT_EQ(options.config.encoding.value_or(""), "latin1");
    EXPECT_EQ(options.config.line_separator.value_or(""), "crlf");
    EXPECT_EQ(options.jobs, 4);
    EXPECT_TRUE(options.check);
    EXPECT_EQ(options.path.value_or(""), "src");
}

TEST(ParseArgsTest, LastPositionalWinsAndLogFlagsIgnored) {
    Args args{"srcfmt", "-vv", "first", "--log-filter=walk=trace", "second"};
    auto parsed = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).path.value_or(""), "second");
}

TEST(ParseArgsTest, HelpAndVersion) {
    Args args{"srcfmt", "--help", "-V"};
    auto parsed = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_TRUE(unwrap(parsed).help);
    EXPECT_TRUE(unwrap(parsed).version);
    EXPECT_FALSE(unwrap(parsed).path.has_value());
}

TEST(ParseArgsTest, MissingValueIsInvalidArgument) {
    Args args{"srcfmt", "src", "--linesep"};
    auto parsed = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed).kind, FatalKind::InvalidArgument);
}

TEST(ParseArgsTest, UnknownOptionIsInvalidArgument) {
    Args args{"srcfmt", "--frobnicate", "src"};
    auto parsed = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(exit_code_for(unwrap_err(parsed).kind), exit_code::INVALID_ARGUMENT);
}

TEST(ParseArgsTest, BadJobCount) {
    Args args{"srcfmt", "-j", "many", "src"};
    EXPECT_TRUE(is_err(parse_args(args.argc(), args.argv())));
}

TEST(ParseArgsTest, JobCountIsBounded) {
    Args too_many{"srcfmt", "-j", "100000", "src"};
    auto parsed = parse_args(too_many.argc(), too_many.argv());
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed).kind, FatalKind::InvalidArgument);

    Args most{"srcfmt", "--jobs=256", "src"};
    auto bounded = parse_args(most.argc(), most.argv());
    ASSERT_TRUE(is_ok(bounded));
    EXPECT_EQ(unwrap(bounded).jobs, 256);
}

// ============================================================================
// run_format
// ============================================================================

class RunFormatTest : public srcfmt::test::ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        java = make_rc<FakeFormatter>("java", ".java");
        java->fail_marker = "SYNTAX ERROR";
        command.formatters = {java};
        command.locate_profile = [this] { return dir / "no-home" / "formatter-profile.yml"; };
    }

    int run(CliOptions options) {
        return run_format(options, command, out);
    }

    Rc<FakeFormatter> java;
    FormatCommand command;
    std::ostringstream out;
};

TEST_F(RunFormatTest, InvalidLineSeparatorTouchesNoFile) {
    write_bytes(dir / "A.java", "class A {}\n");
    CliOptions options;
    options.path = dir.string();
    options.config.line_separator = "tab";

    EXPECT_EQ(run(options), exit_code::INVALID_ARGUMENT);
    EXPECT_EQ(java->calls.load(), 0);
    EXPECT_EQ(read_bytes(dir / "A.java"), "class A {}\n");
}

TEST_F(RunFormatTest, MissingPath) {
    EXPECT_EQ(run(CliOptions{}), exit_code::MISSING_PATH);
}

TEST_F(RunFormatTest, UnsupportedPathIsFatal) {
    CliOptions options;
    options.path = (dir / "missing").string();
    EXPECT_EQ(run(options), exit_code::FATAL);
}

TEST_F(RunFormatTest, CrLfAndHeaderApplied) {
    write_bytes(dir / "HEADER", "// Copyright X\n");
    write_bytes(dir / "src" / "A.java", "class A {}\n");
    CliOptions options;
    options.path = (dir / "src").string();
    options.config.line_separator = "crlf";
    options.config.header_file = (dir / "HEADER").string();

    EXPECT_EQ(run(options), exit_code::SUCCESS);
    EXPECT_EQ(read_bytes(dir / "src" / "A.java"), "// Copyright X\r\n\r\nclass A {}\r\n");
    EXPECT_NE(out.str().find("1 formatted"), std::string::npos);

    // A second run finds nothing to do
    out.str("");
    EXPECT_EQ(run(options), exit_code::SUCCESS);
    EXPECT_NE(out.str().find("0 formatted, 1 unchanged"), std::string::npos);
}

TEST_F(RunFormatTest, OneBrokenFileOfThree) {
    write_bytes(dir / "A.java", "class A {}\r\n");
    write_bytes(dir / "B.java", "class B { SYNTAX ERROR\r\n");
    write_bytes(dir / "C.java", "class C {}\r\n");
    CliOptions options;
    options.path = dir.string();

    EXPECT_EQ(run(options), exit_code::FILE_FAILURES);
    EXPECT_EQ(read_bytes(dir / "A.java"), "class A {}\n");
    EXPECT_EQ(read_bytes(dir / "B.java"), "class B { SYNTAX ERROR\r\n");
    EXPECT_EQ(read_bytes(dir / "C.java"), "class C {}\n");
}

#ifndef _WIN32
TEST_F(RunFormatTest, JavaSyntaxErrorFailsThroughEngineBinary) {
    auto script = srcfmt::test::write_formatter_script(dir / "bin" / "java-formatter");
    auto java_engine = make_rc<const format::GoogleJavaFormatEngine>(script.string());
    command.formatters =
        format::default_formatters(java_engine, make_rc<srcfmt::test::FakeEngine>());

    fs::path src = dir / "src";
    write_bytes(src / "A.java", "class\tA {}\n");
    write_bytes(src / "B.java", "class B { void f( { SYNTAX ERROR\n");
    write_bytes(src / "C.java", "class\tC {}\n");
    CliOptions options;
    options.path = src.string();

    EXPECT_EQ(run(options), exit_code::FILE_FAILURES);
    EXPECT_EQ(read_bytes(src / "A.java"), "class A {}\n");
    EXPECT_EQ(read_bytes(src / "B.java"), "class B { void f( { SYNTAX ERROR\n");
    EXPECT_EQ(read_bytes(src / "C.java"), "class C {}\n");
    EXPECT_NE(out.str().find("2 formatted, 0 unchanged, 0 skipped, 1 failed"), std::string::npos);
}
#endif

TEST_F(RunFormatTest, CheckModeReportsWithoutWriting) {
    write_bytes(dir / "A.java", "class A {}\r\n");
    CliOptions options;
    options.path = dir.string();
    options.check = true;
    options.jobs = 2;

    EXPECT_EQ(run(options), exit_code::FILE_FAILURES);
    EXPECT_EQ(read_bytes(dir / "A.java"), "class A {}\r\n");
    EXPECT_NE(out.str().find("1 would be reformatted"), std::string::npos);
}
