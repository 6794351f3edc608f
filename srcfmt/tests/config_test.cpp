//! # Configuration Tests
//!
//! Flag validation order, profile resolution (explicit, per-user, none)
//! and header loading.

#include "config/config.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace srcfmt;
using namespace srcfmt::config;
using srcfmt::test::write_bytes;

class ConfigTest : public srcfmt::test::ScratchDirTest {
protected:
    ProfileLocator no_home() const {
        return [this] { return dir / "home" / "formatter-profile.yml"; };
    }
};

TEST(LineSeparatorTest, ParsesKnownValues) {
    EXPECT_EQ(unwrap(parse_line_separator("lf")), LineSeparator::LF);
    EXPECT_EQ(unwrap(parse_line_separator("cr")), LineSeparator::CR);
    EXPECT_EQ(unwrap(parse_line_separator("crlf")), LineSeparator::CRLF);
    EXPECT_EQ(line_separator_text(LineSeparator::CRLF), "\r\n");
}

TEST(LineSeparatorTest, RejectsOtherValues) {
    auto sep = parse_line_separator("tab");
    ASSERT_TRUE(is_err(sep));
    EXPECT_EQ(unwrap_err(sep).kind, FatalKind::InvalidArgument);
    EXPECT_NE(unwrap_err(sep).message.find("'tab'"), std::string::npos);

    EXPECT_TRUE(is_err(parse_line_separator("LF")));
}

TEST(PathFromUrlTest, PlainPathAndFileUrl) {
    EXPECT_EQ(unwrap(path_from_url("conf/profile.yml")).string(), "conf/profile.yml");
#ifndef _WIN32
    EXPECT_EQ(unwrap(path_from_url("file:///etc/my%20profile.yml")).string(),
              "/etc/my profile.yml");
    EXPECT_EQ(unwrap(path_from_url("file://localhost/tmp/p.yml")).string(), "/tmp/p.yml");
#endif
}

TEST(PathFromUrlTest, RemoteSchemesAreUnreadable) {
    auto path = path_from_url("http://example.com/profile.yml");
    ASSERT_TRUE(is_err(path));
    EXPECT_EQ(unwrap_err(path).kind, FatalKind::UnreadableResource);
}

TEST(NormalizeHeaderTest, TrimsTrailingBlankLines) {
    EXPECT_EQ(normalize_header("// A\r\n// B\r\n\r\n  \n"), "// A\n// B");
    EXPECT_EQ(normalize_header("\n\n"), "");
}

TEST_F(ConfigTest, DefaultsWithoutFlags) {
    auto config = resolve_configuration({}, no_home());
    ASSERT_TRUE(is_ok(config));
    const auto& c = *unwrap(config);
    EXPECT_EQ(c.encoding, "UTF-8");
    EXPECT_EQ(c.line_separator, LineSeparator::LF);
    EXPECT_FALSE(c.profile.has_value());
    EXPECT_FALSE(c.header.has_value());
    EXPECT_FALSE(c.source_level.has_value());
}

TEST_F(ConfigTest, InvalidLineSeparatorFailsBeforeReadingFiles) {
    ConfigRequest request;
    request.line_separator = "tab";
    request.header_file = (dir / "missing-header.txt").string();

    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_err(config));
    EXPECT_EQ(unwrap_err(config).kind, FatalKind::InvalidArgument);
}

TEST_F(ConfigTest, UnknownEncodingIsInvalidArgument) {
    ConfigRequest request;
    request.encoding = "NO-SUCH-CHARSET";
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_err(config));
    EXPECT_EQ(unwrap_err(config).kind, FatalKind::InvalidArgument);
}

TEST_F(ConfigTest, HomeProfileUsedWhenPresent) {
    fs::path home_profile = dir / "home" / "formatter-profile.yml";
    write_bytes(home_profile, "BasedOnStyle: LLVM\n");

    auto config = resolve_configuration({}, no_home());
    ASSERT_TRUE(is_ok(config));
    ASSERT_TRUE(unwrap(config)->profile.has_value());
    EXPECT_EQ(unwrap(config)->profile->string(), home_profile.string());
}

TEST_F(ConfigTest, ExplicitProfileOverridesHome) {
    write_bytes(dir / "home" / "formatter-profile.yml", "BasedOnStyle: LLVM\n");
    fs::path explicit_profile = dir / "team.yml";
    write_bytes(explicit_profile, "BasedOnStyle: Google\n");

    ConfigRequest request;
    request.conf = explicit_profile.string();
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_ok(config));
    ASSERT_TRUE(unwrap(config)->profile.has_value());
    EXPECT_EQ(unwrap(config)->profile->string(), explicit_profile.string());
}

TEST_F(ConfigTest, MissingExplicitProfileIsFatal) {
    ConfigRequest request;
    request.conf = (dir / "absent.yml").string();
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_err(config));
    EXPECT_EQ(unwrap_err(config).kind, FatalKind::UnreadableResource);
}

TEST_F(ConfigTest, HeaderLoadedAndNormalized) {
    fs::path header = dir / "HEADER.txt";
    write_bytes(header, "// Copyright X\r\n// All rights reserved\r\n\r\n");

    ConfigRequest request;
    request.header_file = header.string();
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_ok(config));
    ASSERT_TRUE(unwrap(config)->header.has_value());
    EXPECT_EQ(*unwrap(config)->header, "// Copyright X\n// All rights reserved");
}

TEST_F(ConfigTest, UnreadableHeaderIsFatal) {
    ConfigRequest request;
    request.header_file = (dir / "absent.txt").string();
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_err(config));
    EXPECT_EQ(unwrap_err(config).kind, FatalKind::UnreadableResource);
}

TEST_F(ConfigTest, EmptyHeaderIsIgnored) {
    fs::path header = dir / "EMPTY.txt";
    write_bytes(header, "\n\n");

    ConfigRequest request;
    request.header_file = header.string();
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_ok(config));
    EXPECT_FALSE(unwrap(config)->header.has_value());
}

TEST_F(ConfigTest, SourceLevelKept) {
    ConfigRequest request;
    request.level = "17";
    auto config = resolve_configuration(request, no_home());
    ASSERT_TRUE(is_ok(config));
    EXPECT_EQ(unwrap(config)->source_level.value_or(""), "17");
}
