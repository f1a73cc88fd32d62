#include "chaosbox/utils/command_runner.hpp"
#include "chaosbox/utils/hash_utils.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <set>

using chaosbox::utils::HashUtils;
using chaosbox::utils::StringUtils;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::Trim("  \t hello world \n"), "hello world");
    EXPECT_EQ(StringUtils::Trim(" \n\t "), "");
    EXPECT_EQ(StringUtils::TrimLeft("  x  "), "x  ");
}

TEST(StringUtilsTest, SplitLinesKeepsInnerEmptyLines) {
    auto lines = StringUtils::SplitLines("a\n\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "b");

    EXPECT_TRUE(StringUtils::SplitLines("").empty());
}

TEST(StringUtilsTest, RemoveCharsHandlesNulBytes) {
    std::string raw("a\x01" "b", 3);
    raw.push_back('\0');
    raw += "c";
    EXPECT_EQ(StringUtils::RemoveChars(raw, std::string("\x00\x01", 2)), "abc");
}

TEST(StringUtilsTest, FormatTimestampIsUtcWithMilliseconds) {
    auto time = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(417);
    EXPECT_EQ(StringUtils::FormatTimestamp(time), "1970-01-01T00:00:00.417Z");

    auto later = std::chrono::system_clock::from_time_t(1792314902);
    EXPECT_EQ(StringUtils::FormatTimestamp(later), "2026-10-18T09:15:02.000Z");
}

TEST(CommandRunnerTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(chaosbox::utils::ShellQuote("plain"), "'plain'");
    EXPECT_EQ(chaosbox::utils::ShellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(chaosbox::utils::BuildCommandLine({"echo", "a b"}), "'echo' 'a b'");
}

TEST(CommandRunnerTest, ExecuteCommandCapturesOutputAndExitCode) {
    auto ok = chaosbox::utils::ExecuteCommand({"sh", "-c", "echo out; echo err 1>&2"});
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_NE(ok.output.find("out"), std::string::npos);
    EXPECT_NE(ok.output.find("err"), std::string::npos);

    auto failed = chaosbox::utils::ExecuteCommand({"sh", "-c", "exit 3"});
    EXPECT_EQ(failed.exit_code, 3);
    EXPECT_FALSE(failed.Succeeded());
}

TEST(CommandRunnerTest, ThrowingCallbackDoesNotLeakThePipe) {
    auto open_fds = [] {
        return std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                             std::filesystem::directory_iterator());
    };
    auto before = open_fds();

    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(chaosbox::utils::StreamCommand(
                         {"sh", "-c", "echo chunk"},
                         [](const std::string&) { throw std::runtime_error("consumer failed"); }),
                     std::runtime_error);
    }

    EXPECT_EQ(open_fds(), before);
}

TEST(HashUtilsTest, Sha256MatchesKnownVector) {
    EXPECT_EQ(HashUtils::Sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, GenerateUuidIsVersion4AndUnique) {
    const std::regex uuid_v4(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string uuid = HashUtils::GenerateUuid();
        EXPECT_TRUE(std::regex_match(uuid, uuid_v4)) << uuid;
        seen.insert(uuid);
    }
    EXPECT_EQ(seen.size(), 1000u);
}
