#include "chaosbox/utils/output_sanitizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using chaosbox::utils::OutputSanitizer;

class OutputSanitizerTest : public ::testing::Test {
protected:
    OutputSanitizer sanitizer_;
};

TEST_F(OutputSanitizerTest, PlainOutputIsOnlyTrimmed) {
    EXPECT_EQ(sanitizer_.Sanitize("  2\n"), "2");
    EXPECT_EQ(sanitizer_.Sanitize(""), "");
}

TEST_F(OutputSanitizerTest, StripsControlBytesAndPipWarnings) {
    std::string raw("\x01\x00\x00\x00\x00\x00\x00\x02", 8);
    raw += "hello\n";
    raw += "WARNING: Running pip as the 'root' user can result in broken permissions\n";
    raw += "world\n";

    EXPECT_EQ(sanitizer_.Sanitize(raw), "hello\nworld");
}

TEST_F(OutputSanitizerTest, KeepsOnlyLogBodiesWhenLoggingIsUsed) {
    std::string raw =
        "Collecting requests\n"
        "INFO:root:Fetching data\n"
        "some stray print\n"
        "INFO:root:Done\n";

    EXPECT_EQ(sanitizer_.Sanitize(raw), "Fetching data\nDone");
}

TEST_F(OutputSanitizerTest, StackedLogPrefixesAreRemoved) {
    EXPECT_EQ(sanitizer_.Sanitize("INFO:root:INFO:root:nested"), "nested");
}

TEST_F(OutputSanitizerTest, TimeoutSentinelAddsNotice) {
    std::string raw = "partial output\n[Timeout]";
    EXPECT_EQ(sanitizer_.Sanitize(raw),
              "Execution timed out after 10 seconds.\npartial output\n[Timeout]");
}

TEST_F(OutputSanitizerTest, TimeoutSentinelSurvivesLogExtraction) {
    std::string raw = "noise\nINFO:root:step 1\n\n[Timeout]";
    EXPECT_EQ(sanitizer_.Sanitize(raw),
              "Execution timed out after 10 seconds.\nstep 1\n[Timeout]");
}

TEST_F(OutputSanitizerTest, NoticeUsesConfiguredLimit) {
    OutputSanitizer custom(std::chrono::seconds(3));
    EXPECT_EQ(custom.TimeoutNotice(), "Execution timed out after 3 seconds.");
}

TEST_F(OutputSanitizerTest, RedactsTruncatedOriginDocument) {
    std::string raw = "Response:\n{\n  \"origin\": \"203.0.113.7";
    EXPECT_EQ(sanitizer_.Sanitize(raw), "Response:\n{ \"origin\": \"[IP address]\" }");
}

TEST_F(OutputSanitizerTest, LeavesCompleteJsonAlone) {
    std::string raw = "{\"origin\": \"203.0.113.7\"}";
    EXPECT_EQ(sanitizer_.Sanitize(raw), raw);
}

TEST_F(OutputSanitizerTest, LeavesUnrelatedTruncatedJsonAlone) {
    std::string raw = "{\"name\": \"value";
    EXPECT_EQ(sanitizer_.Sanitize(raw), raw);
}

TEST_F(OutputSanitizerTest, IsIdempotent) {
    const std::vector<std::string> inputs = {
        "",
        "  2\n",
        std::string("\x01\x02x\x00y", 5),
        "WARNING: Running pip as the 'root' user\nout",
        "INFO:root:a\nINFO:root:b\n[Timeout]",
        "INFO:root:WARNING: Running pip as the 'root' user\nINFO:root:ok",
        "Execution timed out after 10 seconds.\n[Timeout]",
        "x\n{\"origin\": \"1.2.3.4\n[Timeout]",
        "{ \"origin\"",
        "   INFO:root:  padded  \n  \n",
        "[Timeout]",
    };

    for (const auto& input : inputs) {
        std::string once = sanitizer_.Sanitize(input);
        EXPECT_EQ(sanitizer_.Sanitize(once), once) << "input: " << input;
    }
}
