#include "Redaction.hpp"

#include <gtest/gtest.h>

#include "TunnelError.hpp"

TEST(RedactionTest, CleanDropsHiddenSegments) {
    std::string text = "Unable to reach upstream" + redaction::hide(": dial tcp 10.0.0.7:443: Network is unreachable");

    EXPECT_EQ(redaction::clean(text), "Unable to reach upstream");
}

TEST(RedactionTest, CleanKeepsTextAroundSegments) {
    std::string text = "before " + redaction::hide("secret") + " after";

    EXPECT_EQ(redaction::clean(text), "before  after");
}

TEST(RedactionTest, CleanDropsUnterminatedSegmentToEnd) {
    std::string text = "visible: " + std::string(redaction::kHiddenStart) + "internal detail";

    EXPECT_EQ(redaction::clean(text), "visible");
}

TEST(RedactionTest, CleanLeavesPlainTextAlone) {
    EXPECT_EQ(redaction::clean("plain text"), "plain text");
    EXPECT_EQ(redaction::clean(""), "");
}

TEST(RedactionTest, RevealKeepsContentWithoutMarkers) {
    std::string text = "Unable to reach upstream" + redaction::hide(": lookup example.invalid: not found");

    EXPECT_EQ(redaction::reveal(text), "Unable to reach upstream: lookup example.invalid: not found");
}

TEST(RedactionTest, TunnelErrorKeepsBothRepresentations) {
    TunnelError err(std::make_error_code(std::errc::connection_refused),
                    "Unable to reach upstream" + redaction::hide(": dial tcp 127.0.0.1:1: Connection refused"));

    EXPECT_EQ(err.publicMessage(), "Unable to reach upstream");
    EXPECT_EQ(err.logMessage(), "Unable to reach upstream: dial tcp 127.0.0.1:1: Connection refused");
    EXPECT_EQ(err.wrap("CONNECT failed: ").publicMessage(), "CONNECT failed: Unable to reach upstream");
    EXPECT_EQ(err.wrap("x").code(), std::errc::connection_refused);
}

TEST(TunnelErrorTest, EmptyMeansSuccess) {
    TunnelError ok;
    TunnelError failed(TunnelErrc::dial_timeout, "Timed out");

    EXPECT_FALSE(ok);
    EXPECT_TRUE(failed);
    EXPECT_EQ(failed.code(), TunnelErrc::dial_timeout);
    EXPECT_STREQ(failed.code().category().name(), "tunnel");
    EXPECT_EQ(failed.code().message(), "dial timed out");
}
