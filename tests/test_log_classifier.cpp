/**
 * @file test_log_classifier.cpp
 * @brief Unit tests for as-cmd output classification
 */

#include "asmd/log_classifier.hpp"

#include <gtest/gtest.h>

using namespace asmd;

// ============================================================
// parse_peer_token
// ============================================================

TEST(ParsePeerTokenTest, SplitsLastTokenAtLastColon) {
    auto peer = parse_peer_token("2024-01-01 [info] accept 192.168.1.20:51234");

    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->first, "192.168.1.20");
    EXPECT_EQ(peer->second, "51234");
}

TEST(ParsePeerTokenTest, IgnoresTrailingWhitespace) {
    auto peer = parse_peer_token("[info] close 10.0.0.5:4000  \r\n");

    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->first, "10.0.0.5");
    EXPECT_EQ(peer->second, "4000");
}

TEST(ParsePeerTokenTest, BracketedIpv6KeepsInnerColons) {
    auto peer = parse_peer_token("[info] accept [fe80::1]:6000");

    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->first, "[fe80::1]");
    EXPECT_EQ(peer->second, "6000");
}

TEST(ParsePeerTokenTest, RejectsTokenWithoutColon) {
    EXPECT_FALSE(parse_peer_token("[info] accept somebody").has_value());
}

TEST(ParsePeerTokenTest, RejectsEmptyAddressOrPort) {
    EXPECT_FALSE(parse_peer_token("[info] accept :5000").has_value());
    EXPECT_FALSE(parse_peer_token("[info] accept 10.0.0.1:").has_value());
}

TEST(ParsePeerTokenTest, RejectsBlankLine) {
    EXPECT_FALSE(parse_peer_token("   ").has_value());
    EXPECT_FALSE(parse_peer_token("").has_value());
}

// ============================================================
// classify_stdout_line
// ============================================================

TEST(ClassifyStdoutTest, AcceptLineIsConnect) {
    auto event = classify_stdout_line("[info] accept 192.168.1.20:51234");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->peer_address, "192.168.1.20");
    EXPECT_TRUE(event->connected);
}

TEST(ClassifyStdoutTest, CloseLineIsDisconnect) {
    auto event = classify_stdout_line("12:00:01 [info] close 192.168.1.20:51234");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->peer_address, "192.168.1.20");
    EXPECT_FALSE(event->connected);
}

TEST(ClassifyStdoutTest, MalformedPeerIsDropped) {
    EXPECT_FALSE(classify_stdout_line("[info] accept nobody").has_value());
}

TEST(ClassifyStdoutTest, OtherLinesAreIgnored) {
    EXPECT_FALSE(classify_stdout_line("[info] listening on 0.0.0.0:65530").has_value());
    EXPECT_FALSE(classify_stdout_line("").has_value());
}

TEST(ClassifyStdoutTest, MarkerIsCaseSensitive) {
    EXPECT_FALSE(classify_stdout_line("[INFO] ACCEPT 192.168.1.20:51234").has_value());
}

// ============================================================
// classify_stderr_line
// ============================================================

TEST(ClassifyStderrTest, BindFailureIsInvalidBinding) {
    auto reason = classify_stderr_line("Error: bind: cannot assign requested address");

    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->kind(), ProcessStopReason::Kind::INVALID_BINDING);
}

TEST(ClassifyStderrTest, InvalidArgumentIsInvalidArgument) {
    auto reason = classify_stderr_line("error: Invalid argument (os error 22)");

    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->kind(), ProcessStopReason::Kind::INVALID_ARGUMENT);
}

TEST(ClassifyStderrTest, MarkersMatchIgnoringCase) {
    auto reason = classify_stderr_line("CANNOT ASSIGN REQUESTED ADDRESS");

    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->kind(), ProcessStopReason::Kind::INVALID_BINDING);
}

TEST(ClassifyStderrTest, BindFailureWinsWhenBothMarkersPresent) {
    auto reason = classify_stderr_line("invalid argument: cannot assign requested address");

    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->kind(), ProcessStopReason::Kind::INVALID_BINDING);
}

TEST(ClassifyStderrTest, WarningsAreNotFaults) {
    EXPECT_FALSE(classify_stderr_line("warning: buffer underrun").has_value());
    EXPECT_FALSE(classify_stderr_line("").has_value());
}
