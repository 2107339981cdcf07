#include <gtest/gtest.h>
#include "clawlink/streaming/heartbeat_filter.hpp"

using namespace clawlink;
using namespace clawlink::streaming;

TEST(HeartbeatFilterTest, MatchesDefaultPatternsCaseInsensitively) {
    HeartbeatFilter filter;
    EXPECT_TRUE(filter.matches("HEARTBEAT_OK"));
    EXPECT_TRUE(filter.matches("status: heartbeat_ok."));
    EXPECT_TRUE(filter.matches("Please read heartbeat.md first"));
    EXPECT_TRUE(filter.matches("# Heartbeat - Event-Driven Status\n- all good"));
}

TEST(HeartbeatFilterTest, OrdinaryTextDoesNotMatch) {
    HeartbeatFilter filter;
    EXPECT_FALSE(filter.matches("My heart beats fast"));
    EXPECT_FALSE(filter.matches("HEARTBEAT"));
    EXPECT_FALSE(filter.matches(""));
}

TEST(HeartbeatFilterTest, CustomPatternsReplaceDefaults) {
    HeartbeatFilter filter(std::vector<std::string>{"ping", ""});
    EXPECT_EQ(filter.patterns().size(), 1u);
    EXPECT_TRUE(filter.matches("PING from gateway"));
    EXPECT_FALSE(filter.matches("HEARTBEAT_OK"));

    HeartbeatFilter none(std::vector<std::string>{});
    EXPECT_FALSE(none.matches("HEARTBEAT_OK"));
}

TEST(HeartbeatFilterTest, FilterDropsHeartbeatsAndEmptyMessages) {
    HeartbeatFilter filter;
    std::vector<Message> messages = {
        Message::user("1", "hi"),
        Message::assistant("2", "HEARTBEAT_OK"),
        Message::assistant("3", ""),
        Message::assistant("4", "", std::string("only reasoning")),
        Message::assistant("5", "hello")
    };

    auto kept = filter.filter(messages);

    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].id, "1");
    EXPECT_EQ(kept[1].id, "4");
    EXPECT_EQ(kept[2].id, "5");
}

TEST(HeartbeatFilterTest, FilterIsIdempotent) {
    HeartbeatFilter filter;
    std::vector<Message> messages = {
        Message::user("1", "Read HEARTBEAT.md"),
        Message::assistant("2", "real answer"),
        Message::assistant("3", "")
    };

    auto once = filter.filter(messages);
    auto twice = filter.filter(once);
    EXPECT_EQ(once, twice);
}
