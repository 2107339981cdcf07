#include <gtest/gtest.h>
#include "clawlink/chat_session.hpp"
#include "mocks/mock_transport.hpp"
#include "fixtures/gateway_frames.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace clawlink;
using namespace std::chrono_literals;
using clawlink::testing::MockTransport;
namespace fixtures = clawlink::testing::fixtures;

class ChatSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<MockTransport>();
        transport_->accept_handshake([this](const nlohmann::json& request) -> std::optional<std::string> {
            const std::string id = request["id"].get<std::string>();
            const std::string method = request.value("method", "");
            if (method == "chat.history") {
                return fixtures::ok_response(id, history_payload_);
            }
            if (method == "chat.send") {
                if (!send_error_.empty()) {
                    return fixtures::error_response(id, send_error_);
                }
                if (!ack_send_) {
                    return std::nullopt;
                }
                return fixtures::ok_response(id, {{"runId", "run-1"}, {"status", "started"}});
            }
            return std::nullopt;
        });

        Config config;
        config.url = "ws://localhost:18789";
        config.token = "t1";
        config.challenge_poll_interval = 5ms;
        config.send_ack_timeout = 2s;
        config_ = config;

        auto transport = transport_;
        auto result = Connection::create(config_, [transport]() { return transport; });
        ASSERT_TRUE(result.has_value());
        connection_ = std::move(*result);
        ASSERT_TRUE(connection_->connect().has_value());
    }

    void inject(const std::string& name, const nlohmann::json& payload) {
        transport_->inject_message(fixtures::event(name, payload));
    }

    std::shared_ptr<MockTransport> transport_;
    Config config_;
    std::unique_ptr<Connection> connection_;

    nlohmann::json history_payload_ = nlohmann::json::array();
    std::string send_error_;
    bool ack_send_ = true;
};

// ============================================================================
// History Tests
// ============================================================================

TEST_F(ChatSessionTest, LoadHistoryFiltersHeartbeatsAndEmptyMessages) {
    history_payload_ = fixtures::history_records();
    ChatSession chat(*connection_, "main");

    auto loaded = chat.load_history();

    ASSERT_TRUE(loaded.has_value()) << loaded.error().to_string();
    EXPECT_EQ(*loaded, 2u);
    auto messages = chat.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].id, "m1");
    EXPECT_EQ(messages[1].content, "Sunny.");
    EXPECT_EQ(messages[1].thinking, "Check the forecast");

    auto sent = transport_->sent_requests("chat.history");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["params"]["sessionKey"], "main");
}

TEST_F(ChatSessionTest, LoadHistoryAcceptsWrappedMessages) {
    history_payload_ = {{"messages", fixtures::history_records()}, {"sessionKey", "main"}};
    ChatSession chat(*connection_, "main");

    auto loaded = chat.load_history();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 2u);
}

TEST_F(ChatSessionTest, LoadHistoryWithUnexpectedShapeIsEmpty) {
    history_payload_ = {{"unexpected", true}};
    ChatSession chat(*connection_, "main");

    auto loaded = chat.load_history();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 0u);
    EXPECT_TRUE(chat.messages().empty());
}

TEST_F(ChatSessionTest, LoadHistoryWhenDisconnectedRecordsError) {
    ChatSession chat(*connection_, "main");
    connection_->disconnect();

    auto loaded = chat.load_history();

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::NotConnected);
    EXPECT_EQ(chat.last_error(), "Not connected to server");
}

// ============================================================================
// Send Tests
// ============================================================================

TEST_F(ChatSessionTest, SendMessageIssuesChatSend) {
    ChatSession chat(*connection_, "main");

    auto sent = chat.send_message("Hello there", std::string("low"));

    ASSERT_TRUE(sent.has_value()) << sent.error().to_string();
    auto requests = transport_->sent_requests("chat.send");
    ASSERT_EQ(requests.size(), 1u);
    const auto& params = requests[0]["params"];
    EXPECT_EQ(params["sessionKey"], "main");
    EXPECT_EQ(params["message"], "Hello there");
    EXPECT_EQ(params["thinking"], "low");
    ASSERT_TRUE(params["idempotencyKey"].is_string());
    EXPECT_FALSE(params["idempotencyKey"].get<std::string>().empty());

    auto messages = chat.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(messages[0].is_user());
    EXPECT_EQ(messages[0].content, "Hello there");
    EXPECT_TRUE(chat.is_streaming());
}

TEST_F(ChatSessionTest, IdempotencyKeysDifferPerSend) {
    ChatSession chat(*connection_, "main");
    ASSERT_TRUE(chat.send_message("one").has_value());
    ASSERT_TRUE(chat.send_message("two").has_value());

    auto requests = transport_->sent_requests("chat.send");
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0]["params"]["idempotencyKey"], requests[1]["params"]["idempotencyKey"]);
    EXPECT_FALSE(requests[0]["params"].contains("thinking"));
}

TEST_F(ChatSessionTest, RejectsBlankAndOversizedMessages) {
    ChatSession chat(*connection_, "main");

    auto blank = chat.send_message("   \n\t");
    ASSERT_FALSE(blank.has_value());
    EXPECT_EQ(blank.error().code, ErrorCode::InvalidMessage);

    auto oversized = chat.send_message(std::string(ChatSession::kMaxMessageLength + 1, 'x'));
    ASSERT_FALSE(oversized.has_value());
    EXPECT_EQ(oversized.error().code, ErrorCode::InvalidMessage);

    EXPECT_TRUE(chat.send_message(std::string(ChatSession::kMaxMessageLength, 'x')).has_value());
    EXPECT_EQ(transport_->sent_requests("chat.send").size(), 1u);
}

TEST_F(ChatSessionTest, LengthLimitCountsCharactersNotBytes) {
    ChatSession chat(*connection_, "main");

    // U+00E9 is two bytes in UTF-8
    std::string text;
    for (size_t i = 0; i < ChatSession::kMaxMessageLength; ++i) {
        text += "\xC3\xA9";
    }
    EXPECT_TRUE(chat.send_message(text).has_value());
}

TEST_F(ChatSessionTest, ServerErrorAbandonsTurnAndAppendsErrorMessage) {
    send_error_ = "session busy";
    ChatSession chat(*connection_, "main");

    auto sent = chat.send_message("hi");

    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::ServerError);
    EXPECT_FALSE(chat.is_streaming());
    EXPECT_EQ(chat.last_error(), "Server error: session busy");

    auto messages = chat.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_TRUE(messages[0].is_user());
    EXPECT_TRUE(messages[1].is_system());
}

TEST_F(ChatSessionTest, AcknowledgementTimeoutIsNotAFailure) {
    ack_send_ = false;
    connection_.reset();

    Config config = config_;
    config.send_ack_timeout = 30ms;
    auto transport = transport_;
    auto result = Connection::create(config, [transport]() { return transport; });
    ASSERT_TRUE(result.has_value());
    connection_ = std::move(*result);
    ASSERT_TRUE(connection_->connect().has_value());

    ChatSession chat(*connection_, "main");
    auto sent = chat.send_message("slow gateway");

    EXPECT_TRUE(sent.has_value());
    EXPECT_TRUE(chat.is_streaming());
    EXPECT_FALSE(chat.last_error().has_value());
}

TEST_F(ChatSessionTest, SendWhenDisconnectedFails) {
    ChatSession chat(*connection_, "main");
    connection_->disconnect();

    auto sent = chat.send_message("hello?");

    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::NotConnected);
    EXPECT_FALSE(chat.is_streaming());
}

// ============================================================================
// Streaming Tests
// ============================================================================

TEST_F(ChatSessionTest, StreamedReplyLandsInTranscript) {
    ChatSession chat(*connection_, "main");
    std::vector<std::string> drafts;
    std::vector<Message> finals;
    chat.set_stream_handlers({
        [&drafts](const Message& draft) { drafts.push_back(draft.content); },
        [&finals](const Message& message) { finals.push_back(message); },
        nullptr
    });

    ASSERT_TRUE(chat.send_message("Say hello").has_value());
    inject("chat", fixtures::chat_delta("main", "Hel"));

    auto live = chat.messages();
    ASSERT_EQ(live.size(), 2u);
    EXPECT_EQ(live[1].id, "streaming-main");
    EXPECT_EQ(live[1].content, "Hel");

    inject("chat", fixtures::chat_delta("main", "lo"));
    inject("chat", fixtures::chat_final("main", "msg-1", "Hello"));

    EXPECT_EQ(drafts, (std::vector<std::string>{"Hel", "Hello"}));
    ASSERT_EQ(finals.size(), 1u);

    auto messages = chat.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].id, "msg-1");
    EXPECT_EQ(messages[1].content, "Hello");
    EXPECT_FALSE(chat.is_streaming());
}

TEST_F(ChatSessionTest, StreamingErrorAppendsSystemMessage) {
    ChatSession chat(*connection_, "main");
    std::vector<std::string> errors;
    chat.set_stream_handlers({nullptr, nullptr, [&errors](const std::string& e) { errors.push_back(e); }});

    ASSERT_TRUE(chat.send_message("go").has_value());
    inject("agent", {{"sessionKey", "main"}, {"stream", "lifecycle"}, {"data", {{"phase", "error"}, {"error", "tool crashed"}}}});

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(chat.last_error(), "tool crashed");
    auto messages = chat.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_TRUE(messages[1].is_system());
    EXPECT_EQ(messages[1].content, "Error: tool crashed");
}

TEST_F(ChatSessionTest, OtherSessionEventsAreIgnored) {
    ChatSession chat(*connection_, "main");
    ChatSession other(*connection_, "side");

    inject("chat", fixtures::chat_delta("side", "for side"));
    inject("chat", fixtures::chat_final("side", "s1", "for side"));

    EXPECT_TRUE(chat.messages().empty());
    ASSERT_EQ(other.messages().size(), 1u);
    EXPECT_EQ(other.messages()[0].content, "for side");
}

TEST_F(ChatSessionTest, DestructionRemovesListener) {
    {
        ChatSession chat(*connection_, "main");
        EXPECT_TRUE(connection_->dispatcher().has_listener("chat:main"));
    }
    EXPECT_FALSE(connection_->dispatcher().has_listener("chat:main"));
    EXPECT_NO_THROW(inject("chat", fixtures::chat_delta("main", "orphan")));
}
