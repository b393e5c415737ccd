#include <gtest/gtest.h>
#include <transport/channel_handler.hpp>
#include <transport/event_router.hpp>
#include <session/session_manager.hpp>
#include <pool/connection_pool.hpp>
#include <core/utils.hpp>
#include "fake_remote.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace {

// Collects everything a handler sends so tests can wait on it.
class RecordingSink : public MessageSink {
public:
    bool send(const ServerMessage& message) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
        }
        cv_.notify_all();
        return true;
    }

    void close() override { closed = true; }

    // First message satisfying pred, waiting up to timeout for it.
    std::optional<ServerMessage> wait_for(const std::function<bool(const ServerMessage&)>& pred,
                                          std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<ServerMessage> found;
        cv_.wait_for(lock, timeout, [&] {
            for (const auto& m : messages_) {
                if (pred(m)) {
                    found = m;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    template <typename T>
    std::optional<T> wait_for_type(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto m = wait_for([](const ServerMessage& m) { return std::holds_alternative<T>(m); },
                          timeout);
        if (!m) return std::nullopt;
        return std::get<T>(*m);
    }

    std::vector<ServerMessage> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    size_t count_errors() {
        size_t n = 0;
        for (const auto& m : messages()) {
            if (std::holds_alternative<ErrorReply>(m)) n++;
        }
        return n;
    }

    std::atomic<bool> closed{false};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ServerMessage> messages_;
};

Config channel_config() {
    auto config = Config::parse(
        "sessions:\n"
        "  shell: /bin/sh\n"
        "  max_sessions: 8\n"
        "  worker_threads: 2\n"
        "pool:\n"
        "  connect_retries: 0\n"
        "protocol:\n"
        "  max_malformed: 3\n"
        "targets:\n"
        "  - name: build\n"
        "    host: build.example.com\n"
        "    user: ci\n");
    EXPECT_TRUE(config.is_ok()) << config.error.message;
    return config.value;
}

std::string b64(const std::string& s) {
    return base64_encode(s);
}

class ChannelHandlerTest : public ::testing::Test {
protected:
    ChannelHandlerTest()
        : config(channel_config()),
          breakers(config.breaker()),
          pool(remote, config.pool(), breakers),
          sessions(config, &pool),
          router(sessions) {}

    void SetUp() override {
        ASSERT_TRUE(sessions.start().is_ok());
        router.start();
        sink = std::make_shared<RecordingSink>();
        handler = std::make_shared<ChannelHandler>("c1", config, sessions, router, &pool, sink);
        router.add_channel("c1", handler);
    }

    void TearDown() override {
        router.remove_channel("c1");
        handler->disconnect();
        router.stop();
        sessions.shutdown();
        pool.stop();
    }

    std::string open_local() {
        EXPECT_TRUE(handler->handle_line(R"({"type":"open","request_id":"o1"})"));
        auto opened = sink->wait_for_type<OpenedReply>();
        EXPECT_TRUE(opened.has_value());
        return opened ? opened->session_id : "";
    }

    Config config;
    FakeRemote remote;
    CircuitBreakerRegistry breakers;
    ConnectionPool pool;
    SessionManager sessions;
    EventRouter router;
    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<ChannelHandler> handler;
};

} // namespace

TEST_F(ChannelHandlerTest, OpenLocalRepliesAndOwns) {
    std::string id = open_local();
    ASSERT_FALSE(id.empty());
    EXPECT_TRUE(handler->owns(id));
    EXPECT_EQ(router.route_count(), 1u);

    auto opened = sink->wait_for_type<OpenedReply>();
    EXPECT_EQ(opened->request_id, std::optional<std::string>("o1"));

    auto connected = sink->wait_for_type<ConnectedNotice>();
    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ(connected->session_id, id);
}

TEST_F(ChannelHandlerTest, InputProducesOutputNotices) {
    std::string id = open_local();
    std::string line = R"({"type":"input","session_id":")" + id + R"(","data":")" +
                       b64("echo $((40+2))\n") + R"("})";
    ASSERT_TRUE(handler->handle_line(line));

    auto found = sink->wait_for([&](const ServerMessage& m) {
        auto* out = std::get_if<OutputNotice>(&m);
        return out && out->session_id == id && out->data.find("42") != std::string::npos;
    });
    EXPECT_TRUE(found.has_value());
}

TEST_F(ChannelHandlerTest, MalformedThresholdClosesChannel) {
    EXPECT_TRUE(handler->handle_line("{not json"));
    EXPECT_TRUE(handler->handle_line(R"({"type":"teleport"})"));
    EXPECT_TRUE(handler->reject_line("message exceeds 1048576 bytes"));
    EXPECT_EQ(handler->malformed_count(), 3);

    EXPECT_FALSE(handler->handle_line(R"({"type":"input","session_id":"s"})"));
    EXPECT_EQ(handler->malformed_count(), 4);

    auto last = sink->messages().back();
    ASSERT_TRUE(std::holds_alternative<ErrorReply>(last));
    EXPECT_EQ(std::get<ErrorReply>(last).message, "too many malformed messages");
    EXPECT_EQ(sink->count_errors(), 5u);
}

TEST_F(ChannelHandlerTest, ValidMessagesDoNotResetMalformedCount) {
    EXPECT_TRUE(handler->handle_line("garbage"));
    EXPECT_TRUE(handler->handle_line(R"({"type":"stats"})"));
    EXPECT_TRUE(handler->handle_line("garbage"));
    EXPECT_EQ(handler->malformed_count(), 2);
}

TEST_F(ChannelHandlerTest, ErrorEchoesRequestId) {
    ASSERT_TRUE(handler->handle_line(R"({"type":"open","kind":"remote","target":"nowhere","request_id":9})"));
    auto error = sink->wait_for_type<ErrorReply>();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ProtocolError);
    EXPECT_EQ(error->request_id, std::optional<std::string>("9"));
    // A bad target is a failed operation, not a malformed message
    EXPECT_EQ(handler->malformed_count(), 0);
}

TEST_F(ChannelHandlerTest, SessionsArePrivateToTheirChannel) {
    std::string id = open_local();

    auto other_sink = std::make_shared<RecordingSink>();
    auto other = std::make_shared<ChannelHandler>("c2", config, sessions, router, &pool, other_sink);
    router.add_channel("c2", other);

    std::string line = R"({"type":"input","session_id":")" + id + R"(","data":")" + b64("ls\n") + R"("})";
    ASSERT_TRUE(other->handle_line(line));
    auto error = other_sink->wait_for_type<ErrorReply>();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::SessionNotFound);
    EXPECT_EQ(error->session_id, std::optional<std::string>(id));

    ASSERT_TRUE(other->handle_line(R"({"type":"close","session_id":")" + id + R"("})"));
    EXPECT_EQ(sessions.active_count(), 1u);
    router.remove_channel("c2");
}

TEST_F(ChannelHandlerTest, CloseEmitsClosedThenInputFails) {
    std::string id = open_local();
    ASSERT_TRUE(handler->handle_line(R"({"type":"close","session_id":")" + id + R"("})"));

    auto closed = sink->wait_for_type<ClosedNotice>();
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->session_id, id);
    EXPECT_FALSE(closed->kind.has_value());
    EXPECT_FALSE(handler->owns(id));

    // Closing again is a no-op
    ASSERT_TRUE(handler->handle_line(R"({"type":"close","session_id":")" + id + R"("})"));
    EXPECT_EQ(sink->count_errors(), 0u);

    ASSERT_TRUE(handler->handle_line(R"({"type":"input","session_id":")" + id + R"(","data":"eA=="})"));
    auto error = sink->wait_for_type<ErrorReply>();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::SessionClosed);
}

TEST_F(ChannelHandlerTest, DisconnectClosesOwnedSessions) {
    open_local();
    ASSERT_TRUE(handler->handle_line(R"({"type":"open"})"));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (handler->owned_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(sessions.active_count(), 2u);

    router.remove_channel("c1");
    handler->disconnect();
    EXPECT_EQ(sessions.active_count(), 0u);
    EXPECT_EQ(handler->owned_count(), 0u);
    EXPECT_EQ(router.route_count(), 0u);
}

TEST_F(ChannelHandlerTest, RemoteSessionThroughPool) {
    ASSERT_TRUE(handler->handle_line(R"({"type":"open","kind":"remote","target":"build"})"));
    auto opened = sink->wait_for_type<OpenedReply>();
    ASSERT_TRUE(opened.has_value());
    auto connected = sink->wait_for_type<ConnectedNotice>();
    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ(connected->session_id, opened->session_id);

    remote.last_shell()->emit("remote$ ");
    auto output = sink->wait_for_type<OutputNotice>();
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->data, "remote$ ");
}

TEST_F(ChannelHandlerTest, ExecRepliesAsynchronously) {
    remote.exec_handler = [](const std::string& command) {
        ExecResult result;
        result.exit_code = 1;
        result.stdout_data = "ran: " + command;
        return Result<ExecResult>::Ok(result);
    };
    ASSERT_TRUE(handler->handle_line(
        R"({"type":"exec","target":"build","command":"false","request_id":"e1"})"));

    auto reply = sink->wait_for_type<ExecReply>();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->request_id, std::optional<std::string>("e1"));
    EXPECT_EQ(reply->result.exit_code, 1);
    EXPECT_EQ(reply->result.stdout_data, "ran: false");
}

TEST_F(ChannelHandlerTest, ExecReportsCircuitOpen) {
    remote.refuse = ErrorKind::ConnectTimeout;
    for (int i = 0; i < config.breaker().failure_threshold; ++i) {
        ASSERT_TRUE(pool.acquire(Target{"build.example.com", 22, "ci"}).is_err());
    }
    ASSERT_TRUE(handler->handle_line(
        R"({"type":"exec","target":"build","command":"uptime","request_id":"e2"})"));

    auto error = sink->wait_for_type<ErrorReply>();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::CircuitOpen);
    EXPECT_EQ(error->request_id, std::optional<std::string>("e2"));
}

TEST_F(ChannelHandlerTest, StatsReportsSessionsAndTargets) {
    open_local();
    ASSERT_TRUE(pool.warm_up(Target{"build.example.com", 22, "ci"}, 1).is_ok());
    ASSERT_TRUE(handler->handle_line(R"({"type":"stats","request_id":"s"})"));

    auto stats = sink->wait_for_type<StatsReply>();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->sessions, 1u);
    ASSERT_EQ(stats->targets.size(), 1u);
    EXPECT_EQ(stats->targets[0].idle, 1);
    EXPECT_EQ(stats->targets[0].circuit, CircuitBreaker::State::Closed);
    EXPECT_EQ(stats->routes, 1u);
    EXPECT_EQ(stats->queued_tasks, 0u);
}

TEST_F(ChannelHandlerTest, ListReturnsOwnedSessions) {
    std::string id = open_local();
    ASSERT_TRUE(handler->handle_line(R"({"type":"list","request_id":"l1"})"));

    auto listed = sink->wait_for_type<ListReply>();
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->request_id, std::optional<std::string>("l1"));
    ASSERT_EQ(listed->sessions.size(), 1u);
    EXPECT_EQ(listed->sessions[0].id, id);
    EXPECT_EQ(listed->sessions[0].kind, SessionKind::Local);
    EXPECT_FALSE(listed->sessions[0].target.has_value());
    EXPECT_GT(listed->sessions[0].last_activity, 0);
}
