#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "e2e/e2e_support.hpp"

namespace {

using sent::testing::kOpsToken;
namespace websocket = boost::beast::websocket;

constexpr auto kPingPeriod = std::chrono::milliseconds(900);
constexpr auto kPongWait = std::chrono::milliseconds(1000);

class HeartbeatFixture : public sent::testing::ServerFixture {
 protected:
  void ConfigureServer(sent::AppConfig& config) override {
    config.ws_ping_period_ms = static_cast<std::size_t>(kPingPeriod.count());
    config.ws_pong_wait_ms = static_cast<std::size_t>(kPongWait.count());
    config.ws_max_message_bytes = 1024;
  }

  void SetUp() override {
    ServerFixture::SetUp();
    if (HasFatalFailure()) {
      return;
    }
    repository_->CreateMessage("hb", sent::Identity{"system", "System", ""}, "welcome");
  }

  // 읽기를 계속하는 관찰자. 구독 후 히스토리 프레임까지 소비한다.
  std::unique_ptr<WebSocket> Watcher(boost::beast::flat_buffer& buffer) {
    auto ws = ConnectWs(TokenFor("u-watch", "Watch"));
    ReadUntil(*ws, buffer, "connected");
    SendWs(*ws, {{"type", "subscribe"}, {"room_id", "hb"}});
    EXPECT_TRUE(ReadUntil(*ws, buffer, "message").value("history", false));
    return ws;
  }

  // 닫힘이나 오류가 날 때까지 읽는다.
  boost::beast::error_code DrainUntilError(WebSocket& ws) {
    boost::beast::flat_buffer buffer;
    boost::beast::error_code ec;
    for (int i = 0; i < 16 && !ec; ++i) {
      buffer.consume(buffer.size());
      ws.read(buffer, ec);
    }
    return ec;
  }
};

TEST_F(HeartbeatFixture, SilentPeerIsTornDownOnceLivenessWindowPasses) {
  boost::beast::flat_buffer watch_buf;
  auto watcher = Watcher(watch_buf);

  // 핸드셰이크 이후 구독 프레임 하나만 보내고 다시는 읽지 않는 클라이언트. 퐁을 돌려주지 않는다.
  auto silent = ConnectWs(TokenFor("u-silent", "Silent"));
  auto last_sent = std::chrono::steady_clock::now();
  SendWs(*silent, {{"type", "subscribe"}, {"room_id", "hb"}});
  ASSERT_EQ(ReadUntil(*watcher, watch_buf, "system")["user_id"], "u-silent");

  auto left = ReadUntil(*watcher, watch_buf, "system");
  auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - last_sent).count();
  EXPECT_EQ(left["action"], "left");
  EXPECT_EQ(left["user_id"], "u-silent");
  EXPECT_GE(elapsed_ms, kPongWait.count() - 100);
  EXPECT_LT(elapsed_ms, kPongWait.count() + kPingPeriod.count() / 2);

  EXPECT_TRUE(static_cast<bool>(DrainUntilError(*silent)));
  watcher->close(websocket::close_code::normal);
}

TEST_F(HeartbeatFixture, ReadingPeerAnswersPingsAndStaysConnected) {
  auto alive = ConnectWs(TokenFor("u-alive", "Alive"));
  std::atomic<int> pings{0};
  alive->control_callback([&pings](websocket::frame_type kind, boost::beast::string_view) {
    if (kind == websocket::frame_type::ping) {
      ++pings;
    }
  });

  std::atomic<bool> notified{false};
  std::thread reader([&]() {
    boost::beast::flat_buffer buffer;
    try {
      for (;;) {
        auto frame = ReadWs(*alive, buffer);
        if (frame.value("type", "") == "notification") {
          notified = true;
          return;
        }
      }
    } catch (const boost::beast::system_error&) {
    }
  });

  std::this_thread::sleep_for(kPongWait * 2 + kPingPeriod / 2);
  auto status = Get("/ops/status", kOpsToken);
  EXPECT_EQ(status.body["data"]["activeWebsocket"], 1);

  auto res = PostJson("/ops/notify", {{"userId", "u-alive"}, {"type", "message"}}, kOpsToken);
  EXPECT_EQ(res.body["data"]["receivers"], 1);
  reader.join();

  EXPECT_TRUE(notified.load());
  EXPECT_GE(pings.load(), 2);
  alive->close(websocket::close_code::normal);
}

TEST_F(HeartbeatFixture, OversizedFrameClosesTheConnection) {
  boost::beast::flat_buffer watch_buf;
  auto watcher = Watcher(watch_buf);

  auto big = ConnectWs(TokenFor("u-big", "Big"));
  boost::beast::flat_buffer big_buf;
  ReadUntil(*big, big_buf, "connected");
  SendWs(*big, {{"type", "subscribe"}, {"room_id", "hb"}});
  ASSERT_EQ(ReadUntil(*watcher, watch_buf, "system")["user_id"], "u-big");

  SendWs(*big, {{"type", "message"}, {"room_id", "hb"}, {"content", std::string(4096, 'x')}});

  auto next = ReadWs(*watcher, watch_buf);
  EXPECT_EQ(next["type"], "system");
  EXPECT_EQ(next["action"], "left");
  EXPECT_EQ(next["user_id"], "u-big");
  EXPECT_EQ(repository_->MessageCount("hb"), 1u);

  auto ec = DrainUntilError(*big);
  EXPECT_TRUE(static_cast<bool>(ec));
  if (ec == websocket::error::closed) {
    EXPECT_EQ(big->reason().code, websocket::close_code::too_big);
  }
  watcher->close(websocket::close_code::normal);
}

}  // namespace
