#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "e2e/e2e_support.hpp"

namespace {

using sent::testing::ExpectErrorEnvelope;
using sent::testing::ExpectSuccessEnvelope;
using sent::testing::kOpsToken;
namespace http = boost::beast::http;

class MetricsOpsFixture : public sent::testing::ServerFixture {
 protected:
  // 등록/해제는 코디네이터 스트랜드에서 비동기로 반영되므로 잠시 기다린다.
  nlohmann::json WaitForStatus(std::uint64_t active_websocket) {
    nlohmann::json data;
    for (int i = 0; i < 50; ++i) {
      auto res = Get("/ops/status", kOpsToken);
      data = res.body["data"];
      if (data["activeWebsocket"] == active_websocket) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return data;
  }
};

TEST_F(MetricsOpsFixture, HealthReportsVersion) {
  auto res = Get("/api/health");
  EXPECT_EQ(res.status, http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["status"], "ok");
}

TEST_F(MetricsOpsFixture, MetricsExposeDeliveryCounters) {
  auto res = Get("/metrics");
  EXPECT_EQ(res.status, http::status::ok);
  ExpectSuccessEnvelope(res.body);
  const auto& data = res.body["data"];
  EXPECT_TRUE(data["requests"]["total"].is_number_unsigned());
  EXPECT_TRUE(data["connections"]["websocket"].is_number_unsigned());
  EXPECT_TRUE(data["rooms"]["active"].is_number_unsigned());
  EXPECT_TRUE(data["broadcasts"]["total"].is_number_unsigned());
  EXPECT_TRUE(data["broadcasts"]["delivered"].is_number_unsigned());
  EXPECT_EQ(data["backpressureDisconnects"], 0);
  EXPECT_EQ(data["notificationsForwarded"], 0);
  EXPECT_TRUE(data["protocolErrors"].is_number_unsigned());
}

TEST_F(MetricsOpsFixture, OpsEndpointsRequireToken) {
  auto missing = Get("/ops/status");
  EXPECT_EQ(missing.status, http::status::unauthorized);
  ExpectErrorEnvelope(missing.body, "unauthorized");

  auto wrong = Get("/ops/status", "guess");
  EXPECT_EQ(wrong.status, http::status::unauthorized);

  auto notify = PostJson("/ops/notify", {{"userId", "u1"}, {"type", "message"}});
  EXPECT_EQ(notify.status, http::status::unauthorized);
}

TEST_F(MetricsOpsFixture, StatusTracksConnectionsAndRooms) {
  auto initial = Get("/ops/status", kOpsToken);
  EXPECT_EQ(initial.status, http::status::ok);
  ExpectSuccessEnvelope(initial.body);
  EXPECT_EQ(initial.body["data"]["activeWebsocket"], 0);
  EXPECT_EQ(initial.body["data"]["broker"], "memory");

  auto ws = ConnectWs(TokenFor("u-ops", "Ops"));
  boost::beast::flat_buffer buffer;
  ReadUntil(*ws, buffer, "connected");
  ws->text(true);
  ws->write(boost::asio::buffer(nlohmann::json{{"type", "subscribe"}, {"room_id", "lobby"}}.dump()));

  auto connected = WaitForStatus(1);
  EXPECT_EQ(connected["activeWebsocket"], 1);
  for (int i = 0; i < 50 && connected["activeRooms"] != 1; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    connected = Get("/ops/status", kOpsToken).body["data"];
  }
  EXPECT_EQ(connected["activeRooms"], 1);

  ws->close(boost::beast::websocket::close_code::normal);
  auto closed = WaitForStatus(0);
  EXPECT_EQ(closed["activeWebsocket"], 0);
  EXPECT_EQ(closed["activeRooms"], 0);
}

TEST_F(MetricsOpsFixture, NotifyValidatesInput) {
  auto bad_json = Request(http::verb::post, "/ops/notify", "{", kOpsToken);
  EXPECT_EQ(bad_json.status, http::status::bad_request);
  ExpectErrorEnvelope(bad_json.body, "bad_request");

  auto missing_user = PostJson("/ops/notify", {{"type", "friend_request"}}, kOpsToken);
  EXPECT_EQ(missing_user.status, http::status::bad_request);

  auto unknown_kind = PostJson("/ops/notify", {{"userId", "u1"}, {"type", "poke"}}, kOpsToken);
  EXPECT_EQ(unknown_kind.status, http::status::bad_request);

  auto bad_data = PostJson("/ops/notify", {{"userId", "u1"}, {"type", "message"}, {"data", "text"}}, kOpsToken);
  EXPECT_EQ(bad_data.status, http::status::bad_request);
}

TEST_F(MetricsOpsFixture, ForwardedNotificationIsCounted) {
  auto ws = ConnectWs(TokenFor("u-bell", "Bell"));
  boost::beast::flat_buffer buffer;
  ReadUntil(*ws, buffer, "connected");

  auto res = PostJson("/ops/notify", {{"userId", "u-bell"}, {"type", "friend_accepted"}}, kOpsToken);
  EXPECT_EQ(res.status, http::status::accepted);
  EXPECT_EQ(res.body["data"]["receivers"], 1);
  EXPECT_TRUE(res.body["data"]["notification"]["data"].is_object());

  auto frame = ReadWs(*ws, buffer);
  EXPECT_EQ(frame["kind"], "friend_accepted");
  EXPECT_EQ(Get("/metrics").body["data"]["notificationsForwarded"], 1);
  ws->close(boost::beast::websocket::close_code::normal);
}

class VerboseLogFixture : public sent::testing::ServerFixture {
 protected:
  void ConfigureServer(sent::AppConfig& config) override { config.log_level = "info"; }
};

TEST_F(VerboseLogFixture, NonUtf8TargetIsAnsweredAndServerStaysUp) {
  auto res = Get("/x\xff\xfe");
  EXPECT_EQ(res.status, http::status::not_found);
  ExpectErrorEnvelope(res.body, "not_found");

  auto health = Get("/api/health");
  EXPECT_EQ(health.status, http::status::ok);
  EXPECT_EQ(health.body["data"]["status"], "ok");
}

}  // namespace
