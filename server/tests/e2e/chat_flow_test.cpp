#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "e2e/e2e_support.hpp"

namespace {

using sent::testing::ExpectErrorEnvelope;
using sent::testing::ExpectSuccessEnvelope;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

class ChatFlowFixture : public sent::testing::ServerFixture {
 protected:
  void SetUp() override {
    ServerFixture::SetUp();
    if (HasFatalFailure()) {
      return;
    }
    // 구독 직후 히스토리 프레임이 한 개 오도록 방마다 환영 메시지를 미리 저장한다.
    repository_->CreateMessage("r1", sent::Identity{"system", "System", ""}, "welcome");
  }

  struct Client {
    std::unique_ptr<WebSocket> ws;
    boost::beast::flat_buffer buffer;
  };

  Client Connect(const std::string& user_id, const std::string& name) {
    Client client{ConnectWs(TokenFor(user_id, name)), {}};
    auto connected = ReadWs(*client.ws, client.buffer);
    EXPECT_EQ(connected["type"], "connected");
    EXPECT_EQ(connected["user_id"], user_id);
    return client;
  }

  void Subscribe(Client& client, const std::string& room_id) {
    SendWs(*client.ws, {{"type", "subscribe"}, {"room_id", room_id}});
    auto history = ReadUntil(*client.ws, client.buffer, "message");
    EXPECT_TRUE(history.value("history", false));
    EXPECT_EQ(history["content"], "welcome");
  }
};

TEST_F(ChatFlowFixture, ChatReachesOtherMembersAndAcksSender) {
  auto alice = Connect("u-alice", "Alice");
  Subscribe(alice, "r1");
  auto bob = Connect("u-bob", "Bob");
  Subscribe(bob, "r1");

  auto joined = ReadWs(*alice.ws, alice.buffer);
  EXPECT_EQ(joined["type"], "system");
  EXPECT_EQ(joined["action"], "joined");
  EXPECT_EQ(joined["user_id"], "u-bob");

  SendWs(*alice.ws, {{"type", "message"}, {"room_id", "r1"}, {"content", "hello"}});

  auto ack = ReadWs(*alice.ws, alice.buffer);
  EXPECT_EQ(ack["type"], "message_sent");
  EXPECT_TRUE(ack["success"].get<bool>());
  ASSERT_TRUE(ack["message_id"].is_string());
  EXPECT_FALSE(ack["message_id"].get<std::string>().empty());

  auto received = ReadWs(*bob.ws, bob.buffer);
  EXPECT_EQ(received["type"], "message");
  EXPECT_EQ(received["content"], "hello");
  EXPECT_EQ(received["user_id"], "u-alice");
  EXPECT_EQ(received["user_name"], "Alice");
  EXPECT_EQ(received["id"], ack["message_id"]);
  EXPECT_FALSE(received.contains("history"));

  // 발신자에게 자신의 메시지가 돌아왔다면 다음 프레임이 typing이 아니다.
  SendWs(*bob.ws, {{"type", "typing"}, {"room_id", "r1"}, {"data", {{"is_typing", true}}}});
  auto next = ReadWs(*alice.ws, alice.buffer);
  EXPECT_EQ(next["type"], "typing");
  EXPECT_EQ(next["user_id"], "u-bob");

  EXPECT_EQ(repository_->MessageCount("r1"), 2u);
  alice.ws->close(websocket::close_code::normal);
  bob.ws->close(websocket::close_code::normal);
}

TEST_F(ChatFlowFixture, AbruptDisconnectAnnouncesLeave) {
  auto alice = Connect("u-alice", "Alice");
  Subscribe(alice, "r1");
  auto bob = Connect("u-bob", "Bob");
  Subscribe(bob, "r1");
  ASSERT_EQ(ReadWs(*alice.ws, alice.buffer)["action"], "joined");

  SendWs(*alice.ws, {{"type", "typing"}, {"room_id", "r1"}, {"data", {{"is_typing", true}}}});
  auto typing = ReadWs(*bob.ws, bob.buffer);
  EXPECT_EQ(typing["type"], "typing");
  EXPECT_EQ(typing["user_id"], "u-alice");
  EXPECT_TRUE(typing["data"]["is_typing"].get<bool>());

  boost::beast::error_code ec;
  alice.ws->next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  alice.ws->next_layer().socket().close(ec);

  auto left = ReadWs(*bob.ws, bob.buffer);
  EXPECT_EQ(left["type"], "system");
  EXPECT_EQ(left["action"], "left");
  EXPECT_EQ(left["user_id"], "u-alice");
  EXPECT_EQ(left["room_id"], "r1");
  bob.ws->close(websocket::close_code::normal);
}

TEST_F(ChatFlowFixture, NotificationsAreNotBufferedBeforeConnect) {
  auto missed = PostJson("/ops/notify", {{"userId", "u-carol"}, {"type", "friend_request"}, {"data", {{"from", "u-dave"}}}},
                         sent::testing::kOpsToken);
  EXPECT_EQ(missed.status, http::status::accepted);
  ExpectSuccessEnvelope(missed.body);
  EXPECT_EQ(missed.body["data"]["receivers"], 0);

  auto carol = Connect("u-carol", "Carol");
  auto delivered = PostJson("/ops/notify", {{"userId", "u-carol"}, {"type", "chat_invite"}, {"data", {{"room", "r9"}}}},
                            sent::testing::kOpsToken);
  EXPECT_EQ(delivered.status, http::status::accepted);
  EXPECT_EQ(delivered.body["data"]["receivers"], 1);

  auto notification = ReadWs(*carol.ws, carol.buffer);
  EXPECT_EQ(notification, delivered.body["data"]["notification"]);
  EXPECT_EQ(notification["type"], "notification");
  EXPECT_EQ(notification["kind"], "chat_invite");
  EXPECT_EQ(notification["user_id"], "u-carol");
  EXPECT_NE(notification["id"], missed.body["data"]["notification"]["id"]);
  carol.ws->close(websocket::close_code::normal);
}

TEST_F(ChatFlowFixture, MalformedFrameKeepsConnectionOpen) {
  auto alice = Connect("u-alice", "Alice");
  alice.ws->text(true);
  alice.ws->write(boost::asio::buffer(std::string("{not json")));
  auto error = ReadWs(*alice.ws, alice.buffer);
  EXPECT_EQ(error["type"], "error");
  EXPECT_EQ(error["code"], "bad_request");

  SendWs(*alice.ws, {{"type", "message"}, {"room_id", "r1"}, {"content", "sneaky"}});
  auto rejected = ReadWs(*alice.ws, alice.buffer);
  EXPECT_EQ(rejected["code"], "not_subscribed");

  Subscribe(alice, "r1");
  alice.ws->close(websocket::close_code::normal);
}

TEST_F(ChatFlowFixture, CreateThreadRepliesWithRoomId) {
  auto alice = Connect("u-alice", "Alice");
  SendWs(*alice.ws, {{"type", "create_thread"}, {"data", {{"title", "plans"}}}});
  auto created = ReadWs(*alice.ws, alice.buffer);
  EXPECT_EQ(created["type"], "thread_created");
  ASSERT_TRUE(created["thread_id"].is_string());
  auto members = repository_->ThreadMembers(created["thread_id"].get<std::string>());
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0], "u-alice");
  alice.ws->close(websocket::close_code::normal);
}

TEST_F(ChatFlowFixture, QueryTokenIsAccepted) {
  auto ws = std::make_unique<WebSocket>(ioc_);
  boost::asio::ip::tcp::resolver resolver{ioc_};
  ws->next_layer().connect(resolver.resolve(host_, std::to_string(port_)));
  ws->handshake(host_, "/ws?token=" + TokenFor("u-erin", "Erin"));
  boost::beast::flat_buffer buffer;
  auto connected = ReadWs(*ws, buffer);
  EXPECT_EQ(connected["user_id"], "u-erin");
  EXPECT_EQ(connected["user_name"], "Erin");
  ws->close(websocket::close_code::normal);
}

TEST_F(ChatFlowFixture, UpgradeWithoutTokenIsRejected) {
  auto ws = std::make_unique<WebSocket>(ioc_);
  boost::asio::ip::tcp::resolver resolver{ioc_};
  ws->next_layer().connect(resolver.resolve(host_, std::to_string(port_)));
  websocket::response_type res;
  boost::beast::error_code ec;
  ws->handshake(res, host_, "/ws", ec);
  EXPECT_EQ(ec, websocket::error::upgrade_declined);
  EXPECT_EQ(res.result(), http::status::unauthorized);
}

TEST_F(ChatFlowFixture, UpgradeWithForgedTokenIsRejected) {
  sent::JwtIdentityValidator forger("not-the-secret");
  auto forged = forger.Issue(sent::Identity{"u-mallory", "Mallory", ""}, std::chrono::seconds(60));
  auto ws = std::make_unique<WebSocket>(ioc_);
  boost::asio::ip::tcp::resolver resolver{ioc_};
  ws->next_layer().connect(resolver.resolve(host_, std::to_string(port_)));
  ws->set_option(websocket::stream_base::decorator([forged](websocket::request_type& req) {
    req.set(http::field::authorization, "Bearer " + forged);
  }));
  websocket::response_type res;
  boost::beast::error_code ec;
  ws->handshake(res, host_, "/ws", ec);
  EXPECT_EQ(ec, websocket::error::upgrade_declined);
  EXPECT_EQ(res.result(), http::status::unauthorized);
}

TEST_F(ChatFlowFixture, UnknownPathIsNotFound) {
  auto res = Get("/api/unknown");
  EXPECT_EQ(res.status, http::status::not_found);
  ExpectErrorEnvelope(res.body, "not_found");
}

}  // namespace
