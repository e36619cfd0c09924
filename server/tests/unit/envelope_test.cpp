#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "sent/chat_repository.hpp"
#include "sent/envelope.hpp"

namespace {
std::optional<sent::InboundFrame> Decode(const std::string& raw, std::string& code) {
  std::string message;
  return sent::DecodeClientFrame(raw, code, message);
}
}  // namespace

TEST(EnvelopeTest, DecodesChatFrame) {
  std::string code;
  auto frame = Decode(R"({"type":"message","room_id":"r1","content":"hi"})", code);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->kind, sent::EnvelopeKind::kChat);
  EXPECT_EQ(frame->room_id, "r1");
  EXPECT_EQ(std::get<sent::ChatPayload>(frame->payload).content, "hi");
}

TEST(EnvelopeTest, DecodesReadFrameIds) {
  std::string code;
  auto frame = Decode(R"({"type":"read","room_id":"r1","data":{"message_ids":["a","b"]}})", code);
  ASSERT_TRUE(frame.has_value());
  const auto& ids = std::get<sent::ReadPayload>(frame->payload).message_ids;
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids[1], "b");
}

TEST(EnvelopeTest, CreateThreadDoesNotNeedRoom) {
  std::string code;
  auto frame = Decode(R"({"type":"create_thread","data":{"title":"plans"}})", code);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->kind, sent::EnvelopeKind::kCreateThread);
  EXPECT_EQ(std::get<sent::CreateThreadPayload>(frame->payload).title, "plans");
}

TEST(EnvelopeTest, RejectsMalformedFrames) {
  struct Case {
    const char* raw;
    const char* code;
  };
  const Case cases[] = {
      {"{", "bad_request"},
      {"[1,2]", "bad_request"},
      {R"({"room_id":"r1"})", "bad_request"},
      {R"({"type":"wave","room_id":"r1"})", "unknown_type"},
      {R"({"type":"subscribe"})", "missing_room"},
      {R"({"type":"message","room_id":"r1","content":5})", "invalid_payload"},
      {R"({"type":"message","room_id":"r1"})", "empty_content"},
      {R"({"type":"typing","room_id":"r1","data":{"is_typing":"yes"}})", "invalid_payload"},
      {R"({"type":"read","room_id":"r1","data":{"message_ids":[1]}})", "invalid_payload"},
      {R"({"type":"create_thread","data":{}})", "invalid_payload"},
  };
  for (const auto& c : cases) {
    std::string code;
    EXPECT_FALSE(Decode(c.raw, code).has_value()) << c.raw;
    EXPECT_EQ(code, c.code) << c.raw;
  }
}

TEST(EnvelopeTest, ChatFrameMarksHistory) {
  sent::StoredMessage message{"m1", "r1", "u1", "hello",
                              std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123)),
                              "alice", "a.png"};
  auto live = sent::MakeChatFrame(message, false);
  auto replay = sent::MakeChatFrame(message, true);
  EXPECT_EQ(live["type"], "message");
  EXPECT_EQ(live["created_at"], "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(live["user_name"], "alice");
  EXPECT_FALSE(live.contains("history"));
  EXPECT_TRUE(replay["history"].get<bool>());
}

TEST(EnvelopeTest, SystemFrameCarriesAction) {
  sent::Identity user{"u1", "alice", ""};
  auto joined = sent::MakeSystemFrame(sent::EnvelopeKind::kSystemJoin, "r1", user);
  auto left = sent::MakeSystemFrame(sent::EnvelopeKind::kSystemLeave, "r1", user);
  EXPECT_EQ(joined["type"], "system");
  EXPECT_EQ(joined["action"], "joined");
  EXPECT_EQ(left["action"], "left");
  EXPECT_EQ(joined["data"]["user_name"], "alice");
}

TEST(EnvelopeTest, ErrorFrameShape) {
  auto with_room = sent::MakeErrorFrame("not_subscribed", "구독하지 않은 방입니다", "r1");
  auto without_room = sent::MakeErrorFrame("bad_request", "JSON 파싱 오류");
  EXPECT_EQ(with_room["type"], "error");
  EXPECT_FALSE(with_room["success"].get<bool>());
  EXPECT_EQ(with_room["room_id"], "r1");
  EXPECT_FALSE(without_room.contains("room_id"));
}

TEST(EnvelopeTest, RestEnvelopeShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = sent::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));

  auto err = sent::MakeErrorEnvelope("unauthorized", "인증이 필요합니다");
  EXPECT_FALSE(err["success"].get<bool>());
  EXPECT_TRUE(err["data"].is_null());
  EXPECT_EQ(err["error"]["code"], "unauthorized");
}
