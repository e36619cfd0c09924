/*
 * 설명: 채팅 와이어 엔벨로프의 종류, 인바운드 디코딩, 아웃바운드 프레임 생성과 REST 응답 엔벨로프를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "sent/identity.hpp"

namespace sent {

enum class EnvelopeKind {
  kChat,
  kTyping,
  kRead,
  kSubscribe,
  kUnsubscribe,
  kCreateThread,
  kSystemJoin,
  kSystemLeave,
  kThreadCreated,
  kMessageSent,
  kError,
  kNotification,
  kConnected,
};

std::string_view EnvelopeKindName(EnvelopeKind kind);

struct ChatPayload {
  std::string content;
};

struct TypingPayload {
  bool is_typing{false};
};

struct ReadPayload {
  std::vector<std::string> message_ids;
};

struct CreateThreadPayload {
  std::string title;
};

using InboundPayload = std::variant<std::monostate, ChatPayload, TypingPayload, ReadPayload, CreateThreadPayload>;

struct InboundFrame {
  EnvelopeKind kind;
  std::string room_id;
  InboundPayload payload;
};

// 클라이언트 프레임 하나를 해석한다. 실패 시 error_code/error_message를 채우고 nullopt를 반환한다.
std::optional<InboundFrame> DecodeClientFrame(std::string_view raw, std::string& error_code,
                                              std::string& error_message);

struct StoredMessage;

std::string FormatIsoTime(std::chrono::system_clock::time_point tp);
std::string NowIsoString();

nlohmann::json MakeChatFrame(const StoredMessage& message, bool history);
nlohmann::json MakeSystemFrame(EnvelopeKind kind, const std::string& room_id, const Identity& user);
nlohmann::json MakeTypingFrame(const std::string& room_id, const Identity& user, bool is_typing);
nlohmann::json MakeReadFrame(const std::string& room_id, const Identity& user,
                             const std::vector<std::string>& message_ids);
nlohmann::json MakeMessageSentFrame(const std::string& room_id, const std::string& message_id);
nlohmann::json MakeThreadCreatedFrame(const std::string& room_id, const std::string& title);
nlohmann::json MakeConnectedFrame(const Identity& user);
nlohmann::json MakeErrorFrame(std::string_view code, std::string_view message, std::string_view room_id = {});

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

}  // namespace sent
