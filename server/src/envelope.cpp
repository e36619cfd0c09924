/*
 * 설명: 인바운드 클라이언트 프레임을 해석하고 아웃바운드 프레임과 REST 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/envelope_test.cpp
 */
#include "sent/envelope.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "sent/chat_repository.hpp"

namespace sent {
namespace {
const nlohmann::json* FindData(const nlohmann::json& message) {
  auto it = message.find("data");
  if (it == message.end() || !it->is_object()) {
    return nullptr;
  }
  return &*it;
}

std::string RoomIdOf(const nlohmann::json& message) {
  auto it = message.find("room_id");
  if (it == message.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}
}  // namespace

std::string_view EnvelopeKindName(EnvelopeKind kind) {
  switch (kind) {
    case EnvelopeKind::kChat:
      return "message";
    case EnvelopeKind::kTyping:
      return "typing";
    case EnvelopeKind::kRead:
      return "read";
    case EnvelopeKind::kSubscribe:
      return "subscribe";
    case EnvelopeKind::kUnsubscribe:
      return "unsubscribe";
    case EnvelopeKind::kCreateThread:
      return "create_thread";
    case EnvelopeKind::kSystemJoin:
    case EnvelopeKind::kSystemLeave:
      return "system";
    case EnvelopeKind::kThreadCreated:
      return "thread_created";
    case EnvelopeKind::kMessageSent:
      return "message_sent";
    case EnvelopeKind::kError:
      return "error";
    case EnvelopeKind::kNotification:
      return "notification";
    case EnvelopeKind::kConnected:
      return "connected";
  }
  return "error";
}

std::optional<InboundFrame> DecodeClientFrame(std::string_view raw, std::string& error_code,
                                              std::string& error_message) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(raw.begin(), raw.end());
  } catch (const nlohmann::json::exception&) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!message.is_object()) {
    error_code = "bad_request";
    error_message = "잘못된 메시지 형식";
    return std::nullopt;
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    error_code = "bad_request";
    error_message = "type 필드가 필요합니다";
    return std::nullopt;
  }

  const auto type = type_it->get<std::string>();
  InboundFrame frame{EnvelopeKind::kError, RoomIdOf(message), std::monostate{}};

  if (type == "create_thread") {
    frame.kind = EnvelopeKind::kCreateThread;
    const auto* data = FindData(message);
    if (!data || !data->contains("title") || !(*data)["title"].is_string() ||
        (*data)["title"].get<std::string>().empty()) {
      error_code = "invalid_payload";
      error_message = "title이 필요합니다";
      return std::nullopt;
    }
    frame.payload = CreateThreadPayload{(*data)["title"].get<std::string>()};
    return frame;
  }

  if (type == "subscribe") {
    frame.kind = EnvelopeKind::kSubscribe;
  } else if (type == "unsubscribe") {
    frame.kind = EnvelopeKind::kUnsubscribe;
  } else if (type == "message") {
    frame.kind = EnvelopeKind::kChat;
  } else if (type == "typing") {
    frame.kind = EnvelopeKind::kTyping;
  } else if (type == "read") {
    frame.kind = EnvelopeKind::kRead;
  } else {
    error_code = "unknown_type";
    error_message = "알 수 없는 메시지 유형";
    return std::nullopt;
  }

  if (frame.room_id.empty()) {
    error_code = "missing_room";
    error_message = "room_id가 필요합니다";
    return std::nullopt;
  }

  switch (frame.kind) {
    case EnvelopeKind::kChat: {
      auto content_it = message.find("content");
      if (content_it != message.end() && !content_it->is_string()) {
        error_code = "invalid_payload";
        error_message = "content는 문자열이어야 합니다";
        return std::nullopt;
      }
      std::string content = content_it == message.end() ? std::string{} : content_it->get<std::string>();
      if (content.empty()) {
        error_code = "empty_content";
        error_message = "content가 비어 있습니다";
        return std::nullopt;
      }
      frame.payload = ChatPayload{std::move(content)};
      break;
    }
    case EnvelopeKind::kTyping: {
      const auto* data = FindData(message);
      if (!data || !data->contains("is_typing") || !(*data)["is_typing"].is_boolean()) {
        error_code = "invalid_payload";
        error_message = "is_typing 필드가 필요합니다";
        return std::nullopt;
      }
      frame.payload = TypingPayload{(*data)["is_typing"].get<bool>()};
      break;
    }
    case EnvelopeKind::kRead: {
      const auto* data = FindData(message);
      if (!data || !data->contains("message_ids") || !(*data)["message_ids"].is_array()) {
        error_code = "invalid_payload";
        error_message = "message_ids 배열이 필요합니다";
        return std::nullopt;
      }
      ReadPayload payload;
      for (const auto& id : (*data)["message_ids"]) {
        if (!id.is_string() || id.get<std::string>().empty()) {
          error_code = "invalid_payload";
          error_message = "message_ids 형식이 올바르지 않습니다";
          return std::nullopt;
        }
        payload.message_ids.push_back(id.get<std::string>());
      }
      frame.payload = std::move(payload);
      break;
    }
    default:
      break;
  }
  return frame;
}

std::string FormatIsoTime(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string NowIsoString() { return FormatIsoTime(std::chrono::system_clock::now()); }

nlohmann::json MakeChatFrame(const StoredMessage& message, bool history) {
  nlohmann::json j{{"type", EnvelopeKindName(EnvelopeKind::kChat)},
                   {"id", message.id},
                   {"room_id", message.room_id},
                   {"user_id", message.user_id},
                   {"content", message.content},
                   {"created_at", FormatIsoTime(message.created_at)},
                   {"user_name", message.user_name},
                   {"user_avatar", message.user_avatar}};
  if (history) {
    j["history"] = true;
  }
  return j;
}

nlohmann::json MakeSystemFrame(EnvelopeKind kind, const std::string& room_id, const Identity& user) {
  return {{"type", EnvelopeKindName(kind)},
          {"action", kind == EnvelopeKind::kSystemJoin ? "joined" : "left"},
          {"room_id", room_id},
          {"user_id", user.user_id},
          {"timestamp", NowIsoString()},
          {"data", {{"user_name", user.display_name}}}};
}

nlohmann::json MakeTypingFrame(const std::string& room_id, const Identity& user, bool is_typing) {
  return {{"type", EnvelopeKindName(EnvelopeKind::kTyping)},
          {"room_id", room_id},
          {"user_id", user.user_id},
          {"timestamp", NowIsoString()},
          {"data", {{"user_name", user.display_name}, {"is_typing", is_typing}}}};
}

nlohmann::json MakeReadFrame(const std::string& room_id, const Identity& user,
                             const std::vector<std::string>& message_ids) {
  return {{"type", EnvelopeKindName(EnvelopeKind::kRead)},
          {"room_id", room_id},
          {"user_id", user.user_id},
          {"timestamp", NowIsoString()},
          {"message_ids", message_ids}};
}

nlohmann::json MakeMessageSentFrame(const std::string& room_id, const std::string& message_id) {
  return {{"type", EnvelopeKindName(EnvelopeKind::kMessageSent)},
          {"success", true},
          {"room_id", room_id},
          {"message_id", message_id}};
}

nlohmann::json MakeThreadCreatedFrame(const std::string& room_id, const std::string& title) {
  return {{"type", EnvelopeKindName(EnvelopeKind::kThreadCreated)},
          {"success", true},
          {"thread_id", room_id},
          {"room_id", room_id},
          {"data", {{"title", title}}}};
}

nlohmann::json MakeConnectedFrame(const Identity& user) {
  return {{"type", EnvelopeKindName(EnvelopeKind::kConnected)},
          {"user_id", user.user_id},
          {"user_name", user.display_name},
          {"timestamp", NowIsoString()}};
}

nlohmann::json MakeErrorFrame(std::string_view code, std::string_view message, std::string_view room_id) {
  nlohmann::json j{{"type", EnvelopeKindName(EnvelopeKind::kError)},
                   {"success", false},
                   {"code", code},
                   {"message", message}};
  if (!room_id.empty()) {
    j["room_id"] = room_id;
  }
  return j;
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", NowIsoString()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", NowIsoString()}};
  return envelope;
}

}  // namespace sent
