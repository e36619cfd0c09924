/*
 * 설명: 채팅 프로토콜 상태 전이와 오류 응답 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "sent/protocol_handler.hpp"

#include <utility>
#include <vector>

#include <boost/asio/steady_timer.hpp>

namespace sent {
namespace {
// 히스토리 프레임을 간격을 두고 하나씩 보낸다. 연결이 사라지거나 큐가 가득 차면 조용히 중단한다.
class HistoryReplay : public std::enable_shared_from_this<HistoryReplay> {
 public:
  HistoryReplay(boost::asio::io_context& ioc, std::weak_ptr<Connection> conn, std::vector<std::string> frames,
                std::chrono::milliseconds delay)
      : timer_(ioc), conn_(std::move(conn)), frames_(std::move(frames)), delay_(delay) {}

  void Start() { SendNext(); }

 private:
  void SendNext() {
    auto conn = conn_.lock();
    if (!conn || next_ >= frames_.size()) {
      return;
    }
    if (!conn->Enqueue(std::move(frames_[next_]))) {
      return;
    }
    ++next_;
    if (next_ >= frames_.size()) {
      return;
    }
    timer_.expires_after(delay_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
      if (ec) {
        return;
      }
      self->SendNext();
    });
  }

  boost::asio::steady_timer timer_;
  std::weak_ptr<Connection> conn_;
  std::vector<std::string> frames_;
  std::chrono::milliseconds delay_;
  std::size_t next_{0};
};
}  // namespace

ChatProtocolHandler::ChatProtocolHandler(boost::asio::io_context& ioc,
                                         std::shared_ptr<BroadcastCoordinator> coordinator,
                                         std::shared_ptr<ChatRepository> repository,
                                         std::shared_ptr<Observability> observability, ProtocolLimits limits)
    : ioc_(ioc), coordinator_(std::move(coordinator)), repository_(std::move(repository)),
      observability_(std::move(observability)), limits_(limits) {}

void ChatProtocolHandler::OnConnected(const std::shared_ptr<Connection>& conn) {
  coordinator_->Register(conn);
  Reply(conn, MakeConnectedFrame(conn->User()));
  LogEvent(LogLevel::kInfo, "ws_connected", conn, {});
}

void ChatProtocolHandler::Handle(const std::shared_ptr<Connection>& conn, std::string_view raw) {
  std::string error_code;
  std::string error_message;
  auto frame = DecodeClientFrame(raw, error_code, error_message);
  if (!frame) {
    ReplyError(conn, error_code, error_message);
    return;
  }

  switch (frame->kind) {
    case EnvelopeKind::kSubscribe:
      HandleSubscribe(conn, *frame);
      break;
    case EnvelopeKind::kUnsubscribe:
      HandleUnsubscribe(conn, *frame);
      break;
    case EnvelopeKind::kCreateThread:
      HandleCreateThread(conn, *frame);
      break;
    case EnvelopeKind::kChat:
      HandleChat(conn, *frame);
      break;
    case EnvelopeKind::kTyping:
      HandleTyping(conn, *frame);
      break;
    case EnvelopeKind::kRead:
      HandleRead(conn, *frame);
      break;
    default:
      ReplyError(conn, "unknown_type", "알 수 없는 메시지 유형", frame->room_id);
      break;
  }
}

void ChatProtocolHandler::OnDisconnected(const std::shared_ptr<Connection>& conn) {
  for (const auto& room_id : conn->JoinedRooms()) {
    conn->LeaveRoom(room_id);
    coordinator_->Broadcast(room_id, MakeSystemFrame(EnvelopeKind::kSystemLeave, room_id, conn->User()).dump(),
                            conn->Id());
  }
  coordinator_->Deregister(conn);
  LogEvent(LogLevel::kInfo, "ws_disconnected", conn, {});
}

void ChatProtocolHandler::HandleSubscribe(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  const bool newly_joined = conn->JoinRoom(frame.room_id);
  coordinator_->Subscribe(conn, frame.room_id);
  if (newly_joined) {
    coordinator_->Broadcast(frame.room_id,
                            MakeSystemFrame(EnvelopeKind::kSystemJoin, frame.room_id, conn->User()).dump(), conn->Id());
    LogEvent(LogLevel::kInfo, "room_joined", conn, frame.room_id);
  }
  ReplayHistory(conn, frame.room_id);
}

void ChatProtocolHandler::HandleUnsubscribe(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  if (!RequireMembership(conn, frame)) {
    return;
  }
  conn->LeaveRoom(frame.room_id);
  coordinator_->Unsubscribe(conn, frame.room_id);
  coordinator_->Broadcast(frame.room_id,
                          MakeSystemFrame(EnvelopeKind::kSystemLeave, frame.room_id, conn->User()).dump(), conn->Id());
  LogEvent(LogLevel::kInfo, "room_left", conn, frame.room_id);
}

void ChatProtocolHandler::HandleCreateThread(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  const auto& payload = std::get<CreateThreadPayload>(frame.payload);
  std::string room_id;
  try {
    room_id = repository_->CreateThread(payload.title, conn->User().user_id);
  } catch (const StoreError& ex) {
    LogEvent(LogLevel::kError, "thread_create_failed", conn, {}, ex.what());
    ReplyError(conn, "store_error", "스레드를 생성하지 못했습니다");
    return;
  }
  Reply(conn, MakeThreadCreatedFrame(room_id, payload.title));
  LogEvent(LogLevel::kInfo, "thread_created", conn, room_id);
}

void ChatProtocolHandler::HandleChat(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  if (!RequireMembership(conn, frame)) {
    return;
  }
  const auto& payload = std::get<ChatPayload>(frame.payload);
  if (payload.content.size() > limits_.max_content_bytes) {
    ReplyError(conn, "content_too_long", "메시지가 너무 깁니다", frame.room_id);
    return;
  }
  StoredMessage stored;
  try {
    stored = repository_->CreateMessage(frame.room_id, conn->User(), payload.content);
  } catch (const StoreError& ex) {
    LogEvent(LogLevel::kError, "message_store_failed", conn, frame.room_id, ex.what());
    ReplyError(conn, "store_error", "메시지를 저장하지 못했습니다", frame.room_id);
    return;
  }
  auto chat_frame = MakeChatFrame(stored, false).dump();
  coordinator_->Broadcast(frame.room_id, chat_frame, conn->Id());
  if (relay_) {
    relay_->Publish(frame.room_id, chat_frame);
  }
  Reply(conn, MakeMessageSentFrame(frame.room_id, stored.id));
}

void ChatProtocolHandler::HandleTyping(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  if (!RequireMembership(conn, frame)) {
    return;
  }
  const auto& payload = std::get<TypingPayload>(frame.payload);
  coordinator_->Broadcast(frame.room_id, MakeTypingFrame(frame.room_id, conn->User(), payload.is_typing).dump(),
                          conn->Id());
}

void ChatProtocolHandler::HandleRead(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  if (!RequireMembership(conn, frame)) {
    return;
  }
  const auto& payload = std::get<ReadPayload>(frame.payload);
  try {
    for (const auto& message_id : payload.message_ids) {
      repository_->MarkRead(message_id, conn->User().user_id);
    }
  } catch (const StoreError& ex) {
    LogEvent(LogLevel::kError, "mark_read_failed", conn, frame.room_id, ex.what());
    ReplyError(conn, "store_error", "읽음 표시를 저장하지 못했습니다", frame.room_id);
    return;
  }
  coordinator_->Broadcast(frame.room_id, MakeReadFrame(frame.room_id, conn->User(), payload.message_ids).dump(),
                          conn->Id());
}

bool ChatProtocolHandler::RequireMembership(const std::shared_ptr<Connection>& conn, const InboundFrame& frame) {
  if (conn->IsInRoom(frame.room_id)) {
    return true;
  }
  ReplyError(conn, "not_subscribed", "구독하지 않은 방입니다", frame.room_id);
  return false;
}

void ChatProtocolHandler::ReplayHistory(const std::shared_ptr<Connection>& conn, const std::string& room_id) {
  std::vector<StoredMessage> history;
  try {
    history = repository_->ListMessages(room_id, limits_.history_page_size, 0);
  } catch (const StoreError& ex) {
    LogEvent(LogLevel::kError, "history_load_failed", conn, room_id, ex.what());
    ReplyError(conn, "store_error", "이전 메시지를 불러오지 못했습니다", room_id);
    return;
  }
  if (history.empty()) {
    return;
  }
  std::vector<std::string> frames;
  frames.reserve(history.size());
  for (const auto& message : history) {
    frames.push_back(MakeChatFrame(message, true).dump());
  }
  std::make_shared<HistoryReplay>(ioc_, conn, std::move(frames), limits_.history_frame_delay)->Start();
}

void ChatProtocolHandler::Reply(const std::shared_ptr<Connection>& conn, const nlohmann::json& frame) {
  if (conn->Enqueue(frame.dump())) {
    return;
  }
  if (conn->QueueClosed()) {
    return;
  }
  if (observability_) {
    observability_->IncrementBackpressureDisconnect();
  }
  LogEvent(LogLevel::kWarn, "backpressure_disconnect", conn, {}, "응답 전송 큐 한도 초과");
  coordinator_->Deregister(conn);
}

void ChatProtocolHandler::ReplyError(const std::shared_ptr<Connection>& conn, std::string_view code,
                                     std::string_view message, std::string_view room_id) {
  if (observability_) {
    observability_->IncrementProtocolError();
  }
  LogEvent(LogLevel::kDebug, "protocol_error", conn, std::string(room_id), std::string(code));
  Reply(conn, MakeErrorFrame(code, message, room_id));
}

void ChatProtocolHandler::LogEvent(LogLevel level, const std::string& name, const std::shared_ptr<Connection>& conn,
                                   const std::string& room_id, const std::string& detail) {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx{.trace_id = observability_->NextTraceId(),
                 .name = name,
                 .level = level,
                 .user_id = conn->User().user_id,
                 .connection_id = conn->Id(),
                 .detail = detail};
  if (!room_id.empty()) {
    ctx.room_id = room_id;
  }
  observability_->Log(ctx);
}

}  // namespace sent
