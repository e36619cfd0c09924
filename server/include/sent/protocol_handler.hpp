/*
 * 설명: 인바운드 채팅 프레임을 해석해 구독/해지/스레드 생성/채팅/입력중/읽음 동작을 수행하고 응답과 브로드캐스트를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "sent/broadcast_coordinator.hpp"
#include "sent/chat_repository.hpp"
#include "sent/connection.hpp"
#include "sent/envelope.hpp"
#include "sent/observability.hpp"
#include "sent/room_relay.hpp"

namespace sent {

struct ProtocolLimits {
  std::size_t history_page_size{50};
  std::chrono::milliseconds history_frame_delay{5};
  std::size_t max_content_bytes{4000};
};

class ChatProtocolHandler {
 public:
  ChatProtocolHandler(boost::asio::io_context& ioc, std::shared_ptr<BroadcastCoordinator> coordinator,
                      std::shared_ptr<ChatRepository> repository, std::shared_ptr<Observability> observability,
                      ProtocolLimits limits);

  void OnConnected(const std::shared_ptr<Connection>& conn);
  // 연결의 읽기 루프에서만 호출한다.
  void Handle(const std::shared_ptr<Connection>& conn, std::string_view raw);
  void OnDisconnected(const std::shared_ptr<Connection>& conn);

  const ProtocolLimits& Limits() const { return limits_; }
  // 저장된 채팅 프레임을 다른 프로세스에도 게시한다.
  void SetRoomRelay(const std::shared_ptr<RoomRelay>& relay) { relay_ = relay; }

 private:
  void HandleSubscribe(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);
  void HandleUnsubscribe(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);
  void HandleCreateThread(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);
  void HandleChat(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);
  void HandleTyping(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);
  void HandleRead(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);

  bool RequireMembership(const std::shared_ptr<Connection>& conn, const InboundFrame& frame);
  void ReplayHistory(const std::shared_ptr<Connection>& conn, const std::string& room_id);
  void Reply(const std::shared_ptr<Connection>& conn, const nlohmann::json& frame);
  void ReplyError(const std::shared_ptr<Connection>& conn, std::string_view code, std::string_view message,
                  std::string_view room_id = {});
  void LogEvent(LogLevel level, const std::string& name, const std::shared_ptr<Connection>& conn,
                const std::string& room_id, const std::string& detail = {});

  boost::asio::io_context& ioc_;
  std::shared_ptr<BroadcastCoordinator> coordinator_;
  std::shared_ptr<ChatRepository> repository_;
  std::shared_ptr<Observability> observability_;
  ProtocolLimits limits_;
  std::shared_ptr<RoomRelay> relay_;
};

}  // namespace sent
