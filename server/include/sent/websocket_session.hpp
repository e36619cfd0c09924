/*
 * 설명: Beast WebSocket 전송 위의 연결. 읽기 루프, 전달 큐 쓰기 루프, 핑/퐁 생존 확인과 단일 종료 경로를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/backpressure_test.cpp, server/tests/e2e/heartbeat_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "sent/connection.hpp"
#include "sent/notification.hpp"
#include "sent/observability.hpp"
#include "sent/protocol_handler.hpp"

namespace sent {

struct WebSocketLimits {
  std::size_t max_queue_messages{256};
  std::size_t max_queue_bytes{1048576};
  std::size_t max_message_bytes{8192};
  std::chrono::milliseconds ping_period{54000};
  std::chrono::milliseconds pong_wait{60000};
  // 닫기 프레임이 막힌 쓰기 뒤에서 나가지 못하면 이 시간 뒤에 소켓을 강제로 닫는다.
  std::chrono::milliseconds close_grace{2000};
};

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::uint64_t id, Identity identity,
                   const WebSocketLimits& limits, std::shared_ptr<ChatProtocolHandler> handler,
                   std::unique_ptr<NotificationBridge> bridge, std::shared_ptr<Observability> observability);

  void Run();

 protected:
  void OnFrameQueued() override;
  void OnQueueClosed() override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void ScheduleHeartbeat();
  void OnHeartbeat(const boost::system::error_code& ec);
  void ArmLiveness();
  void OnLiveness(const boost::system::error_code& ec);
  void Teardown(const std::string& reason);
  void CloseTransport(boost::beast::websocket::close_reason reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::asio::steady_timer heartbeat_;
  // 마지막 인바운드 프레임 또는 퐁으로부터 pong_wait가 지나면 만료된다.
  boost::asio::steady_timer liveness_;
  boost::asio::steady_timer close_timer_;
  WebSocketLimits limits_;
  std::shared_ptr<ChatProtocolHandler> handler_;
  std::unique_ptr<NotificationBridge> bridge_;
  std::shared_ptr<Observability> observability_;
  std::string in_flight_;
  std::chrono::steady_clock::time_point last_seen_;
  bool writing_{false};
  bool ping_pending_{false};
  bool transport_closed_{false};
};

}  // namespace sent
