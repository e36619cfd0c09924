/*
 * 설명: WebSocket 연결의 읽기/쓰기 루프와 하트비트, 종료 수렴 경로를 구현한다. 모든 핸들러는 스트림 스트랜드에서 실행된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/backpressure_test.cpp, server/tests/e2e/heartbeat_test.cpp
 */
#include "sent/websocket_session.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace sent {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::uint64_t id,
                                   Identity identity, const WebSocketLimits& limits,
                                   std::shared_ptr<ChatProtocolHandler> handler,
                                   std::unique_ptr<NotificationBridge> bridge,
                                   std::shared_ptr<Observability> observability)
    : Connection(id, std::move(identity), limits.max_queue_messages, limits.max_queue_bytes), ws_(std::move(ws)),
      heartbeat_(ws_.get_executor()), liveness_(ws_.get_executor()), close_timer_(ws_.get_executor()), limits_(limits),
      handler_(std::move(handler)), bridge_(std::move(bridge)),
      observability_(std::move(observability)), last_seen_(std::chrono::steady_clock::now()) {}

void WebSocketSession::Run() {
  auto self = shared_from_this();
  ws_.read_message_max(limits_.max_message_bytes);
  ws_.control_callback([this](boost::beast::websocket::frame_type kind, boost::beast::string_view) {
    if (kind == boost::beast::websocket::frame_type::pong) {
      last_seen_ = std::chrono::steady_clock::now();
    }
  });
  bridge_->Attach(self);
  handler_->OnConnected(self);
  ScheduleHeartbeat();
  ArmLiveness();
  DoRead();
}

void WebSocketSession::OnFrameQueued() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->WriteNext(); });
}

void WebSocketSession::OnQueueClosed() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
    boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
    reason.reason = "backpressure_exceeded";
    self->CloseTransport(reason);
  });
}

void WebSocketSession::DoRead() {
  ws_.async_read(buffer_, [self = shared_from_this()](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    Teardown(ec == boost::beast::websocket::error::closed ? "peer_closed" : "read_failed: " + ec.message());
    return;
  }
  last_seen_ = std::chrono::steady_clock::now();
  auto raw = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  handler_->Handle(shared_from_this(), raw);
  if (!TeardownStarted()) {
    DoRead();
  }
}

void WebSocketSession::WriteNext() {
  if (writing_ || transport_closed_) {
    return;
  }
  auto self = shared_from_this();
  if (ping_pending_) {
    ping_pending_ = false;
    writing_ = true;
    ws_.async_ping({}, [self](boost::beast::error_code ec) { self->OnWrite(ec); });
    return;
  }
  auto frame = NextFrame();
  if (!frame) {
    return;
  }
  writing_ = true;
  in_flight_ = std::move(*frame);
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(in_flight_),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  in_flight_.clear();
  if (ec) {
    Teardown("write_failed: " + ec.message());
    return;
  }
  WriteNext();
}

void WebSocketSession::ScheduleHeartbeat() {
  heartbeat_.expires_after(limits_.ping_period);
  heartbeat_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) { self->OnHeartbeat(ec); });
}

void WebSocketSession::OnHeartbeat(const boost::system::error_code& ec) {
  if (ec || TeardownStarted()) {
    return;
  }
  ping_pending_ = true;
  WriteNext();
  ScheduleHeartbeat();
}

void WebSocketSession::ArmLiveness() {
  liveness_.expires_at(last_seen_ + limits_.pong_wait);
  liveness_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) { self->OnLiveness(ec); });
}

void WebSocketSession::OnLiveness(const boost::system::error_code& ec) {
  if (ec || TeardownStarted()) {
    return;
  }
  // 그 사이 수신이 있었으면 마지막 수신 시각 기준으로 다시 건다.
  if (std::chrono::steady_clock::now() < last_seen_ + limits_.pong_wait) {
    ArmLiveness();
    return;
  }
  Teardown("heartbeat_timeout");
}

void WebSocketSession::Teardown(const std::string& reason) {
  if (!BeginTeardown()) {
    return;
  }
  heartbeat_.cancel();
  liveness_.cancel();
  bridge_->Detach();
  auto self = shared_from_this();
  handler_->OnDisconnected(self);
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                   .name = "ws_teardown",
                                   .level = LogLevel::kDebug,
                                   .user_id = User().user_id,
                                   .connection_id = Id(),
                                   .detail = reason});
  }
  CloseTransport(boost::beast::websocket::close_code::normal);
}

void WebSocketSession::CloseTransport(boost::beast::websocket::close_reason reason) {
  if (transport_closed_) {
    return;
  }
  transport_closed_ = true;
  heartbeat_.cancel();
  liveness_.cancel();
  if (!ws_.is_open()) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->close_timer_.cancel(); });
  close_timer_.expires_after(limits_.close_grace);
  close_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (!ec) {
      boost::beast::get_lowest_layer(self->ws_).close();
    }
  });
}

}  // namespace sent
