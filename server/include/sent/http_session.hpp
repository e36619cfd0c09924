/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭/운영 엔드포인트와 인증된 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "sent/broadcast_coordinator.hpp"
#include "sent/config.hpp"
#include "sent/identity.hpp"
#include "sent/notification.hpp"
#include "sent/observability.hpp"
#include "sent/protocol_handler.hpp"
#include "sent/pubsub.hpp"

namespace sent {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<IdentityValidator> validator,
              std::shared_ptr<BroadcastCoordinator> coordinator,
              std::shared_ptr<ChatProtocolHandler> handler,
              std::shared_ptr<PubSubBroker> broker,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleNotify(const std::shared_ptr<Response>& res);
  void SendJson(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  bool CheckOpsToken() const;
  std::string ExtractToken(const std::string& query) const;
  std::string ParseBearer(const std::string& header_value) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<IdentityValidator> validator_;
  std::shared_ptr<BroadcastCoordinator> coordinator_;
  std::shared_ptr<ChatProtocolHandler> handler_;
  std::shared_ptr<PubSubBroker> broker_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace sent
