/*
 * 설명: HTTP 요청을 분기하고 WS 업그레이드 시 토큰을 검증해 WebSocket 연결을 시작한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "sent/http_session.hpp"

#include <unordered_map>

#include <boost/beast/version.hpp>

#include "sent/envelope.hpp"
#include "sent/websocket_session.hpp"

namespace sent {

namespace {
constexpr const char* kServerName = "sent";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void SplitTarget(const std::string& target, std::string& path, std::string& query) {
  auto qpos = target.find('?');
  path = qpos == std::string::npos ? target : target.substr(0, qpos);
  query = qpos == std::string::npos ? std::string{} : target.substr(qpos + 1);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<IdentityValidator> validator,
                         std::shared_ptr<BroadcastCoordinator> coordinator,
                         std::shared_ptr<ChatProtocolHandler> handler,
                         std::shared_ptr<PubSubBroker> broker,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), validator_(std::move(validator)),
      coordinator_(std::move(coordinator)), handler_(std::move(handler)), broker_(std::move(broker)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"rooms", {{"active", snapshot.rooms_active}}},
                        {"broadcasts", {{"total", snapshot.broadcasts_total}, {"delivered", snapshot.frames_delivered}}},
                        {"backpressureDisconnects", snapshot.backpressure_disconnects},
                        {"notificationsForwarded", snapshot.notifications_forwarded},
                        {"protocolErrors", snapshot.protocol_errors}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/ops/status" || path == "/ops/notify") {
    if (!CheckOpsToken()) {
      return SendJson(res, http::status::unauthorized,
                      MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    if (req_.method() == http::verb::get && path == "/ops/status") {
      auto snapshot = observability_->Snapshot();
      nlohmann::json data{{"activeWebsocket", coordinator_->ActiveConnections()},
                          {"activeRooms", coordinator_->ActiveRooms()},
                          {"broker", config_.redis_host.empty() ? "memory" : "redis"},
                          {"errorCount", snapshot.request_errors}};
      return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
    }
    if (req_.method() == http::verb::post && path == "/ops/notify") {
      return HandleNotify(res);
    }
  }

  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleNotify(const std::shared_ptr<Response>& res) {
  using boost::beast::http::status;
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(req_.body());
  } catch (const nlohmann::json::exception&) {
    return SendJson(res, status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  }
  if (!body.is_object() || !body.contains("userId") || !body["userId"].is_string() ||
      body["userId"].get<std::string>().empty() || !body.contains("type") || !body["type"].is_string()) {
    return SendJson(res, status::bad_request, MakeErrorEnvelope("bad_request", "userId와 type이 필요합니다"));
  }
  auto kind = ParseNotificationKind(body["type"].get<std::string>());
  if (!kind) {
    return SendJson(res, status::bad_request, MakeErrorEnvelope("bad_request", "지원하지 않는 알림 유형입니다"));
  }
  nlohmann::json data = body.contains("data") ? body["data"] : nlohmann::json::object();
  if (!data.is_object()) {
    return SendJson(res, status::bad_request, MakeErrorEnvelope("bad_request", "data는 객체여야 합니다"));
  }

  NotificationPublisher publisher(broker_);
  try {
    auto published = publisher.Publish(body["userId"].get<std::string>(), *kind, data);
    nlohmann::json result{{"receivers", published.receivers}, {"notification", published.payload}};
    SendJson(res, status::accepted, MakeSuccessEnvelope(result));
  } catch (const PubSubError& ex) {
    if (observability_) {
      observability_->Log(LogContext{.trace_id = trace_id_,
                                     .name = "notify_publish_failed",
                                     .level = LogLevel::kError,
                                     .detail = ex.what()});
    }
    SendJson(res, status::service_unavailable, MakeErrorEnvelope("pubsub_unavailable", "알림을 게시하지 못했습니다"));
  }
}

void HttpSession::SendJson(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                           const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{.trace_id = trace_id_,
                                   .name = "http_request",
                                   .level = LogLevel::kInfo,
                                   .detail = std::string(req_.target()) + " " + std::to_string(res->result_int()),
                                   .latency_ms = static_cast<long>(latency)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  if (path != "/ws") {
    return SendJson(res, boost::beast::http::status::not_found,
                    MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }

  std::string error_code = "unauthorized";
  std::string error_message = "WS 업그레이드에는 인증이 필요합니다";
  auto token = ExtractToken(query);
  std::optional<Identity> identity;
  if (!token.empty()) {
    identity = validator_->Validate(token, error_code, error_message);
  }
  if (!identity) {
    return SendJson(res, boost::beast::http::status::unauthorized, MakeErrorEnvelope(error_code, error_message));
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  auto timeouts = boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server);
  // 생존 확인은 세션 하트비트가 담당한다.
  timeouts.idle_timeout = boost::beast::websocket::stream_base::none();
  ws.set_option(timeouts);
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& r) {
    r.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
  } catch (const boost::beast::system_error& ex) {
    if (observability_) {
      observability_->Log(LogContext{.trace_id = trace_id_,
                                     .name = "ws_accept_failed",
                                     .level = LogLevel::kWarn,
                                     .user_id = identity->user_id,
                                     .detail = ex.what()});
    }
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }

  WebSocketLimits limits{config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes, config_.ws_max_message_bytes,
                         std::chrono::milliseconds(config_.ws_ping_period_ms),
                         std::chrono::milliseconds(config_.ws_pong_wait_ms)};
  auto bridge = std::make_unique<NotificationBridge>(broker_, coordinator_, observability_);
  std::make_shared<WebSocketSession>(std::move(ws), coordinator_->NextConnectionId(), std::move(*identity), limits,
                                     handler_, std::move(bridge), observability_)
      ->Run();
}

bool HttpSession::CheckOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

std::string HttpSession::ExtractToken(const std::string& query) const {
  auto params = ParseQueryParams(query);
  auto it = params.find("token");
  if (it != params.end() && !it->second.empty()) {
    return it->second;
  }
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it == req_.end()) {
    return {};
  }
  return ParseBearer(std::string(auth_it->value()));
}

std::string HttpSession::ParseBearer(const std::string& header_value) const {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace sent
