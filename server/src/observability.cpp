/*
 * 설명: 구조화 로그와 실시간 전달 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "sent/observability.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sent {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::SetRoomsActive(std::uint64_t count) { rooms_active_.store(count); }

void Observability::RecordBroadcast(std::uint64_t delivered) {
  broadcasts_total_.fetch_add(1);
  frames_delivered_.fetch_add(delivered);
}

void Observability::IncrementBackpressureDisconnect() { backpressure_disconnects_.fetch_add(1); }

void Observability::IncrementNotificationForwarded() { notifications_forwarded_.fetch_add(1); }

void Observability::IncrementProtocolError() { protocol_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.rooms_active = rooms_active_.load();
  snapshot.broadcasts_total = broadcasts_total_.load();
  snapshot.frames_delivered = frames_delivered_.load();
  snapshot.backpressure_disconnects = backpressure_disconnects_.load();
  snapshot.notifications_forwarded = notifications_forwarded_.load();
  snapshot.protocol_errors = protocol_errors_.load();
  return snapshot;
}

nlohmann::json Observability::Render(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  log_json["latencyMs"] = ctx.latency_ms;
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  // 요청 경로처럼 외부에서 온 문자열은 UTF-8이 아닐 수 있다. 잘못된 바이트는 U+FFFD로 바꾼다.
  auto line = Render(ctx).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

}  // namespace sent
