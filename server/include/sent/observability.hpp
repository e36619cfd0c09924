/*
 * 설명: 구조화 로그와 실시간 전달 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace sent {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> user_id;
  std::optional<std::string> room_id;
  std::optional<std::uint64_t> connection_id;
  std::string detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t rooms_active{0};
  std::uint64_t broadcasts_total{0};
  std::uint64_t frames_delivered{0};
  std::uint64_t backpressure_disconnects{0};
  std::uint64_t notifications_forwarded{0};
  std::uint64_t protocol_errors{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void SetRoomsActive(std::uint64_t count);
  void RecordBroadcast(std::uint64_t delivered);
  void IncrementBackpressureDisconnect();
  void IncrementNotificationForwarded();
  void IncrementProtocolError();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  nlohmann::json Render(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> rooms_active_{0};
  std::atomic<std::uint64_t> broadcasts_total_{0};
  std::atomic<std::uint64_t> frames_delivered_{0};
  std::atomic<std::uint64_t> backpressure_disconnects_{0};
  std::atomic<std::uint64_t> notifications_forwarded_{0};
  std::atomic<std::uint64_t> protocol_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace sent
