/*
 * 설명: 방 레지스트리와 활성 연결 집합을 단일 스트랜드에서 소유하고 구독/해지/브로드캐스트 명령을 직렬 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_coordinator_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "sent/connection.hpp"
#include "sent/observability.hpp"
#include "sent/room_registry.hpp"

namespace sent {

class RoomRelay;

class BroadcastCoordinator : public std::enable_shared_from_this<BroadcastCoordinator> {
 public:
  explicit BroadcastCoordinator(boost::asio::io_context& ioc);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  // 설정하면 로컬 구성원이 있는 방의 채널만 구독 상태로 유지한다.
  void SetRoomRelay(const std::shared_ptr<RoomRelay>& relay) { relay_ = relay; }

  // 0은 "제외 대상 없음"을 뜻하므로 연결 id는 1부터 발급한다.
  std::uint64_t NextConnectionId() { return next_connection_id_.fetch_add(1); }

  void Register(const std::shared_ptr<Connection>& conn);
  void Deregister(const std::shared_ptr<Connection>& conn);
  void Subscribe(const std::shared_ptr<Connection>& conn, const std::string& room_id);
  void Unsubscribe(const std::shared_ptr<Connection>& conn, const std::string& room_id);
  void Broadcast(const std::string& room_id, std::string frame, std::uint64_t exclude_id = 0);
  void QueryRegistry(std::function<void(const RoomRegistry&)> visitor);

  // io_context가 멈춘 뒤 호출한다. 남은 연결 참조를 모두 해제한다.
  void Shutdown();

  std::size_t ActiveConnections() const { return active_connections_.load(); }
  std::size_t ActiveRooms() const { return active_rooms_.load(); }

 private:
  void DoDeregister(const std::shared_ptr<Connection>& conn);
  void PublishGauges();
  void SyncRelay(const std::string& room_id);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  RoomRegistry registry_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Connection>> live_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RoomRelay> relay_;
  std::atomic<std::uint64_t> next_connection_id_{1};
  std::atomic<std::size_t> active_connections_{0};
  std::atomic<std::size_t> active_rooms_{0};
};

}  // namespace sent
