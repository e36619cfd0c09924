/*
 * 설명: 브로드캐스트 코디네이터의 명령을 스트랜드에 게시하고 직렬로 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_coordinator_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "sent/broadcast_coordinator.hpp"

#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "sent/room_relay.hpp"

namespace sent {

BroadcastCoordinator::BroadcastCoordinator(boost::asio::io_context& ioc) : strand_(boost::asio::make_strand(ioc)) {}

void BroadcastCoordinator::Register(const std::shared_ptr<Connection>& conn) {
  boost::asio::post(strand_, [self = shared_from_this(), conn]() {
    if (conn->QueueClosed()) {
      return;
    }
    self->live_.emplace(conn->Id(), conn);
    self->PublishGauges();
    if (self->observability_ && self->observability_->Enabled(LogLevel::kDebug)) {
      self->observability_->Log(LogContext{.trace_id = self->observability_->NextTraceId(),
                                           .name = "connection_registered",
                                           .level = LogLevel::kDebug,
                                           .user_id = conn->User().user_id,
                                           .connection_id = conn->Id()});
    }
  });
}

void BroadcastCoordinator::Deregister(const std::shared_ptr<Connection>& conn) {
  boost::asio::post(strand_, [self = shared_from_this(), conn]() { self->DoDeregister(conn); });
}

void BroadcastCoordinator::Subscribe(const std::shared_ptr<Connection>& conn, const std::string& room_id) {
  boost::asio::post(strand_, [self = shared_from_this(), conn, room_id]() {
    if (self->live_.count(conn->Id()) == 0) {
      return;
    }
    self->registry_.Join(room_id, conn);
    self->SyncRelay(room_id);
    self->PublishGauges();
  });
}

void BroadcastCoordinator::Unsubscribe(const std::shared_ptr<Connection>& conn, const std::string& room_id) {
  boost::asio::post(strand_, [self = shared_from_this(), conn, room_id]() {
    self->registry_.Leave(room_id, conn->Id());
    self->SyncRelay(room_id);
    self->PublishGauges();
  });
}

void BroadcastCoordinator::Broadcast(const std::string& room_id, std::string frame, std::uint64_t exclude_id) {
  boost::asio::post(strand_, [self = shared_from_this(), room_id, frame = std::move(frame), exclude_id]() {
    std::uint64_t delivered = 0;
    for (const auto& member : self->registry_.Members(room_id)) {
      if (member->Id() == exclude_id) {
        continue;
      }
      if (member->Enqueue(frame)) {
        ++delivered;
        continue;
      }
      if (self->observability_) {
        self->observability_->IncrementBackpressureDisconnect();
        self->observability_->Log(LogContext{.trace_id = self->observability_->NextTraceId(),
                                             .name = "backpressure_disconnect",
                                             .level = LogLevel::kWarn,
                                             .user_id = member->User().user_id,
                                             .room_id = room_id,
                                             .connection_id = member->Id(),
                                             .detail = "전송 큐 한도 초과"});
      }
      self->DoDeregister(member);
    }
    if (self->observability_) {
      self->observability_->RecordBroadcast(delivered);
    }
  });
}

void BroadcastCoordinator::QueryRegistry(std::function<void(const RoomRegistry&)> visitor) {
  boost::asio::post(strand_, [self = shared_from_this(), visitor = std::move(visitor)]() { visitor(self->registry_); });
}

void BroadcastCoordinator::Shutdown() {
  std::vector<std::shared_ptr<Connection>> remaining;
  remaining.reserve(live_.size());
  for (auto& [id, conn] : live_) {
    remaining.push_back(conn);
  }
  for (const auto& conn : remaining) {
    for (const auto& room_id : registry_.LeaveAll(conn->Id())) {
      SyncRelay(room_id);
    }
  }
  live_.clear();
  PublishGauges();
}

void BroadcastCoordinator::DoDeregister(const std::shared_ptr<Connection>& conn) {
  for (const auto& room_id : registry_.LeaveAll(conn->Id())) {
    SyncRelay(room_id);
  }
  live_.erase(conn->Id());
  conn->CloseQueue();
  PublishGauges();
}

void BroadcastCoordinator::PublishGauges() {
  active_connections_.store(live_.size());
  active_rooms_.store(registry_.RoomCount());
  if (observability_) {
    observability_->SetWebsocketActive(live_.size());
    observability_->SetRoomsActive(registry_.RoomCount());
  }
}

void BroadcastCoordinator::SyncRelay(const std::string& room_id) {
  if (!relay_) {
    return;
  }
  if (registry_.HasRoom(room_id)) {
    relay_->Watch(room_id);
  } else {
    relay_->Unwatch(room_id);
  }
}

}  // namespace sent
