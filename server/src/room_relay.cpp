/*
 * 설명: 방 채널 구독 수명과 프로세스 간 채팅 프레임 게시/수신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_relay_test.cpp
 */
#include "sent/room_relay.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "sent/broadcast_coordinator.hpp"

namespace sent {

std::string RoomChannel(const std::string& room_id) { return "chat:room:" + room_id; }

RoomRelay::RoomRelay(std::shared_ptr<PubSubBroker> broker, std::string instance_id,
                     std::shared_ptr<Observability> observability)
    : broker_(std::move(broker)), instance_id_(std::move(instance_id)), observability_(std::move(observability)) {}

RoomRelay::~RoomRelay() {
  std::unordered_map<std::string, std::shared_ptr<Subscription>> rooms;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    rooms.swap(rooms_);
  }
  for (auto& [room_id, subscription] : rooms) {
    subscription->Cancel();
  }
}

void RoomRelay::Bind(const std::shared_ptr<BroadcastCoordinator>& coordinator) { coordinator_ = coordinator; }

void RoomRelay::Watch(const std::string& room_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rooms_.count(room_id) != 0) {
      return;
    }
  }
  auto subscription =
      broker_->Subscribe(RoomChannel(room_id), [this, room_id](const std::string& payload) { Forward(room_id, payload); });
  std::lock_guard<std::mutex> lock(mutex_);
  rooms_.emplace(room_id, std::move(subscription));
}

void RoomRelay::Unwatch(const std::string& room_id) {
  std::shared_ptr<Subscription> subscription;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
      return;
    }
    subscription = std::move(it->second);
    rooms_.erase(it);
  }
  subscription->Cancel();
}

bool RoomRelay::Watching(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.count(room_id) != 0;
}

void RoomRelay::Publish(const std::string& room_id, const std::string& frame) {
  nlohmann::json envelope{{"origin", instance_id_}, {"frame", frame}};
  try {
    broker_->Publish(RoomChannel(room_id), envelope.dump());
  } catch (const PubSubError& ex) {
    if (observability_) {
      observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                     .name = "room_relay_publish_failed",
                                     .level = LogLevel::kWarn,
                                     .room_id = room_id,
                                     .detail = ex.what()});
    }
  }
}

void RoomRelay::Forward(const std::string& room_id, const std::string& payload) {
  auto envelope = nlohmann::json::parse(payload, nullptr, false);
  if (envelope.is_discarded() || !envelope.is_object() || !envelope["origin"].is_string() ||
      !envelope["frame"].is_string()) {
    if (observability_) {
      observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                     .name = "room_relay_bad_payload",
                                     .level = LogLevel::kWarn,
                                     .room_id = room_id});
    }
    return;
  }
  if (envelope["origin"].get<std::string>() == instance_id_) {
    return;
  }
  auto coordinator = coordinator_.lock();
  if (!coordinator) {
    return;
  }
  coordinator->Broadcast(room_id, envelope["frame"].get<std::string>(), 0);
}

}  // namespace sent
