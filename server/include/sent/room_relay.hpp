/*
 * 설명: 방 채널을 통해 다른 프로세스의 채팅 프레임을 로컬 방 구성원에게 중계한다. 자신이 게시한 프레임은 인스턴스 id로 걸러낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_relay_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sent/observability.hpp"
#include "sent/pubsub.hpp"

namespace sent {

class BroadcastCoordinator;

std::string RoomChannel(const std::string& room_id);

class RoomRelay {
 public:
  RoomRelay(std::shared_ptr<PubSubBroker> broker, std::string instance_id,
            std::shared_ptr<Observability> observability);
  ~RoomRelay();

  RoomRelay(const RoomRelay&) = delete;
  RoomRelay& operator=(const RoomRelay&) = delete;

  void Bind(const std::shared_ptr<BroadcastCoordinator>& coordinator);

  // 로컬에 구성원이 생긴 방만 구독한다. 코디네이터 스트랜드에서 호출된다.
  void Watch(const std::string& room_id);
  void Unwatch(const std::string& room_id);
  bool Watching(const std::string& room_id) const;

  // 게시 실패는 로그로만 남긴다. 로컬 전달은 이미 끝난 뒤다.
  void Publish(const std::string& room_id, const std::string& frame);

  const std::string& InstanceId() const { return instance_id_; }

 private:
  void Forward(const std::string& room_id, const std::string& payload);

  std::shared_ptr<PubSubBroker> broker_;
  std::string instance_id_;
  std::shared_ptr<Observability> observability_;
  std::weak_ptr<BroadcastCoordinator> coordinator_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Subscription>> rooms_;
};

}  // namespace sent
