/*
 * 설명: 연결 하나의 신원, 유한 전달 큐, 참여 중인 방 집합과 일회성 종료 가드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_test.cpp, server/tests/unit/broadcast_coordinator_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sent/identity.hpp"

namespace sent {

class DeliveryQueue {
 public:
  enum class PushResult { kQueued, kFull, kClosed };

  DeliveryQueue(std::size_t max_messages, std::size_t max_bytes);

  PushResult TryPush(std::string frame);
  std::optional<std::string> TryPop();
  bool Close();
  bool Closed() const;
  std::size_t Size() const;
  std::size_t Bytes() const;

 private:
  mutable std::mutex mutex_;
  std::deque<std::string> frames_;
  std::size_t queued_bytes_{0};
  std::size_t max_messages_;
  std::size_t max_bytes_;
  bool closed_{false};
};

class Connection {
 public:
  Connection(std::uint64_t id, Identity identity, std::size_t max_queue_messages, std::size_t max_queue_bytes);
  virtual ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  std::uint64_t Id() const { return id_; }
  const Identity& User() const { return identity_; }

  // 큐가 가득 찼거나 닫혀 있으면 false. 호출자는 false를 받으면 연결을 종료시켜야 한다.
  bool Enqueue(std::string frame);
  bool CloseQueue();
  bool QueueClosed() const { return queue_.Closed(); }
  std::size_t QueuedFrames() const { return queue_.Size(); }

  bool BeginTeardown();
  bool TeardownStarted() const { return teardown_started_.load(); }

  // 참여 방 집합은 해당 연결의 읽기 루프만 변경한다.
  bool JoinRoom(const std::string& room_id);
  bool LeaveRoom(const std::string& room_id);
  bool IsInRoom(const std::string& room_id) const;
  std::vector<std::string> JoinedRooms() const;

 protected:
  std::optional<std::string> NextFrame() { return queue_.TryPop(); }

  virtual void OnFrameQueued() = 0;
  virtual void OnQueueClosed() = 0;

 private:
  std::uint64_t id_;
  Identity identity_;
  DeliveryQueue queue_;
  std::set<std::string> joined_rooms_;
  std::atomic<bool> teardown_started_{false};
};

}  // namespace sent
