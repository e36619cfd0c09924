/*
 * 설명: 유한 전달 큐와 연결 상태(참여 방, 종료 가드)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_test.cpp, server/tests/unit/broadcast_coordinator_test.cpp
 */
#include "sent/connection.hpp"

#include <utility>

namespace sent {

DeliveryQueue::DeliveryQueue(std::size_t max_messages, std::size_t max_bytes)
    : max_messages_(max_messages), max_bytes_(max_bytes) {}

DeliveryQueue::PushResult DeliveryQueue::TryPush(std::string frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return PushResult::kClosed;
  }
  const auto frame_size = frame.size();
  if (frames_.size() >= max_messages_ || queued_bytes_ + frame_size > max_bytes_) {
    return PushResult::kFull;
  }
  frames_.push_back(std::move(frame));
  queued_bytes_ += frame_size;
  return PushResult::kQueued;
}

std::optional<std::string> DeliveryQueue::TryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (frames_.empty()) {
    return std::nullopt;
  }
  std::string frame = std::move(frames_.front());
  frames_.pop_front();
  queued_bytes_ -= frame.size();
  return frame;
}

bool DeliveryQueue::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  closed_ = true;
  frames_.clear();
  queued_bytes_ = 0;
  return true;
}

bool DeliveryQueue::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t DeliveryQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_.size();
}

std::size_t DeliveryQueue::Bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queued_bytes_;
}

Connection::Connection(std::uint64_t id, Identity identity, std::size_t max_queue_messages,
                       std::size_t max_queue_bytes)
    : id_(id), identity_(std::move(identity)), queue_(max_queue_messages, max_queue_bytes) {}

bool Connection::Enqueue(std::string frame) {
  if (queue_.TryPush(std::move(frame)) != DeliveryQueue::PushResult::kQueued) {
    return false;
  }
  OnFrameQueued();
  return true;
}

bool Connection::CloseQueue() {
  if (!queue_.Close()) {
    return false;
  }
  OnQueueClosed();
  return true;
}

bool Connection::BeginTeardown() { return !teardown_started_.exchange(true); }

bool Connection::JoinRoom(const std::string& room_id) { return joined_rooms_.insert(room_id).second; }

bool Connection::LeaveRoom(const std::string& room_id) { return joined_rooms_.erase(room_id) > 0; }

bool Connection::IsInRoom(const std::string& room_id) const { return joined_rooms_.count(room_id) > 0; }

std::vector<std::string> Connection::JoinedRooms() const {
  return std::vector<std::string>(joined_rooms_.begin(), joined_rooms_.end());
}

}  // namespace sent
