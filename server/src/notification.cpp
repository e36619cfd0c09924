/*
 * 설명: 사용자 알림 채널 구독을 연결 수명에 묶고, 알림 페이로드를 생성해 수신자 채널로 게시한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notification_bridge_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "sent/notification.hpp"

#include <utility>

#include "sent/chat_repository.hpp"
#include "sent/envelope.hpp"

namespace sent {

std::string UserNotificationChannel(const std::string& user_id) { return "user:notify:" + user_id; }

std::string_view NotificationKindName(NotificationKind kind) {
  switch (kind) {
    case NotificationKind::kFriendRequest:
      return "friend_request";
    case NotificationKind::kFriendAccepted:
      return "friend_accepted";
    case NotificationKind::kFriendDeclined:
      return "friend_declined";
    case NotificationKind::kChatInvite:
      return "chat_invite";
    case NotificationKind::kMessage:
      return "message";
  }
  return "message";
}

std::optional<NotificationKind> ParseNotificationKind(std::string_view text) {
  if (text == "friend_request") {
    return NotificationKind::kFriendRequest;
  }
  if (text == "friend_accepted") {
    return NotificationKind::kFriendAccepted;
  }
  if (text == "friend_declined") {
    return NotificationKind::kFriendDeclined;
  }
  if (text == "chat_invite") {
    return NotificationKind::kChatInvite;
  }
  if (text == "message") {
    return NotificationKind::kMessage;
  }
  return std::nullopt;
}

NotificationBridge::NotificationBridge(std::shared_ptr<PubSubBroker> broker,
                                       std::shared_ptr<BroadcastCoordinator> coordinator,
                                       std::shared_ptr<Observability> observability)
    : broker_(std::move(broker)), coordinator_(std::move(coordinator)), observability_(std::move(observability)) {}

NotificationBridge::~NotificationBridge() { Detach(); }

void NotificationBridge::Attach(const std::shared_ptr<Connection>& conn) {
  std::weak_ptr<Connection> weak_conn = conn;
  std::weak_ptr<BroadcastCoordinator> weak_coordinator = coordinator_;
  auto observability = observability_;
  auto subscription = broker_->Subscribe(
      UserNotificationChannel(conn->User().user_id),
      [weak_conn, weak_coordinator, observability](const std::string& payload) {
        auto target = weak_conn.lock();
        if (!target) {
          return;
        }
        if (target->Enqueue(payload)) {
          if (observability) {
            observability->IncrementNotificationForwarded();
          }
          return;
        }
        if (target->QueueClosed()) {
          return;
        }
        if (observability) {
          observability->IncrementBackpressureDisconnect();
          observability->Log(LogContext{.trace_id = observability->NextTraceId(),
                                        .name = "notification_backpressure",
                                        .level = LogLevel::kWarn,
                                        .user_id = target->User().user_id,
                                        .connection_id = target->Id(),
                                        .detail = "알림 전달 중 전송 큐 한도 초과"});
        }
        if (auto coordinator = weak_coordinator.lock()) {
          coordinator->Deregister(target);
        } else {
          target->CloseQueue();
        }
      });

  std::shared_ptr<Subscription> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::exchange(subscription_, std::move(subscription));
  }
  if (previous) {
    previous->Cancel();
  }
}

void NotificationBridge::Detach() {
  std::shared_ptr<Subscription> current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = std::move(subscription_);
    subscription_.reset();
  }
  if (current) {
    current->Cancel();
  }
}

bool NotificationBridge::Attached() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscription_ != nullptr;
}

NotificationPublisher::NotificationPublisher(std::shared_ptr<PubSubBroker> broker) : broker_(std::move(broker)) {}

nlohmann::json NotificationPublisher::Build(const std::string& user_id, NotificationKind kind,
                                            const nlohmann::json& data) const {
  return {{"type", EnvelopeKindName(EnvelopeKind::kNotification)},
          {"id", GenerateUuid()},
          {"kind", NotificationKindName(kind)},
          {"user_id", user_id},
          {"is_read", false},
          {"created_at", NowIsoString()},
          {"data", data.is_null() ? nlohmann::json::object() : data}};
}

PublishedNotification NotificationPublisher::Publish(const std::string& user_id, NotificationKind kind,
                                                     const nlohmann::json& data) {
  PublishedNotification published;
  published.payload = Build(user_id, kind, data);
  published.receivers = broker_->Publish(UserNotificationChannel(user_id), published.payload.dump());
  return published;
}

}  // namespace sent
