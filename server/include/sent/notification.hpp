/*
 * 설명: 사용자 알림 채널을 연결 전달 큐로 중계하는 브리지와 알림 페이로드를 게시하는 퍼블리셔를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notification_bridge_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "sent/broadcast_coordinator.hpp"
#include "sent/connection.hpp"
#include "sent/observability.hpp"
#include "sent/pubsub.hpp"

namespace sent {

std::string UserNotificationChannel(const std::string& user_id);

enum class NotificationKind { kFriendRequest, kFriendAccepted, kFriendDeclined, kChatInvite, kMessage };

std::string_view NotificationKindName(NotificationKind kind);
std::optional<NotificationKind> ParseNotificationKind(std::string_view text);

class NotificationBridge {
 public:
  NotificationBridge(std::shared_ptr<PubSubBroker> broker, std::shared_ptr<BroadcastCoordinator> coordinator,
                     std::shared_ptr<Observability> observability);
  ~NotificationBridge();

  NotificationBridge(const NotificationBridge&) = delete;
  NotificationBridge& operator=(const NotificationBridge&) = delete;

  // 연결된 이후에 게시된 알림만 전달한다.
  void Attach(const std::shared_ptr<Connection>& conn);
  void Detach();
  bool Attached() const;

 private:
  std::shared_ptr<PubSubBroker> broker_;
  std::shared_ptr<BroadcastCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  std::shared_ptr<Subscription> subscription_;
};

struct PublishedNotification {
  nlohmann::json payload;
  std::size_t receivers{0};
};

class NotificationPublisher {
 public:
  explicit NotificationPublisher(std::shared_ptr<PubSubBroker> broker);

  nlohmann::json Build(const std::string& user_id, NotificationKind kind, const nlohmann::json& data) const;
  PublishedNotification Publish(const std::string& user_id, NotificationKind kind, const nlohmann::json& data);

 private:
  std::shared_ptr<PubSubBroker> broker_;
};

}  // namespace sent
