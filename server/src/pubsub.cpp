/*
 * 설명: 구독 핸들의 취소 보장과 채널별 구독 테이블, 프로세스 내 브로커를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notification_bridge_test.cpp
 */
#include "sent/pubsub.hpp"

#include <algorithm>
#include <utility>

namespace sent {

Subscription::Subscription(std::string channel, Handler handler)
    : channel_(std::move(channel)), handler_(std::move(handler)) {}

bool Subscription::Deliver(const std::string& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }
  handler_(payload);
  return true;
}

void Subscription::Cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;
  handler_ = nullptr;
}

bool Subscription::Cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void SubscriptionTable::Add(const std::shared_ptr<Subscription>& subscription) {
  std::lock_guard<std::mutex> lock(mutex_);
  PruneLocked();
  channels_[subscription->Channel()].push_back(subscription);
}

std::size_t SubscriptionTable::Dispatch(const std::string& channel, const std::string& payload) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
      return 0;
    }
    targets = it->second;
  }
  std::size_t delivered = 0;
  for (const auto& subscription : targets) {
    if (subscription->Deliver(payload)) {
      ++delivered;
    }
  }
  return delivered;
}

std::set<std::string> SubscriptionTable::Channels() {
  std::lock_guard<std::mutex> lock(mutex_);
  PruneLocked();
  std::set<std::string> names;
  for (const auto& [channel, subscriptions] : channels_) {
    names.insert(channel);
  }
  return names;
}

void SubscriptionTable::PruneLocked() {
  for (auto it = channels_.begin(); it != channels_.end();) {
    auto& subscriptions = it->second;
    subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
                                       [](const std::shared_ptr<Subscription>& s) { return s->Cancelled(); }),
                        subscriptions.end());
    if (subscriptions.empty()) {
      it = channels_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t InMemoryPubSub::Publish(const std::string& channel, const std::string& payload) {
  return table_.Dispatch(channel, payload);
}

std::shared_ptr<Subscription> InMemoryPubSub::Subscribe(const std::string& channel, Subscription::Handler handler) {
  auto subscription = std::make_shared<Subscription>(channel, std::move(handler));
  table_.Add(subscription);
  return subscription;
}

}  // namespace sent
