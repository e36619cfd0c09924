/*
 * 설명: 채널 기반 게시/구독 브로커 계약과 프로세스 내 구현, 취소 가능한 구독 핸들을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notification_bridge_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace sent {

class PubSubError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Subscription {
 public:
  using Handler = std::function<void(const std::string& payload)>;

  Subscription(std::string channel, Handler handler);

  const std::string& Channel() const { return channel_; }

  // Cancel()이 반환된 뒤에는 핸들러가 다시 호출되지 않는다. 핸들러 안에서 자신을 취소하면 안 된다.
  bool Deliver(const std::string& payload);
  void Cancel();
  bool Cancelled() const;

 private:
  std::string channel_;
  Handler handler_;
  mutable std::mutex mutex_;
  bool cancelled_{false};
};

class SubscriptionTable {
 public:
  void Add(const std::shared_ptr<Subscription>& subscription);
  std::size_t Dispatch(const std::string& channel, const std::string& payload);
  std::set<std::string> Channels();

 private:
  void PruneLocked();

  std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::shared_ptr<Subscription>>> channels_;
};

class PubSubBroker {
 public:
  virtual ~PubSubBroker() = default;
  // 전달된 수신자 수를 반환한다. 구독자가 없으면 페이로드는 버려진다.
  virtual std::size_t Publish(const std::string& channel, const std::string& payload) = 0;
  virtual std::shared_ptr<Subscription> Subscribe(const std::string& channel, Subscription::Handler handler) = 0;
};

class InMemoryPubSub : public PubSubBroker {
 public:
  std::size_t Publish(const std::string& channel, const std::string& payload) override;
  std::shared_ptr<Subscription> Subscribe(const std::string& channel, Subscription::Handler handler) override;

 private:
  SubscriptionTable table_;
};

}  // namespace sent
