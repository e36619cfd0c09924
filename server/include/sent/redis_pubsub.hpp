/*
 * 설명: Redis PUBLISH/SUBSCRIBE 위에서 동작하는 프로세스 간 브로커. 리스너 스레드가 채널 구독을 조정하고 메시지를 분배한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/redis_pubsub_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <sw/redis++/redis++.h>

#include "sent/observability.hpp"
#include "sent/pubsub.hpp"

namespace sent {

struct RedisConfig {
  std::string host;
  unsigned short port{6379};
  std::string password;
  std::chrono::milliseconds poll_interval{100};
};

class RedisPubSub : public PubSubBroker {
 public:
  RedisPubSub(const RedisConfig& config, std::shared_ptr<Observability> observability);
  ~RedisPubSub() override;

  void Start();
  void Stop();

  std::size_t Publish(const std::string& channel, const std::string& payload) override;
  std::shared_ptr<Subscription> Subscribe(const std::string& channel, Subscription::Handler handler) override;

 private:
  void ListenLoop();
  void LogWarn(const std::string& name, const std::string& detail);

  RedisConfig config_;
  std::shared_ptr<Observability> observability_;
  sw::redis::Redis publisher_;
  sw::redis::Redis listener_;
  SubscriptionTable table_;
  std::thread worker_;
  std::atomic<bool> running_{false};
};

}  // namespace sent
