/*
 * 설명: redis-plus-plus 구독자를 폴링 주기마다 깨워 채널 구독 집합을 갱신하고 수신 메시지를 구독 테이블로 분배한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/redis_pubsub_it_test.cpp
 */
#include "sent/redis_pubsub.hpp"

#include <set>
#include <utility>

namespace sent {
namespace {
constexpr std::chrono::milliseconds kReconnectBackoff{500};

sw::redis::ConnectionOptions MakeOptions(const RedisConfig& config, bool listener) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  if (!config.password.empty()) {
    options.password = config.password;
  }
  options.connect_timeout = std::chrono::milliseconds(2000);
  // 리스너 소켓 타임아웃이 곧 구독 집합 갱신 주기다.
  options.socket_timeout = listener ? config.poll_interval : std::chrono::milliseconds(2000);
  return options;
}
}  // namespace

RedisPubSub::RedisPubSub(const RedisConfig& config, std::shared_ptr<Observability> observability)
    : config_(config), observability_(std::move(observability)), publisher_(MakeOptions(config, false)),
      listener_(MakeOptions(config, true)) {}

RedisPubSub::~RedisPubSub() { Stop(); }

void RedisPubSub::Start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread([this]() { ListenLoop(); });
}

void RedisPubSub::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::size_t RedisPubSub::Publish(const std::string& channel, const std::string& payload) {
  try {
    return static_cast<std::size_t>(publisher_.publish(channel, payload));
  } catch (const sw::redis::Error& ex) {
    throw PubSubError(std::string("Redis 게시 실패: ") + ex.what());
  }
}

std::shared_ptr<Subscription> RedisPubSub::Subscribe(const std::string& channel, Subscription::Handler handler) {
  auto subscription = std::make_shared<Subscription>(channel, std::move(handler));
  table_.Add(subscription);
  return subscription;
}

void RedisPubSub::ListenLoop() {
  while (running_) {
    try {
      auto subscriber = listener_.subscriber();
      subscriber.on_message([this](std::string channel, std::string payload) { table_.Dispatch(channel, payload); });
      std::set<std::string> subscribed;
      while (running_) {
        auto wanted = table_.Channels();
        for (const auto& channel : wanted) {
          if (subscribed.insert(channel).second) {
            subscriber.subscribe(channel);
          }
        }
        for (auto it = subscribed.begin(); it != subscribed.end();) {
          if (wanted.count(*it) == 0) {
            subscriber.unsubscribe(*it);
            it = subscribed.erase(it);
          } else {
            ++it;
          }
        }
        try {
          subscriber.consume();
        } catch (const sw::redis::TimeoutError&) {
          continue;
        }
      }
    } catch (const sw::redis::Error& ex) {
      LogWarn("redis_listener_error", ex.what());
      std::this_thread::sleep_for(kReconnectBackoff);
    }
  }
}

void RedisPubSub::LogWarn(const std::string& name, const std::string& detail) {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = name,
                                 .level = LogLevel::kWarn,
                                 .detail = detail});
}

}  // namespace sent
