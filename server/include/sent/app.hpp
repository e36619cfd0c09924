/*
 * 설명: 서버 전체 수명주기와 협력자(저장소, 브로커, 코디네이터) 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "sent/broadcast_coordinator.hpp"
#include "sent/chat_repository.hpp"
#include "sent/config.hpp"
#include "sent/identity.hpp"
#include "sent/observability.hpp"
#include "sent/protocol_handler.hpp"
#include "sent/pubsub.hpp"
#include "sent/room_relay.hpp"

namespace sent {

class Listener;
class RedisPubSub;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 테스트에서 저장소와 브로커를 주입할 때 사용한다.
  ServerApp(const AppConfig& config, std::shared_ptr<ChatRepository> repository, std::shared_ptr<PubSubBroker> broker);
  ~ServerApp();

  // 리스너를 열고 워커 스레드를 띄운 뒤 현재 스레드에서도 이벤트 루프를 돈다. Stop()까지 반환하지 않는다.
  void Run();
  void Stop();

  // Run() 시작 후 실제로 바인딩된 포트. SERVER_PORT=0일 때 사용한다.
  unsigned short BoundPort() const { return bound_port_.load(); }
  bool Running() const { return running_.load(); }

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<BroadcastCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<ChatRepository> GetRepository() { return repository_; }
  std::shared_ptr<PubSubBroker> GetBroker() { return broker_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Assemble();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<IdentityValidator> validator_;
  std::shared_ptr<ChatRepository> repository_;
  std::shared_ptr<PubSubBroker> broker_;
  std::shared_ptr<RedisPubSub> redis_;
  std::shared_ptr<BroadcastCoordinator> coordinator_;
  std::shared_ptr<RoomRelay> relay_;
  std::shared_ptr<ChatProtocolHandler> handler_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned short> bound_port_{0};
};

}  // namespace sent
