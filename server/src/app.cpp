/*
 * 설명: 서버 수명주기, 리스너와 환경설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "sent/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "sent/db_client.hpp"
#include "sent/http_session.hpp"
#include "sent/mariadb_chat_repository.hpp"
#include "sent/memory_chat_repository.hpp"
#include "sent/redis_pubsub.hpp"

namespace sent {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<IdentityValidator> validator, std::shared_ptr<BroadcastCoordinator> coordinator,
           std::shared_ptr<ChatProtocolHandler> handler, std::shared_ptr<PubSubBroker> broker,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), validator_(std::move(validator)),
        coordinator_(std::move(coordinator)), handler_(std::move(handler)), broker_(std::move(broker)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->validator_, self->coordinator_,
                                          self->handler_, self->broker_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<IdentityValidator> validator_;
  std::shared_ptr<BroadcastCoordinator> coordinator_;
  std::shared_ptr<ChatProtocolHandler> handler_;
  std::shared_ptr<PubSubBroker> broker_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (config.chat_store == "memory") {
    repository_ = std::make_shared<MemoryChatRepository>();
  } else {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    repository_ = std::make_shared<MariaDbChatRepository>(std::make_shared<MariaDbClient>(db_config));
  }
  if (config.redis_host.empty()) {
    broker_ = std::make_shared<InMemoryPubSub>();
  } else {
    RedisConfig redis_config{config.redis_host, config.redis_port, config.redis_password,
                             std::chrono::milliseconds(config.redis_poll_interval_ms)};
    redis_ = std::make_shared<RedisPubSub>(redis_config, observability_);
    broker_ = redis_;
  }
  Assemble();
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<ChatRepository> repository,
                     std::shared_ptr<PubSubBroker> broker)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), repository_(std::move(repository)),
      broker_(std::move(broker)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  Assemble();
}

void ServerApp::Assemble() {
  validator_ = std::make_shared<JwtIdentityValidator>(config_.jwt_secret);
  coordinator_ = std::make_shared<BroadcastCoordinator>(ioc_);
  coordinator_->SetObservability(observability_);
  relay_ = std::make_shared<RoomRelay>(broker_, config_.instance_id.empty() ? GenerateUuid() : config_.instance_id,
                                       observability_);
  relay_->Bind(coordinator_);
  coordinator_->SetRoomRelay(relay_);
  ProtocolLimits limits{config_.history_page_size, std::chrono::milliseconds(config_.history_frame_delay_ms),
                        config_.max_content_bytes};
  handler_ = std::make_shared<ChatProtocolHandler>(ioc_, coordinator_, repository_, observability_, limits);
  handler_->SetRoomRelay(relay_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, validator_, coordinator_, handler_, broker_,
                                           observability_);
    bound_port_ = listener_->LocalPort();
    if (redis_) {
      redis_->Start();
    }
    listener_->Run();
    RunWorkers();
    running_ = true;
    observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                   .name = "server_started",
                                   .level = LogLevel::kInfo,
                                   .detail = "포트 " + std::to_string(bound_port_.load())});
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  unsigned int thread_count = config_.worker_threads > 0 ? static_cast<unsigned int>(config_.worker_threads)
                                                         : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  // 이벤트 루프가 모두 멈춘 뒤에만 루프 소유 상태를 정리한다.
  if (listener_) {
    listener_->Stop();
  }
  coordinator_->Shutdown();
  if (redis_) {
    redis_->Stop();
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.worker_threads = get_size("WORKER_THREADS", "0");
  cfg.chat_store = get_env("CHAT_STORE", "mariadb");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "chat_db");
  cfg.redis_host = get_env("REDIS_HOST", "");
  cfg.redis_port = static_cast<unsigned short>(std::stoi(get_env("REDIS_PORT", "6379")));
  cfg.redis_password = get_env("REDIS_PASSWORD", "");
  cfg.redis_poll_interval_ms = get_size("REDIS_POLL_INTERVAL_MS", "100");
  cfg.instance_id = get_env("INSTANCE_ID", "");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret = get_env("JWT_SECRET", "dev-secret-change-me");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "256");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "1048576");
  cfg.ws_max_message_bytes = get_size("WS_MAX_MESSAGE_BYTES", "8192");
  cfg.ws_ping_period_ms = get_size("WS_PING_PERIOD_MS", "54000");
  cfg.ws_pong_wait_ms = get_size("WS_PONG_WAIT_MS", "60000");
  cfg.max_content_bytes = get_size("CHAT_MAX_CONTENT_BYTES", "4000");
  cfg.history_page_size = get_size("HISTORY_PAGE_SIZE", "50");
  cfg.history_frame_delay_ms = get_size("HISTORY_FRAME_DELAY_MS", "5");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

}  // namespace sent
