/*
 * 설명: MariaDB 연결 수명, 재시도 분류와 백오프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#include "sent/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace sent {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

class ConnectionGuard {
 public:
  explicit ConnectionGuard(MYSQL* conn) : conn_(conn) {}
  ~ConnectionGuard() {
    if (conn_) {
      mysql_close(conn_);
    }
  }
  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  MYSQL* get() const { return conn_; }

 private:
  MYSQL* conn_;
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    ConnectionGuard guard(conn);
    RaiseError(conn, "연결 실패");
  }
  if (mysql_query(conn, "SET SESSION time_zone='+00:00';") != 0) {
    ConnectionGuard guard(conn);
    RaiseError(conn, "세션 시간대 설정 실패");
  }
  return conn;
}

template <typename Fn>
auto MariaDbClient::RunWithRetry(const Fn& fn) const -> decltype(fn(std::size_t{})) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return fn(attempt);
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

void MariaDbClient::InjectTransient(std::size_t attempt) const {
  if (transient_injector_ && transient_injector_(attempt)) {
    throw DbException("주입된 일시 오류", kDeadlock, true);
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*, std::size_t)>& work) const {
  return RunWithRetry([&](std::size_t attempt) {
    ConnectionGuard guard(Connect());
    mysql_autocommit(guard.get(), 0);
    try {
      InjectTransient(attempt);
      if (!work(guard.get(), attempt)) {
        mysql_rollback(guard.get());
        return false;
      }
      if (mysql_commit(guard.get()) != 0) {
        RaiseError(guard.get(), "커밋 실패");
      }
      return true;
    } catch (...) {
      mysql_rollback(guard.get());
      throw;
    }
  });
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry([&](std::size_t attempt) {
    ConnectionGuard guard(Connect());
    InjectTransient(attempt);
    work(guard.get());
  });
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 25);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + static_cast<std::size_t>(dist(gen))));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace sent
