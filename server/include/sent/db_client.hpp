/*
 * 설명: MariaDB 연결 생성, 일시 오류 재시도와 트랜잭션 경계를 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace sent {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 false를 반환하면 롤백한다. 재시도 가능한 오류는 지수 백오프 후 최대 3회까지 다시 시도한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*, std::size_t attempt)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

 private:
  MYSQL* Connect() const;
  template <typename Fn>
  auto RunWithRetry(const Fn& fn) const -> decltype(fn(std::size_t{}));
  void InjectTransient(std::size_t attempt) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace sent
