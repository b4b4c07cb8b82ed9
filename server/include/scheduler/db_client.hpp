/*
 * 설명: MariaDB 연결, 세션 단위 트랜잭션, 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace scheduler {

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

struct ResultDeleter {
  void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};

using ResultSet = std::unique_ptr<MYSQL_RES, ResultDeleter>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 false를 반환하면 롤백한다. 교착/락 대기 타임아웃/연결 끊김은 재시도한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  ResultSet Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::int64_t LastInsertId(MYSQL* conn) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace scheduler
