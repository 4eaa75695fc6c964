/*
 * 설명: MariaDB 연결과 재시도 정책, 시각 변환을 캡슐화한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/it/mariadb_token_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace tokenguard {

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

  // work는 재시도될 수 있으므로 조건부 단일 쓰기처럼 멱등인 작업만 넘긴다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

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

// DATETIME(6) UTC 문자열과 system_clock 사이를 변환한다.
std::string ToSqlTimestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point ParseSqlTimestamp(const char* text);

}  // namespace tokenguard
